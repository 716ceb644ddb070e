// Services.hpp
// Registration surface: collect type groups, then build a host handing out facades
#pragma once

#include <NGIN/Containers/Vector.hpp>

#include <NGIN/PolyJson/Serializer.hpp>
#include <NGIN/PolyJson/TypeGroup.hpp>

#include <expected>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace NGIN::PolyJson
{

  /**
   * Resolves facades built by SerializerServices. Copies share state: the
   * non-generic serializer is a single instance and each TypedSerializer<B> is
   * created once per base type.
   */
  class NGIN_POLYJSON_API SerializerHost
  {
  public:
    [[nodiscard]] const GroupList &Groups() const noexcept { return m_state->groups; }

    // NotFound when AddPolymorphicSerializer was not called.
    [[nodiscard]] std::expected<std::shared_ptr<PolymorphicSerializer>, Error> GetSerializer() const;

    template <class B>
    [[nodiscard]] std::expected<std::shared_ptr<TypedSerializer<B>>, Error> GetSerializer() const
    {
      auto inner = GetSerializer();
      if (!inner)
        return std::unexpected(std::move(inner.error()));
      const auto key = detail::TypeIdOf<B>();
      std::lock_guard lock{m_state->mutex};
      if (auto it = m_state->typed.find(key); it != m_state->typed.end())
        return std::static_pointer_cast<TypedSerializer<B>>(it->second);
      auto created = TypedSerializer<B>::Create(std::move(*inner));
      if (!created)
        return std::unexpected(std::move(created.error()));
      m_state->typed.emplace(key, *created);
      return std::move(*created);
    }

  private:
    friend class SerializerServices;

    struct State
    {
      GroupList groups;
      std::shared_ptr<PolymorphicSerializer> serializer;
      std::mutex mutex;
      std::unordered_map<NGIN::UInt64, std::shared_ptr<void>> typed;
    };

    explicit SerializerHost(std::shared_ptr<State> state) noexcept : m_state(std::move(state)) {}

    std::shared_ptr<State> m_state;
  };

  class NGIN_POLYJSON_API SerializerServices
  {
  public:
    // G exposes `static void Declare(TypeGroupBuilder&)`.
    template <class G>
    SerializerServices &AddTypeGroup()
    {
      return AddTypeGroup(DescriptorOf<G>());
    }

    // Groups are materialized by Build in the order they were added.
    SerializerServices &AddTypeGroup(const TypeGroupDescriptor &descriptor);
    SerializerServices &AddPolymorphicSerializer() noexcept;

    // Fails with the first group's Configuration error.
    [[nodiscard]] std::expected<SerializerHost, Error> Build() const;

  private:
    NGIN::Containers::Vector<TypeGroupDescriptor> m_groups;
    bool m_withSerializer{false};
  };

} // namespace NGIN::PolyJson
