// TypeGroup.hpp
// Named sets of declared types and the contract providers built from them
#pragma once

#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Meta/TypeName.hpp>

#include <NGIN/PolyJson/Contract.hpp>
#include <NGIN/PolyJson/Options.hpp>
#include <NGIN/PolyJson/Registry.hpp>

#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>

namespace NGIN::PolyJson
{
  class TypeGroup;

  /**
   * Collects the types a group declares. Handed to a group's declare function;
   * registration errors are latched and reported by MaterializeTypeGroup.
   */
  class NGIN_POLYJSON_API TypeGroupBuilder
  {
  public:
    explicit TypeGroupBuilder(std::string_view groupName) noexcept : m_name(groupName) {}

    [[nodiscard]] std::string_view GroupName() const noexcept { return m_name; }

    /** Declare a single type, registering it first. */
    template <class T>
    TypeGroupBuilder &RegisterType()
    {
      return RegisterType(Type{TypeHandle{detail::EnsureRegistered<T>()}});
    }

    /** Declare multiple types in one call, in order. */
    template <class... T>
    TypeGroupBuilder &RegisterTypes()
    {
      (RegisterType<T>(), ...);
      return *this;
    }

    /** Declare an already registered type; an invalid handle or a repeat is an error. */
    TypeGroupBuilder &RegisterType(Type type);

    [[nodiscard]] const NGIN::Containers::Vector<NGIN::UInt32> &DeclaredIndices() const noexcept { return m_types; }
    [[nodiscard]] const std::optional<Error> &FirstError() const noexcept { return m_error; }
    [[nodiscard]] NGIN::Containers::Vector<NGIN::UInt32> TakeDeclared() noexcept { return std::move(m_types); }

  private:
    std::string_view m_name;
    NGIN::Containers::Vector<NGIN::UInt32> m_types;
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> m_seen;
    std::optional<Error> m_error;
  };

  // Identifies a group: a name plus the function that declares its types.
  struct TypeGroupDescriptor
  {
    std::string_view name{};
    void (*declare)(TypeGroupBuilder &){nullptr};
  };

  // Descriptor for a group class exposing `static void Declare(TypeGroupBuilder&)`.
  template <class G>
  [[nodiscard]] TypeGroupDescriptor DescriptorOf() noexcept
  {
    return TypeGroupDescriptor{NGIN::Meta::TypeName<G>::qualifiedName, &G::Declare};
  }

  class NGIN_POLYJSON_API TypeGroup
  {
  public:
    virtual ~TypeGroup() = default;

    [[nodiscard]] virtual std::string_view Name() const noexcept = 0;
    [[nodiscard]] virtual NGIN::UIntSize DeclaredTypeCount() const noexcept = 0;
    [[nodiscard]] virtual Type DeclaredTypeAt(NGIN::UIntSize i) const noexcept = 0;
    // Declared types plus every type reachable from them through members.
    [[nodiscard]] virtual bool Knows(NGIN::UInt64 typeId) const noexcept = 0;
    [[nodiscard]] virtual NGIN::UIntSize KnownTypeCount() const noexcept = 0;

    // Provider with default options; created on first use and shared for the
    // process lifetime.
    [[nodiscard]] virtual std::shared_ptr<const ContractProvider> DefaultProvider() const = 0;
    // Fresh provider honoring `options`.
    [[nodiscard]] virtual std::shared_ptr<const ContractProvider> CreateProvider(const SerializerOptions &options) const = 0;
  };

  // The group produced from a descriptor.
  class NGIN_POLYJSON_API DeclaredTypeGroup final : public TypeGroup
  {
  public:
    DeclaredTypeGroup(std::string_view name, NGIN::Containers::Vector<NGIN::UInt32> declared);

    [[nodiscard]] std::string_view Name() const noexcept override { return m_name; }
    [[nodiscard]] NGIN::UIntSize DeclaredTypeCount() const noexcept override { return m_declared.Size(); }
    [[nodiscard]] Type DeclaredTypeAt(NGIN::UIntSize i) const noexcept override;
    [[nodiscard]] bool Knows(NGIN::UInt64 typeId) const noexcept override;
    [[nodiscard]] NGIN::UIntSize KnownTypeCount() const noexcept override { return m_known.Size(); }

    [[nodiscard]] std::shared_ptr<const ContractProvider> DefaultProvider() const override;
    [[nodiscard]] std::shared_ptr<const ContractProvider> CreateProvider(const SerializerOptions &options) const override;

  private:
    void CollectReferences(NGIN::UInt32 index);

    std::string_view m_name;
    NGIN::Containers::Vector<NGIN::UInt32> m_declared;
    NGIN::Containers::Vector<NGIN::UInt32> m_known;
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> m_knownById;
    mutable std::once_flag m_defaultOnce;
    mutable std::shared_ptr<const ContractProvider> m_default;
  };

  using SharedTypeGroup = std::shared_ptr<const TypeGroup>;
  using GroupList = NGIN::Containers::Vector<SharedTypeGroup>;

  // Run the descriptor's declare function and build the group. Fails with
  // Configuration on a missing declare function, an empty name or a bad declaration.
  [[nodiscard]] NGIN_POLYJSON_API std::expected<SharedTypeGroup, Error> MaterializeTypeGroup(const TypeGroupDescriptor &descriptor);

  template <class G>
  [[nodiscard]] std::expected<SharedTypeGroup, Error> MaterializeTypeGroup()
  {
    return MaterializeTypeGroup(DescriptorOf<G>());
  }

} // namespace NGIN::PolyJson
