#include <NGIN/PolyJson/Services.hpp>

namespace NGIN::PolyJson
{

  std::expected<std::shared_ptr<PolymorphicSerializer>, Error> SerializerHost::GetSerializer() const
  {
    if (!m_state->serializer)
      return std::unexpected(Error{ErrorCode::NotFound, "polymorphic serializer was not added"});
    return m_state->serializer;
  }

  SerializerServices &SerializerServices::AddTypeGroup(const TypeGroupDescriptor &descriptor)
  {
    m_groups.PushBack(descriptor);
    return *this;
  }

  SerializerServices &SerializerServices::AddPolymorphicSerializer() noexcept
  {
    m_withSerializer = true;
    return *this;
  }

  std::expected<SerializerHost, Error> SerializerServices::Build() const
  {
    auto state = std::make_shared<SerializerHost::State>();
    state->groups.Reserve(m_groups.Size());
    for (NGIN::UIntSize i = 0; i < m_groups.Size(); ++i)
    {
      auto group = MaterializeTypeGroup(m_groups[i]);
      if (!group)
        return std::unexpected(std::move(group.error()));
      state->groups.PushBack(std::move(*group));
    }
    if (m_withSerializer)
      state->serializer = std::make_shared<PolymorphicSerializer>(state->groups);
    return SerializerHost{std::move(state)};
  }

} // namespace NGIN::PolyJson
