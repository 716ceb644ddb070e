#include <NGIN/PolyJson/TypeGroup.hpp>

#include <string>

namespace NGIN::PolyJson
{
  namespace
  {
    // Object contracts for every type a group knows, all sharing one member policy.
    class GroupContractProvider final : public ContractProvider
    {
    public:
      GroupContractProvider(const NGIN::Containers::Vector<NGIN::UInt32> &known, MemberPolicy policy)
      {
        const auto &reg = detail::GetRegistry();
        m_contracts.Reserve(known.Size());
        for (NGIN::UIntSize i = 0; i < known.Size(); ++i)
        {
          TypeContract c{};
          c.kind = ContractKind::Object;
          c.typeIndex = known[i];
          c.typeId = reg.types[known[i]].typeId;
          c.policy = policy;
          m_contracts.PushBack(c);
          m_byTypeId.Insert(c.typeId, static_cast<NGIN::UInt32>(i));
        }
      }

      [[nodiscard]] const TypeContract *FindContract(NGIN::UInt64 typeId) const noexcept override
      {
        if (auto *p = m_byTypeId.GetPtr(typeId))
          return &m_contracts[*p];
        return nullptr;
      }

    private:
      NGIN::Containers::Vector<TypeContract> m_contracts;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> m_byTypeId;
    };
  } // namespace

  TypeGroupBuilder &TypeGroupBuilder::RegisterType(Type type)
  {
    if (m_error)
      return *this;
    if (!type.IsValid())
    {
      m_error = Error{ErrorCode::Configuration, "invalid type handle", std::string{m_name}};
      return *this;
    }
    const auto tid = type.GetTypeId();
    if (m_seen.GetPtr(tid))
    {
      m_error = Error{ErrorCode::Configuration, "type declared twice in group", std::string{type.QualifiedName()}};
      return *this;
    }
    m_seen.Insert(tid, type.Handle().index);
    m_types.PushBack(type.Handle().index);
    return *this;
  }

  DeclaredTypeGroup::DeclaredTypeGroup(std::string_view name, NGIN::Containers::Vector<NGIN::UInt32> declared)
      : m_name(detail::InternName(name)), m_declared(std::move(declared))
  {
    // Breadth-first over member references; m_known doubles as the work queue.
    const auto &reg = detail::GetRegistry();
    for (NGIN::UIntSize i = 0; i < m_declared.Size(); ++i)
    {
      const auto idx = m_declared[i];
      if (m_knownById.GetPtr(reg.types[idx].typeId))
        continue;
      m_knownById.Insert(reg.types[idx].typeId, idx);
      m_known.PushBack(idx);
    }
    for (NGIN::UIntSize next = 0; next < m_known.Size(); ++next)
      CollectReferences(m_known[next]);
  }

  // Queue the types referenced by the members of `index` and of its bases.
  void DeclaredTypeGroup::CollectReferences(NGIN::UInt32 index)
  {
    const auto &reg = detail::GetRegistry();
    const auto &tdesc = reg.types[index];
    for (NGIN::UIntSize b = 0; b < tdesc.bases.Size(); ++b)
      CollectReferences(tdesc.bases[b].baseTypeIndex);
    for (NGIN::UIntSize f = 0; f < tdesc.fields.Size(); ++f)
    {
      const auto ref = tdesc.fields[f].referencedTypeId;
      if (ref == 0 || m_knownById.GetPtr(ref))
        continue;
      if (auto *p = reg.byTypeId.GetPtr(ref))
      {
        m_knownById.Insert(ref, *p);
        m_known.PushBack(*p);
      }
    }
  }

  Type DeclaredTypeGroup::DeclaredTypeAt(NGIN::UIntSize i) const noexcept
  {
    if (i >= m_declared.Size())
      return Type{};
    return Type{TypeHandle{m_declared[i]}};
  }

  bool DeclaredTypeGroup::Knows(NGIN::UInt64 typeId) const noexcept
  {
    return m_knownById.GetPtr(typeId) != nullptr;
  }

  std::shared_ptr<const ContractProvider> DeclaredTypeGroup::DefaultProvider() const
  {
    std::call_once(m_defaultOnce, [this] { m_default = CreateProvider(SerializerOptions{}); });
    return m_default;
  }

  std::shared_ptr<const ContractProvider> DeclaredTypeGroup::CreateProvider(const SerializerOptions &options) const
  {
    return std::make_shared<const GroupContractProvider>(m_known, PolicyFrom(options));
  }

  std::expected<SharedTypeGroup, Error> MaterializeTypeGroup(const TypeGroupDescriptor &descriptor)
  {
    if (descriptor.name.empty())
      return std::unexpected(Error{ErrorCode::Configuration, "type group has no name"});
    if (!descriptor.declare)
      return std::unexpected(Error{ErrorCode::Configuration, "type group has no declare function", std::string{descriptor.name}});

    TypeGroupBuilder builder{descriptor.name};
    descriptor.declare(builder);
    if (builder.FirstError())
      return std::unexpected(*builder.FirstError());
    return std::make_shared<const DeclaredTypeGroup>(descriptor.name, builder.TakeDeclared());
  }

} // namespace NGIN::PolyJson
