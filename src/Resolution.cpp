#include <NGIN/PolyJson/Resolution.hpp>

#include <string>

namespace NGIN::PolyJson
{

  const ResolvedVariant *CompiledResolution::FindByDynamicType(const std::type_info &dynamicType) const noexcept
  {
    for (NGIN::UIntSize i = 0; i < m_variants.Size(); ++i)
    {
      if (*m_variants[i].rtti == dynamicType)
        return &m_variants[i];
    }
    return nullptr;
  }

  const ResolvedVariant *CompiledResolution::FindByDiscriminator(const Json &value) const noexcept
  {
    for (NGIN::UIntSize i = 0; i < m_variants.Size(); ++i)
    {
      if (m_variants[i].discriminator.Matches(value))
        return &m_variants[i];
    }
    return nullptr;
  }

  std::expected<std::shared_ptr<const CompiledResolution>, Error>
  CompileResolution(Type base, const NGIN::Containers::Vector<VariantEntry> &entries)
  {
    if (!base.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid base type"});

    const auto &reg = detail::GetRegistry();
    NGIN::Containers::Vector<ResolvedVariant> variants;
    for (NGIN::UIntSize i = 0; i < entries.Size(); ++i)
    {
      const auto &entry = entries[i];
      const auto idx = entry.type.Handle().index;
      const auto &tdesc = reg.types[idx];

      bool repeated = false;
      for (NGIN::UIntSize k = 0; k < variants.Size(); ++k)
      {
        if (!(variants[k].discriminator == entry.discriminator))
          continue;
        if (variants[k].typeIndex != idx)
          return std::unexpected(Error{ErrorCode::Configuration, "duplicate discriminator",
                                       entry.discriminator.ToString() + " on " + std::string{reg.types[variants[k].typeIndex].qualifiedName} +
                                           " and " + std::string{tdesc.qualifiedName}});
        repeated = true;
        break;
      }
      if (repeated)
        continue;

      if (!tdesc.Construct)
        return std::unexpected(Error{ErrorCode::Configuration, "variant is not default constructible",
                                     std::string{tdesc.qualifiedName}});

      ResolvedVariant v{};
      v.typeIndex = idx;
      v.typeId = tdesc.typeId;
      v.rtti = tdesc.rtti;
      v.discriminator = entry.discriminator;
      if (!detail::FindBasePath(idx, base.GetTypeId(), v.path))
        return std::unexpected(Error{ErrorCode::Configuration, "variant is not assignable to base",
                                     std::string{tdesc.qualifiedName}});
      variants.PushBack(std::move(v));
    }
    return std::make_shared<const CompiledResolution>(base, std::move(variants));
  }

  PolymorphicContractProvider::PolymorphicContractProvider(std::shared_ptr<const CompiledResolution> resolution, MemberPolicy policy)
      : m_resolution(std::move(resolution))
  {
    const Type base = m_resolution->BaseType();
    m_contract.kind = ContractKind::Polymorphic;
    m_contract.typeIndex = base.Handle().index;
    m_contract.typeId = base.GetTypeId();
    m_contract.policy = policy;
    m_contract.resolution = m_resolution.get();
  }

  const TypeContract *PolymorphicContractProvider::FindContract(NGIN::UInt64 typeId) const noexcept
  {
    return typeId == m_contract.typeId ? &m_contract : nullptr;
  }

} // namespace NGIN::PolyJson
