#include <NGIN/PolyJson/Config.hpp>

namespace NGIN::PolyJson
{

  SerializerConfig::SerializerConfig(Type base, const SerializerOptions &options, std::shared_ptr<const CompiledResolution> resolution,
                                     NGIN::Containers::Vector<SharedProvider> chain)
      : m_base(base), m_options(options), m_resolution(std::move(resolution)), m_chain(std::move(chain))
  {
  }

  const TypeContract *SerializerConfig::FindContract(NGIN::UInt64 typeId) const noexcept
  {
    for (NGIN::UIntSize i = 0; i < m_chain.Size(); ++i)
    {
      if (const auto *c = m_chain[i]->FindContract(typeId))
        return c;
    }
    return nullptr;
  }

  const TypeContract *SerializerConfig::FindObjectContract(NGIN::UInt64 typeId) const noexcept
  {
    for (NGIN::UIntSize i = 0; i < m_chain.Size(); ++i)
    {
      const auto *c = m_chain[i]->FindContract(typeId);
      if (c && c->kind == ContractKind::Object)
        return c;
    }
    return nullptr;
  }

  std::expected<SharedConfig, Error> CombineResolvers(Type base, const GroupList &groups, const SerializerOptions *options)
  {
    auto entries = ResolveVariants(base, groups);
    if (!entries)
      return std::unexpected(std::move(entries.error()));
    auto resolution = CompileResolution(base, *entries);
    if (!resolution)
      return std::unexpected(std::move(resolution.error()));

    const SerializerOptions effective = options ? *options : SerializerOptions{};

    NGIN::Containers::Vector<SharedProvider> chain;
    chain.Reserve(groups.Size() + 1);
    chain.PushBack(std::make_shared<const PolymorphicContractProvider>(*resolution, PolicyFrom(effective)));
    for (NGIN::UIntSize g = 0; g < groups.Size(); ++g)
      chain.PushBack(options ? groups[g]->CreateProvider(*options) : groups[g]->DefaultProvider());

    return std::make_shared<const SerializerConfig>(base, effective, std::move(*resolution), std::move(chain));
  }

} // namespace NGIN::PolyJson
