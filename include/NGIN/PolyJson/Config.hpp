// Config.hpp
// Immutable serializer configuration and the resolver combinator that builds it
#pragma once

#include <NGIN/Containers/Vector.hpp>

#include <NGIN/PolyJson/Contract.hpp>
#include <NGIN/PolyJson/Options.hpp>
#include <NGIN/PolyJson/Resolution.hpp>
#include <NGIN/PolyJson/TypeGroup.hpp>

#include <expected>
#include <memory>

namespace NGIN::PolyJson
{

  using SharedProvider = std::shared_ptr<const ContractProvider>;

  class NGIN_POLYJSON_API SerializerConfig
  {
  public:
    SerializerConfig(Type base, const SerializerOptions &options, std::shared_ptr<const CompiledResolution> resolution,
                     NGIN::Containers::Vector<SharedProvider> chain);

    [[nodiscard]] Type BaseType() const noexcept { return m_base; }
    [[nodiscard]] const SerializerOptions &Options() const noexcept { return m_options; }
    [[nodiscard]] const CompiledResolution &Resolution() const noexcept { return *m_resolution; }

    [[nodiscard]] NGIN::UIntSize ProviderCount() const noexcept { return m_chain.Size(); }
    [[nodiscard]] const SharedProvider &ProviderAt(NGIN::UIntSize i) const noexcept { return m_chain[i]; }

    // First provider in chain order that knows `typeId`.
    [[nodiscard]] const TypeContract *FindContract(NGIN::UInt64 typeId) const noexcept;
    // As FindContract, skipping Polymorphic contracts; used for a variant's members.
    [[nodiscard]] const TypeContract *FindObjectContract(NGIN::UInt64 typeId) const noexcept;

  private:
    Type m_base{};
    SerializerOptions m_options{};
    std::shared_ptr<const CompiledResolution> m_resolution;
    NGIN::Containers::Vector<SharedProvider> m_chain;
  };

  using SharedConfig = std::shared_ptr<const SerializerConfig>;

  // Build the configuration for `base`: variants from every group, compiled into a
  // polymorphic provider placed first, followed by one provider per group in
  // order. With `options` null each group contributes its shared default provider.
  [[nodiscard]] NGIN_POLYJSON_API std::expected<SharedConfig, Error> CombineResolvers(Type base, const GroupList &groups,
                                                                                 const SerializerOptions *options);

} // namespace NGIN::PolyJson
