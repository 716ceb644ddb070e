// Resolution.hpp
// Compiled base-type resolution: discriminator <-> concrete type lookups
#pragma once

#include <NGIN/Containers/Vector.hpp>

#include <NGIN/PolyJson/Contract.hpp>
#include <NGIN/PolyJson/Discriminator.hpp>
#include <NGIN/PolyJson/Registry.hpp>
#include <NGIN/PolyJson/VariantRegistry.hpp>

#include <expected>
#include <memory>
#include <typeinfo>
#include <utility>

namespace NGIN::PolyJson
{

  struct ResolvedVariant
  {
    NGIN::UInt32 typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt64 typeId{0};
    const std::type_info *rtti{nullptr};
    Discriminator discriminator{};
    // Concrete type up to the base.
    detail::BasePath path{};
  };

  class NGIN_POLYJSON_API CompiledResolution
  {
  public:
    CompiledResolution(Type base, NGIN::Containers::Vector<ResolvedVariant> variants) noexcept
        : m_base(base), m_variants(std::move(variants))
    {
    }

    [[nodiscard]] Type BaseType() const noexcept { return m_base; }
    [[nodiscard]] NGIN::UIntSize VariantCount() const noexcept { return m_variants.Size(); }
    [[nodiscard]] const ResolvedVariant &VariantAt(NGIN::UIntSize i) const noexcept { return m_variants[i]; }

    [[nodiscard]] const ResolvedVariant *FindByDynamicType(const std::type_info &dynamicType) const noexcept;
    // `value` is the raw "$type" member.
    [[nodiscard]] const ResolvedVariant *FindByDiscriminator(const Json &value) const noexcept;

  private:
    Type m_base{};
    NGIN::Containers::Vector<ResolvedVariant> m_variants;
  };

  // Fails with Configuration when two different types share a discriminator or a
  // variant cannot be constructed. Repeated identical entries collapse to one.
  [[nodiscard]] NGIN_POLYJSON_API std::expected<std::shared_ptr<const CompiledResolution>, Error>
  CompileResolution(Type base, const NGIN::Containers::Vector<VariantEntry> &entries);

  // Answers the base type with a Polymorphic contract and nothing else.
  class NGIN_POLYJSON_API PolymorphicContractProvider final : public ContractProvider
  {
  public:
    PolymorphicContractProvider(std::shared_ptr<const CompiledResolution> resolution, MemberPolicy policy);

    [[nodiscard]] const TypeContract *FindContract(NGIN::UInt64 typeId) const noexcept override;
    [[nodiscard]] const CompiledResolution &Resolution() const noexcept { return *m_resolution; }

  private:
    std::shared_ptr<const CompiledResolution> m_resolution;
    TypeContract m_contract{};
  };

} // namespace NGIN::PolyJson
