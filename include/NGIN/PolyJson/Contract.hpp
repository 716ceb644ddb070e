// Contract.hpp
// Per-type encoding contracts and the provider interface combined into a chain
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/PolyJson/Options.hpp>

namespace NGIN::PolyJson
{
  class CompiledResolution;

  enum class ContractKind : NGIN::UInt8
  {
    // Plain object: declared members only.
    Object = 0,
    // Discriminator-tagged object resolved through a CompiledResolution.
    Polymorphic = 1,
  };

  struct MemberPolicy
  {
    bool writeNullMembers{true};
    bool allowUnknownMembers{true};
  };

  [[nodiscard]] inline MemberPolicy PolicyFrom(const SerializerOptions &options) noexcept
  {
    return MemberPolicy{options.writeNullMembers, options.allowUnknownMembers};
  }

  struct TypeContract
  {
    ContractKind kind{ContractKind::Object};
    NGIN::UInt32 typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt64 typeId{0};
    MemberPolicy policy{};
    // Set for Polymorphic contracts; owned by the provider.
    const CompiledResolution *resolution{nullptr};
  };

  // Answers "how is this type encoded?" for the types it knows; null otherwise.
  class ContractProvider
  {
  public:
    virtual ~ContractProvider() = default;
    [[nodiscard]] virtual const TypeContract *FindContract(NGIN::UInt64 typeId) const noexcept = 0;
  };

} // namespace NGIN::PolyJson
