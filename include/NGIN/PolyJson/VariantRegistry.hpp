// VariantRegistry.hpp
// Enumerates discriminator-tagged variants of a base type across type groups
#pragma once

#include <NGIN/Containers/Vector.hpp>

#include <NGIN/PolyJson/Discriminator.hpp>
#include <NGIN/PolyJson/Registry.hpp>
#include <NGIN/PolyJson/TypeGroup.hpp>

#include <expected>
#include <optional>

namespace NGIN::PolyJson
{

  struct VariantEntry
  {
    Type type{};
    Discriminator discriminator{};
  };

  // First discriminator declared on `type`, if any. A discriminator attribute that
  // is neither a string nor an integer in 32-bit range is a Configuration error.
  [[nodiscard]] NGIN_POLYJSON_API std::expected<std::optional<Discriminator>, Error> ReadDiscriminator(Type type);

  // Declared types of every group that are assignable to `base` and carry a
  // discriminator, ordered by group then declaration. Duplicates are kept; the
  // resolution compiler decides what they mean.
  [[nodiscard]] NGIN_POLYJSON_API std::expected<NGIN::Containers::Vector<VariantEntry>, Error> ResolveVariants(Type base, const GroupList &groups);

} // namespace NGIN::PolyJson
