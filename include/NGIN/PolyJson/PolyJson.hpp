// PolyJson.hpp
// Umbrella header
#pragma once

#include <string_view>

#include <NGIN/PolyJson/Export.hpp>
#include <NGIN/PolyJson/Types.hpp>
#include <NGIN/PolyJson/Registry.hpp>
#include <NGIN/PolyJson/TypeBuilder.hpp>
#include <NGIN/PolyJson/TypeGroup.hpp>
#include <NGIN/PolyJson/VariantRegistry.hpp>
#include <NGIN/PolyJson/Resolution.hpp>
#include <NGIN/PolyJson/Config.hpp>
#include <NGIN/PolyJson/ConfigurationCache.hpp>
#include <NGIN/PolyJson/Serializer.hpp>
#include <NGIN/PolyJson/Services.hpp>

namespace NGIN::PolyJson
{

  // For quick sanity checks / examples.
  [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "NGIN.PolyJson"; }

} // namespace NGIN::PolyJson
