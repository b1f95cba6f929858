#pragma once

#include <string_view>

#include <NGIN/Attributes/Export.hpp>
#include <NGIN/Attributes/Types.hpp>
#include <NGIN/Attributes/Log.hpp>
#include <NGIN/Attributes/Capabilities.hpp>
#include <NGIN/Attributes/MarkerMap.hpp>
#include <NGIN/Attributes/MarkerType.hpp>
#include <NGIN/Attributes/Instantiator.hpp>
#include <NGIN/Attributes/Source.hpp>
#include <NGIN/Attributes/Registry.hpp>
#include <NGIN/Attributes/Analyzer.hpp>
#include <NGIN/Attributes/MemoryCacheAnalyzer.hpp>

namespace NGIN::Attributes
{

    // For quick sanity checks / examples.
    [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "NGIN.Attributes"; }

} // namespace NGIN::Attributes
