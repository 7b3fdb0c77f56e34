#pragma once

/// @file target_size.hpp
/// @brief Target size classes and creature-type markers parsed from the
///        scenario's free-form size string (e.g. "medium construct").

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "wbs/foundation/sim_result.hpp"

namespace wbs::model {

enum class SizeClass : uint8_t {
    Tiny = 0,
    Small,
    Medium,
    Large,
    Huge,
    Gargantuan
};

inline constexpr std::size_t kSizeClassCount = 6;

constexpr std::string_view sizeClassName(SizeClass size) {
    constexpr std::array<std::string_view, kSizeClassCount> names = {
        "tiny", "small", "medium", "large", "huge", "gargantuan"
    };
    auto idx = static_cast<std::size_t>(size);
    return idx < kSizeClassCount ? names[idx] : "unknown";
}

/// Parse the size class from the first word of @p sizeText,
/// case-insensitively. UnknownSizeClass when it is not one of the six.
[[nodiscard]] foundation::SimResult<SizeClass> parseSizeClass(std::string_view sizeText);

/// True when @p sizeText names a creature type that does not bleed
/// (construct, undead, elemental), anywhere in the string.
[[nodiscard]] bool hasBleedImmunityMarker(std::string_view sizeText);

/// Lower-case copy of @p text.
[[nodiscard]] std::string toLower(std::string_view text);

} // namespace wbs::model
