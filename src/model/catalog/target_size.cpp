/// @file target_size.cpp
/// @brief Size class parsing and bleed immunity markers.

#include "wbs/model/target_size.hpp"

#include <algorithm>
#include <cctype>

namespace wbs::model {

using foundation::ErrorCode;
using foundation::SimError;
using foundation::SimResult;

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

SimResult<SizeClass> parseSizeClass(std::string_view sizeText) {
    auto lower = toLower(sizeText);
    auto begin = lower.find_first_not_of(" \t");
    auto end = begin == std::string::npos ? std::string::npos : lower.find_first_of(" \t", begin);
    auto word = begin == std::string::npos ? std::string() : lower.substr(begin, end - begin);

    for (std::size_t i = 0; i < kSizeClassCount; ++i) {
        auto size = static_cast<SizeClass>(i);
        if (word == sizeClassName(size)) {
            return SimResult<SizeClass>::ok(size);
        }
    }
    return SimResult<SizeClass>::err(
        SimError(ErrorCode::UnknownSizeClass,
                 "unknown target size class '" + std::string(sizeText) + "'",
                 std::string(sizeText)));
}

bool hasBleedImmunityMarker(std::string_view sizeText) {
    auto lower = toLower(sizeText);
    constexpr std::array<std::string_view, 3> markers = {"construct", "undead", "elemental"};
    return std::any_of(markers.begin(), markers.end(), [&](std::string_view marker) {
        return lower.find(marker) != std::string::npos;
    });
}

} // namespace wbs::model
