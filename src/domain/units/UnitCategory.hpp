#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace qm::domain {

enum class UnitCategory { LENGTH, WEIGHT, VOLUME, TEMPERATURE };

constexpr std::array<UnitCategory, 4> all_categories() {
    return {UnitCategory::LENGTH, UnitCategory::WEIGHT, UnitCategory::VOLUME,
            UnitCategory::TEMPERATURE};
}

std::string to_string(UnitCategory category);

// Case-insensitive: "length", "Weight", "VOLUME", ...
std::optional<UnitCategory> category_from_string(std::string_view str);

namespace detail {

inline bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace detail

} // namespace qm::domain
