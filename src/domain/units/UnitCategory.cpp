#include "domain/units/UnitCategory.hpp"

namespace qm::domain {

std::string to_string(UnitCategory category) {
    switch (category) {
        case UnitCategory::LENGTH: return "length";
        case UnitCategory::WEIGHT: return "weight";
        case UnitCategory::VOLUME: return "volume";
        case UnitCategory::TEMPERATURE: return "temperature";
    }
    return "unknown";
}

std::optional<UnitCategory> category_from_string(std::string_view str) {
    for (auto category : all_categories()) {
        if (detail::iequals(str, to_string(category))) return category;
    }
    return std::nullopt;
}

} // namespace qm::domain
