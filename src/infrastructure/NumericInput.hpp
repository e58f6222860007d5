#pragma once

#include <optional>
#include <string_view>

namespace qm::infrastructure {

// Parses a decimal number, ignoring surrounding whitespace. Returns
// std::nullopt for blank input, non-numeric text, trailing characters and
// values outside the range of double.
std::optional<double> try_parse_double(std::string_view input);

} // namespace qm::infrastructure
