#include "infrastructure/NumericInput.hpp"

#include <cctype>
#include <stdexcept>
#include <string>

namespace qm::infrastructure {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view str) {
    while (!str.empty() && is_space(str.front())) str.remove_prefix(1);
    while (!str.empty() && is_space(str.back())) str.remove_suffix(1);
    return str;
}

} // namespace

std::optional<double> try_parse_double(std::string_view input) {
    auto text = trim(input);
    if (text.empty()) return std::nullopt;

    std::string str(text);
    std::size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(str, &consumed);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    if (consumed != str.size()) return std::nullopt;
    return value;
}

} // namespace qm::infrastructure
