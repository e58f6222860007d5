#pragma once

#include "domain/units/UnitCategory.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace qm::domain {

enum class Operation { COMPARE, CONVERT, ADD, SUBTRACT, DIVIDE };

std::string to_string(Operation operation);
std::optional<Operation> operation_from_string(std::string_view str);

// Unit names and values are kept as text; they are resolved against the
// category's closed unit set when the request is processed.
struct MeasurementRequest {
    Operation operation;
    UnitCategory category;
    std::optional<std::string> value;
    std::string unit;
    std::optional<std::string> other_value;
    std::optional<std::string> other_unit;
    std::optional<std::string> target_unit;
};

enum class ErrorKind {
    PARSE_ERROR,
    INVALID_REQUEST,
    INVALID_VALUE,
    UNSUPPORTED_OPERATION,
    DIVISION_BY_ZERO,
    NULL_ARGUMENT,
};

std::string to_string(ErrorKind kind);

struct MeasurementResponse {
    bool ok = false;
    std::optional<Operation> operation;
    std::optional<bool> equal;      // compare
    std::optional<double> value;    // convert, add, subtract
    std::optional<std::string> unit;
    std::optional<double> ratio;    // divide
    std::optional<ErrorKind> error;
    std::string message;

    static MeasurementResponse failure(ErrorKind kind, std::string message,
                                       std::optional<Operation> operation = std::nullopt);
};

} // namespace qm::domain
