#include "domain/requests/MeasurementRequest.hpp"

#include <array>
#include <utility>

namespace qm::domain {

std::string to_string(Operation operation) {
    switch (operation) {
        case Operation::COMPARE: return "compare";
        case Operation::CONVERT: return "convert";
        case Operation::ADD: return "add";
        case Operation::SUBTRACT: return "subtract";
        case Operation::DIVIDE: return "divide";
    }
    return "unknown";
}

std::optional<Operation> operation_from_string(std::string_view str) {
    constexpr std::array<Operation, 5> operations = {
        Operation::COMPARE, Operation::CONVERT, Operation::ADD, Operation::SUBTRACT,
        Operation::DIVIDE};
    for (auto operation : operations) {
        if (detail::iequals(str, to_string(operation))) return operation;
    }
    return std::nullopt;
}

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PARSE_ERROR: return "parse_error";
        case ErrorKind::INVALID_REQUEST: return "invalid_request";
        case ErrorKind::INVALID_VALUE: return "invalid_value";
        case ErrorKind::UNSUPPORTED_OPERATION: return "unsupported_operation";
        case ErrorKind::DIVISION_BY_ZERO: return "division_by_zero";
        case ErrorKind::NULL_ARGUMENT: return "null_argument";
    }
    return "unknown";
}

MeasurementResponse MeasurementResponse::failure(ErrorKind kind, std::string message,
                                                 std::optional<Operation> operation) {
    MeasurementResponse response;
    response.ok = false;
    response.operation = operation;
    response.error = kind;
    response.message = std::move(message);
    return response;
}

} // namespace qm::domain
