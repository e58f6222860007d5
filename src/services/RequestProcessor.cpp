#include "services/RequestProcessor.hpp"

#include "domain/units/LengthUnit.hpp"
#include "domain/units/TemperatureUnit.hpp"
#include "domain/units/VolumeUnit.hpp"
#include "domain/units/WeightUnit.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using namespace qm::domain;

namespace qm::services {

namespace {

class InvalidRequest : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

template <MeasurableUnit U>
U resolve_unit(const std::optional<std::string>& name, const char* field) {
    if (!name || name->empty()) {
        throw InvalidRequest(std::string("Missing ") + field);
    }
    auto unit = unit_from_string<U>(*name);
    if (!unit) {
        throw InvalidRequest("Unknown " + to_string(UnitTraits<U>::category) + " unit: " + *name);
    }
    return *unit;
}

template <MeasurableUnit U>
MeasurementResponse quantity_response(Operation operation, const Quantity<U>& result) {
    MeasurementResponse response;
    response.ok = true;
    response.operation = operation;
    response.value = result.value();
    response.unit = std::string(unit_symbol(result.unit()));
    return response;
}

std::optional<std::string_view> as_view(const std::optional<std::string>& str) {
    if (!str) return std::nullopt;
    return std::string_view(*str);
}

} // namespace

RequestProcessor::RequestProcessor(const MeasurementService& service, bool log_requests)
    : service_(service)
    , log_requests_(log_requests) {}

MeasurementResponse RequestProcessor::process(const MeasurementRequest& request) {
    ++processed_count_;
    auto response = dispatch(request);

    if (!response.ok) {
        ++failed_count_;
        std::cerr << "[request] " << to_string(request.operation) << " "
                  << to_string(request.category) << " failed: "
                  << to_string(*response.error) << ": " << response.message << std::endl;
    } else if (log_requests_) {
        std::cerr << "[request] " << to_string(request.operation) << " "
                  << to_string(request.category) << " ok" << std::endl;
    }
    return response;
}

void RequestProcessor::record_rejected() {
    ++processed_count_;
    ++failed_count_;
}

MeasurementResponse RequestProcessor::dispatch(const MeasurementRequest& request) const {
    auto op = request.operation;
    try {
        switch (request.category) {
            case UnitCategory::LENGTH: return process_typed<LengthUnit>(request);
            case UnitCategory::WEIGHT: return process_typed<WeightUnit>(request);
            case UnitCategory::VOLUME: return process_typed<VolumeUnit>(request);
            case UnitCategory::TEMPERATURE: return process_typed<TemperatureUnit>(request);
        }
        return MeasurementResponse::failure(ErrorKind::INVALID_REQUEST, "Unknown category", op);
    } catch (const InvalidRequest& e) {
        return MeasurementResponse::failure(ErrorKind::INVALID_REQUEST, e.what(), op);
    } catch (const NullArgumentError& e) {
        return MeasurementResponse::failure(ErrorKind::NULL_ARGUMENT, e.what(), op);
    } catch (const InvalidValueError& e) {
        return MeasurementResponse::failure(ErrorKind::INVALID_VALUE, e.what(), op);
    } catch (const UnsupportedOperationError& e) {
        return MeasurementResponse::failure(ErrorKind::UNSUPPORTED_OPERATION, e.what(), op);
    } catch (const DivisionByZeroError& e) {
        return MeasurementResponse::failure(ErrorKind::DIVISION_BY_ZERO, e.what(), op);
    }
}

template <MeasurableUnit U>
MeasurementResponse RequestProcessor::process_typed(const MeasurementRequest& request) const {
    auto op = request.operation;
    U unit = resolve_unit<U>(request.unit, "unit");
    auto first = service_.parse_quantity(as_view(request.value), unit);

    switch (op) {
        case Operation::COMPARE: {
            U other_unit = resolve_unit<U>(request.other_unit, "other_unit");
            auto second = service_.parse_quantity(as_view(request.other_value), other_unit);
            MeasurementResponse response;
            response.ok = true;
            response.operation = op;
            response.equal = service_.are_equal(first, second);
            return response;
        }
        case Operation::CONVERT: {
            U target = resolve_unit<U>(request.target_unit, "target_unit");
            if (!first) {
                throw InvalidValueError("Value is not a finite number: " +
                                        request.value.value_or(""));
            }
            double converted = service_.convert_value(first->value(), unit, target);
            return quantity_response(op, Quantity<U>(converted, target));
        }
        case Operation::ADD:
        case Operation::SUBTRACT: {
            U other_unit = resolve_unit<U>(request.other_unit, "other_unit");
            auto second = service_.parse_quantity(as_view(request.other_value), other_unit);
            U target = request.target_unit ? resolve_unit<U>(request.target_unit, "target_unit")
                                           : unit;
            auto result = (op == Operation::ADD)
                              ? service_.add_with_target(first, second, target)
                              : service_.subtract_with_target(first, second, target);
            return quantity_response(op, result);
        }
        case Operation::DIVIDE: {
            U other_unit = resolve_unit<U>(request.other_unit, "other_unit");
            auto second = service_.parse_quantity(as_view(request.other_value), other_unit);
            MeasurementResponse response;
            response.ok = true;
            response.operation = op;
            response.ratio = service_.divide(first, second);
            return response;
        }
    }
    throw InvalidRequest("Unknown operation");
}

} // namespace qm::services
