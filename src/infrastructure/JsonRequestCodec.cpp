#include "infrastructure/JsonRequestCodec.hpp"

#include <stdexcept>

using json = nlohmann::json;
using namespace qm::domain;

namespace qm::infrastructure {

namespace {

class MalformedRequest : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string required_string(const json& obj, const char* key) {
    if (!obj.contains(key)) {
        throw MalformedRequest(std::string("Missing field: ") + key);
    }
    if (!obj[key].is_string()) {
        throw MalformedRequest(std::string("Field must be a string: ") + key);
    }
    return obj[key].get<std::string>();
}

std::optional<std::string> optional_string(const json& obj, const char* key) {
    if (!obj.contains(key) || obj[key].is_null()) return std::nullopt;
    if (!obj[key].is_string()) {
        throw MalformedRequest(std::string("Field must be a string: ") + key);
    }
    return obj[key].get<std::string>();
}

// Values may be sent as strings ("2.5") or JSON numbers (2.5); both are
// handed on as text so they share the service's parse path.
std::optional<std::string> optional_value(const json& obj, const char* key) {
    if (!obj.contains(key) || obj[key].is_null()) return std::nullopt;
    const auto& field = obj[key];
    if (field.is_string()) return field.get<std::string>();
    if (field.is_number()) return field.dump();
    throw MalformedRequest(std::string("Field must be a string or number: ") + key);
}

MeasurementRequest parse_request(const json& obj) {
    auto op_name = required_string(obj, "op");
    auto operation = operation_from_string(op_name);
    if (!operation) {
        throw MalformedRequest("Unknown op: " + op_name);
    }

    auto category_name = required_string(obj, "category");
    auto category = category_from_string(category_name);
    if (!category) {
        throw MalformedRequest("Unknown category: " + category_name);
    }

    return MeasurementRequest{
        *operation,
        *category,
        optional_value(obj, "value"),
        required_string(obj, "unit"),
        optional_value(obj, "other_value"),
        optional_string(obj, "other_unit"),
        optional_string(obj, "target_unit"),
    };
}

} // anonymous namespace

DecodedRequest JsonRequestCodec::decode(const std::string& json_str) const {
    DecodedRequest decoded;

    json obj;
    try {
        obj = json::parse(json_str);
    } catch (const json::exception& e) {
        decoded.rejection = MeasurementResponse::failure(ErrorKind::PARSE_ERROR, e.what());
        return decoded;
    }

    if (!obj.is_object()) {
        decoded.rejection = MeasurementResponse::failure(
            ErrorKind::INVALID_REQUEST, "Request must be a JSON object");
        return decoded;
    }

    decoded.id = obj.value("id", json(nullptr));

    try {
        decoded.request = parse_request(obj);
    } catch (const MalformedRequest& e) {
        auto operation = obj.contains("op") && obj["op"].is_string()
                             ? operation_from_string(obj["op"].get<std::string>())
                             : std::nullopt;
        decoded.rejection =
            MeasurementResponse::failure(ErrorKind::INVALID_REQUEST, e.what(), operation);
    }
    return decoded;
}

json JsonRequestCodec::to_json(const MeasurementResponse& response, const json& id) const {
    json out;
    if (!id.is_null()) out["id"] = id;
    out["ok"] = response.ok;
    if (response.operation) out["op"] = to_string(*response.operation);

    if (response.ok) {
        if (response.equal) out["equal"] = *response.equal;
        if (response.value) out["value"] = *response.value;
        if (response.unit) out["unit"] = *response.unit;
        if (response.ratio) out["ratio"] = *response.ratio;
    } else {
        out["error"] = response.error ? to_string(*response.error) : "unknown";
        out["message"] = response.message;
    }
    return out;
}

std::string JsonRequestCodec::encode(const MeasurementResponse& response, const json& id,
                                     bool pretty) const {
    return to_json(response, id).dump(pretty ? 2 : -1);
}

} // namespace qm::infrastructure
