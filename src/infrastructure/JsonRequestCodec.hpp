#pragma once

#include "domain/requests/MeasurementRequest.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace qm::infrastructure {

// Result of decoding one input line. Exactly one of request / rejection is
// set. `id` is the request's "id" member (null when absent) and is echoed
// back in the response.
struct DecodedRequest {
    std::optional<qm::domain::MeasurementRequest> request;
    std::optional<qm::domain::MeasurementResponse> rejection;
    nlohmann::json id;
};

class JsonRequestCodec {
public:
    // Never throws for malformed input: syntax errors and out-of-range numbers
    // become a parse_error rejection, missing or ill-typed fields an
    // invalid_request rejection.
    DecodedRequest decode(const std::string& json_str) const;

    nlohmann::json to_json(const qm::domain::MeasurementResponse& response,
                           const nlohmann::json& id = nullptr) const;

    std::string encode(const qm::domain::MeasurementResponse& response,
                       const nlohmann::json& id = nullptr,
                       bool pretty = false) const;
};

} // namespace qm::infrastructure
