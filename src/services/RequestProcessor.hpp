#pragma once

#include "domain/requests/MeasurementRequest.hpp"
#include "domain/units/MeasurableUnit.hpp"
#include "services/MeasurementService.hpp"

#include <cstdint>

namespace qm::services {

// Resolves the untyped request against its category's unit set and runs it
// through MeasurementService. Domain errors become failed responses.
class RequestProcessor {
public:
    explicit RequestProcessor(const MeasurementService& service, bool log_requests = false);

    qm::domain::MeasurementResponse process(const qm::domain::MeasurementRequest& request);

    // Records a request rejected before processing (e.g. undecodable input).
    void record_rejected();

    uint64_t processed_count() const noexcept { return processed_count_; }
    uint64_t failed_count() const noexcept { return failed_count_; }

private:
    qm::domain::MeasurementResponse dispatch(const qm::domain::MeasurementRequest& request) const;

    template <qm::domain::MeasurableUnit U>
    qm::domain::MeasurementResponse process_typed(
        const qm::domain::MeasurementRequest& request) const;

    const MeasurementService& service_;
    bool log_requests_;
    uint64_t processed_count_{0};
    uint64_t failed_count_{0};
};

} // namespace qm::services
