#include "config/Settings.hpp"
#include "domain/units/LengthUnit.hpp"
#include "domain/units/TemperatureUnit.hpp"
#include "domain/units/VolumeUnit.hpp"
#include "domain/units/WeightUnit.hpp"
#include "infrastructure/JsonRequestCodec.hpp"
#include "services/MeasurementService.hpp"
#include "services/RequestProcessor.hpp"

#include <cstddef>
#include <iostream>
#include <string>

namespace {

template <qm::domain::MeasurableUnit U>
void print_units() {
    std::cout << qm::domain::to_string(qm::domain::UnitTraits<U>::category) << ":";
    bool first = true;
    for (auto unit : qm::domain::all_units<U>()) {
        std::cout << (first ? " " : ", ") << qm::domain::to_string(unit);
        first = false;
    }
    std::cout << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    auto settings = qm::config::Settings::from_environment();

    if (argc >= 2) {
        std::string arg = argv[1];
        if (arg == "--list-units") {
            print_units<qm::domain::LengthUnit>();
            print_units<qm::domain::WeightUnit>();
            print_units<qm::domain::VolumeUnit>();
            print_units<qm::domain::TemperatureUnit>();
            return 0;
        }
        std::cerr << "Usage: quantity_measurement [--list-units]" << std::endl;
        std::cerr << "       Reads one JSON request per line from stdin." << std::endl;
        return 1;
    }

    qm::services::MeasurementService service;
    qm::services::RequestProcessor processor(service, settings.service.log_requests);
    qm::infrastructure::JsonRequestCodec codec;

    std::cerr << "[engine] Started" << std::endl;

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        if (line.size() > static_cast<std::size_t>(settings.input.max_request_bytes)) {
            processor.record_rejected();
            auto rejection = qm::domain::MeasurementResponse::failure(
                qm::domain::ErrorKind::INVALID_REQUEST,
                "Request exceeds " + std::to_string(settings.input.max_request_bytes) + " bytes");
            std::cerr << "[request] rejected: " << rejection.message << std::endl;
            std::cout << codec.encode(rejection, nullptr, settings.output.pretty_print) << std::endl;
            continue;
        }

        auto decoded = codec.decode(line);
        qm::domain::MeasurementResponse response;
        if (decoded.request) {
            response = processor.process(*decoded.request);
        } else {
            processor.record_rejected();
            response = *decoded.rejection;
            std::cerr << "[request] rejected: " << response.message << std::endl;
        }
        std::cout << codec.encode(response, decoded.id, settings.output.pretty_print) << std::endl;
    }

    std::cerr << "[engine] Done. Processed " << processor.processed_count() << " requests ("
              << processor.failed_count() << " failed)." << std::endl;
    return 0;
}
