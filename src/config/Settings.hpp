#pragma once

#include <string>

namespace qm::config {

struct ServiceSettings {
    bool log_requests = true;
};

struct InputSettings {
    int max_request_bytes = 4096;
};

struct OutputSettings {
    bool pretty_print = false;
};

struct Settings {
    ServiceSettings service;
    InputSettings input;
    OutputSettings output;

    static Settings from_environment();
    static Settings development();
    static Settings production();
};

} // namespace qm::config
