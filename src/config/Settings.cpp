#include "config/Settings.hpp"

#include <cstdlib>
#include <stdexcept>

namespace qm::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

bool env_bool_or(const char* name, bool fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    std::string str(val);
    if (str == "true" || str == "1" || str == "yes") return true;
    if (str == "false" || str == "0" || str == "no") return false;
    return fallback;
}

} // namespace

Settings Settings::from_environment() {
    std::string env = env_or("QM_ENV", "development");
    Settings s = (env == "production") ? production() : development();
    s.service.log_requests = env_bool_or("QM_LOG_REQUESTS", s.service.log_requests);
    int max_bytes = env_int_or("QM_MAX_REQUEST_BYTES", s.input.max_request_bytes);
    if (max_bytes > 0) s.input.max_request_bytes = max_bytes;
    s.output.pretty_print = env_bool_or("QM_PRETTY_PRINT", s.output.pretty_print);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.service.log_requests = true;
    s.input.max_request_bytes = 4096;
    return s;
}

Settings Settings::production() {
    Settings s;
    s.service.log_requests = false;
    s.input.max_request_bytes = 1024;
    return s;
}

} // namespace qm::config
