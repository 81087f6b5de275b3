#include "core/types/ScanConfig.hpp"

namespace eyes::core {

void ScanConfig::validate() const {
    if (targetAddress.empty()) {
        throw ConfigError("target address is required");
    }
    if (ports.empty()) {
        throw ConfigError("no ports to scan");
    }
    if (*ports.begin() < MinPort) {
        throw ConfigError("port 0 cannot be scanned");
    }
    if (concurrency < 1) {
        throw ConfigError("concurrency must be a positive integer");
    }
    if (timeout.count() < 1) {
        throw ConfigError("timeout must be at least one second");
    }
}

OutputFormat ScanConfig::formatFromString(const std::string& str) {
    if (str == "text")
        return OutputFormat::Text;
    if (str == "json")
        return OutputFormat::Json;
    throw ConfigError("unknown output format '" + str + "' (expected text or json)");
}

} // namespace eyes::core
