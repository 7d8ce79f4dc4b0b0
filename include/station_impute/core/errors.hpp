#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace station_impute {

class StationImputeError : public std::runtime_error {
public:
    explicit StationImputeError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public StationImputeError {
public:
    explicit ConfigError(const std::string& message)
        : StationImputeError("Config error: " + message) {}
};

class ValidationError : public StationImputeError {
public:
    explicit ValidationError(const std::string& message)
        : StationImputeError("Validation error: " + message) {}
};

class IOError : public StationImputeError {
public:
    explicit IOError(const std::string& message)
        : StationImputeError("I/O error: " + message) {}
};

// Raw observation document that matches none of the known shapes or cannot
// be parsed. Recovered by the flattener (file skipped).
class MalformedRecordError : public IOError {
public:
    explicit MalformedRecordError(const std::string& message)
        : IOError("Malformed record: " + message) {}
};

class MissingStationMetadataError : public ValidationError {
public:
    explicit MissingStationMetadataError(const std::vector<std::string>& stations)
        : ValidationError(build_message(stations)), stations_(stations) {}

    const std::vector<std::string>& stations() const { return stations_; }

private:
    static std::string build_message(const std::vector<std::string>& stations) {
        std::string msg = "no usable metadata for " + std::to_string(stations.size()) +
                          " valid station(s):";
        for (const auto& s : stations) {
            msg += " " + s;
        }
        return msg;
    }

    std::vector<std::string> stations_;
};

class PipelineError : public StationImputeError {
public:
    explicit PipelineError(const std::string& message)
        : StationImputeError("Pipeline error: " + message) {}
};

} // namespace station_impute
