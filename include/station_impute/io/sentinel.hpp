#pragma once

#include "station_impute/core/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <vector>

namespace station_impute::io {

// Maps placeholder codes to "missing". Matching is exact floating-point
// equality against the configured list; there is no tolerance.
class SentinelNormalizer {
public:
    explicit SentinelNormalizer(std::vector<double> sentinels = default_sentinels());

    bool is_sentinel(double value) const;

    std::optional<double> normalize(double value) const;

    // JSON numbers and numeric strings are normalized like doubles; null,
    // booleans, containers and non-numeric strings are missing.
    std::optional<double> normalize(const nlohmann::json& raw) const;

    const std::vector<double>& sentinels() const { return sentinels_; }

private:
    std::vector<double> sentinels_;
};

} // namespace station_impute::io
