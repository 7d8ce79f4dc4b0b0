#include "station_impute/io/sentinel.hpp"
#include "station_impute/core/utils.hpp"

#include <algorithm>
#include <cmath>

namespace station_impute::io {

SentinelNormalizer::SentinelNormalizer(std::vector<double> sentinels)
    : sentinels_(std::move(sentinels)) {}

bool SentinelNormalizer::is_sentinel(double value) const {
    return std::find(sentinels_.begin(), sentinels_.end(), value) != sentinels_.end();
}

std::optional<double> SentinelNormalizer::normalize(double value) const {
    if (!std::isfinite(value) || is_sentinel(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> SentinelNormalizer::normalize(const nlohmann::json& raw) const {
    if (raw.is_number()) {
        return normalize(raw.get<double>());
    }
    if (raw.is_string()) {
        auto parsed = core::parse_double(raw.get<std::string>());
        if (!parsed) {
            return std::nullopt;
        }
        return normalize(*parsed);
    }
    return std::nullopt;
}

} // namespace station_impute::io
