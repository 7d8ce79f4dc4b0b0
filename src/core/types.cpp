#include "station_impute/core/types.hpp"

namespace station_impute {

std::vector<std::string> FeatureSchema::feature_names() const {
    std::vector<std::string> names;
    names.reserve(feature_count());
    for (const auto& g : groups) {
        for (const auto& sub : g.subs) {
            names.push_back(g.name + "_" + sub);
        }
    }
    return names;
}

size_t FeatureSchema::feature_count() const {
    size_t n = 0;
    for (const auto& g : groups) {
        n += g.subs.size();
    }
    return n;
}

FeatureSchema FeatureSchema::default_schema() {
    FeatureSchema schema;
    schema.groups = {
        {"StationPressure", {"Instantaneous"}},
        {"SeaLevelPressure", {"Instantaneous"}},
        {"AirTemperature", {"Instantaneous", "Maximum", "Minimum"}},
        {"DewPointTemperature", {"Instantaneous"}},
        {"RelativeHumidity", {"Instantaneous"}},
        {"WindSpeed", {"TenMinutelyMaximum", "Mean"}},
        {"WindDirection", {"TenMinutelyMaximum", "Mean"}},
        {"PeakGust", {"Direction", "Maximum"}},
        {"Precipitation", {"Accumulation"}},
        {"PrecipitationDuration", {"Total"}},
        {"SunshineDuration", {"Total"}},
        {"GlobalSolarRadiation", {"Accumulation"}},
        {"Visibility", {"Instantaneous"}},
        {"UVIndex", {"Accumulation"}},
        {"TotalCloudAmount", {"Instantaneous"}},
    };
    for (int depth_cm : {0, 5, 10, 20, 30, 50, 100}) {
        schema.groups.push_back(
            {"SoilTemperatureAt" + std::to_string(depth_cm) + "cm", {"Instantaneous"}});
    }
    return schema;
}

std::vector<double> default_sentinels() {
    return {-9.5, -9.8, -9.95, -99.5, -99.7, -99.9, -99.95, -999.5, -9995.0, -9999.5};
}

} // namespace station_impute
