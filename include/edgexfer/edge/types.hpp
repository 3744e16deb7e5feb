#pragma once

#include "edgexfer/core/clock.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace edgexfer::edge {

struct GeoPoint {
    double lat = 0.0;
    double lng = 0.0;
};

/**
 * @brief Great-circle distance in kilometres (haversine, mean Earth radius)
 */
double haversine_km(const GeoPoint& a, const GeoPoint& b) noexcept;

/**
 * @brief A registered transfer endpoint
 *
 * Identity fields never change after registration; only `active` is toggled
 * by the operator.
 */
struct EdgeLocation {
    std::string id;
    std::string url;
    std::string city;
    std::string country;
    std::string provider;
    GeoPoint location;
    bool active = true;
};

/**
 * @brief Time-stamped performance sample reported by the metrics collector
 */
struct EdgeMetric {
    std::string edge_id;
    core::TimePoint timestamp{};
    double latency_ms = 0.0;
    double load_percent = 0.0;
    double bandwidth_mbps = 0.0;
    std::uint32_t active_uploads = 0;
    double error_rate = 0.0;  ///< Percent of failed transfers
};

enum class Priority {
    Speed,
    Cost,
    Balanced
};

const char* to_string(Priority priority) noexcept;
std::optional<Priority> priority_from_string(std::string_view text) noexcept;

} // namespace edgexfer::edge
