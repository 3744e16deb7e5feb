#include "edgexfer/edge/types.hpp"

#include <cmath>

namespace edgexfer::edge {
namespace {

constexpr double kEarthRadiusKm = 6371.0;
constexpr double kPi = 3.14159265358979323846;

double to_radians(double degrees) noexcept {
    return degrees * kPi / 180.0;
}

} // namespace

double haversine_km(const GeoPoint& a, const GeoPoint& b) noexcept {
    const double d_lat = to_radians(b.lat - a.lat);
    const double d_lng = to_radians(b.lng - a.lng);
    const double h = std::sin(d_lat / 2) * std::sin(d_lat / 2) +
                     std::cos(to_radians(a.lat)) * std::cos(to_radians(b.lat)) *
                     std::sin(d_lng / 2) * std::sin(d_lng / 2);
    const double c = 2 * std::atan2(std::sqrt(h), std::sqrt(1 - h));
    return kEarthRadiusKm * c;
}

const char* to_string(Priority priority) noexcept {
    switch (priority) {
        case Priority::Speed: return "speed";
        case Priority::Cost: return "cost";
        case Priority::Balanced: return "balanced";
    }
    return "balanced";
}

std::optional<Priority> priority_from_string(std::string_view text) noexcept {
    if (text == "speed") return Priority::Speed;
    if (text == "cost") return Priority::Cost;
    if (text == "balanced") return Priority::Balanced;
    return std::nullopt;
}

} // namespace edgexfer::edge
