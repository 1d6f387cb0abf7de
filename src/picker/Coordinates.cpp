#include "Coordinates.hpp"
#include "../debug/Log.hpp"

#include <algorithm>
#include <cmath>

// wl_fixed carries 8 fractional bits, anything below this is float noise
constexpr double FP_EPSILON = 1e-6;

Vector2D SMonitorGeometry::scale() const {
    if (logicalSize.x <= 0 || logicalSize.y <= 0)
        return {1, 1};

    return pixelSize / logicalSize;
}

bool SMonitorGeometry::contains(const Vector2D& logical) const {
    return logical.x >= position.x && logical.y >= position.y && logical.x < position.x + logicalSize.x && logical.y < position.y + logicalSize.y;
}

double SMonitorGeometry::distanceTo(const Vector2D& logical) const {
    const Vector2D CLOSEST = {std::clamp(logical.x, position.x, position.x + std::max(0.0, logicalSize.x - 1)),
                              std::clamp(logical.y, position.y, position.y + std::max(0.0, logicalSize.y - 1))};
    return CLOSEST.distance(logical);
}

const SMonitorGeometry* CCoordinateMapper::monitorFor(const Vector2D& cursor, const std::vector<SMonitorGeometry>& monitors) {
    if (monitors.empty())
        return nullptr;

    for (auto& m : monitors) {
        if (m.contains(cursor))
            return &m;
    }

    const SMonitorGeometry* closest  = &monitors.front();
    double                  distance = closest->distanceTo(cursor);
    for (auto& m : monitors) {
        const double D = m.distanceTo(cursor);
        if (D < distance) {
            distance = D;
            closest  = &m;
        }
    }

    return closest;
}

const SMonitorGeometry* CCoordinateMapper::monitorById(int id, const std::vector<SMonitorGeometry>& monitors) {
    for (auto& m : monitors) {
        if (m.id == id)
            return &m;
    }
    return nullptr;
}

SScreenPoint CCoordinateMapper::toSamplerSpace(const Vector2D& cursor, const SMonitorGeometry& monitor) {
    const auto     SCALE = monitor.scale();
    const Vector2D LOCAL = (cursor - monitor.position) * SCALE;

    const int      MAXX = std::max(0, (int)std::round(monitor.pixelSize.x) - 1);
    const int      MAXY = std::max(0, (int)std::round(monitor.pixelSize.y) - 1);

    const int      X = (int)std::floor(LOCAL.x + FP_EPSILON);
    const int      Y = (int)std::floor(LOCAL.y + FP_EPSILON);

    SScreenPoint   point = {.monitor = monitor.id, .x = std::clamp(X, 0, MAXX), .y = std::clamp(Y, 0, MAXY)};

    if (point.x != X || point.y != Y)
        Debug::log(TRACE, "%s: cursor %.2f, %.2f maps to %i, %i outside %s, clamped to %i, %i", errorKindName(PICK_ERROR_MAPPING_OUT_OF_BOUNDS), cursor.x, cursor.y, X, Y,
                   monitor.name.c_str(), point.x, point.y);

    return point;
}

CPickResult<SScreenPoint> CCoordinateMapper::toSamplerSpace(const Vector2D& cursor, const std::vector<SMonitorGeometry>& monitors) {
    const auto PMONITOR = monitorFor(cursor, monitors);

    if (!PMONITOR)
        return pickError(PICK_ERROR_NO_MONITORS, "no monitors to map the cursor onto");

    return toSamplerSpace(cursor, *PMONITOR);
}

Vector2D CCoordinateMapper::toGlobal(const SScreenPoint& point, const std::vector<SMonitorGeometry>& monitors) {
    const auto PMONITOR = monitorById(point.monitor, monitors);

    if (!PMONITOR)
        return Vector2D{(double)point.x, (double)point.y};

    return PMONITOR->position + Vector2D{(double)point.x, (double)point.y} / PMONITOR->scale();
}

Vector2D CCoordinateMapper::toGlobalPixel(const SScreenPoint& point, const std::vector<SMonitorGeometry>& monitors) {
    return toGlobal(point, monitors).floor();
}
