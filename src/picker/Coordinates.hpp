#pragma once

#include "Types.hpp"

#include <hyprutils/math/Vector2D.hpp>
#include <string>
#include <vector>

using namespace Hyprutils::Math;

struct SMonitorGeometry {
    int         id = -1;
    std::string name;
    Vector2D    position;    // logical, in the desktop layout
    Vector2D    logicalSize;
    Vector2D    pixelSize;   // buffer pixels, already swapped for 90/270 transforms

    // device pixels per logical pixel, per axis
    Vector2D    scale() const;
    bool        contains(const Vector2D& logical) const;
    double      distanceTo(const Vector2D& logical) const;
};

class CCoordinateMapper {
  public:
    // Picks the monitor under the cursor (or the closest one when the cursor is
    // outside every output) and maps to its device pixels, clamped to the output.
    static CPickResult<SScreenPoint> toSamplerSpace(const Vector2D& cursor, const std::vector<SMonitorGeometry>& monitors);
    static SScreenPoint              toSamplerSpace(const Vector2D& cursor, const SMonitorGeometry& monitor);

    // top-left of the device pixel, in global logical coordinates
    static Vector2D                  toGlobal(const SScreenPoint& point, const std::vector<SMonitorGeometry>& monitors);
    // toGlobal floored to whole logical pixels, the position events report
    static Vector2D                  toGlobalPixel(const SScreenPoint& point, const std::vector<SMonitorGeometry>& monitors);

    static const SMonitorGeometry*   monitorFor(const Vector2D& cursor, const std::vector<SMonitorGeometry>& monitors);
    static const SMonitorGeometry*   monitorById(int id, const std::vector<SMonitorGeometry>& monitors);
};
