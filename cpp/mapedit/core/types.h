#ifndef MAPEDIT_CORE_TYPES_H
#define MAPEDIT_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Lightweight value types shared by the editor subsystem.

struct Coordinate {
    double x{0.0};
    double y{0.0};
    double z{0.0};
};

inline bool operator==(const Coordinate& a, const Coordinate& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}
inline bool operator!=(const Coordinate& a, const Coordinate& b) {
    return !(a == b);
}

struct PixelPosition {
    double x{0.0};
    double y{0.0};
};

enum class GeometryKind : std::uint8_t {
    Point = 0,
    LineString = 1,
    Polygon = 2,
    Box = 3,
    Circle = 4,
};

static constexpr std::size_t geometryKindCount = 5;

inline const char* geometryKindName(GeometryKind kind) {
    switch (kind) {
        case GeometryKind::Point: return "Point";
        case GeometryKind::LineString: return "LineString";
        case GeometryKind::Polygon: return "Polygon";
        case GeometryKind::Box: return "BBox";
        case GeometryKind::Circle: return "Circle";
    }
    return "Unknown";
}

enum class GeometryLayout : std::uint8_t {
    XY = 0,
    XYZ = 1,
};

// Point: one coordinate. LineString: the line. Polygon and Box: the outer ring, not closed.
// Circle: the center, with radius.
struct Geometry {
    GeometryKind kind{GeometryKind::Point};
    GeometryLayout layout{GeometryLayout::XY};
    std::vector<Coordinate> coordinates;
    std::vector<std::vector<Coordinate>> holes;
    double radius{0.0};
};

enum class AltitudeMode : std::uint8_t {
    ClampToGround = 0,
    RelativeToGround = 1,
    Absolute = 2,
};

struct Feature {
    std::uint32_t id{0};
    Geometry geometry;
    AltitudeMode altitudeMode{AltitudeMode::ClampToGround};
    std::optional<double> extrudedHeight;
    std::optional<bool> allowPicking;
    std::string label;
};

struct Extent {
    double minX;
    double minY;
    double minZ;
    double maxX;
    double maxY;
    double maxZ;
};

enum class EditorError : std::uint8_t {
    Ok = 0,
    UnsupportedGeometry = 1,
    InvalidModeTransition = 2,
    InvalidGeometry = 3,
    FeatureNotFound = 4,
    SessionStopped = 5,
};

#endif // MAPEDIT_CORE_TYPES_H
