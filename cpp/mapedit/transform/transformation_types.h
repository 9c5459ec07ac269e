#pragma once

#include <cstdint>

enum class TransformationMode : std::uint8_t {
    Translate = 0,
    Rotate = 1,
    Scale = 2,
    Extrude = 3,
};

inline const char* transformationModeName(TransformationMode mode) {
    switch (mode) {
        case TransformationMode::Translate: return "translate";
        case TransformationMode::Rotate: return "rotate";
        case TransformationMode::Scale: return "scale";
        case TransformationMode::Extrude: return "extrude";
    }
    return "unknown";
}

// Axis or plane a handler glyph stands for.
enum class AxisAndPlanes : std::uint8_t {
    None = 0,
    X = 1,
    Y = 2,
    Z = 3,
    XY = 4,
    XZ = 5,
    YZ = 6,
    XYZ = 7,
};

inline bool is1DAxis(AxisAndPlanes axis) {
    return axis == AxisAndPlanes::X || axis == AxisAndPlanes::Y || axis == AxisAndPlanes::Z;
}

inline const char* axisName(AxisAndPlanes axis) {
    switch (axis) {
        case AxisAndPlanes::None: return "none";
        case AxisAndPlanes::X: return "X";
        case AxisAndPlanes::Y: return "Y";
        case AxisAndPlanes::Z: return "Z";
        case AxisAndPlanes::XY: return "XY";
        case AxisAndPlanes::XZ: return "XZ";
        case AxisAndPlanes::YZ: return "YZ";
        case AxisAndPlanes::XYZ: return "XYZ";
    }
    return "none";
}
