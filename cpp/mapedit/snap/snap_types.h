#pragma once

#include "mapedit/core/types.h"
#include <cstdint>

enum class SnapType : std::uint8_t {
    None       = 0,
    Orthogonal = 1 << 0,
    Parallel   = 1 << 1,
    Vertex     = 1 << 2,
    Edge       = 1 << 3,
    All        = 0x0F,
};

inline SnapType operator|(SnapType a, SnapType b) {
    return static_cast<SnapType>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}
inline bool hasFlag(SnapType flags, SnapType flag) {
    return (static_cast<std::uint8_t>(flags) & static_cast<std::uint8_t>(flag)) != 0;
}

// Correction proposed for a candidate coordinate. For orthogonal and parallel results
// `orthogonalIndex` is the neighbouring vertex the reference segment ends at and
// `parallelIndex` the index of the matched bearing.
struct SnapResult {
    SnapType type{SnapType::None};
    Coordinate snapped{};
    int orthogonalIndex = -1;
    int parallelIndex = -1;
};
