#pragma once

#include "mapedit/core/types.h"
#include <cstdint>

class MapView;
class FeatureLayer;

enum class EventType : std::uint32_t {
    None = 0,
    Click = 1 << 0,
    DblClick = 1 << 1,
    DragStart = 1 << 2,
    Drag = 1 << 3,
    DragEnd = 1 << 4,
    Move = 1 << 5,
    DragEvents = (1 << 2) | (1 << 3) | (1 << 4),
    ClickMove = (1 << 0) | (1 << 5),
    All = 0x3F,
};

enum class ModificationKey : std::uint32_t {
    None = 1 << 0,
    Alt = 1 << 1,
    Ctrl = 1 << 2,
    Shift = 1 << 3,
    All = 0x0F,
};

enum class PointerKey : std::uint32_t {
    Left = 1 << 0,
    Right = 1 << 1,
    Middle = 1 << 2,
    All = 0x07,
};

inline EventType operator|(EventType a, EventType b) {
    return static_cast<EventType>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}
inline ModificationKey operator|(ModificationKey a, ModificationKey b) {
    return static_cast<ModificationKey>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}
inline PointerKey operator|(PointerKey a, PointerKey b) {
    return static_cast<PointerKey>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}

inline bool hasFlag(EventType mask, EventType flag) {
    return (static_cast<std::uint32_t>(mask) & static_cast<std::uint32_t>(flag)) != 0;
}
inline bool hasFlag(ModificationKey mask, ModificationKey flag) {
    return (static_cast<std::uint32_t>(mask) & static_cast<std::uint32_t>(flag)) != 0;
}
inline bool hasFlag(PointerKey mask, PointerKey flag) {
    return (static_cast<std::uint32_t>(mask) & static_cast<std::uint32_t>(flag)) != 0;
}

// A pointer event after hit testing by the host view. `featureLayer` and `featureId`
// describe the picked feature; featureId == 0 means nothing was picked.
struct InteractionEvent {
    EventType type{EventType::None};
    ModificationKey key{ModificationKey::None};
    PointerKey pointer{PointerKey::Left};
    MapView* map{nullptr};
    Coordinate position{};
    Coordinate positionOrPixel{};
    PixelPosition windowPosition{};
    FeatureLayer* featureLayer{nullptr};
    std::uint32_t featureId{0};
    bool exactPosition{false};
    bool stopPropagation{false};
    // Set by layer snapping, which keeps the pointer position it replaced.
    bool alreadySnapped{false};
    Coordinate unsnappedPositionOrPixel{};
};

inline bool hasPickedFeature(const InteractionEvent& event) {
    return event.featureLayer != nullptr && event.featureId != 0;
}
