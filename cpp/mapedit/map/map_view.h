#pragma once

#include "mapedit/core/types.h"
#include "mapedit/core/signal.h"
#include <cstdint>
#include <optional>

enum class MapKind : std::uint8_t {
    Planar = 0,
    Globe3D = 1,
    Oblique = 2,
};

struct Plane {
    Coordinate origin;
    Coordinate normal{0.0, 0.0, 1.0};
};

// A rendering backend as seen by the editor. Picking and projection stay in the backend;
// the editor only asks for resolutions, terrain heights and plane intersections.
class MapView {
public:
    explicit MapView(MapKind kind) : kind_(kind) {}
    virtual ~MapView() = default;

    MapView(const MapView&) = delete;
    MapView& operator=(const MapView&) = delete;

    MapKind kind() const noexcept { return kind_; }
    bool is3D() const noexcept { return kind_ == MapKind::Globe3D; }
    bool isOblique() const noexcept { return kind_ == MapKind::Oblique; }

    // Ground units per screen pixel at the coordinate.
    virtual double resolutionAt(const Coordinate& coordinate) const = 0;

    virtual std::optional<double> sampleTerrainHeight(const Coordinate& coordinate) const {
        (void)coordinate;
        return std::nullopt;
    }

    // Intersects the view ray through `pixel` with `plane`. Returns false if the ray misses
    // or the backend has no 3D scene.
    virtual bool pickOnPlane(const Plane& plane, const PixelPosition& pixel, Coordinate& out) const {
        (void)plane;
        (void)pixel;
        (void)out;
        return false;
    }

    // Vertical plane through origin facing the camera.
    virtual Plane verticalPlaneAt(const Coordinate& origin) const {
        return {origin, {0.0, 1.0, 0.0}};
    }

    // Oblique views switch images while panning unless disabled.
    void setSwitchEnabled(bool enabled) { switchEnabled_ = enabled; }
    bool switchEnabled() const noexcept { return switchEnabled_; }

    // Camera navigation by pointer drags; disabled while a handle is dragged.
    void setNavigationEnabled(bool enabled) { navigationEnabled_ = enabled; }
    bool navigationEnabled() const noexcept { return navigationEnabled_; }

    Signal<> imageChanged;
    Signal<> postRender;

private:
    MapKind kind_;
    bool switchEnabled_ = true;
    bool navigationEnabled_ = true;
};
