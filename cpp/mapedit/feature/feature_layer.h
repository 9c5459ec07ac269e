#pragma once

#include "mapedit/core/types.h"
#include "mapedit/core/signal.h"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// In-memory feature store with per-id visibility and highlight state. Geometry pointers
// handed out by geometry() stay valid until the feature is removed.
class FeatureLayer {
public:
    explicit FeatureLayer(std::string name, int zIndex = 0);

    FeatureLayer(const FeatureLayer&) = delete;
    FeatureLayer& operator=(const FeatureLayer&) = delete;

    const std::string& name() const { return name_; }

    // Assigns an id when feature.id is 0. Returns 0 if the id is already taken.
    std::uint32_t addFeature(Feature feature);
    std::uint32_t addFeature(Geometry geometry);
    bool removeFeature(std::uint32_t id);
    void clear();

    bool hasFeature(std::uint32_t id) const;
    Feature* getFeature(std::uint32_t id);
    const Feature* getFeature(std::uint32_t id) const;
    Geometry* geometry(std::uint32_t id);
    const Geometry* geometry(std::uint32_t id) const;
    const std::vector<std::uint32_t>& featureIds() const { return order_; }
    std::size_t featureCount() const { return order_.size(); }

    bool setGeometry(std::uint32_t id, Geometry geometry);
    // Notifies listeners after the geometry was mutated in place.
    void markGeometryChanged(std::uint32_t id);

    void hide(std::uint32_t id);
    void show(std::uint32_t id);
    bool isHidden(std::uint32_t id) const { return hidden_.find(id) != hidden_.end(); }

    void highlight(std::uint32_t id);
    void unhighlight(std::uint32_t id);
    bool isHighlighted(std::uint32_t id) const { return highlighted_.find(id) != highlighted_.end(); }
    const std::unordered_set<std::uint32_t>& highlightedIds() const { return highlighted_; }

    int zIndex() const noexcept { return zIndex_; }
    void setZIndex(int zIndex) noexcept { zIndex_ = zIndex; }
    // Volatile layers hold session state only and are never persisted.
    bool isVolatile() const noexcept { return volatile_; }
    void setVolatile(bool value) noexcept { volatile_ = value; }

    Signal<std::uint32_t> featureAdded;
    Signal<std::uint32_t> featureRemoved;
    Signal<std::uint32_t> geometryChanged;

private:
    std::string name_;
    int zIndex_;
    bool volatile_ = false;
    std::uint32_t nextId_ = 1;
    std::unordered_map<std::uint32_t, Feature> features_;
    std::vector<std::uint32_t> order_;
    std::unordered_set<std::uint32_t> hidden_;
    std::unordered_set<std::uint32_t> highlighted_;
};
