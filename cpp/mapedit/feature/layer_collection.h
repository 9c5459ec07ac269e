#pragma once

#include "mapedit/core/signal.h"
#include <vector>

class FeatureLayer;

// Non-owning list of the layers shown by the map views.
class LayerCollection {
public:
    LayerCollection() = default;
    LayerCollection(const LayerCollection&) = delete;
    LayerCollection& operator=(const LayerCollection&) = delete;

    bool add(FeatureLayer* layer);
    bool remove(FeatureLayer* layer);
    bool contains(const FeatureLayer* layer) const;
    const std::vector<FeatureLayer*>& layers() const { return layers_; }
    std::size_t size() const { return layers_.size(); }

    // Highest z-index in the collection, 0 when empty.
    int maxZIndex() const;

    Signal<FeatureLayer*> added;
    Signal<FeatureLayer*> removed;

private:
    std::vector<FeatureLayer*> layers_;
};
