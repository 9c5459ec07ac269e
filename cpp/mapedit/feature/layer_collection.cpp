#include "mapedit/feature/layer_collection.h"
#include "mapedit/feature/feature_layer.h"

#include <algorithm>

bool LayerCollection::add(FeatureLayer* layer) {
    if (!layer || contains(layer)) return false;
    layers_.push_back(layer);
    added.raise(layer);
    return true;
}

bool LayerCollection::remove(FeatureLayer* layer) {
    const auto it = std::find(layers_.begin(), layers_.end(), layer);
    if (it == layers_.end()) return false;
    layers_.erase(it);
    removed.raise(layer);
    return true;
}

bool LayerCollection::contains(const FeatureLayer* layer) const {
    return std::find(layers_.begin(), layers_.end(), layer) != layers_.end();
}

int LayerCollection::maxZIndex() const {
    int maxZ = 0;
    for (const FeatureLayer* layer : layers_) {
        maxZ = std::max(maxZ, layer->zIndex());
    }
    return maxZ;
}
