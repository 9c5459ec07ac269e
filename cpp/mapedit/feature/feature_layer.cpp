#include "mapedit/feature/feature_layer.h"

#include <algorithm>

FeatureLayer::FeatureLayer(std::string name, int zIndex)
    : name_(std::move(name)), zIndex_(zIndex) {}

std::uint32_t FeatureLayer::addFeature(Feature feature) {
    if (feature.id == 0) {
        while (features_.find(nextId_) != features_.end()) nextId_++;
        feature.id = nextId_++;
    } else if (features_.find(feature.id) != features_.end()) {
        return 0;
    }
    const std::uint32_t id = feature.id;
    features_.emplace(id, std::move(feature));
    order_.push_back(id);
    featureAdded.raise(id);
    return id;
}

std::uint32_t FeatureLayer::addFeature(Geometry geometry) {
    Feature feature;
    feature.geometry = std::move(geometry);
    return addFeature(std::move(feature));
}

bool FeatureLayer::removeFeature(std::uint32_t id) {
    const auto it = features_.find(id);
    if (it == features_.end()) return false;
    features_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    hidden_.erase(id);
    highlighted_.erase(id);
    featureRemoved.raise(id);
    return true;
}

void FeatureLayer::clear() {
    const std::vector<std::uint32_t> ids = order_;
    for (const std::uint32_t id : ids) {
        removeFeature(id);
    }
}

bool FeatureLayer::hasFeature(std::uint32_t id) const {
    return features_.find(id) != features_.end();
}

Feature* FeatureLayer::getFeature(std::uint32_t id) {
    const auto it = features_.find(id);
    return it == features_.end() ? nullptr : &it->second;
}

const Feature* FeatureLayer::getFeature(std::uint32_t id) const {
    const auto it = features_.find(id);
    return it == features_.end() ? nullptr : &it->second;
}

Geometry* FeatureLayer::geometry(std::uint32_t id) {
    Feature* feature = getFeature(id);
    return feature ? &feature->geometry : nullptr;
}

const Geometry* FeatureLayer::geometry(std::uint32_t id) const {
    const Feature* feature = getFeature(id);
    return feature ? &feature->geometry : nullptr;
}

bool FeatureLayer::setGeometry(std::uint32_t id, Geometry geometry) {
    Feature* feature = getFeature(id);
    if (!feature) return false;
    feature->geometry = std::move(geometry);
    geometryChanged.raise(id);
    return true;
}

void FeatureLayer::markGeometryChanged(std::uint32_t id) {
    if (!hasFeature(id)) return;
    geometryChanged.raise(id);
}

void FeatureLayer::hide(std::uint32_t id) {
    if (!hasFeature(id)) return;
    hidden_.insert(id);
}

void FeatureLayer::show(std::uint32_t id) {
    hidden_.erase(id);
}

void FeatureLayer::highlight(std::uint32_t id) {
    if (!hasFeature(id)) return;
    highlighted_.insert(id);
}

void FeatureLayer::unhighlight(std::uint32_t id) {
    highlighted_.erase(id);
}
