#include "mapedit/select/select_features_session.h"
#include "mapedit/core/logging.h"
#include "mapedit/feature/feature_layer.h"
#include "mapedit/map/map_context.h"
#include "mapedit/map/map_view.h"
#include "mapedit/select/select_feature_interaction.h"

#include <algorithm>

SelectFeaturesSession::SelectFeaturesSession(
    MapContext& context,
    FeatureLayer& layer,
    SelectFeaturesSessionOptions options)
    : EditorSession(SessionKind::Select),
      context_(context),
      layer_(layer),
      mode_(options.mode),
      chainSetup_(setupInteractionChain(context.dispatcher(), options.interactionId)),
      selection_(layer) {
    selectInteraction_ = std::make_shared<SelectFeatureInteraction>(layer_);
    chainSetup_.chain->addInteraction(selectInteraction_);

    listeners_.push(selectInteraction_->clicked.connect(
        [this](std::uint32_t id, ModificationKey key) { onClicked(id, key); }));
    listeners_.push(chainSetup_.removed->connect([this]() { stop(); }));
    listeners_.push(context_.mapActivated.connect([this](MapView* map) { setupActiveMap(map); }));
    listeners_.push(layer_.featureRemoved.connect([this](std::uint32_t) {
        if (selection_.prune()) selectionChanged();
    }));
    listeners_.push([this]() {
        if (imageChangedListener_) imageChangedListener_();
        imageChangedListener_ = nullptr;
    });

    setupActiveMap(context_.activeMap());
}

SelectFeaturesSession::~SelectFeaturesSession() {
    stop();
}

void SelectFeaturesSession::setupActiveMap(MapView* map) {
    if (imageChangedListener_) imageChangedListener_();
    imageChangedListener_ = nullptr;

    if (map && map->isOblique()) {
        clearSelection();
        obliqueMap_ = map;
        obliqueMap_->setSwitchEnabled(selection_.empty());
        imageChangedListener_ = map->imageChanged.connect([this]() { clearSelection(); });
    } else if (obliqueMap_) {
        MapView* previous = obliqueMap_;
        obliqueMap_ = nullptr;
        previous->setSwitchEnabled(true);
        clearSelection();
    }
}

void SelectFeaturesSession::updateHighlight() {
    const std::vector<std::uint32_t>& selected = selection_.getOrdered();
    for (const std::uint32_t id : highlighted_) {
        if (!selection_.isSelected(id)) layer_.unhighlight(id);
    }
    for (const std::uint32_t id : selected) {
        if (std::find(highlighted_.begin(), highlighted_.end(), id) == highlighted_.end()) {
            layer_.highlight(id);
        }
    }
    highlighted_ = selected;
}

void SelectFeaturesSession::selectionChanged() {
    updateHighlight();
    if (obliqueMap_) obliqueMap_->setSwitchEnabled(selection_.empty());
    const std::vector<std::uint32_t> features = selection_.getOrdered();
    featuresChanged.raise(features);
}

void SelectFeaturesSession::onClicked(std::uint32_t id, ModificationKey key) {
    if (selection_.selectByPick(id, key, mode_ == SelectionMode::Multi)) selectionChanged();
}

void SelectFeaturesSession::setMode(SelectionMode mode) {
    if (isStopped() || mode == mode_) return;
    mode_ = mode;
    if (mode_ == SelectionMode::Single && selection_.size() > 1) {
        const std::uint32_t first = selection_.getOrdered().front();
        if (selection_.setSelection(&first, 1, SelectionManager::Mode::Replace)) selectionChanged();
    }
    modeChanged.raise(mode_);
}

void SelectFeaturesSession::setCurrentFeatures(const std::vector<std::uint32_t>& ids) {
    if (isStopped()) return;
    std::vector<std::uint32_t> selected = ids;
    if (mode_ == SelectionMode::Single && selected.size() > 1) selected.resize(1);
    if (selection_.setSelection(selected, SelectionManager::Mode::Replace)) selectionChanged();
}

void SelectFeaturesSession::clearSelection() {
    if (isStopped()) return;
    if (selection_.clearSelection()) selectionChanged();
}

std::uint32_t SelectFeaturesSession::firstFeature() const {
    return selection_.empty() ? 0 : selection_.getOrdered().front();
}

void SelectFeaturesSession::stop() {
    if (!markStopped()) return;

    listeners_.dispose();
    chainSetup_.destroy();
    for (const std::uint32_t id : highlighted_) {
        layer_.unhighlight(id);
    }
    highlighted_.clear();
    if (obliqueMap_) {
        obliqueMap_->setSwitchEnabled(true);
        obliqueMap_ = nullptr;
    }
    selection_.clear();
    MAPEDIT_LOG_DEBUG("%s session stopped", sessionKindName(kind()));
    stopped.raise();
    stopped.clear();
    modeChanged.clear();
    featuresChanged.clear();
}

std::unique_ptr<SelectFeaturesSession> startSelectFeaturesSession(
    MapContext& context,
    FeatureLayer& layer,
    SelectFeaturesSessionOptions options) {
    return std::make_unique<SelectFeaturesSession>(context, layer, std::move(options));
}
