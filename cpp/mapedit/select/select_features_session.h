#pragma once

#include "mapedit/select/selection_manager.h"
#include "mapedit/session/disposer_list.h"
#include "mapedit/session/editor_session.h"
#include "mapedit/session/session_helpers.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

class FeatureLayer;
class MapContext;
class MapView;
class SelectFeatureInteraction;

enum class SelectionMode : std::uint8_t {
    Single = 0,
    Multi = 1,
};

struct SelectFeaturesSessionOptions {
    SelectionMode mode = SelectionMode::Multi;
    std::string interactionId;
};

// Selects features of a layer by clicking them. Selected features are highlighted.
class SelectFeaturesSession : public EditorSession {
public:
    SelectFeaturesSession(MapContext& context, FeatureLayer& layer, SelectFeaturesSessionOptions options = {});
    ~SelectFeaturesSession() override;

    void stop() override;

    SelectionMode mode() const noexcept { return mode_; }
    // Switching to Single keeps the first selected feature only.
    void setMode(SelectionMode mode);

    void setCurrentFeatures(const std::vector<std::uint32_t>& ids);
    void clearSelection();
    const std::vector<std::uint32_t>& currentFeatures() const { return selection_.getOrdered(); }
    // 0 when nothing is selected.
    std::uint32_t firstFeature() const;

    FeatureLayer& layer() { return layer_; }
    const SelectionManager& selection() const { return selection_; }

    Signal<const std::vector<std::uint32_t>&> featuresChanged;
    Signal<SelectionMode> modeChanged;

private:
    void onClicked(std::uint32_t id, ModificationKey key);
    void selectionChanged();
    void updateHighlight();
    void setupActiveMap(MapView* map);

    MapContext& context_;
    FeatureLayer& layer_;
    SelectionMode mode_;
    InteractionChainSetup chainSetup_;
    SelectionManager selection_;
    std::shared_ptr<SelectFeatureInteraction> selectInteraction_;
    std::vector<std::uint32_t> highlighted_;
    MapView* obliqueMap_ = nullptr;
    std::function<void()> imageChangedListener_;
    DisposerList listeners_;
};

std::unique_ptr<SelectFeaturesSession> startSelectFeaturesSession(
    MapContext& context,
    FeatureLayer& layer,
    SelectFeaturesSessionOptions options = {});
