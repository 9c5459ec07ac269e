#pragma once

#include "mapedit/interaction/interaction.h"
#include <cstdint>
#include <set>
#include <utility>

// First member of the dispatcher chain. Filters the host's pick result: features with
// allowPicking == false are dropped, and the feature picked on DragStart is carried
// through the following Drag and DragEnd events.
class FeatureInteraction : public Interaction {
public:
    FeatureInteraction();

    void pipe(InteractionEvent& event) override;
    void destroy() override;

    // Event types on which the picked feature's surface position is used as the event
    // position.
    EventType pickPosition() const noexcept { return pickPosition_; }
    void setPickPosition(EventType mask) noexcept { pickPosition_ = mask; }

    void excludeFromPickPosition(const FeatureLayer* layer, std::uint32_t id);
    void includeInPickPosition(const FeatureLayer* layer, std::uint32_t id);
    bool isExcludedFromPickPosition(const FeatureLayer* layer, std::uint32_t id) const;

private:
    EventType pickPosition_ = EventType::Click;
    FeatureLayer* draggingLayer_ = nullptr;
    std::uint32_t draggingId_ = 0;
    std::set<std::pair<const FeatureLayer*, std::uint32_t>> excluded_;
};
