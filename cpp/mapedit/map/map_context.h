#pragma once

#include "mapedit/core/signal.h"
#include "mapedit/feature/layer_collection.h"
#include "mapedit/interaction/event_dispatcher.h"

class MapView;

// Shared state of the host application: the event dispatcher, the layers and the view
// currently receiving input.
class MapContext {
public:
    MapContext() = default;
    MapContext(const MapContext&) = delete;
    MapContext& operator=(const MapContext&) = delete;

    EventDispatcher& dispatcher() { return dispatcher_; }
    LayerCollection& layers() { return layers_; }

    MapView* activeMap() const { return activeMap_; }
    // Raises mapActivated when the view changes.
    void setActiveMap(MapView* map);

    Signal<MapView*> mapActivated;

private:
    EventDispatcher dispatcher_;
    LayerCollection layers_;
    MapView* activeMap_ = nullptr;
};
