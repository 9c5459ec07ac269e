#include "mapedit/map/map_context.h"

void MapContext::setActiveMap(MapView* map) {
    if (map == activeMap_) return;
    activeMap_ = map;
    mapActivated.raise(map);
}
