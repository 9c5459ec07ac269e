#pragma once

#include "mapedit/core/signal.h"
#include "mapedit/interaction/interaction.h"
#include <cstdint>

class VertexList;

// Drags a handle of a vertex list to the event position. The dragged handle is not
// pickable until the drag ends, so picks go to the surface below it.
class TranslateVertexInteraction : public Interaction {
public:
    explicit TranslateVertexInteraction(VertexList& vertices);

    void pipe(InteractionEvent& event) override;
    void destroy() override;

    std::uint32_t draggedVertex() const noexcept { return draggedId_; }

    // Index of the moved handle, raised on every Drag and on DragEnd.
    Signal<std::size_t> vertexChanged;

private:
    void setPickable(std::uint32_t id, bool pickable);

    VertexList& vertices_;
    std::uint32_t draggedId_ = 0;
};
