#pragma once

#include "mapedit/core/signal.h"
#include "mapedit/interaction/interaction.h"
#include <cstdint>

class VertexList;

// Shift + click on a handle requests its removal.
class RemoveVertexInteraction : public Interaction {
public:
    explicit RemoveVertexInteraction(const VertexList& vertices);

    void pipe(InteractionEvent& event) override;
    void destroy() override;

    // Feature id of the handle.
    Signal<std::uint32_t> vertexRemoved;

private:
    const VertexList& vertices_;
};
