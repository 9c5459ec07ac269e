#pragma once

#include "mapedit/create/create_interaction.h"
#include <vector>

// Clicks append vertices, moves update a trailing preview vertex and a double click ends
// the path. Shared by line strings and polygon rings.
class CreatePathInteraction : public CreateInteraction {
public:
    void pipe(InteractionEvent& event) override;

    const std::vector<Coordinate>& committed() const { return committed_; }

protected:
    explicit CreatePathInteraction(GeometryKind kind);
    void prepareFinish() override;

private:
    void updateGeometry();

    std::vector<Coordinate> committed_;
    Coordinate preview_{};
    bool hasPreview_ = false;
};

class CreateLineStringInteraction : public CreatePathInteraction {
public:
    CreateLineStringInteraction() : CreatePathInteraction(GeometryKind::LineString) {}
};

class CreatePolygonInteraction : public CreatePathInteraction {
public:
    CreatePolygonInteraction() : CreatePathInteraction(GeometryKind::Polygon) {}
};
