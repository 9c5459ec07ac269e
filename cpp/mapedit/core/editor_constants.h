#pragma once

/**
 * @file editor_constants.h
 * @brief Tunables of the editor subsystem.
 *
 * Pixel values are converted to ground units with the view resolution at the
 * coordinate in question (ground units per pixel).
 */

namespace editor_constants {

// =============================================================================
// Snapping
// =============================================================================

/// Screen radius inside which a snap result is accepted
constexpr double SNAP_TOLERANCE_PX = 12.0;

/// Angular window for orthogonal and parallel snapping (5 degrees, in radians)
constexpr double SNAP_ANGLE_RAD = 0.0872664625997164788;

/// Length of the perpendicular offset used for orthogonal projection
constexpr double ORTHOGONAL_OFFSET_LENGTH = 0.0001;

/// Length of the direction offset used for parallel projection
constexpr double PARALLEL_OFFSET_LENGTH = 100.0;

// =============================================================================
// Editing
// =============================================================================

/// Offset applied to a box corner that coincides with its opposite corner on an axis
constexpr double BOX_DEGENERACY_EPSILON = 1e-8;

/// Tolerance for inserting a vertex on a clicked edge
constexpr double INSERT_TOLERANCE_PX = 10.0;

// =============================================================================
// Transformation handlers
// =============================================================================

/// Screen length of an axis glyph
constexpr double HANDLER_SIZE_PX = 60.0;

/// Offset of the plane square glyph from the pivot, relative to the axis glyph
constexpr double HANDLER_PLANE_OFFSET = 0.2;

/// Side of the plane square glyph, relative to the axis glyph
constexpr double HANDLER_PLANE_SIZE = 0.2;

/// Radius of the rotation ring glyph, relative to the axis glyph
constexpr double ROTATION_RING_RADIUS = 0.5;

/// Half length of the axis guide shown while dragging, in axis glyph lengths
constexpr double AXIS_GUIDE_LENGTH = 1000.0;

} // namespace editor_constants
