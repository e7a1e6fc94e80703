#pragma once

#include "Points.h"

#include <optional>

// The displayed square of vote-share space: both axes run from "start" to "stop".
struct Viewport {
	double start = 0.2;
	double stop = 0.6;

	bool contains(Point2D point, double tolerance = 0.0) const {
		return point.x >= start - tolerance && point.x <= stop + tolerance
			&& point.y >= start - tolerance && point.y <= stop + tolerance;
	}
};

struct Segment {
	Point2D start;
	Point2D end;
};

// Clips the segment from p0 to p1 so that it lies within the viewport.
// Returns nothing if no part of the segment is visible.
std::optional<Segment> clipSegment(Point2D p0, Point2D p1, Viewport const& viewport);
