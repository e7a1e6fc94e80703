#include "LineClipper.h"

#include <algorithm>
#include <cmath>

// Segments whose x (or y) extent is smaller than this are treated as exactly vertical (or horizontal)
constexpr double DegenerateExtent = 1.0e-9;

// Slack allowed when checking that clipped endpoints landed inside the viewport
constexpr double ContainmentTolerance = 1.0e-9;

namespace {
	bool whollyBeyondOneSide(Point2D p0, Point2D p1, Viewport const& viewport) {
		return (p0.x < viewport.start && p1.x < viewport.start) ||
			(p0.y < viewport.start && p1.y < viewport.start) ||
			(p0.x > viewport.stop && p1.x > viewport.stop) ||
			(p0.y > viewport.stop && p1.y > viewport.stop);
	}

	// Moves the point along the line y = m * x + c until it is within the x bounds and then the y bounds.
	Point2D clipEndpoint(Point2D point, double m, double c, Viewport const& viewport) {
		if (point.x < viewport.start) {
			point = Point2D(viewport.start, m * viewport.start + c);
		}
		else if (point.x > viewport.stop) {
			point = Point2D(viewport.stop, m * viewport.stop + c);
		}

		if (point.y < viewport.start) {
			point = Point2D((viewport.start - c) / m, viewport.start);
		}
		else if (point.y > viewport.stop) {
			point = Point2D((viewport.stop - c) / m, viewport.stop);
		}
		return point;
	}
}

std::optional<Segment> clipSegment(Point2D p0, Point2D p1, Viewport const& viewport)
{
	if (whollyBeyondOneSide(p0, p1, viewport)) return std::nullopt;

	auto clampToViewport = [&](Point2D p) {
		return Point2D(std::clamp(p.x, viewport.start, viewport.stop), std::clamp(p.y, viewport.start, viewport.stop));
	};

	// Vertical and horizontal lines can be clamped without changing their direction
	if (std::abs(p1.x - p0.x) <= DegenerateExtent || std::abs(p1.y - p0.y) <= DegenerateExtent) {
		return Segment{ clampToViewport(p0), clampToViewport(p1) };
	}

	const double m = (p1.y - p0.y) / (p1.x - p0.x); // gradient
	const double c = p0.y - m * p0.x; // y-offset

	Point2D a = clipEndpoint(p0, m, c, viewport);
	Point2D b = clipEndpoint(p1, m, c, viewport);

	// The line can pass outside a corner, in which case the clipped points still lie outside
	if (!viewport.contains(a, ContainmentTolerance) || !viewport.contains(b, ContainmentTolerance)) {
		return std::nullopt;
	}
	return Segment{ clampToViewport(a), clampToViewport(b) };
}
