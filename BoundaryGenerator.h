#pragma once

#include "LineClipper.h"
#include "Party.h"
#include "Points.h"
#include "PreferenceFlows.h"

#include <array>
#include <optional>
#include <string>
#include <vector>

// Which tie-for-third line a contest boundary's midpoint falls on.
// Determined by which of the two contenders the excluded party's preferences favour.
enum class BoundaryRegime {
	// Even split: the midpoint collapses onto the terpoint
	Degenerate,
	// Excluded party favours the first contender, so the midpoint is where they tie for third
	MeetsFirstContender,
	// Excluded party favours the second contender, so the midpoint is where they tie for third
	MeetsSecondContender
};

struct Boundary {
	enum class Kind {
		RedGreen,
		RedBlue,
		BlueGreen,
		Diagonal,
		Num
	};

	Kind kind = Kind::Diagonal;

	// Not set for the diagonal, which doesn't depend on preference flows
	std::optional<BoundaryRegime> regime;

	// Characteristic points in (blue, green) space, before clipping
	std::vector<Point2D> vertices;

	// Visible pieces of the polyline, in order
	std::vector<Segment> segments;

	bool visible() const { return !segments.empty(); }

	// Joins the visible segments into runs of connected vertices.
	// Normally there is a single run; there will be more if the polyline leaves and re-enters the viewport.
	std::vector<std::vector<Point2D>> visiblePaths() const;
};

constexpr int NumBoundaryKinds = static_cast<int>(Boundary::Kind::Num);

std::string boundaryName(Boundary::Kind kind);

std::string regimeName(BoundaryRegime regime);

struct Boundaries {
	std::array<Boundary, NumBoundaryKinds> lines;

	Boundary const& get(Boundary::Kind kind) const { return lines[static_cast<int>(kind)]; }
};

// The point where all three parties are tied
constexpr Point2D Terpoint = Point2D(1.0 / 3.0, 1.0 / 3.0);

// Blue and Green tied on half the vote each, with Red on nothing
constexpr Point2D Hapoint = Point2D(0.5, 0.5);

// Characteristic points of the boundary between "first" and "second" when "excluded" comes third,
// together with the regime that decided where its midpoint lies.
// "excludedAxisShare" is the excluded party's share at the outer end of the boundary.
struct ContestBoundaryPoints {
	BoundaryRegime regime;
	Point2D terpoint;
	Point2D midpoint;
	Point2D axisPoint;
};

ContestBoundaryPoints calculateContestBoundary(PreferenceFlows const& flows, Party excluded,
	Party first, Party second, double excludedAxisShare);

// Derives the change-of-winner lines for the given preference flows, clipped to the viewport.
Boundaries generateBoundaries(PreferenceFlows const& flows, Viewport const& viewport);
