#include "BoundaryGenerator.h"

#include "Log.h"

#include <cmath>

// Each contest boundary is the line along which the two contenders' 2CP totals are equal
// once the excluded party's preferences are distributed:
//   p + x * f(X->P) = q + x * f(X->Q)
// With d = f(X->Q) - f(X->P) and p + q + x = 1 this gives
//   p = (1 - x + x * d) / 2
//   q = (1 - x - x * d) / 2
// The line only separates P from Q while X is actually third. Starting from the outer edge
// and moving inwards, X first catches up with whichever contender it favours (that contender
// is behind on primaries along this line), which happens at
//   x = 1 / (3 + |d|)
// From there the boundary follows the line where X and that contender tie for third,
// until all three are level at the terpoint.

namespace {

	BoundaryRegime decideRegime(double favourDifference) {
		if (favourDifference == 0.0) return BoundaryRegime::Degenerate;
		if (favourDifference < 0.0) return BoundaryRegime::MeetsFirstContender;
		return BoundaryRegime::MeetsSecondContender;
	}

	// Converts shares for (excluded, first, second) into a point in (blue, green) space
	Point2D plotShares(Party excluded, double x, Party first, double p, Party second, double q) {
		std::array<double, NumParties> shares = {};
		shares[partyIndex(excluded)] = x;
		shares[partyIndex(first)] = p;
		shares[partyIndex(second)] = q;
		return Point2D(shares[partyIndex(Party::Blue)], shares[partyIndex(Party::Green)]);
	}

	Point2D pointOnEqualityLine(Party excluded, Party first, Party second, double favourDifference, double x) {
		double p = (1.0 - x + x * favourDifference) * 0.5;
		double q = (1.0 - x - x * favourDifference) * 0.5;
		return plotShares(excluded, x, first, p, second, q);
	}

	// The outer end of a boundary is where the excluded party's share reaches the edge of the diagram.
	// Blue and Green are the axes so that's the start of the viewport, while Red runs out at the
	// diagonal edge of the simplex.
	double axisShareFor(Party excluded, Viewport const& viewport) {
		return excluded == Party::Red ? 0.0 : viewport.start;
	}

	void clipPolyline(Boundary& boundary, Viewport const& viewport) {
		for (size_t i = 1; i < boundary.vertices.size(); ++i) {
			auto segment = clipSegment(boundary.vertices[i - 1], boundary.vertices[i], viewport);
			if (segment) boundary.segments.push_back(*segment);
		}
	}

	Boundary contestBoundary(Boundary::Kind kind, PreferenceFlows const& flows, Party excluded,
		Party first, Party second, Viewport const& viewport)
	{
		auto points = calculateContestBoundary(flows, excluded, first, second, axisShareFor(excluded, viewport));
		Boundary boundary;
		boundary.kind = kind;
		boundary.regime = points.regime;
		boundary.vertices.push_back(points.terpoint);
		if (points.regime != BoundaryRegime::Degenerate) boundary.vertices.push_back(points.midpoint);
		boundary.vertices.push_back(points.axisPoint);
		clipPolyline(boundary, viewport);
		return boundary;
	}

	// Green = 1 - Blue, the edge of the simplex where Red has no vote.
	Boundary diagonalBoundary(Viewport const& viewport) {
		Boundary boundary;
		boundary.kind = Boundary::Kind::Diagonal;
		boundary.vertices = { Point2D(0.0, 1.0), Hapoint, Point2D(1.0, 0.0) };
		clipPolyline(boundary, viewport);
		return boundary;
	}
}

std::vector<std::vector<Point2D>> Boundary::visiblePaths() const
{
	constexpr double JoinTolerance = 1.0e-9;
	std::vector<std::vector<Point2D>> paths;
	for (auto const& segment : segments) {
		if (paths.empty() || !paths.back().back().isClose(segment.start, JoinTolerance)) {
			paths.push_back({ segment.start });
		}
		paths.back().push_back(segment.end);
	}
	return paths;
}

std::string boundaryName(Boundary::Kind kind)
{
	switch (kind) {
	case Boundary::Kind::RedGreen: return partyName(Party::Red) + "/" + partyName(Party::Green);
	case Boundary::Kind::RedBlue: return partyName(Party::Red) + "/" + partyName(Party::Blue);
	case Boundary::Kind::BlueGreen: return partyName(Party::Blue) + "/" + partyName(Party::Green);
	case Boundary::Kind::Diagonal: return "Diagonal";
	default: return "Invalid";
	}
}

std::string regimeName(BoundaryRegime regime)
{
	switch (regime) {
	case BoundaryRegime::Degenerate: return "degenerate";
	case BoundaryRegime::MeetsFirstContender: return "meets first contender";
	case BoundaryRegime::MeetsSecondContender: return "meets second contender";
	default: return "invalid";
	}
}

ContestBoundaryPoints calculateContestBoundary(PreferenceFlows const& flows, Party excluded,
	Party first, Party second, double excludedAxisShare)
{
	const double favourDifference = flows.get(excluded, second) - flows.get(excluded, first);
	ContestBoundaryPoints points;
	points.regime = decideRegime(favourDifference);
	points.terpoint = Terpoint;
	switch (points.regime) {
	case BoundaryRegime::Degenerate:
		points.midpoint = Terpoint;
		break;
	case BoundaryRegime::MeetsFirstContender:
	case BoundaryRegime::MeetsSecondContender:
	{
		const double midpointShare = 1.0 / (3.0 + std::abs(favourDifference));
		points.midpoint = pointOnEqualityLine(excluded, first, second, favourDifference, midpointShare);
		break;
	}
	}
	points.axisPoint = pointOnEqualityLine(excluded, first, second, favourDifference, excludedAxisShare);
	return points;
}

Boundaries generateBoundaries(PreferenceFlows const& flows, Viewport const& viewport)
{
	Boundaries boundaries;
	boundaries.lines[int(Boundary::Kind::RedGreen)] =
		contestBoundary(Boundary::Kind::RedGreen, flows, Party::Blue, Party::Red, Party::Green, viewport);
	boundaries.lines[int(Boundary::Kind::RedBlue)] =
		contestBoundary(Boundary::Kind::RedBlue, flows, Party::Green, Party::Red, Party::Blue, viewport);
	boundaries.lines[int(Boundary::Kind::BlueGreen)] =
		contestBoundary(Boundary::Kind::BlueGreen, flows, Party::Red, Party::Blue, Party::Green, viewport);
	boundaries.lines[int(Boundary::Kind::Diagonal)] = diagonalBoundary(viewport);

	for (auto const& boundary : boundaries.lines) {
		if (!boundary.visible()) {
			logger << "Boundary " << boundaryName(boundary.kind) << " lies entirely outside the viewport\n";
		}
	}
	return boundaries;
}
