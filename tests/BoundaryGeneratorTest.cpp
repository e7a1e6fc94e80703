#include "BoundaryGenerator.h"

#include "WinnerResolver.h"

#include <gtest/gtest.h>

namespace {
	constexpr double PointTolerance = 1.0e-6;

	PreferenceFlows defaultFlows() {
		return PreferenceFlows::fromComplementary(0.8, 0.8, 0.7);
	}

	void expectPoint(Point2D actual, double x, double y) {
		EXPECT_NEAR(actual.x, x, PointTolerance) << actual.stringify();
		EXPECT_NEAR(actual.y, y, PointTolerance) << actual.stringify();
	}
}

TEST(BoundaryGenerator, RedGreenBoundaryMeetsLaborTieForThird)
{
	auto points = calculateContestBoundary(defaultFlows(), Party::Blue, Party::Red, Party::Green, 0.2);
	EXPECT_EQ(points.regime, BoundaryRegime::MeetsFirstContender);
	expectPoint(points.terpoint, 1.0 / 3.0, 1.0 / 3.0);
	expectPoint(points.midpoint, 1.0 / 3.4, 1.4 / 3.4);
	expectPoint(points.axisPoint, 0.2, 0.44);
}

TEST(BoundaryGenerator, RedBlueBoundaryMeetsLaborTieForThird)
{
	auto points = calculateContestBoundary(defaultFlows(), Party::Green, Party::Red, Party::Blue, 0.2);
	EXPECT_EQ(points.regime, BoundaryRegime::MeetsFirstContender);
	expectPoint(points.midpoint, 1.6 / 3.6, 1.0 / 3.6);
	expectPoint(points.axisPoint, 0.46, 0.2);
}

TEST(BoundaryGenerator, BlueGreenBoundaryEndsAtHapoint)
{
	auto points = calculateContestBoundary(defaultFlows(), Party::Red, Party::Blue, Party::Green, 0.0);
	EXPECT_EQ(points.regime, BoundaryRegime::MeetsSecondContender);
	expectPoint(points.midpoint, 1.6 / 3.6, 1.0 / 3.6);
	expectPoint(points.axisPoint, Hapoint.x, Hapoint.y);
}

TEST(BoundaryGenerator, EvenSplitCollapsesMidpoint)
{
	auto flows = PreferenceFlows::fromComplementary(0.8, 0.8, 0.5);
	auto points = calculateContestBoundary(flows, Party::Blue, Party::Red, Party::Green, 0.2);
	EXPECT_EQ(points.regime, BoundaryRegime::Degenerate);
	expectPoint(points.midpoint, 1.0 / 3.0, 1.0 / 3.0);
	expectPoint(points.axisPoint, 0.2, 0.4);

	auto boundaries = generateBoundaries(flows, Viewport{ 0.2, 0.6 });
	auto const& redGreen = boundaries.get(Boundary::Kind::RedGreen);
	ASSERT_EQ(redGreen.vertices.size(), size_t(2));
	expectPoint(redGreen.vertices[0], 1.0 / 3.0, 1.0 / 3.0);
	expectPoint(redGreen.vertices[1], 0.2, 0.4);
}

TEST(BoundaryGenerator, DefaultViewportShowsAllFourLines)
{
	Viewport viewport{ 0.2, 0.6 };
	auto boundaries = generateBoundaries(defaultFlows(), viewport);
	for (auto const& boundary : boundaries.lines) {
		EXPECT_TRUE(boundary.visible()) << boundaryName(boundary.kind);
		for (auto const& segment : boundary.segments) {
			EXPECT_TRUE(viewport.contains(segment.start, 1.0e-9)) << boundaryName(boundary.kind);
			EXPECT_TRUE(viewport.contains(segment.end, 1.0e-9)) << boundaryName(boundary.kind);
		}
		// Each line is drawn as one connected run
		EXPECT_EQ(boundary.visiblePaths().size(), size_t(1)) << boundaryName(boundary.kind);
	}
}

TEST(BoundaryGenerator, ContestLinesShareTheTerpoint)
{
	auto boundaries = generateBoundaries(defaultFlows(), Viewport{ 0.2, 0.6 });
	auto const& redGreen = boundaries.get(Boundary::Kind::RedGreen);
	auto const& redBlue = boundaries.get(Boundary::Kind::RedBlue);
	auto const& blueGreen = boundaries.get(Boundary::Kind::BlueGreen);
	expectPoint(redGreen.segments.front().start, 1.0 / 3.0, 1.0 / 3.0);
	expectPoint(redBlue.segments.front().start, 1.0 / 3.0, 1.0 / 3.0);
	expectPoint(blueGreen.segments.front().start, 1.0 / 3.0, 1.0 / 3.0);
}

TEST(BoundaryGenerator, DiagonalIsClippedToTheViewport)
{
	auto boundaries = generateBoundaries(defaultFlows(), Viewport{ 0.2, 0.6 });
	auto const& diagonal = boundaries.get(Boundary::Kind::Diagonal);
	EXPECT_FALSE(diagonal.regime.has_value());
	auto paths = diagonal.visiblePaths();
	ASSERT_EQ(paths.size(), size_t(1));
	ASSERT_EQ(paths[0].size(), size_t(3));
	expectPoint(paths[0][0], 0.4, 0.6);
	expectPoint(paths[0][1], 0.5, 0.5);
	expectPoint(paths[0][2], 0.6, 0.4);
}

TEST(BoundaryGenerator, LinesOutsideTheViewportAreHidden)
{
	auto boundaries = generateBoundaries(defaultFlows(), Viewport{ 0.45, 0.55 });
	EXPECT_FALSE(boundaries.get(Boundary::Kind::RedGreen).visible());
	EXPECT_TRUE(boundaries.get(Boundary::Kind::Diagonal).visible());
}

TEST(BoundaryGenerator, MidpointIsWhereExcludedPartyTiesForThird)
{
	auto flows = PreferenceFlows::fromComplementary(0.65, 0.75, 0.6);
	auto points = calculateContestBoundary(flows, Party::Blue, Party::Red, Party::Green, 0.2);
	double blue = points.midpoint.x;
	double green = points.midpoint.y;
	double red = 1.0 - blue - green;
	// Blue favours Labor here, so Blue and Labor are level at the midpoint
	EXPECT_NEAR(blue, red, PointTolerance);
	EXPECT_LT(red, green);
	// and the two 2CP totals are level along the whole line
	auto totals = distributePreferences(VoteShares(red, green, blue), flows, Party::Blue);
	EXPECT_NEAR(totals.firstTotal, totals.secondTotal, PointTolerance);
}
