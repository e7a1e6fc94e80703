#include "LineClipper.h"

#include <gtest/gtest.h>

namespace {
	const Viewport DefaultViewport{ 0.2, 0.6 };

	void expectPoint(Point2D actual, double x, double y) {
		EXPECT_NEAR(actual.x, x, 1.0e-9) << actual.stringify();
		EXPECT_NEAR(actual.y, y, 1.0e-9) << actual.stringify();
	}
}

TEST(LineClipper, KeepsSegmentsInsideTheViewport)
{
	auto segment = clipSegment(Point2D(0.3, 0.3), Point2D(0.5, 0.4), DefaultViewport);
	ASSERT_TRUE(segment.has_value());
	expectPoint(segment->start, 0.3, 0.3);
	expectPoint(segment->end, 0.5, 0.4);
}

TEST(LineClipper, RejectsSegmentsBeyondOneSide)
{
	EXPECT_FALSE(clipSegment(Point2D(0.0, 0.3), Point2D(0.1, 0.5), DefaultViewport).has_value());
	EXPECT_FALSE(clipSegment(Point2D(0.3, 0.7), Point2D(0.5, 0.9), DefaultViewport).has_value());
}

TEST(LineClipper, ClipsBothEnds)
{
	auto segment = clipSegment(Point2D(0.0, 1.0), Point2D(1.0, 0.0), DefaultViewport);
	ASSERT_TRUE(segment.has_value());
	expectPoint(segment->start, 0.4, 0.6);
	expectPoint(segment->end, 0.6, 0.4);
}

TEST(LineClipper, ClipsAgainstTheOtherAxisAfterTheFirst)
{
	// Crossing x = 0.2 happens at y = 0.1, still outside, so the end is moved on to y = 0.2
	auto segment = clipSegment(Point2D(0.0, -0.2), Point2D(0.4, 0.4), DefaultViewport);
	ASSERT_TRUE(segment.has_value());
	expectPoint(segment->start, 0.4 / 1.5, 0.2);
	expectPoint(segment->end, 0.4, 0.4);
}

TEST(LineClipper, ClampsVerticalAndHorizontalSegments)
{
	auto vertical = clipSegment(Point2D(0.3, 0.0), Point2D(0.3, 1.0), DefaultViewport);
	ASSERT_TRUE(vertical.has_value());
	expectPoint(vertical->start, 0.3, 0.2);
	expectPoint(vertical->end, 0.3, 0.6);

	auto horizontal = clipSegment(Point2D(0.0, 0.5), Point2D(1.0, 0.5), DefaultViewport);
	ASSERT_TRUE(horizontal.has_value());
	expectPoint(horizontal->start, 0.2, 0.5);
	expectPoint(horizontal->end, 0.6, 0.5);
}

TEST(LineClipper, RejectsLinesPassingOutsideACorner)
{
	EXPECT_FALSE(clipSegment(Point2D(0.0, 0.3), Point2D(0.3, 0.0), DefaultViewport).has_value());
}
