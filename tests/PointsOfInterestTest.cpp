#include "PointsOfInterest.h"

#include <gtest/gtest.h>

#include <sstream>

namespace {
	constexpr double Tolerance = 0.001;
}

TEST(PointsOfInterest, ReadsRowsAndSkipsBadOnes)
{
	std::istringstream csv(
		"0.25,0.30,Seat A\n"
		"\n"
		"bad,row\n"
		"0.3\n"
		"0.7,0.5,too much\n"
		"0.2,0.2, Label, with comma\n"
		"0.4,0.35\n");
	auto points = loadPointsOfInterest(csv, PreferenceFlows(), Tolerance);
	ASSERT_EQ(points.size(), size_t(3));

	EXPECT_EQ(points[0].label, "Seat A");
	EXPECT_DOUBLE_EQ(points[0].shares.blue(), 0.25);
	EXPECT_DOUBLE_EQ(points[0].shares.green(), 0.30);
	ASSERT_FALSE(points[0].result.isTie());
	EXPECT_EQ(*points[0].result.winner, Party::Red);
	EXPECT_NEAR(points[0].result.margin, 0.625, 1.0e-9);

	EXPECT_EQ(points[1].label, "Label, with comma");
	ASSERT_FALSE(points[1].result.isTie());
	EXPECT_EQ(*points[1].result.winner, Party::Red);

	EXPECT_EQ(points[2].label, "");
}

TEST(PointsOfInterest, MissingFileThrows)
{
	EXPECT_THROW(loadPointsOfInterest(std::string("no/such/points.csv"), PreferenceFlows(), Tolerance),
		PointsOfInterestFileException);
}
