#include "OutcomeText.h"

#include "General.h"

#include <gtest/gtest.h>

TEST(OutcomeText, FormatPercentDropsTrailingZero)
{
	EXPECT_EQ(formatPercent(0.3), "30%");
	EXPECT_EQ(formatPercent(0.625), "62.5%");
	EXPECT_EQ(formatPercent(0.0), "0%");
}

TEST(OutcomeText, DescribesShares)
{
	EXPECT_EQ(describeShares(VoteShares::fromAxes(0.25, 0.30)), "Greens: 30%, Labor: 45%, Coalition: 25%.");
}

TEST(OutcomeText, DescribesWinner)
{
	EXPECT_EQ(describeWinner(WinnerResult::win(Party::Red, 0.625)), "Winner: Labor 62.5%");
	EXPECT_EQ(describeWinner(WinnerResult::tie()), "Winner: TIE");
}

TEST(OutcomeText, DescribesFlow)
{
	EXPECT_EQ(describeFlow(Party::Red, Party::Green, PreferenceFlows()), "Labor to Greens: 80.0%");
	EXPECT_EQ(describeFlow(Party::Blue, Party::Green, PreferenceFlows()), "Coalition to Greens: 30.0%");
}

TEST(OutcomeText, DescribesPointWithOptionalLabel)
{
	auto shares = VoteShares::fromAxes(0.25, 0.30);
	auto result = WinnerResult::win(Party::Red, 0.625);
	EXPECT_EQ(describePoint(shares, result),
		"Greens: 30%, Labor: 45%, Coalition: 25%.\nWinner: Labor 62.5%");
	EXPECT_EQ(describePoint(shares, result, "Seat A"),
		"Seat A\nGreens: 30%, Labor: 45%, Coalition: 25%.\nWinner: Labor 62.5%");
}
