#include "WinnerResolver.h"

#include <gtest/gtest.h>

#include <array>

namespace {
	constexpr double Tolerance = 0.001;

	PreferenceFlows defaultFlows() {
		return PreferenceFlows::fromComplementary(0.8, 0.8, 0.7);
	}

	// Red -> Green -> Blue -> Red
	Party rotate(Party party) {
		return static_cast<Party>((partyIndex(party) + 1) % NumParties);
	}

	PreferenceFlows rotateFlows(PreferenceFlows const& flows) {
		PreferenceFlows::FlowMatrix matrix = {};
		for (auto from : AllParties) {
			for (auto to : AllParties) {
				if (from == to) continue;
				matrix[partyIndex(rotate(from))][partyIndex(rotate(to))] = flows.get(from, to);
			}
		}
		return PreferenceFlows::fromIndependent(matrix);
	}

	VoteShares rotateShares(VoteShares const& shares) {
		std::array<double, NumParties> rotated = {};
		for (auto party : AllParties) rotated[partyIndex(rotate(party))] = shares.get(party);
		return VoteShares(rotated[0], rotated[1], rotated[2]);
	}
}

TEST(WinnerResolver, RedWinsWhenBlueIsThird)
{
	auto result = resolveWinner(0.45, 0.30, 0.25, defaultFlows(), Tolerance);
	ASSERT_FALSE(result.isTie());
	EXPECT_EQ(*result.winner, Party::Red);
	EXPECT_NEAR(result.margin, 0.625, 1.0e-9);
}

TEST(WinnerResolver, LeaderWinsWhenBothExclusionOrdersAgree)
{
	// Red and Green are level for last, but Blue wins whichever of them is excluded
	auto result = resolveWinner(0.20, 0.20, 0.60, defaultFlows(), Tolerance);
	ASSERT_FALSE(result.isTie());
	EXPECT_EQ(*result.winner, Party::Blue);
	EXPECT_NEAR(result.margin, 0.64, Tolerance);
}

TEST(WinnerResolver, LeaderDoesNotWinWhenExclusionOrdersDisagree)
{
	// Excluding Red sends enough to the Greens to beat Blue, excluding the Greens elects Labor
	auto result = resolveWinner(0.30, 0.30, 0.40, defaultFlows(), Tolerance);
	EXPECT_TRUE(result.isTie());
}

TEST(WinnerResolver, CastingVoteKeepsFullToleranceForTwoCandidateTotals)
{
	// Red and Green are level for last. Excluding Red leaves Green and Blue
	// within the tolerance of each other, so this is no better than a tie.
	const double level = (1.0 - 0.0005) / 3.6;
	auto result = resolveWinner(level, level, 1.0 - 2.0 * level, defaultFlows(), Tolerance);
	EXPECT_TRUE(result.isTie());

	// Same outcome as when Red is clearly third
	auto clearlyThird = resolveWinner(level - 0.0011, level + 0.0011, 1.0 - 2.0 * level, defaultFlows(), Tolerance);
	EXPECT_TRUE(clearlyThird.isTie());
}

TEST(WinnerResolver, TerpointIsATie)
{
	auto result = resolveWinner(1.0 / 3.0, 1.0 / 3.0, 1.0 / 3.0, defaultFlows(), Tolerance);
	EXPECT_TRUE(result.isTie());
}

TEST(WinnerResolver, EqualTwoCandidateTotalsAreATie)
{
	// Blue is third and splits 50/50, leaving Red and Green level
	auto flows = PreferenceFlows::fromComplementary(0.8, 0.8, 0.5);
	auto result = resolveWinner(0.40, 0.40, 0.20, flows, Tolerance);
	EXPECT_TRUE(result.isTie());
}

TEST(WinnerResolver, MarginsAreAboveHalf)
{
	auto flows = defaultFlows();
	for (int blue = 0; blue <= 100; blue += 3) {
		for (int green = 0; blue + green <= 100; green += 3) {
			auto shares = VoteShares::fromAxes(blue * 0.01, green * 0.01);
			auto result = resolveWinner(shares, flows, Tolerance);
			if (result.isTie()) continue;
			EXPECT_GT(result.margin, 0.5) << shares.stringify();
			EXPECT_LE(result.margin, 1.0) << shares.stringify();
		}
	}
}

TEST(WinnerResolver, MarginsCountOnlyNonExhaustedVotes)
{
	PreferenceFlows::FlowMatrix matrix = {};
	matrix[partyIndex(Party::Red)][partyIndex(Party::Green)] = 0.5;
	matrix[partyIndex(Party::Red)][partyIndex(Party::Blue)] = 0.1;
	matrix[partyIndex(Party::Green)][partyIndex(Party::Red)] = 0.8;
	matrix[partyIndex(Party::Blue)][partyIndex(Party::Red)] = 0.7;
	auto flows = PreferenceFlows::fromIndependent(matrix);

	auto result = resolveWinner(0.20, 0.40, 0.40, flows, Tolerance);
	ASSERT_FALSE(result.isTie());
	EXPECT_EQ(*result.winner, Party::Green);
	// Green 0.5, Blue 0.42, with 0.08 exhausted
	EXPECT_NEAR(result.margin, 0.5 / 0.92, 1.0e-9);
}

TEST(WinnerResolver, RelabellingPartiesRelabelsTheWinner)
{
	auto flows = PreferenceFlows::fromComplementary(0.75, 0.65, 0.6);
	auto rotatedFlows = rotateFlows(flows);
	for (int blue = 1; blue < 100; blue += 7) {
		for (int green = 1; blue + green < 100; green += 7) {
			auto shares = VoteShares::fromAxes(blue * 0.01, green * 0.01);
			auto unrotated = resolveWinner(shares, flows, Tolerance);
			auto rotated = resolveWinner(rotateShares(shares), rotatedFlows, Tolerance);
			ASSERT_EQ(unrotated.isTie(), rotated.isTie()) << shares.stringify();
			if (unrotated.isTie()) continue;
			EXPECT_EQ(rotate(*unrotated.winner), *rotated.winner) << shares.stringify();
			EXPECT_NEAR(unrotated.margin, rotated.margin, 1.0e-12) << shares.stringify();
		}
	}
}

TEST(WinnerResolver, GreenTotalGrowsWithRedToGreenFlow)
{
	auto shares = VoteShares(0.20, 0.35, 0.45);
	double previousTotal = 0.0;
	for (int i = 0; i <= 10; ++i) {
		auto flows = PreferenceFlows::fromComplementary(i * 0.1, 0.8, 0.7);
		auto totals = distributePreferences(shares, flows, Party::Red);
		ASSERT_EQ(totals.first, Party::Green);
		EXPECT_GE(totals.firstTotal, previousTotal);
		previousTotal = totals.firstTotal;
	}
}

TEST(WinnerResolver, DistributionListsContendersInPartyOrder)
{
	auto totals = distributePreferences(VoteShares(0.45, 0.30, 0.25), defaultFlows(), Party::Blue);
	EXPECT_EQ(totals.first, Party::Red);
	EXPECT_EQ(totals.second, Party::Green);
	EXPECT_NEAR(totals.firstTotal, 0.625, 1.0e-12);
	EXPECT_NEAR(totals.secondTotal, 0.375, 1.0e-12);

	totals = distributePreferences(VoteShares(0.45, 0.30, 0.25), defaultFlows(), Party::Red);
	EXPECT_EQ(totals.first, Party::Green);
	EXPECT_EQ(totals.second, Party::Blue);
}

TEST(WinnerResolver, RejectsInvalidInput)
{
	EXPECT_THROW(resolveWinner(0.5, 0.5, 0.5, defaultFlows(), Tolerance), InvalidVoteSharesException);
	EXPECT_THROW(resolveWinner(-0.1, 0.6, 0.5, defaultFlows(), Tolerance), InvalidVoteSharesException);
	EXPECT_THROW(resolveWinner(0.45, 0.30, 0.25, defaultFlows(), 0.0), std::invalid_argument);
}

TEST(WinnerResolver, ToleranceIsATenthOfTheStep)
{
	EXPECT_DOUBLE_EQ(toleranceFromStep(0.01), 0.001);
}
