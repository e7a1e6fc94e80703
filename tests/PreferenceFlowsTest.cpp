#include "PreferenceFlows.h"

#include <gtest/gtest.h>

#include <cmath>

TEST(PreferenceFlows, ComplementaryFlowsHaveNoExhaust)
{
	auto flows = PreferenceFlows::fromComplementary(0.8, 0.75, 0.7);
	EXPECT_EQ(flows.mode(), PreferenceFlows::Mode::Complementary);
	EXPECT_DOUBLE_EQ(flows.get(Party::Red, Party::Green), 0.8);
	EXPECT_NEAR(flows.get(Party::Red, Party::Blue), 0.2, 1.0e-12);
	EXPECT_DOUBLE_EQ(flows.get(Party::Green, Party::Red), 0.75);
	EXPECT_NEAR(flows.get(Party::Green, Party::Blue), 0.25, 1.0e-12);
	EXPECT_DOUBLE_EQ(flows.get(Party::Blue, Party::Red), 0.7);
	EXPECT_NEAR(flows.get(Party::Blue, Party::Green), 0.3, 1.0e-12);
	for (auto party : AllParties) {
		EXPECT_NEAR(flows.exhaustRate(party), 0.0, 1.0e-12);
		EXPECT_DOUBLE_EQ(flows.get(party, party), 0.0);
	}
}

TEST(PreferenceFlows, DefaultFlows)
{
	PreferenceFlows flows;
	EXPECT_DOUBLE_EQ(flows.get(Party::Red, Party::Green), 0.8);
	EXPECT_DOUBLE_EQ(flows.get(Party::Green, Party::Red), 0.8);
	EXPECT_DOUBLE_EQ(flows.get(Party::Blue, Party::Red), 0.7);
}

TEST(PreferenceFlows, ComplementaryRatiosAreClamped)
{
	auto flows = PreferenceFlows::fromComplementary(-0.3, 1.5, 0.7);
	EXPECT_DOUBLE_EQ(flows.get(Party::Red, Party::Green), 0.3);
	EXPECT_DOUBLE_EQ(flows.get(Party::Green, Party::Red), 1.0);
	EXPECT_DOUBLE_EQ(flows.get(Party::Green, Party::Blue), 0.0);
}

TEST(PreferenceFlows, IndependentFlowsKeepExhaust)
{
	PreferenceFlows::FlowMatrix matrix = {};
	matrix[partyIndex(Party::Red)][partyIndex(Party::Green)] = 0.5;
	matrix[partyIndex(Party::Red)][partyIndex(Party::Blue)] = 0.1;
	auto flows = PreferenceFlows::fromIndependent(matrix);
	EXPECT_EQ(flows.mode(), PreferenceFlows::Mode::Independent);
	EXPECT_NEAR(flows.exhaustRate(Party::Red), 0.4, 1.0e-12);
	EXPECT_DOUBLE_EQ(flows.exhaustRate(Party::Green), 1.0);
}

TEST(PreferenceFlows, IndependentFlowsOverOneAreScaledDown)
{
	PreferenceFlows::FlowMatrix matrix = {};
	matrix[partyIndex(Party::Red)][partyIndex(Party::Green)] = 0.9;
	matrix[partyIndex(Party::Red)][partyIndex(Party::Blue)] = -0.6;
	matrix[partyIndex(Party::Red)][partyIndex(Party::Red)] = 0.5;
	auto flows = PreferenceFlows::fromIndependent(matrix);
	EXPECT_NEAR(flows.get(Party::Red, Party::Green), 0.6, 1.0e-12);
	EXPECT_NEAR(flows.get(Party::Red, Party::Blue), 0.4, 1.0e-12);
	EXPECT_DOUBLE_EQ(flows.get(Party::Red, Party::Red), 0.0);
	EXPECT_NEAR(flows.exhaustRate(Party::Red), 0.0, 1.0e-12);
}

TEST(PreferenceFlows, ClampFlowRatio)
{
	EXPECT_DOUBLE_EQ(clampFlowRatio(0.4), 0.4);
	EXPECT_DOUBLE_EQ(clampFlowRatio(-0.4), 0.4);
	EXPECT_DOUBLE_EQ(clampFlowRatio(2.0), 1.0);
	EXPECT_DOUBLE_EQ(clampFlowRatio(std::nan("")), 0.0);
}
