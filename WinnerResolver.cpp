#include "WinnerResolver.h"

#include "General.h"

#include <algorithm>
#include <cmath>

namespace {

	// Comparisons that treat values within "tolerance" of each other as equal
	struct TolerantComparer {
		double tolerance;

		bool eq(double x, double y) const { return std::abs(x - y) <= tolerance; }
		bool lt(double x, double y) const { return x < y && !eq(x, y); }
		bool gt(double x, double y) const { return lt(y, x); }
	};

	// The party whose share is below both others by more than the tolerance, if there is one
	std::optional<Party> findStrictlyThird(VoteShares const& shares, TolerantComparer const& cmp) {
		for (auto party : AllParties) {
			bool belowAll = true;
			for (auto other : AllParties) {
				if (other == party) continue;
				if (!cmp.lt(shares.get(party), shares.get(other))) belowAll = false;
			}
			if (belowAll) return party;
		}
		return std::nullopt;
	}

	WinnerResult contestAfterExclusion(VoteShares const& shares, PreferenceFlows const& flows,
		Party excluded, TolerantComparer const& cmp)
	{
		auto totals = distributePreferences(shares, flows, excluded);
		if (cmp.eq(totals.firstTotal, totals.secondTotal)) return WinnerResult::tie();
		// Exhausted preferences don't count towards either candidate, so the 2CP share
		// is taken over the votes that reached one of them.
		double combined = totals.firstTotal + totals.secondTotal;
		if (cmp.gt(totals.firstTotal, totals.secondTotal)) {
			return WinnerResult::win(totals.first, totals.firstTotal / combined);
		}
		return WinnerResult::win(totals.second, totals.secondTotal / combined);
	}

	// "leader" is clear of "tiedA" and "tiedB", which are level with each other for last place.
	// Re-runs the contest once with each of them nudged into third place. The nudge only
	// decides who is excluded; the 2CP totals are still compared at the full tolerance.
	WinnerResult resolveCastingVote(VoteShares const& shares, PreferenceFlows const& flows,
		Party leader, Party tiedA, Party tiedB, TolerantComparer const& cmp)
	{
		const double mean = (shares.get(tiedA) + shares.get(tiedB)) * 0.5;
		const double nudge = cmp.tolerance * 0.1;
		VoteShares excludeA = shares.with(tiedA, mean - nudge, tiedB, mean + nudge);
		VoteShares excludeB = shares.with(tiedA, mean + nudge, tiedB, mean - nudge);
		WinnerResult resultA = contestAfterExclusion(excludeA, flows, tiedA, cmp);
		WinnerResult resultB = contestAfterExclusion(excludeB, flows, tiedB, cmp);
		if (resultA.winner == leader && resultB.winner == leader) {
			return WinnerResult::win(leader, std::min(resultA.margin, resultB.margin));
		}
		return WinnerResult::tie();
	}
}

std::string WinnerResult::stringify() const
{
	if (isTie()) return "Tie";
	return partyName(*winner) + " " + formatFloat(margin, 4);
}

TwoCandidateTotals distributePreferences(VoteShares const& shares, PreferenceFlows const& flows, Party excluded)
{
	Party first = (excluded == Party::Red ? Party::Green : Party::Red);
	Party second = remainingParty(excluded, first);
	if (partyIndex(second) < partyIndex(first)) std::swap(first, second);
	const double excludedShare = shares.get(excluded);
	TwoCandidateTotals totals;
	totals.first = first;
	totals.firstTotal = shares.get(first) + excludedShare * flows.get(excluded, first);
	totals.second = second;
	totals.secondTotal = shares.get(second) + excludedShare * flows.get(excluded, second);
	return totals;
}

WinnerResult resolveWinner(VoteShares const& shares, PreferenceFlows const& flows, double tolerance)
{
	if (!(tolerance > 0.0)) throw std::invalid_argument("Tolerance must be positive: " + formatFloat(tolerance, 6));

	TolerantComparer cmp{ tolerance };

	bool allTied = true;
	for (auto a : AllParties) {
		for (auto b : AllParties) {
			if (!cmp.eq(shares.get(a), shares.get(b))) allTied = false;
		}
	}
	if (allTied) return WinnerResult::tie();

	if (auto third = findStrictlyThird(shares, cmp)) {
		return contestAfterExclusion(shares, flows, *third, cmp);
	}

	// Nobody is clearly third: look for two parties level for last place behind a clear leader
	for (auto leader : AllParties) {
		Party tiedA = (leader == Party::Red ? Party::Green : Party::Red);
		Party tiedB = remainingParty(leader, tiedA);
		double leaderShare = shares.get(leader);
		if (cmp.eq(shares.get(tiedA), shares.get(tiedB)) &&
			cmp.lt(shares.get(tiedA), leaderShare) && cmp.lt(shares.get(tiedB), leaderShare))
		{
			return resolveCastingVote(shares, flows, leader, tiedA, tiedB, cmp);
		}
	}

	// Chains of near-ties (a ~ b ~ c without a ~ c) can't be ordered reliably
	return WinnerResult::tie();
}

WinnerResult resolveWinner(double red, double green, double blue, PreferenceFlows const& flows, double tolerance)
{
	return resolveWinner(VoteShares(red, green, blue), flows, tolerance);
}
