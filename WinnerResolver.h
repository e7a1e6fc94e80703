#pragma once

#include "Party.h"
#include "PreferenceFlows.h"
#include "VoteShares.h"

#include <optional>
#include <string>

// Outcome of a simulated two-candidate-preferred contest.
// Either a winning party with its 2CP share (always above 0.5), or a tie.
struct WinnerResult {
	static WinnerResult win(Party party, double margin) { return WinnerResult{ party, margin }; }
	static WinnerResult tie() { return WinnerResult{ std::nullopt, 0.0 }; }

	bool isTie() const { return !winner.has_value(); }

	std::string stringify() const;

	std::optional<Party> winner;
	double margin = 0.0;
};

// The comparison tolerance used for a grid of the given step size.
constexpr double toleranceFromStep(double step) { return step / 10.0; }

// Given three-party vote shares, works out which party is excluded (comes third),
// distributes its preferences and reports the 2CP winner.
// Ties for third are resolved when the leading party wins under either exclusion order,
// in which case the tighter 2CP result is reported.
// "tolerance" is the distance within which two shares (or two 2CP totals) are treated as equal.
WinnerResult resolveWinner(VoteShares const& shares, PreferenceFlows const& flows, double tolerance);

// As above, but takes raw shares and validates them first.
// Throws InvalidVoteSharesException if they are out of range or don't sum to 1.
WinnerResult resolveWinner(double red, double green, double blue, PreferenceFlows const& flows, double tolerance);

// The two 2CP totals obtained when "excluded" is eliminated and its preferences
// distributed to the other two parties, in the order given by the remaining parties' enum order.
struct TwoCandidateTotals {
	Party first;
	double firstTotal;
	Party second;
	double secondTotal;
};

TwoCandidateTotals distributePreferences(VoteShares const& shares, PreferenceFlows const& flows, Party excluded);
