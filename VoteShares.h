#pragma once

#include "Party.h"

#include <array>
#include <stdexcept>
#include <string>

class InvalidVoteSharesException : public std::runtime_error {
public:
	InvalidVoteSharesException(std::string what) : std::runtime_error(what) {}
};

// Three-party vote shares, each between 0 and 1 and summing to 1.
class VoteShares {
public:
	// Allowed deviation from the exact sum/bounds before shares are rejected.
	constexpr static double SumTolerance = 1.0e-9;

	// Throws InvalidVoteSharesException if the shares are out of range or do not sum to 1
	VoteShares(double red, double green, double blue);

	// Builds shares from the two plotted axes (blue on x, green on y), with red taking the remainder.
	// Throws InvalidVoteSharesException if blue + green exceeds 1
	static VoteShares fromAxes(double blue, double green);

	double get(Party party) const { return shares[partyIndex(party)]; }
	double red() const { return get(Party::Red); }
	double green() const { return get(Party::Green); }
	double blue() const { return get(Party::Blue); }

	// Returns a copy with the shares of the given parties replaced
	VoteShares with(Party a, double aShare, Party b, double bShare) const;

	std::string stringify() const;

private:
	// Used only where the shares are already known to be valid
	VoteShares() = default;

	std::array<double, NumParties> shares = {};
};
