#include "VoteShares.h"

#include "General.h"

#include <algorithm>
#include <cmath>

VoteShares::VoteShares(double red, double green, double blue)
	: shares{ { red, green, blue } }
{
	for (auto share : shares) {
		if (std::isnan(share) || share < -SumTolerance || share > 1.0 + SumTolerance) {
			throw InvalidVoteSharesException("Vote share out of range: " + stringify());
		}
	}
	double sum = red + green + blue;
	if (std::abs(sum - 1.0) > SumTolerance) {
		throw InvalidVoteSharesException("Vote shares do not sum to 1: " + stringify());
	}
}

VoteShares VoteShares::fromAxes(double blue, double green)
{
	if (blue + green > 1.0 + SumTolerance) {
		throw InvalidVoteSharesException("Sum of blue and green shares must be <= 1: "
			+ formatFloat(blue, 4) + ", " + formatFloat(green, 4));
	}
	return VoteShares(std::max(1.0 - (blue + green), 0.0), green, blue);
}

VoteShares VoteShares::with(Party a, double aShare, Party b, double bShare) const
{
	VoteShares copy;
	copy.shares = shares;
	copy.shares[partyIndex(a)] = aShare;
	copy.shares[partyIndex(b)] = bShare;
	return copy;
}

std::string VoteShares::stringify() const
{
	return "(" + formatFloat(red(), 6) + ", " + formatFloat(green(), 6) + ", " + formatFloat(blue(), 6) + ")";
}
