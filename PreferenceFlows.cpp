#include "PreferenceFlows.h"

#include "General.h"

#include <algorithm>
#include <cmath>

double clampFlowRatio(double value)
{
	if (std::isnan(value)) return 0.0;
	return std::clamp(std::abs(value), 0.0, 1.0);
}

PreferenceFlows::PreferenceFlows()
	: PreferenceFlows(fromComplementary(0.8, 0.8, 0.7))
{
}

PreferenceFlows::PreferenceFlows(FlowMatrix const& flows, Mode mode)
	: matrix(flows), mode_(mode)
{
	for (auto party : AllParties) {
		matrix[partyIndex(party)][partyIndex(party)] = 0.0;
	}
}

PreferenceFlows PreferenceFlows::fromComplementary(double redToGreen, double greenToRed, double blueToRed)
{
	redToGreen = clampFlowRatio(redToGreen);
	greenToRed = clampFlowRatio(greenToRed);
	blueToRed = clampFlowRatio(blueToRed);

	FlowMatrix flows = {};
	flows[partyIndex(Party::Red)][partyIndex(Party::Green)] = redToGreen;
	flows[partyIndex(Party::Red)][partyIndex(Party::Blue)] = 1.0 - redToGreen;
	flows[partyIndex(Party::Green)][partyIndex(Party::Red)] = greenToRed;
	flows[partyIndex(Party::Green)][partyIndex(Party::Blue)] = 1.0 - greenToRed;
	flows[partyIndex(Party::Blue)][partyIndex(Party::Red)] = blueToRed;
	flows[partyIndex(Party::Blue)][partyIndex(Party::Green)] = 1.0 - blueToRed;
	return PreferenceFlows(flows, Mode::Complementary);
}

PreferenceFlows PreferenceFlows::fromIndependent(FlowMatrix const& flows)
{
	FlowMatrix normalised = {};
	for (auto from : AllParties) {
		int source = partyIndex(from);
		double total = 0.0;
		for (auto to : AllParties) {
			if (to == from) continue;
			normalised[source][partyIndex(to)] = clampFlowRatio(flows[source][partyIndex(to)]);
			total += normalised[source][partyIndex(to)];
		}
		if (total > 1.0) {
			for (auto to : AllParties) {
				normalised[source][partyIndex(to)] /= total;
			}
		}
	}
	return PreferenceFlows(normalised, Mode::Independent);
}

double PreferenceFlows::exhaustRate(Party from) const
{
	double transferred = 0.0;
	for (auto to : AllParties) {
		if (to != from) transferred += get(from, to);
	}
	return std::max(0.0, 1.0 - transferred);
}

std::string PreferenceFlows::stringify() const
{
	std::string out;
	for (auto from : AllParties) {
		for (auto to : AllParties) {
			if (to == from) continue;
			if (!out.empty()) out += ", ";
			out += partyName(from) + "->" + partyName(to) + ": " + formatFloat(get(from, to), 3);
		}
	}
	return out;
}
