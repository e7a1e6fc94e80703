#pragma once

#include "Party.h"

#include <array>
#include <string>

// Directed preference-flow ratios between the three parties.
// Stored in independent form: each source party has two outflows whose sum
// is at most 1, with the remainder treated as exhausted preferences.
class PreferenceFlows {
public:
	enum class Mode {
		// One ratio per source party is given and the other is its complement
		Complementary,
		// Both ratios per source party are given, normalised so they don't exceed 1 in total
		Independent
	};

	// Row is the source party, column is the destination.
	// Diagonal entries are ignored.
	typedef std::array<std::array<double, NumParties>, NumParties> FlowMatrix;

	// Builds flows in complementary mode from the three ratios the diagram is usually labelled with.
	static PreferenceFlows fromComplementary(double redToGreen, double greenToRed, double blueToRed);

	// Builds flows in independent mode. Each ratio is clamped to [0, 1] (taking the absolute value first)
	// and a source party whose outflows sum to more than 1 is scaled down proportionally.
	static PreferenceFlows fromIndependent(FlowMatrix const& flows);

	// Default flows match the visualiser's defaults (80% Labor->Greens, 80% Greens->Labor, 70% Coalition->Labor)
	PreferenceFlows();

	double get(Party from, Party to) const { return matrix[partyIndex(from)][partyIndex(to)]; }

	// Fraction of the given party's votes that flow to neither of the other parties
	double exhaustRate(Party from) const;

	Mode mode() const { return mode_; }

	std::string stringify() const;

private:
	PreferenceFlows(FlowMatrix const& flows, Mode mode);

	FlowMatrix matrix = {};

	Mode mode_ = Mode::Complementary;
};

// Clamps a user-supplied ratio to [0, 1], treating negative values by their magnitude
double clampFlowRatio(double value);
