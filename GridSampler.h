#pragma once

#include "VoteShares.h"
#include "WinnerResolver.h"

#include <vector>

struct VisualiserSettings;

struct GridPoint {
	VoteShares shares;
	WinnerResult result;
};

// Values start, start + step, start + 2 * step, ... strictly below "stop".
// Each value is calculated from its index rather than accumulated, so rounding errors don't build up.
std::vector<double> floatRange(double start, double stop, double step);

// Classifies every dot of the diagram's grid. Blue runs along the outer loop and Green along the inner,
// and dots where Blue and Green together exceed the whole vote are skipped.
// Work is split by Blue value across "numThreads" threads; the output order doesn't depend on the thread count.
std::vector<GridPoint> sampleGrid(VisualiserSettings const& settings, PreferenceFlows const& flows, int numThreads = 1);
