#pragma once

#include "BoundaryGenerator.h"
#include "GridSampler.h"
#include "PointsOfInterest.h"
#include "PreferenceFlows.h"
#include "VisualiserSettings.h"

#include <array>
#include <ostream>
#include <vector>

struct GridSummary {
	std::array<int, NumParties> wins = {};
	int ties = 0;
	int total() const;
};

GridSummary summariseGrid(std::vector<GridPoint> const& grid);

// Writes a plain-text account of the diagram: flow assumptions, how the grid divides up,
// the change-of-winner lines and the outcome at each point of interest.
void writeReport(std::ostream& os, VisualiserSettings const& settings, PreferenceFlows const& flows,
	std::vector<GridPoint> const& grid, Boundaries const& boundaries, std::vector<PointOfInterest> const& points);
