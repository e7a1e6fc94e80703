#pragma once

#include "BoundaryGenerator.h"
#include "GridSampler.h"
#include "PointsOfInterest.h"
#include "PreferenceFlows.h"
#include "VisualiserSettings.h"

#include <optional>
#include <vector>

// Everything needed to draw or report on one diagram.
struct WinnerMap {
	VisualiserSettings settings;
	PreferenceFlows flows;
	std::vector<GridPoint> grid;
	Boundaries boundaries;
	std::vector<PointOfInterest> points;
};

// Validates the settings and calculates the grid, boundaries and (if settings.input is set) points of interest.
// Throws InvalidSettingsException or PointsOfInterestFileException.
WinnerMap buildWinnerMap(VisualiserSettings settings, int numThreads);

// Replaces the points of interest with those read from "path", keeping the rest of the map.
void reloadPointsOfInterest(WinnerMap& map, std::string const& path);

// Something on the diagram within "reach" pixels of the given diagram position.
// Points of interest take priority over grid dots, as they're drawn on top.
struct DiagramHit {
	VoteShares shares;
	WinnerResult result;
	std::string label;
};

std::optional<DiagramHit> findDiagramHit(WinnerMap const& map, Point2D position, double reach);
