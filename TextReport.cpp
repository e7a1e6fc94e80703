#include "TextReport.h"

#include "General.h"
#include "OutcomeText.h"

// Exhaust rates below this are rounding left over from complementary flows
constexpr double ReportedExhaustThreshold = 1.0e-9;

int GridSummary::total() const
{
	int sum = ties;
	for (int partyWins : wins) sum += partyWins;
	return sum;
}

GridSummary summariseGrid(std::vector<GridPoint> const& grid)
{
	GridSummary summary;
	for (auto const& point : grid) {
		if (point.result.isTie()) ++summary.ties;
		else ++summary.wins[partyIndex(*point.result.winner)];
	}
	return summary;
}

void writeReport(std::ostream& os, VisualiserSettings const& settings, PreferenceFlows const& flows,
	std::vector<GridPoint> const& grid, Boundaries const& boundaries, std::vector<PointOfInterest> const& points)
{
	os << "Three-candidate-preferred outcomes\n";
	os << "Axes: " << partyName(Party::Blue) << " (x) and " << partyName(Party::Green) << " (y), from "
		<< formatPercent(settings.start) << " to " << formatPercent(settings.stop) << "\n";
	os << "Preference flows (" << (flows.mode() == PreferenceFlows::Mode::Independent ? "independent" : "complementary") << "):\n";
	for (auto from : AllParties) {
		for (auto to : AllParties) {
			if (to == from) continue;
			os << "  " << describeFlow(from, to, flows) << "\n";
		}
		if (flows.exhaustRate(from) > ReportedExhaustThreshold) {
			os << "  " << partyName(from) << " exhausted: " << formatFloat(100.0 * flows.exhaustRate(from), 1) << "%\n";
		}
	}

	GridSummary summary = summariseGrid(grid);
	os << "Grid (" << summary.total() << " points, step " << formatFloat(settings.step, 3) << "):\n";
	for (auto party : AllParties) {
		os << "  " << partyName(party) << ": " << summary.wins[partyIndex(party)] << "\n";
	}
	os << "  Tie: " << summary.ties << "\n";

	os << "Boundaries:\n";
	for (auto const& boundary : boundaries.lines) {
		os << "  " << boundaryName(boundary.kind);
		if (boundary.regime) os << " (" << regimeName(*boundary.regime) << ")";
		os << ":";
		if (!boundary.visible()) os << " not visible";
		for (auto const& path : boundary.visiblePaths()) {
			os << " [";
			bool first = true;
			for (auto const& vertex : path) {
				if (!first) os << " ";
				os << vertex.stringify();
				first = false;
			}
			os << "]";
		}
		os << "\n";
	}

	if (!points.empty()) {
		os << "Points of interest:\n";
		for (auto const& point : points) {
			os << "  " << (point.label.empty() ? std::string("(unlabelled)") : point.label) << ": "
				<< describeShares(point.shares) << " " << describeWinner(point.result) << "\n";
		}
	}
}
