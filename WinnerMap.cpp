#include "WinnerMap.h"

#include "Log.h"

WinnerMap buildWinnerMap(VisualiserSettings settings, int numThreads)
{
	settings.validate();
	WinnerMap map{ settings, settings.buildFlows(), {}, {}, {} };
	logger << "Building winner map with flows " << map.flows.stringify() << "\n";
	map.grid = sampleGrid(map.settings, map.flows, numThreads);
	map.boundaries = generateBoundaries(map.flows, map.settings.viewport());
	if (!map.settings.input.empty()) {
		map.points = loadPointsOfInterest(map.settings.input, map.flows, map.settings.tolerance());
	}
	return map;
}

void reloadPointsOfInterest(WinnerMap& map, std::string const& path)
{
	auto points = loadPointsOfInterest(path, map.flows, map.settings.tolerance());
	map.points = std::move(points);
	map.settings.input = path;
}

std::optional<DiagramHit> findDiagramHit(WinnerMap const& map, Point2D position, double reach)
{
	for (auto const& point : map.points) {
		Point2D shares(point.shares.blue(), point.shares.green());
		if (!map.settings.viewport().contains(shares)) continue;
		if (map.settings.diagramPosition(shares).distance(position) <= reach) {
			return DiagramHit{ point.shares, point.result, point.label };
		}
	}
	std::optional<DiagramHit> best;
	double bestDistance = reach;
	for (auto const& dot : map.grid) {
		double distance = map.settings.diagramPosition(Point2D(dot.shares.blue(), dot.shares.green())).distance(position);
		if (distance <= bestDistance) {
			bestDistance = distance;
			best = DiagramHit{ dot.shares, dot.result, "" };
		}
	}
	return best;
}
