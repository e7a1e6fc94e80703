#include "GridSampler.h"

#include "Log.h"
#include "VisualiserSettings.h"

#include <algorithm>
#include <thread>

std::vector<double> floatRange(double start, double stop, double step)
{
	std::vector<double> values;
	if (!(step > 0.0)) return values;
	for (int count = 0;; ++count) {
		double value = start + double(count) * step;
		if (value >= stop) break;
		values.push_back(value);
	}
	return values;
}

std::vector<GridPoint> sampleGrid(VisualiserSettings const& settings, PreferenceFlows const& flows, int numThreads)
{
	const std::vector<double> axisValues = floatRange(settings.start, settings.stop + settings.step, settings.step);
	const double tolerance = settings.tolerance();
	const int numColumns = int(axisValues.size());

	// One entry per Blue value, so threads never write to the same vector
	std::vector<std::vector<GridPoint>> columns(numColumns);

	auto sampleColumns = [&](int firstColumn, int columnCount) {
		for (int column = firstColumn; column < firstColumn + columnCount; ++column) {
			double blue = axisValues[column];
			for (double green : axisValues) {
				if (green + blue > 1.0) continue;
				VoteShares shares = VoteShares::fromAxes(blue, green);
				columns[column].push_back({ shares, resolveWinner(shares, flows, tolerance) });
			}
		}
	};

	numThreads = std::clamp(numThreads, 1, std::max(numColumns, 1));
	std::vector<int> batchSizes;
	int minBatchSize = numColumns / numThreads;
	for (int i = 0; i < numThreads; ++i) batchSizes.push_back(minBatchSize);
	int extraColumns = numColumns - minBatchSize * numThreads;
	for (int i = 0; i < extraColumns; ++i) ++batchSizes[i];

	std::vector<std::thread> threads;
	threads.resize(numThreads);

	int batchStart = 0;
	for (int thread = 0; thread < numThreads; ++thread) {
		threads[thread] = std::thread(sampleColumns, batchStart, batchSizes[thread]);
		batchStart += batchSizes[thread];
	}

	for (int thread = 0; thread < numThreads; ++thread) {
		if (threads[thread].joinable()) threads[thread].join();
	}

	std::vector<GridPoint> grid;
	for (auto& column : columns) {
		grid.insert(grid.end(), column.begin(), column.end());
	}
	logger << "Sampled " << grid.size() << " grid points using " << numThreads << " thread(s)\n";
	return grid;
}
