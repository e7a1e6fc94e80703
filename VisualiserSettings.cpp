#include "VisualiserSettings.h"

#include "General.h"
#include "Log.h"
#include "WinnerResolver.h"

#include <algorithm>
#include <cmath>

constexpr double MinimumStep = 0.002;
constexpr double MaximumStep = 0.05;

// The axis must cover at least this many steps below the 50% line
constexpr double MinimumStepsBelowHalf = 10.0;

std::vector<double> VisualiserSettings::defaultMarks()
{
	std::vector<double> marks;
	for (int i = 0; i < 10; ++i) marks.push_back(double(i) / 10.0);
	return marks;
}

void VisualiserSettings::validate()
{
	step = std::clamp(std::abs(step), MinimumStep, MaximumStep);

	start = std::max(std::min(std::abs(start), 0.5 - MinimumStepsBelowHalf * step), 0.0);

	// If (1 - stop) < start the graph gets distorted
	stop = std::min(std::abs(stop), 1.0 - start);

	if (!(start < stop)) {
		throw InvalidSettingsException("Axis range is empty: start " + formatFloat(start, 3)
			+ " must be below stop " + formatFloat(stop, 3));
	}

	scale = std::max(scale, 1);
	offset = std::max(offset, 1);

	innerWidth = double(scale) * 100.0 * (stop - start);
	width = double(offset + 1) * double(scale) + innerWidth; // extra on right and top
	// scale is pixels per percent, step is percent per dot
	radius = 50.0 * double(scale) * step;

	redToGreen = clampFlowRatio(redToGreen);
	greenToRed = clampFlowRatio(greenToRed);
	blueToRed = clampFlowRatio(blueToRed);
	if (redToBlue) redToBlue = clampFlowRatio(*redToBlue);
	if (greenToBlue) greenToBlue = clampFlowRatio(*greenToBlue);
	if (blueToGreen) blueToGreen = clampFlowRatio(*blueToGreen);

	logger << "Validated settings: start " << start << ", stop " << stop << ", step " << step << "\n";
}

PreferenceFlows VisualiserSettings::buildFlows() const
{
	if (!usesIndependentFlows()) {
		return PreferenceFlows::fromComplementary(redToGreen, greenToRed, blueToRed);
	}
	PreferenceFlows::FlowMatrix matrix = {};
	auto set = [&](Party from, Party to, double value) {
		matrix[partyIndex(from)][partyIndex(to)] = value;
	};
	set(Party::Red, Party::Green, redToGreen);
	set(Party::Red, Party::Blue, redToBlue.value_or(1.0 - clampFlowRatio(redToGreen)));
	set(Party::Green, Party::Red, greenToRed);
	set(Party::Green, Party::Blue, greenToBlue.value_or(1.0 - clampFlowRatio(greenToRed)));
	set(Party::Blue, Party::Red, blueToRed);
	set(Party::Blue, Party::Green, blueToGreen.value_or(1.0 - clampFlowRatio(blueToRed)));
	return PreferenceFlows::fromIndependent(matrix);
}

double VisualiserSettings::tolerance() const
{
	return toleranceFromStep(step);
}

Point2D VisualiserSettings::diagramPosition(Point2D shares) const
{
	double x = (shares.x - start) / (stop - start) * innerWidth + double(offset * scale);
	double y = innerWidth * (1.0 - (shares.y - start) / (stop - start)) + double(scale);
	return Point2D(x, y);
}
