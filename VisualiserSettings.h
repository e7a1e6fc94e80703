#pragma once

#include "LineClipper.h"
#include "PreferenceFlows.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class InvalidSettingsException : public std::runtime_error {
public:
	InvalidSettingsException(std::string what) : std::runtime_error(what) {}
};

// Everything the user can choose about the diagram.
// Defaults here are the defaults offered on the command line.
struct VisualiserSettings {
	// Complementary-mode flows; the other flow from each party is the remainder
	double redToGreen = 0.8;
	double greenToRed = 0.8;
	double blueToRed = 0.7;

	// If any of these is given, flows are treated independently (with exhausted preferences
	// making up any shortfall). A missing one falls back to the complement of its partner.
	std::optional<double> redToBlue;
	std::optional<double> greenToBlue;
	std::optional<double> blueToGreen;

	double start = 0.2; // minimum X and Y axis value
	double stop = 0.6; // maximum X and Y axis value
	double step = 0.01; // spacing of the sampled dots
	int scale = 10; // pixels per percent
	int offset = 5; // axis offset, as a multiple of the scale
	std::vector<double> marks = defaultMarks();

	// Points of interest CSV, "-" for standard input
	std::string input;

	// Text report destination, "-" for standard output
	std::string report;

	// Quantities derived by validate()
	double innerWidth = 0.0;
	double width = 0.0;
	double radius = 0.0;

	static std::vector<double> defaultMarks();

	// Clamps all values into usable ranges and calculates the derived sizes.
	// Throws InvalidSettingsException if the resulting axis range is empty.
	void validate();

	bool usesIndependentFlows() const { return redToBlue || greenToBlue || blueToGreen; }

	PreferenceFlows buildFlows() const;

	Viewport viewport() const { return Viewport{ start, stop }; }

	double tolerance() const;

	// Maps vote shares (x = blue, y = green) to diagram pixel coordinates, with y increasing downwards.
	Point2D diagramPosition(Point2D shares) const;
};
