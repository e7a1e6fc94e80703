#pragma once

#include "VoteShares.h"
#include "WinnerResolver.h"

#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

class PointsOfInterestFileException : public std::runtime_error {
public:
	PointsOfInterestFileException(std::string what) : std::runtime_error(what) {}
};

struct PointOfInterest {
	VoteShares shares;
	std::string label;
	WinnerResult result;
};

// Reads points of interest as CSV rows of "blue, green[, label]".
// Rows that can't be parsed are logged and skipped.
std::vector<PointOfInterest> loadPointsOfInterest(std::istream& stream, PreferenceFlows const& flows, double tolerance);

// As above, reading from the given file ("-" for standard input).
// Throws PointsOfInterestFileException if the file can't be opened.
std::vector<PointOfInterest> loadPointsOfInterest(std::string const& path, PreferenceFlows const& flows, double tolerance);
