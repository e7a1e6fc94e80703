#include "PointsOfInterest.h"

#include "General.h"
#include "Log.h"

#include <fstream>
#include <iostream>

namespace {
	class RowParseException : public std::runtime_error {
	public:
		RowParseException(std::string what) : std::runtime_error(what) {}
	};

	PointOfInterest parseRow(std::string const& line, PreferenceFlows const& flows, double tolerance) {
		auto columns = splitString(line, ",");
		if (columns.size() < 2) throw RowParseException("expected at least two columns");
		double blue = 0.0;
		double green = 0.0;
		try {
			blue = parseDouble(columns[0]);
			green = parseDouble(columns[1]);
		}
		catch (std::logic_error const&) {
			throw RowParseException("vote shares must be numbers");
		}
		if (blue + green > 1.0) throw RowParseException("sum of X and Y columns must be <= 1");
		std::string label;
		// Labels may contain commas themselves
		for (size_t column = 2; column < columns.size(); ++column) {
			if (column > 2) label += ",";
			label += columns[column];
		}
		VoteShares shares = VoteShares::fromAxes(blue, green);
		return PointOfInterest{ shares, trimString(label), resolveWinner(shares, flows, tolerance) };
	}
}

std::vector<PointOfInterest> loadPointsOfInterest(std::istream& stream, PreferenceFlows const& flows, double tolerance)
{
	std::vector<PointOfInterest> points;
	std::string line;
	while (std::getline(stream, line)) {
		if (trimString(line).empty()) continue;
		try {
			points.push_back(parseRow(line, flows, tolerance));
		}
		catch (RowParseException const& e) {
			logger << "Could not parse input row: " << e.what() << "\n" << line << "\n";
		}
		catch (InvalidVoteSharesException const& e) {
			logger << "Could not parse input row: " << e.what() << "\n" << line << "\n";
		}
	}
	logger << "Loaded " << points.size() << " points of interest\n";
	return points;
}

std::vector<PointOfInterest> loadPointsOfInterest(std::string const& path, PreferenceFlows const& flows, double tolerance)
{
	if (path == "-") return loadPointsOfInterest(std::cin, flows, tolerance);
	std::ifstream file(path);
	if (!file) throw PointsOfInterestFileException("Could not open points of interest file: " + path);
	return loadPointsOfInterest(file, flows, tolerance);
}
