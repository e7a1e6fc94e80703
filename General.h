#pragma once

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

inline std::string formatFloat(double floatToFormat, int numDigits, bool addPlusToPositives = false) {
	if (std::isnan(floatToFormat)) return "none";
	std::stringstream ss;
	if (addPlusToPositives && !std::signbit(floatToFormat)) ss << "+";
	ss << std::fixed << std::setprecision(numDigits) << floatToFormat;
	return ss.str();
}

// Formats a proportion (0-1) as a percentage with one decimal place,
// dropping the decimal when it would be zero ("30%" rather than "30.0%").
inline std::string formatPercent(double proportion) {
	std::string formatted = formatFloat(proportion * 100.0, 1);
	if (formatted.size() > 2 && formatted.compare(formatted.size() - 2, 2, ".0") == 0) {
		formatted.erase(formatted.size() - 2);
	}
	if (formatted == "-0") formatted = "0";
	return formatted + "%";
}

inline std::vector<std::string> splitString(std::string s, std::string const& delimiter) {
	std::vector<std::string> tokens;
	size_t pos = 0;
	while ((pos = s.find(delimiter)) != std::string::npos) {
		tokens.emplace_back(s.substr(0, pos));
		s.erase(0, pos + delimiter.length());
	}
	tokens.emplace_back(s);
	return tokens;
}

inline std::string trimString(std::string const& s) {
	const std::string whitespace = " \t\r\n\f\v";
	auto first = s.find_first_not_of(whitespace);
	if (first == std::string::npos) return "";
	auto last = s.find_last_not_of(whitespace);
	return s.substr(first, last - first + 1);
}

// Converts the whole of the string to a double.
// Throws std::invalid_argument if there is anything other than a number (after trimming)
inline double parseDouble(std::string const& s) {
	std::string trimmed = trimString(s);
	size_t charsUsed = 0;
	double value = std::stod(trimmed, &charsUsed);
	if (charsUsed != trimmed.size()) throw std::invalid_argument("Trailing characters in number: " + s);
	return value;
}

// Splits a string into an vector of double values according to the provided delimiter
// Throws std::invalid_argument if a value cannot be converted to a double
inline std::vector<double> splitStringD(std::string s, std::string const& delimiter) {
	auto stringTokens = splitString(s, delimiter);
	std::vector<double> values;
	std::transform(stringTokens.begin(), stringTokens.end(), std::back_inserter(values),
		[](std::string const& s) {return parseDouble(s); });
	return values;
}
