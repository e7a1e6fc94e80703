#pragma once

#include "Log.h"

#include <cmath>
#include <string>

// A point in vote-share space: x is the Blue share and y is the Green share.
struct Point2D {
	constexpr Point2D(double in_x, double in_y) : x(in_x), y(in_y) {}
	constexpr Point2D() : x(0), y(0) {}

	double magnitude() const { return std::hypot(x, y); }
	double distance(Point2D other) const;

	std::string stringify() const;
	double x;
	double y;
};

inline Logger& operator<<(Logger& loggerToUse, const Point2D& obj) {
	loggerToUse << obj.stringify();
	return loggerToUse;
}

inline constexpr void operator+=(Point2D& lhs, const Point2D& rhs) {
	lhs.x += rhs.x;
	lhs.y += rhs.y;
}

inline constexpr Point2D operator+(Point2D lhs, const Point2D& rhs) {
	lhs += rhs;
	return lhs;
}

inline constexpr void operator-=(Point2D& lhs, const Point2D& rhs) {
	lhs.x -= rhs.x;
	lhs.y -= rhs.y;
}

inline constexpr Point2D operator-(Point2D lhs, const Point2D& rhs) {
	lhs -= rhs;
	return lhs;
}
