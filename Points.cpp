#include "Points.h"

#include "General.h"

double Point2D::distance(Point2D other) const {
	return (*this - other).magnitude();
}

std::string Point2D::stringify() const
{
	return "(" + formatFloat(x, 6) + ", " + formatFloat(y, 6) + ")";
}
