#include <cmath>

#include "predicates.hpp"
#include "geometry.hpp"


namespace PTG
{
	PredicateType Orient2d(const Point& a, const Point& b, const Point& c)
	{
		return predicates::adaptive::orient2d(
			a.X(), a.Y(),
			b.X(), b.Y(),
			c.X(), c.Y()
		);
	}

	bool IsLeft(const Point& a, const Point& b, const Point& c)
	{
		return Orient2d(a, b, c) > 0;
	}

	PntLineLocationType LocatePntLine(const Point& v, const Point& v1, const Point& v2)
	{
		/* NOTE: orient2d(v1, v2, v) > 0 means v is on the left of v1->v2*/
		PredicateType orient = Orient2d(v1, v2, v);
		if (orient < 0)
			return PntLineLocationType::PL_RIGHT;
		if (orient > 0)
			return PntLineLocationType::PL_LEFT;
		return PntLineLocationType::PL_ON_LINE;
	}

	PrecisionType SquaredDistance(const Point& a, const Point& b)
	{
		PrecisionType dx = a.X() - b.X();
		PrecisionType dy = a.Y() - b.Y();
		return dx * dx + dy * dy;
	}

	PrecisionType Distance(const Point& a, const Point& b)
	{
		return std::sqrt(SquaredDistance(a, b));
	}

	Point Midpoint(const Point& a, const Point& b)
	{
		return Point((a.X() + b.X()) / 2.0, (a.Y() + b.Y()) / 2.0);
	}
}
