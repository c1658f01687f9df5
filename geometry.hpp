#pragma once

#include <utility>


namespace PTG
{
	#define PTG_ZERO 10E-9

	typedef double PrecisionType;
	typedef PrecisionType PredicateType;

	enum PntLineLocationType
	{
		PL_LEFT = 0,
		PL_RIGHT,
		PL_ON_LINE,
	};

	class Point
	{
	public:
		Point()
		{
			pos = std::make_pair(PrecisionType(0), PrecisionType(0));
		}
		explicit Point(PrecisionType x, PrecisionType y)
		{
			pos = std::make_pair(x, y);
		}
		inline PrecisionType X() const { return pos.first; };
		inline PrecisionType Y() const { return pos.second; };
		inline void SetX(PrecisionType x) { pos.first = x; };
		inline void SetY(PrecisionType y) { pos.second = y; };
		bool operator==(const Point& pt) const
		{
			return pos.first == pt.X() && pos.second == pt.Y();
		}
		bool operator!=(const Point& pt) const
		{
			return !(*this == pt);
		}
	private:
		std::pair<PrecisionType, PrecisionType> pos;
	};

	/* Positive if a, b, c are in counter-clockwise order, negative if clockwise,
	zero if collinear (robust adaptive predicate)*/
	PredicateType Orient2d(const Point& a, const Point& b, const Point& c);

	/* Whether c lies strictly to the left of the directed line a->b*/
	bool IsLeft(const Point& a, const Point& b, const Point& c);

	PntLineLocationType LocatePntLine(const Point& v, const Point& v1, const Point& v2);

	PrecisionType Distance(const Point& a, const Point& b);
	PrecisionType SquaredDistance(const Point& a, const Point& b);

	Point Midpoint(const Point& a, const Point& b);
}
