#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "ptg2d.hpp"


namespace PTG
{
	PlanarGraph::PlanarGraph(unsigned int randomSeed)
		: rng(randomSeed)
	{
	}

	void PlanarGraph::Reset()
	{
		vertices.clear();
		edges.clear();
		periphery.clear();
		peripheryPos.clear();

		// ccw seed triangle: bottom left, bottom right, top
		IdxType v1 = addVertex(Point(-seedSpan, -seedSpan / 2.0), 0);
		IdxType v2 = addVertex(Point(seedSpan, -seedSpan / 2.0), 1);
		IdxType v3 = addVertex(Point(0.0, seedSpan), 2);

		addEdge(v1, v2);
		addEdge(v2, v3);
		addEdge(v3, v1);

		periphery.push_back(v1);
		periphery.push_back(v2);
		periphery.push_back(v3);
		reindexPeriphery();

		maxVisibleIdx = UNBOUNDED_IDX;

		if (verbose)
		{
			std::cout << "------------------Reset--------------------" << std::endl;
			std::cout << "seed triangle: " << v1 << ' ' << v2 << ' ' << v3 << std::endl;
			std::cout << std::endl;
		}
	}

	InsertResultType PlanarGraph::InsertOnArc(IdxType vp, IdxType vq, ColorClass color, IdxType& newVtx)
	{
		newVtx = INVALID_VTX_IDX;
		if (periphery.empty())
			return InsertResultType::IR_EMPTY_GRAPH;

		// validate everything up front, nothing below may fail
		if (vp == vq || !IsOnPeriphery(vp) || !IsOnPeriphery(vq) || color >= colorClassCount)
		{
			if (verbose)
			{
				std::cout << "rejected arc (" << vp << ", " << vq << "): "
					<< "endpoints must be two distinct periphery vertices" << std::endl;
			}
			return InsertResultType::IR_INVALID_BOUNDARY_VERTEX;
		}

		IdxList arc = collectArc(vp, vq);
		Point pos = placeOutside(arc);

		newVtx = addVertex(pos, color);
		for (IdxType v : arc)
		{
			addEdge(newVtx, v);
		}
		spliceArc(vp, vq, newVtx);

		if (verbose)
		{
			std::cout << "vertex " << newVtx << " joined to " << arc.size() << " periphery vertices"
				<< ", periphery size: " << periphery.size() << std::endl;
		}
		return InsertResultType::IR_SUCCESS;
	}

	IdxType PlanarGraph::InsertRandom()
	{
		// two listing positions at least 2 apart so the arc has an interior vertex
		size_t n = periphery.size();
		if (n < 3)
			return INVALID_VTX_IDX;

		size_t lo = randomPos(0, n - 3);
		size_t hi = randomPos(lo + 2, n - 1);

		IdxType newVtx = INVALID_VTX_IDX;
		if (InsertOnArc(periphery[lo], periphery[hi], randomColor(), newVtx) != InsertResultType::IR_SUCCESS)
			return INVALID_VTX_IDX;
		return newVtx;
	}

	IdxList PlanarGraph::RecomputeBoundary() const
	{
		/* Jarvis march: from the current hull point p pick w such that no vertex
		 * lies on the left of p->w, which walks the hull clockwise.
		 *
		 * Collinear candidates are resolved by taking the furthest one, so hull
		 * edges never stop at an intermediate collinear vertex. Vertices sharing
		 * the position of p are skipped. The walk is bounded by the vertex count,
		 * on degenerate input the partial hull is returned.
		 */
		IdxList hull;
		if (vertices.empty())
			return hull;

		IdxType start = vertices.front().Index();
		for (const Vertex& vtx : vertices)
		{
			const Point& best = GetVertex(start).Pos();
			if (vtx.X() < best.X() || (vtx.X() == best.X() && vtx.Y() < best.Y()))
				start = vtx.Index();
		}

		size_t steps = 0;
		IdxType pointOnHull = start;
		while (true)
		{
			hull.push_back(pointOnHull);
			const Point& p = GetVertex(pointOnHull).Pos();

			IdxType endpoint = INVALID_VTX_IDX;
			for (const Vertex& vtx : vertices)
			{
				if (vtx.Index() == pointOnHull || vtx.Pos() == p)
					continue;
				if (endpoint == INVALID_VTX_IDX)
				{
					endpoint = vtx.Index();
					continue;
				}
				const Point& e = GetVertex(endpoint).Pos();
				PntLineLocationType plLocType = LocatePntLine(vtx.Pos(), p, e);
				if (plLocType == PntLineLocationType::PL_LEFT)
				{
					endpoint = vtx.Index();
				}
				else if (plLocType == PntLineLocationType::PL_ON_LINE &&
					SquaredDistance(p, vtx.Pos()) > SquaredDistance(p, e))
				{
					endpoint = vtx.Index();
				}
			}

			if (endpoint == INVALID_VTX_IDX || endpoint == start)
				break;
			if (++steps >= vertices.size())
				break;
			pointOnHull = endpoint;
		}

		if (verbose)
		{
			std::cout << "recovered boundary size: " << hull.size()
				<< ", periphery size: " << periphery.size() << std::endl;
		}
		return hull;
	}

	void PlanarGraph::SetTruncation(IdxType m)
	{
		maxVisibleIdx = m;
	}

	void PlanarGraph::ClearTruncation()
	{
		maxVisibleIdx = UNBOUNDED_IDX;
	}

	void PlanarGraph::SetVertexPos(IdxType v, const Point& pos)
	{
		if (!HasVertex(v))
			throw std::out_of_range("PlanarGraph::SetVertexPos: no vertex with this index");
		vertices[v - 1].SetPos(pos);
	}

	IdxType PlanarGraph::FindVertexAt(const Point& p) const
	{
		for (const Vertex& vtx : vertices)
		{
			if (IsVisible(vtx.Index()) && vtx.Contains(p))
				return vtx.Index();
		}
		return INVALID_VTX_IDX;
	}

	const Vertex& PlanarGraph::GetVertex(IdxType v) const
	{
		if (!HasVertex(v))
			throw std::out_of_range("PlanarGraph::GetVertex: no vertex with this index");
		return vertices[v - 1];
	}

	std::vector<const Vertex*> PlanarGraph::GetVisibleVertices() const
	{
		std::vector<const Vertex*> visible;
		for (const Vertex& vtx : vertices)
		{
			if (IsVisible(vtx.Index()))
				visible.push_back(&vtx);
		}
		return visible;
	}

	std::vector<Edge> PlanarGraph::GetVisibleEdges() const
	{
		std::vector<Edge> visible;
		for (const Edge& edge : edges)
		{
			// V2 is the larger index
			if (IsVisible(edge.V2()))
				visible.push_back(edge);
		}
		std::sort(visible.begin(), visible.end());
		return visible;
	}

	IdxList PlanarGraph::GetVisiblePeriphery() const
	{
		return FilterVisible(periphery);
	}

	IdxList PlanarGraph::FilterVisible(const IdxList& list) const
	{
		IdxList visible;
		for (IdxType v : list)
		{
			if (IsVisible(v))
				visible.push_back(v);
		}
		return visible;
	}

	IdxType PlanarGraph::addVertex(const Point& pos, ColorClass color)
	{
		// discs grow slightly with the graph so that long labels still fit
		PrecisionType radius = baseRadius + std::min<size_t>(10, vertices.size() / 100);
		IdxType index = vertices.size() + 1;
		vertices.push_back(Vertex(index, pos, color, radius));
		return index;
	}

	void PlanarGraph::addEdge(IdxType v1, IdxType v2)
	{
		if (v1 == v2 || !HasVertex(v1) || !HasVertex(v2))
			return;
		if (!edges.insert(Edge(v1, v2)).second)
			return;
		vertices[v1 - 1].neighbors.insert(v2);
		vertices[v2 - 1].neighbors.insert(v1);
	}

	IdxList PlanarGraph::collectArc(IdxType vp, IdxType vq) const
	{
		IdxList arc;
		size_t n = periphery.size();
		size_t i = peripheryPos.at(vp);
		size_t iq = peripheryPos.at(vq);
		while (true)
		{
			arc.push_back(periphery[i]);
			if (i == iq)
				break;
			i = (i + 1) % n;
		}
		return arc;
	}

	Point PlanarGraph::placeOutside(const IdxList& arc) const
	{
		/* Heuristic placement, not a visibility guarantee:
		 * start at the arc centroid and move along the direction centroid->chord
		 * midpoint, oriented towards the right of the chord vp->vq. For a ccw
		 * periphery that is the outer side of every arc, the whole periphery
		 * included, since the kept edge vq->vp has the interior on its left.
		 *
		 * The step is the shortest one that puts every interior arc vertex inside
		 * the triangle vp, new, vq, plus offsetDistance. Both containment tests
		 * are linear in the step, so each vertex yields a lower bound.
		 */
		const Point& p = GetVertex(arc.front()).Pos();
		const Point& q = GetVertex(arc.back()).Pos();

		PrecisionType cx = 0.0;
		PrecisionType cy = 0.0;
		for (IdxType v : arc)
		{
			cx += GetVertex(v).X();
			cy += GetVertex(v).Y();
		}
		cx /= arc.size();
		cy /= arc.size();

		Point mid = Midpoint(p, q);
		PrecisionType outX = q.Y() - p.Y();
		PrecisionType outY = p.X() - q.X();

		PrecisionType dx = mid.X() - cx;
		PrecisionType dy = mid.Y() - cy;
		PrecisionType length = std::sqrt(dx * dx + dy * dy);
		if (length <= PTG_ZERO)
		{
			dx = outX;
			dy = outY;
			length = std::sqrt(dx * dx + dy * dy);
		}
		else if (dx * outX + dy * outY < 0)
		{
			dx = -dx;
			dy = -dy;
		}
		if (length <= PTG_ZERO)
		{
			// endpoints coincide: fixed downward offset
			dx = 0.0;
			dy = -1.0;
			length = 1.0;
		}
		dx /= length;
		dy /= length;

		PrecisionType step = 0.0;
		for (size_t i = 1; i + 1 < arc.size(); i++)
		{
			const Point& x = GetVertex(arc[i]).Pos();
			// orient2d(vp, new, x) = a0 + step * a1
			PrecisionType a0 = (cx - p.X()) * (x.Y() - p.Y()) - (cy - p.Y()) * (x.X() - p.X());
			PrecisionType a1 = dx * (x.Y() - p.Y()) - dy * (x.X() - p.X());
			// orient2d(new, vq, x) = b0 + step * b1
			PrecisionType b0 = (x.X() - q.X()) * (cy - q.Y()) - (x.Y() - q.Y()) * (cx - q.X());
			PrecisionType b1 = (x.X() - q.X()) * dy - (x.Y() - q.Y()) * dx;
			if (a1 > PTG_ZERO)
				step = std::max(step, -a0 / a1);
			if (b1 > PTG_ZERO)
				step = std::max(step, -b0 / b1);
		}
		step += offsetDistance;

		return Point(cx + dx * step, cy + dy * step);
	}

	void PlanarGraph::spliceArc(IdxType vp, IdxType vq, IdxType newVtx)
	{
		size_t ip = peripheryPos.at(vp);
		size_t iq = peripheryPos.at(vq);
		IdxList spliced;
		spliced.reserve(periphery.size() + 1);
		if (ip < iq)
		{
			// [.. vp] new [vq ..]
			spliced.insert(spliced.end(), periphery.begin(), periphery.begin() + ip + 1);
			spliced.push_back(newVtx);
			spliced.insert(spliced.end(), periphery.begin() + iq, periphery.end());
		}
		else
		{
			// the arc wraps past the end: keep [vq .. vp] and close with new
			spliced.insert(spliced.end(), periphery.begin() + iq, periphery.begin() + ip + 1);
			spliced.push_back(newVtx);
		}
		periphery.swap(spliced);
		reindexPeriphery();
	}

	void PlanarGraph::reindexPeriphery()
	{
		peripheryPos.clear();
		for (size_t i = 0; i < periphery.size(); i++)
		{
			peripheryPos[periphery[i]] = i;
		}
	}

	ColorClass PlanarGraph::randomColor()
	{
		std::uniform_int_distribution<int> dist(0, colorClassCount - 1);
		return static_cast<ColorClass>(dist(rng));
	}

	size_t PlanarGraph::randomPos(size_t lo, size_t hi)
	{
		std::uniform_int_distribution<size_t> dist(lo, hi);
		return dist(rng);
	}
}
