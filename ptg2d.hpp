#pragma once

#include <vector>
#include <random>
#include <unordered_map>
#include <unordered_set>
#include <limits>

#include "geometry.hpp"


namespace PTG
{
	typedef size_t IdxType;
	typedef unsigned short ColorClass;

	static IdxType INVALID_VTX_IDX = 0;     // vertex indices start at 1
	static IdxType UNBOUNDED_IDX = std::numeric_limits<IdxType>::max();

	enum InsertResultType
	{
		IR_SUCCESS = 0,
		IR_INVALID_BOUNDARY_VERTEX,
		IR_EMPTY_GRAPH,
	};

	typedef std::unordered_set<IdxType> IdxUSet;

	class Vertex
	{
	public:
		explicit Vertex(IdxType index, const Point& pos, ColorClass color, PrecisionType radius)
			: index(index), pos(pos), color(color), radius(radius)
		{
		}
		inline IdxType Index() const { return index; };
		inline const Point& Pos() const { return pos; };
		inline PrecisionType X() const { return pos.X(); };
		inline PrecisionType Y() const { return pos.Y(); };
		inline void SetPos(const Point& p) { pos = p; };
		inline ColorClass Color() const { return color; };
		inline PrecisionType Radius() const { return radius; };
		inline const IdxUSet& Neighbors() const { return neighbors; };
		inline size_t Degree() const { return neighbors.size(); };
		bool IsNeighbor(IdxType v) const { return neighbors.count(v) != 0; };
		bool Contains(const Point& p) const { return Distance(pos, p) <= radius; };
	private:
		friend class PlanarGraph;
		IdxType index;
		Point pos;
		ColorClass color;
		PrecisionType radius;
		IdxUSet neighbors;
	};

	class Edge
	{
	public:
		Edge()
		{
			vertices = std::make_pair(INVALID_VTX_IDX, INVALID_VTX_IDX);
		};
		Edge(IdxType v1, IdxType v2)
		{
			// undirected edge's vertices store as (min, max)
			if (v2 < v1)
				vertices = std::make_pair(v2, v1);
			else
				vertices = std::make_pair(v1, v2);
		};
		inline IdxType V1() const { return vertices.first; };
		inline IdxType V2() const { return vertices.second; };
		bool operator==(const Edge& edge) const
		{
			return vertices.first == edge.V1() && vertices.second == edge.V2();
		}
		bool operator<(const Edge& edge) const
		{
			return vertices < std::make_pair(edge.V1(), edge.V2());
		}
	private:
		std::pair<IdxType, IdxType> vertices;
	};

	inline static void hash_combine_value(std::size_t& seed, std::size_t hash_value)
	{
		seed ^= hash_value + 0x9e3779b9 + (seed << 6) + (seed >> 2);
	}

	template <class T>
	inline static void hash_combine(std::size_t& seed, const T& v)
	{
		std::hash<T> hasher;
		hash_combine_value(seed, hasher(v));
	}

	struct HashEdge
	{
		size_t operator()(const Edge& edge) const
		{
			size_t value = 0;
			hash_combine(value, edge.V1());
			hash_combine(value, edge.V2());
			return value;
		}
	};

	typedef std::unordered_set<Edge, HashEdge> EdgeUSet;
	typedef std::vector<IdxType> IdxList;

	class PlanarGraph
	{
	public:
		explicit PlanarGraph(unsigned int randomSeed = std::mt19937::default_seed);

		/* Drop everything and install the seed triangle 1, 2, 3 (ccw)*/
		void Reset();

		/* Fan insertion: a new vertex joined to every periphery vertex on the ccw
		arc vp..vq. The arc interior leaves the periphery, vp and vq stay*/
		InsertResultType InsertOnArc(IdxType vp, IdxType vq, ColorClass color, IdxType& newVtx);

		/* Fan insertion over a random arc with at least one interior vertex.
		Return INVALID_VTX_IDX if no such arc exists*/
		IdxType InsertRandom();

		/* Gift wrapping over vertex positions only (diagnostic, listed cw)*/
		IdxList RecomputeBoundary() const;

		void SetTruncation(IdxType m);
		void ClearTruncation();
		inline IdxType GetTruncation() const { return maxVisibleIdx; };
		inline bool IsTruncated() const { return maxVisibleIdx != UNBOUNDED_IDX; };
		inline bool IsVisible(IdxType v) const { return v <= maxVisibleIdx; };

		/* Layout hook, topology is left untouched*/
		void SetVertexPos(IdxType v, const Point& pos);

		/* Lowest index visible vertex whose disc contains p*/
		IdxType FindVertexAt(const Point& p) const;

		const std::vector<Vertex>& GetVertices() const { return vertices; };
		const EdgeUSet& GetEdges() const { return edges; };
		const IdxList& GetPeriphery() const { return periphery; };
		const Vertex& GetVertex(IdxType v) const;
		bool HasVertex(IdxType v) const { return v != INVALID_VTX_IDX && v <= vertices.size(); };
		bool HasEdge(IdxType v1, IdxType v2) const { return edges.count(Edge(v1, v2)) != 0; };
		bool IsOnPeriphery(IdxType v) const { return peripheryPos.count(v) != 0; };

		std::vector<const Vertex*> GetVisibleVertices() const;
		std::vector<Edge> GetVisibleEdges() const;
		IdxList GetVisiblePeriphery() const;
		/* Entries of list that pass the truncation filter, order kept*/
		IdxList FilterVisible(const IdxList& list) const;

		inline size_t VertexCount() const { return vertices.size(); };
		inline size_t EdgeCount() const { return edges.size(); };
		inline bool IsEmpty() const { return vertices.empty(); };

		inline ColorClass GetColorClassCount() const { return colorClassCount; };
		inline void SetVerbose(bool isVerbose) { verbose = isVerbose; };

	private:
		IdxType addVertex(const Point& pos, ColorClass color);
		void addEdge(IdxType v1, IdxType v2);

		/* Periphery vertices from vp to vq inclusive, walking in stored order*/
		IdxList collectArc(IdxType vp, IdxType vq) const;
		Point placeOutside(const IdxList& arc) const;
		void spliceArc(IdxType vp, IdxType vq, IdxType newVtx);
		void reindexPeriphery();

		ColorClass randomColor();
		size_t randomPos(size_t lo, size_t hi);

	private:
		/* vertex with index i lives at vertices[i - 1]*/
		std::vector<Vertex> vertices;
		EdgeUSet edges;
		/* ccw boundary of the outer face*/
		IdxList periphery;
		/* vertex index to its position in periphery*/
		std::unordered_map<IdxType, size_t> peripheryPos;

		IdxType maxVisibleIdx = UNBOUNDED_IDX;

		std::mt19937 rng;
		bool verbose = true;

		PrecisionType seedSpan = 100.0;        // half width of the seed triangle
		PrecisionType offsetDistance = 100.0;  // distance of a new vertex from its arc centroid
		PrecisionType baseRadius = 20.0;       // vertex disc radius
		ColorClass colorClassCount = 4;
	};
}
