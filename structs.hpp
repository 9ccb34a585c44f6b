// structs.hpp

#pragma once
#include <cstddef>
#include <functional>
#include <ostream>
#include <vector>

struct Cell
	{
	int x = 0;  // column
	int y = 0;  // row (0 at the top, as in the file)
	};

inline bool operator==(const Cell& a, const Cell& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Cell& a, const Cell& b) { return !(a == b); }

// Canonical row-major order: y first, then x.
inline bool operator<(const Cell& a, const Cell& b)
	{
	return (a.y != b.y) ? (a.y < b.y) : (a.x < b.x);
	}

inline std::ostream& operator<<(std::ostream& os, const Cell& c)
	{
	return os << "(" << c.x << "," << c.y << ")";
	}

struct CellHash
	{
	std::size_t operator()(const Cell& c) const noexcept
		{
		return std::hash<int>()(c.x) ^ (std::hash<int>()(c.y) << 1);
		}
	};

// Waypoint sequence for one agent, in visiting order.
using CellSeq = std::vector<Cell>;
