#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "MapfIO.hpp"
#include "structs.hpp"

/*
* Cells reachable from a start by 4-connected moves over free cells.
* `cells` lists them in row-major order, independent of traversal order;
* contains() is an O(1) lookup into a width*height mask.
*/
struct ReachableSet
	{
	int width = 0;
	std::vector<uint8_t> mask;
	std::vector<Cell> cells;

	bool contains(const Cell& c) const
		{
		if (mask.empty() || c.x < 0 || c.y < 0 || c.x >= width) return false;
		const std::size_t i = (std::size_t)c.y * width + c.x;
		return i < mask.size() && mask[i] != 0u;
		}

	std::size_t size() const { return cells.size(); }
	bool empty() const { return cells.empty(); }
	};

// BFS flood fill. Empty result when `start` is out of bounds or blocked.
ReachableSet reachable(const GRID& grid, const Cell& start);

/*
* 4-connected components of the free cells, labelled in one sweep.
* Agents whose starts share a component share one row-major cell list,
* so memory stays O(width*height) however many agents a map has.
*/
struct ComponentIndex
	{
	int width = 0;
	std::vector<int> label;      // component id per cell, -1 when blocked
	std::vector<CellSeq> cells;  // per component, row-major

	// -1 when `c` is out of bounds or blocked.
	int componentOf(const Cell& c) const
		{
		if (c.x < 0 || c.y < 0 || c.x >= width) return -1;
		const std::size_t i = (std::size_t)c.y * width + c.x;
		return i < label.size() ? label[i] : -1;
		}
	};

ComponentIndex labelComponents(const GRID& grid);
