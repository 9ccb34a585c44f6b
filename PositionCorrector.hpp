#pragma once
#include <string>

#include "MapfIO.hpp"
#include "structs.hpp"

struct Correction
	{
	Cell original;
	Cell corrected;
	bool outOfBounds = false;  // clamped into the grid
	bool blocked     = false;  // clamped cell was an obstacle, moved to nearest free cell

	bool changed() const { return outOfBounds || blocked; }
	};

// "out-of-bounds", "obstacle", "out-of-bounds+obstacle" or "none"
std::string correctionReason(const Correction& c);

/*
* Snap `cell` onto a free cell:
*   1. clamp x into [0,W-1] and y into [0,H-1];
*   2. if that cell is blocked, scan rings of growing Manhattan distance,
*      increasing x then increasing y inside a ring, and take the first free cell.
* Throws NoFreeCellError if the grid has no free cell.
*/
Correction fixPosition(const GRID& grid, const Cell& cell);
