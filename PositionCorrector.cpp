#include "PositionCorrector.hpp"
#include <algorithm>
#include <cstdlib>

std::string correctionReason(const Correction& c)
	{
	if (c.outOfBounds && c.blocked) return "out-of-bounds+obstacle";
	if (c.outOfBounds) return "out-of-bounds";
	if (c.blocked) return "obstacle";
	return "none";
	}

Correction fixPosition(const GRID& grid, const Cell& cell)
	{
	if (grid.width <= 0 || grid.height <= 0 || grid.freeCells.empty())
		throw NoFreeCellError("No free cell to move agent onto");

	Correction r;
	r.original = cell;

	const Cell clamped{ std::max(0, std::min(cell.x, grid.width - 1)),
	                    std::max(0, std::min(cell.y, grid.height - 1)) };
	r.outOfBounds = (clamped != cell);
	r.corrected = clamped;

	if (grid.at(clamped.x, clamped.y)) return r;

	r.blocked = true;
	const int maxD = (grid.width - 1) + (grid.height - 1);
	for (int d = 1; d <= maxD; ++d)
		{
		for (int x = clamped.x - d; x <= clamped.x + d; ++x)
			{
			const int dy = d - std::abs(x - clamped.x);
			const Cell lo{ x, clamped.y - dy };
			if (grid.passable(lo)) { r.corrected = lo; return r; }
			const Cell hi{ x, clamped.y + dy };
			if (dy != 0 && grid.passable(hi)) { r.corrected = hi; return r; }
			}
		}

	// freeCells was non-empty, so every free cell lies within maxD.
	throw NoFreeCellError("No free cell reachable by ring search");
	}
