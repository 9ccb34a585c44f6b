#include "Reachability.hpp"
#include <queue>

ReachableSet reachable(const GRID& grid, const Cell& start)
	{
	ReachableSet rs;
	if (!grid.passable(start)) return rs;

	const int W = grid.width, H = grid.height;
	rs.width = W;
	rs.mask.assign((std::size_t)W * H, 0);

	static const int DX[4] = { 0, 0, 1, -1 };
	static const int DY[4] = { 1, -1, 0, 0 };

	std::queue<Cell> q;
	rs.mask[(std::size_t)start.y * W + start.x] = 1;
	q.push(start);

	while (!q.empty())
		{
		const Cell c = q.front(); q.pop();
		for (int d = 0; d < 4; ++d)
			{
			const Cell n{ c.x + DX[d], c.y + DY[d] };
			if (!grid.passable(n)) continue;
			uint8_t& seen = rs.mask[(std::size_t)n.y * W + n.x];
			if (seen) continue;
			seen = 1;
			q.push(n);
			}
		}

	// Row-major listing so that sampling never depends on BFS order.
	for (const Cell& c : grid.freeCells)
		if (rs.mask[(std::size_t)c.y * W + c.x]) rs.cells.push_back(c);

	return rs;
	}

ComponentIndex labelComponents(const GRID& grid)
	{
	ComponentIndex idx;
	const int W = grid.width, H = grid.height;
	idx.width = W;
	idx.label.assign((std::size_t)W * H, -1);

	static const int DX[4] = { 0, 0, 1, -1 };
	static const int DY[4] = { 1, -1, 0, 0 };

	int next = 0;
	std::queue<Cell> q;
	for (const Cell& seed : grid.freeCells)
		{
		if (idx.label[(std::size_t)seed.y * W + seed.x] >= 0) continue;

		const int id = next++;
		idx.label[(std::size_t)seed.y * W + seed.x] = id;
		q.push(seed);
		while (!q.empty())
			{
			const Cell c = q.front(); q.pop();
			for (int d = 0; d < 4; ++d)
				{
				const Cell n{ c.x + DX[d], c.y + DY[d] };
				if (!grid.passable(n)) continue;
				int& l = idx.label[(std::size_t)n.y * W + n.x];
				if (l >= 0) continue;
				l = id;
				q.push(n);
				}
			}
		}

	// freeCells is row-major, so each list comes out row-major too.
	idx.cells.resize(next);
	for (const Cell& c : grid.freeCells)
		idx.cells[idx.label[(std::size_t)c.y * W + c.x]].push_back(c);

	return idx;
	}
