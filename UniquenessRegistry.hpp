#pragma once
#include <cstddef>
#include <unordered_set>

#include "structs.hpp"

/*
* Waypoint cells already handed out on one map. Owned by the per-map pass and
* passed by reference to the assigner; cells are only ever added.
*/
class UniquenessRegistry
	{
	public:
		bool contains(const Cell& c) const;

		// false if `c` was already registered
		bool insert(const Cell& c);

		std::size_t size() const { return used.size(); }

	private:
		std::unordered_set<Cell, CellHash> used;
	};
