#include "UniquenessRegistry.hpp"

bool UniquenessRegistry::contains(const Cell& c) const
	{
	return used.find(c) != used.end();
	}

bool UniquenessRegistry::insert(const Cell& c)
	{
	return used.insert(c).second;
	}
