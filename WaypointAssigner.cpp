#include "WaypointAssigner.hpp"
#include <algorithm>
#include <utility>
#include <vector>

static inline uint64_t fnv1a_bytes(uint64_t h, const unsigned char* p, std::size_t n)
	{
	for (std::size_t i = 0; i < n; ++i)
		{
		h ^= (uint64_t)p[i];
		h *= 0x100000001b3ull;
		}
	return h;
	}

// Little-endian regardless of host.
static inline uint64_t fnv1a_u64(uint64_t h, uint64_t v)
	{
	unsigned char b[8];
	for (int i = 0; i < 8; ++i) b[i] = (unsigned char)((v >> (8 * i)) & 0xFFu);
	return fnv1a_bytes(h, b, sizeof(b));
	}

static inline uint64_t splitmix64(uint64_t z)
	{
	z += 0x9e3779b97f4a7c15ull;
	z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
	z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
	return z ^ (z >> 31);
	}

uint64_t deriveAgentSeed(uint64_t globalSeed, int agentId, const std::string& scenarioKey)
	{
	uint64_t h = 0xcbf29ce484222325ull;
	h = fnv1a_u64(h, globalSeed);
	h = fnv1a_u64(h, (uint64_t)(int64_t)agentId);
	h = fnv1a_u64(h, (uint64_t)scenarioKey.size());
	h = fnv1a_bytes(h, (const unsigned char*)scenarioKey.data(), scenarioKey.size());
	return splitmix64(h);
	}

std::size_t uniformBelow(std::mt19937_64& gen, std::size_t n)
	{
	const uint64_t range = (uint64_t)n;
	const uint64_t threshold = (0 - range) % range;  // 2^64 mod range
	for (;;)
		{
		const uint64_t r = gen();
		if (r >= threshold) return (std::size_t)(r % range);
		}
	}

// Partial Fisher-Yates: the first k entries of `pool` become the draw, in draw order.
static void draw_prefix(std::mt19937_64& gen, std::vector<Cell>& pool, std::size_t k)
	{
	const std::size_t n = pool.size();
	for (std::size_t i = 0; i < k && i < n; ++i)
		{
		const std::size_t j = i + uniformBelow(gen, n - i);
		std::swap(pool[i], pool[j]);
		}
	}

AssignResult assignWaypoints(uint64_t globalSeed,
		int agentId,
		const std::string& scenarioKey,
		const CellSeq& reach,
		UniquenessRegistry& registry,
		int maxCount)
	{
	AssignResult res;
	if (maxCount <= 0 || reach.empty()) return res;

	const std::size_t want = (std::size_t)maxCount;
	std::mt19937_64 gen(deriveAgentSeed(globalSeed, agentId, scenarioKey));

	std::vector<Cell> available, fallback;
	available.reserve(reach.size());
	for (const Cell& c : reach)
		(registry.contains(c) ? fallback : available).push_back(c);

	if (available.size() >= want)
		{
		draw_prefix(gen, available, want);
		res.waypoints.assign(available.begin(), available.begin() + want);
		}
	else
		{
		draw_prefix(gen, available, available.size());
		res.waypoints = available;

		const std::size_t need = std::min(want - available.size(), fallback.size());
		if (need > 0)
			{
			draw_prefix(gen, fallback, need);
			res.waypoints.insert(res.waypoints.end(), fallback.begin(), fallback.begin() + need);
			res.fallbackUsed = true;
			res.reused = need;
			}
		res.degraded = (reach.size() < want);
		}

	for (const Cell& c : res.waypoints) registry.insert(c);  // fallback cells are already present

	return res;
	}
