#pragma once
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

#include "UniquenessRegistry.hpp"
#include "structs.hpp"

struct AssignResult
	{
	CellSeq waypoints;          // visiting order; prefixes serve the smaller counts
	bool fallbackUsed = false;  // some waypoints were already taken by another agent
	bool degraded     = false;  // fewer reachable cells than requested
	std::size_t reused = 0;     // number of waypoints drawn from the fallback pool
	};

/*
* Stable per-agent seed: FNV-1a over (globalSeed, agentId, scenarioKey) followed
* by a SplitMix64 finaliser. Pure; does not depend on any other agent.
*/
uint64_t deriveAgentSeed(uint64_t globalSeed, int agentId, const std::string& scenarioKey);

// Uniform integer in [0, n), n > 0. Rejection on the raw engine output so the
// result is identical across standard library implementations.
std::size_t uniformBelow(std::mt19937_64& gen, std::size_t n);

/*
* Draw up to `maxCount` distinct waypoints from `reach`, the row-major cells
* reachable from the agent's start.
* Cells not yet in `registry` are preferred; when they run out, the remainder is
* drawn from cells other agents already hold (fallbackUsed). Newly taken cells
* are committed to `registry`.
*/
AssignResult assignWaypoints(uint64_t globalSeed,
		int agentId,
		const std::string& scenarioKey,
		const CellSeq& reach,
		UniquenessRegistry& registry,
		int maxCount);
