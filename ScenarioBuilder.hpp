#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include "MapfIO.hpp"
#include "structs.hpp"

struct GeneratorConfig
	{
	uint64_t seed = 0;
	std::vector<int> counts{ 0, 1, 2, 4, 8 };
	bool fixGoals = false;  // also snap goals onto free cells
	};

/*
* Sorted, de-duplicated copy of `counts`.
* Throws std::invalid_argument if it is empty or holds a negative value.
*/
std::vector<int> normalizeCounts(const std::vector<int>& counts);

// One .scen file of a map: its key (file name) and raw lines.
struct ScenarioInput
	{
	std::string key;
	std::vector<std::string> lines;
	};

struct AgentResult
	{
	int line = 0;              // 1-based line number in its file; also the agent id
	AGENT agent;               // start (and goal) after correction
	CellSeq waypoints;         // sample drawn once at the largest count
	std::size_t reachableCount = 0;
	bool fallbackUsed = false;
	bool degraded     = false;
	bool skipped      = false; // position could not be corrected; no waypoints

	// First `count` waypoints (all of them if fewer exist).
	CellSeq forCount(int count) const;
	};

struct ScenarioOutput
	{
	std::string key;
	std::vector<AgentResult> agents;
	std::map<int, std::vector<std::string>> linesByCount;
	int fixedPositions = 0;
	};

struct MapReport
	{
	int agents            = 0;
	int fixedPositions    = 0;
	int fallbackAgents    = 0;
	int degradedAgents    = 0;  // fewer reachable cells than the largest count
	int unreachableAgents = 0;  // no start cell to sample from
	int passthroughLines  = 0;
	std::size_t reusedWaypoints = 0;
	};

/*
* Two-pass waypoint generation for all scenario files of one map.
*   Pass 1: parse every line, correct positions, look up the component of each start.
*   Pass 2: in file then line order, sample each agent once at max(counts)
*           against a registry shared by the whole map, then slice per count.
* Progress goes to `log`, warnings to `err` (the same stream when only `log`
* is given).
*/
class ScenarioBuilder
	{
	public:
		ScenarioBuilder(const GRID& grid, const GeneratorConfig& config, std::ostream& log);
		ScenarioBuilder(const GRID& grid, const GeneratorConfig& config, std::ostream& log, std::ostream& err);

		std::vector<ScenarioOutput> build(const std::vector<ScenarioInput>& files);

		const std::vector<int>& counts() const { return counts_; }
		const MapReport& report() const { return report_; }

	private:
		bool correct(AgentResult& r, const std::string& key);
		void emit(ScenarioOutput& out, const ScenarioInput& in) const;

		const GRID& grid_;
		GeneratorConfig config_;
		std::vector<int> counts_;
		std::ostream& log_;
		std::ostream& err_;
		MapReport report_;
	};
