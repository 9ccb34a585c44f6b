#pragma once
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "ScenarioBuilder.hpp"

struct RunOptions
	{
	std::string mapsDir;  // <name>.map files
	std::string srcDir;   // one sub-directory of .scen files per map name
	std::string dstDir;
	std::optional<int> legacyCount;  // --n: single count, written to dst/<map>/
	GeneratorConfig gen;
	};

struct RunSummary
	{
	int mapsProcessed   = 0;
	int filesWritten    = 0;
	int agentsProcessed = 0;
	std::vector<int> counts;
	std::vector<std::string> skipped;  // "<item>: <reason>"
	bool fatal = false;                // maps/src directory unusable
	};

// dst/<map>_<count>wp in multi-count mode, dst/<map> in legacy mode.
std::string outputDirFor(const RunOptions& opt, const std::string& mapName, int count);

/*
* Generate augmented scenarios for every map sub-directory of srcDir.
* Per-file and per-map failures are logged and listed in the summary;
* only an unusable maps/src directory sets `fatal`.
* Progress goes to `log`; warnings and errors go to `err`.
*/
RunSummary runBatch(const RunOptions& opt, std::ostream& log, std::ostream& err);
RunSummary runBatch(const RunOptions& opt, std::ostream& log);
