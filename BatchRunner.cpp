#include "BatchRunner.hpp"
#include <algorithm>
#include <filesystem>
#include <map>
#include <new>
#include <ostream>
#include <system_error>

namespace fs = std::filesystem;

// Regular files in `dir` with extension `ext`, sorted by name.
static std::vector<fs::path> list_files(const fs::path& dir, const std::string& ext, std::error_code& ec)
	{
	std::vector<fs::path> out;
	for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
		{
		std::error_code fec;
		if (it->is_regular_file(fec) && it->path().extension() == ext) out.push_back(it->path());
		}
	std::sort(out.begin(), out.end());
	return out;
	}

static std::vector<fs::path> list_subdirs(const fs::path& dir, std::error_code& ec)
	{
	std::vector<fs::path> out;
	for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
		{
		std::error_code dec;
		if (it->is_directory(dec)) out.push_back(it->path());
		}
	std::sort(out.begin(), out.end());
	return out;
	}

std::string outputDirFor(const RunOptions& opt, const std::string& mapName, int count)
	{
	const fs::path dst(opt.dstDir);
	if (opt.legacyCount) return (dst / mapName).string();
	return (dst / (mapName + "_" + std::to_string(count) + "wp")).string();
	}

static void process_map(const RunOptions& opt, const GeneratorConfig& gen, const std::string& mapName,
		const fs::path& mapPath, const fs::path& scenDir, RunSummary& sum, std::ostream& log, std::ostream& err)
	{
	GRID grid;
	if (!loadMap(mapPath.string(), grid))
		{
		err << "Warning: Could not read map " << mapPath.string() << ", skipping " << mapName << "\n";
		sum.skipped.push_back("map " + mapName + ": unreadable");
		return;
		}
	log << "Loaded map " << mapPath.filename().string() << ": " << grid.height << "x" << grid.width
	    << ", " << grid.freeCells.size() << " free cells\n";

	const int maxCount = sum.counts.back();
	if ((int)grid.freeCells.size() < maxCount)
		err << "Warning: Map " << mapName << " has only " << grid.freeCells.size()
		    << " free cells, need " << maxCount << "\n";

	std::error_code ec;
	const std::vector<fs::path> scens = list_files(scenDir, ".scen", ec);
	if (ec)
		{
		err << "Warning: Could not list " << scenDir.string() << ": " << ec.message() << "\n";
		sum.skipped.push_back("scenarios " + mapName + ": " + ec.message());
		return;
		}

	std::vector<ScenarioInput> inputs;
	for (const fs::path& p : scens)
		{
		ScenarioInput in;
		in.key = p.filename().string();
		if (!readLines(p.string(), in.lines))
			{
			err << "Warning: Could not read " << p.string() << "\n";
			sum.skipped.push_back("scenario " + p.string() + ": unreadable");
			continue;
			}
		inputs.push_back(std::move(in));
		}
	if (inputs.empty()) return;

	std::map<int, fs::path> dirs;
	for (int c : sum.counts)
		{
		const fs::path d(outputDirFor(opt, mapName, c));
		fs::create_directories(d, ec);
		if (ec)
			{
			err << "Warning: Could not create " << d.string() << ": " << ec.message() << "\n";
			sum.skipped.push_back("output " + d.string() + ": " + ec.message());
			return;
			}
		dirs[c] = d;
		}

	log << "Processing " << inputs.size() << " scenario file(s) of " << mapName << " for counts [";
	for (std::size_t i = 0; i < sum.counts.size(); ++i) log << (i ? ", " : "") << sum.counts[i];
	log << "]\n";

	ScenarioBuilder builder(grid, gen, log, err);
	const std::vector<ScenarioOutput> outs = builder.build(inputs);

	for (const ScenarioOutput& o : outs)
		{
		for (const auto& kv : o.linesByCount)
			{
			const fs::path target = dirs[kv.first] / o.key;
			if (writeLines(target.string(), kv.second))
				++sum.filesWritten;
			else
				{
				err << "Warning: Could not write " << target.string() << "\n";
				sum.skipped.push_back("output " + target.string() + ": unwritable");
				}
			}
		}

	const MapReport& rep = builder.report();
	sum.agentsProcessed += rep.agents;
	++sum.mapsProcessed;
	if (rep.fallbackAgents > 0)
		err << "Warning: " << rep.fallbackAgents << " agent(s) on " << mapName << " share "
		    << rep.reusedWaypoints << " waypoint(s) with other agents\n";
	if (rep.degradedAgents > 0)
		err << "Warning: " << rep.degradedAgents << " agent(s) on " << mapName
		    << " reach fewer than " << maxCount << " cells\n";
	if (rep.unreachableAgents > 0)
		err << "Warning: " << rep.unreachableAgents << " agent(s) on " << mapName
		    << " have no reachable cell and got no waypoints\n";
	}

RunSummary runBatch(const RunOptions& opt, std::ostream& log)
	{
	return runBatch(opt, log, log);
	}

RunSummary runBatch(const RunOptions& opt, std::ostream& log, std::ostream& err)
	{
	RunSummary sum;

	GeneratorConfig gen = opt.gen;
	if (opt.legacyCount) gen.counts = { *opt.legacyCount };
	sum.counts = normalizeCounts(gen.counts);

	std::error_code ec;
	if (!fs::is_directory(opt.mapsDir, ec))
		{
		err << "Error: Maps directory " << opt.mapsDir << " does not exist\n";
		sum.fatal = true;
		return sum;
		}
	if (!fs::is_directory(opt.srcDir, ec))
		{
		err << "Error: Source directory " << opt.srcDir << " does not exist\n";
		sum.fatal = true;
		return sum;
		}

	fs::create_directories(opt.dstDir, ec);
	if (ec)
		{
		err << "Error: Could not create " << opt.dstDir << ": " << ec.message() << "\n";
		sum.fatal = true;
		return sum;
		}

	std::map<std::string, fs::path> maps;
	for (const fs::path& p : list_files(opt.mapsDir, ".map", ec)) maps[p.stem().string()] = p;
	if (ec || maps.empty())
		{
		err << "Error: No map files found in " << opt.mapsDir << "\n";
		sum.fatal = true;
		return sum;
		}

	const std::vector<fs::path> subdirs = list_subdirs(opt.srcDir, ec);
	if (ec)
		{
		err << "Error: Could not list " << opt.srcDir << ": " << ec.message() << "\n";
		sum.fatal = true;
		return sum;
		}

	for (const fs::path& sub : subdirs)
		{
		const std::string mapName = sub.filename().string();
		auto it = maps.find(mapName);
		if (it == maps.end())
			{
			err << "Warning: No map file found for " << mapName << ", skipping\n";
			sum.skipped.push_back("scenarios " + mapName + ": no map");
			continue;
			}

		// Per-map boundary: a bad map never stops the run.
		try
			{
			process_map(opt, gen, mapName, it->second, sub, sum, log, err);
			}
		catch (const MalformedMapError& e)
			{
			err << "Warning: Malformed map " << it->second.string() << ": " << e.what() << "\n";
			sum.skipped.push_back("map " + mapName + ": " + e.what());
			}
		catch (const NoFreeCellError& e)
			{
			err << "Warning: Map " << it->second.string() << ": " << e.what() << "\n";
			sum.skipped.push_back("map " + mapName + ": " + e.what());
			}
		catch (const fs::filesystem_error& e)
			{
			err << "Warning: " << e.what() << "\n";
			sum.skipped.push_back("map " + mapName + ": " + e.what());
			}
		catch (const std::bad_alloc&)
			{
			err << "Warning: Out of memory while processing " << mapName << ", skipping\n";
			sum.skipped.push_back("map " + mapName + ": out of memory");
			}
		}

	return sum;
	}
