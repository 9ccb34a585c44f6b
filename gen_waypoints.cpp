#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "BatchRunner.hpp"

static void usage(const char* prog)
	{
	std::cerr
	<< "Usage:\n  " << prog
	<< " --maps <dir> --src <dir> --dst <dir> [--n <count>] [--counts a,b,...] [--seed <s>] [--fix-goals]\n"
	<< "  --n        legacy mode: one waypoint count, written to <dst>/<map>/\n"
	<< "  --counts   waypoint counts for multi-count mode (default 0,1,2,4,8)\n"
	<< "  --seed     random seed (default 0)\n"
	<< "  --fix-goals  also move goals off obstacles / back into the map\n";
	}

static std::vector<int> parse_counts(const std::string& s)
	{
	std::vector<int> out;
	std::istringstream iss(s);
	std::string tok;
	while (std::getline(iss, tok, ','))
		{
		std::size_t used = 0;
		out.push_back(std::stoi(tok, &used));
		if (used != tok.size()) throw std::invalid_argument("bad count '" + tok + "'");
		}
	return out;
	}

int main(int argc, char* argv[])
	{
	RunOptions opt;

	// Parse args
	try
		{
		for (int i = 1; i < argc; ++i)
			{
			const std::string a = argv[i];
			const bool hasValue = (i + 1 < argc);

			if (a == "--fix-goals") { opt.gen.fixGoals = true; continue; }
			if (!hasValue) throw std::invalid_argument("missing value for " + a);

			const std::string v = argv[++i];
			if      (a == "--maps")   opt.mapsDir = v;
			else if (a == "--src")    opt.srcDir  = v;
			else if (a == "--dst")    opt.dstDir  = v;
			else if (a == "--n")      opt.legacyCount = std::stoi(v);
			else if (a == "--counts") opt.gen.counts = parse_counts(v);
			else if (a == "--seed")   opt.gen.seed = std::stoull(v);
			else throw std::invalid_argument("unknown option " + a);
			}
		if (opt.mapsDir.empty() || opt.srcDir.empty() || opt.dstDir.empty())
			throw std::invalid_argument("--maps, --src and --dst are required");
		if (opt.legacyCount && *opt.legacyCount < 0)
			throw std::invalid_argument("--n must be non-negative");
		normalizeCounts(opt.gen.counts);
		}
	catch (const std::exception& e)
		{
		std::cerr << "Error: " << e.what() << "\n";
		usage(argv[0]);
		return 2;
		}

	if (opt.legacyCount)
		std::cout << "Running in legacy mode with " << *opt.legacyCount << " waypoints\n";
	else
		std::cout << "Running in multi-file mode with seed " << opt.gen.seed << "\n";

	const RunSummary sum = runBatch(opt, std::cout, std::cerr);
	if (sum.fatal) return EXIT_FAILURE;

	std::cout << "\nGenerated " << sum.filesWritten << " waypoint files.\n";
	std::cout << "Total agents processed: " << sum.agentsProcessed << ".\n";
	std::cout << "Waypoint configurations: [";
	for (std::size_t i = 0; i < sum.counts.size(); ++i) std::cout << (i ? ", " : "") << sum.counts[i];
	std::cout << "].\n";

	if (!sum.skipped.empty())
		{
		std::cout << "Skipped " << sum.skipped.size() << " item(s):\n";
		for (const auto& s : sum.skipped) std::cout << "  " << s << "\n";
		}

	return sum.filesWritten > 0 ? EXIT_SUCCESS : EXIT_FAILURE;
	}
