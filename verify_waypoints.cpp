#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

#include "MapfIO.hpp"
#include "Verifier.hpp"

int main(int argc, char* argv[])
	{
	if (argc != 3)
		{
		std::cerr
		<< "Usage:\n  " << argv[0] << " <file1> <file2>\n"
		<< "Example:\n  " << argv[0] << " scen-2wp.scen scen-4wp.scen\n";
		return 2;
		}

	const std::string file1 = argv[1];
	const std::string file2 = argv[2];
	std::cout << "Comparing " << file1 << " and " << file2 << "\n";

	std::vector<std::string> lines1, lines2;
	if (!readLines(file1, lines1))
		{
		std::cerr << "Error opening file " << file1 << "\n";
		return 2;
		}
	if (!readLines(file2, lines2))
		{
		std::cerr << "Error opening file " << file2 << "\n";
		return 2;
		}

	const VerifyReport rep = verifyPrefixConsistency(lines1, lines2, std::cout);
	if (rep.countMismatch) return 1;

	std::cout << "\nResults:\n";
	std::cout << "  Total agents: " << rep.total() << "\n";
	std::cout << "  Matches: " << rep.matches << "\n";
	std::cout << "  Mismatches: " << rep.mismatches << "\n";
	if (rep.total() > 0)
		printf("  Success rate: %.1f%%\n", 100.0 * rep.matches / rep.total());

	return rep.ok() ? 0 : 1;
	}
