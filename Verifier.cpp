#include "Verifier.hpp"
#include <ostream>

#include "MapfIO.hpp"

static std::vector<std::string> agent_lines(const std::vector<std::string>& lines)
	{
	std::vector<std::string> out;
	for (const auto& l : lines)
		if (!l.empty() && !isVersionLine(l)) out.push_back(l);
	return out;
	}

static std::ostream& operator<<(std::ostream& os, const CellSeq& s)
	{
	os << "[";
	for (std::size_t i = 0; i < s.size(); ++i) os << (i ? " " : "") << s[i];
	return os << "]";
	}

VerifyReport verifyPrefixConsistency(const std::vector<std::string>& smaller,
		const std::vector<std::string>& larger,
		std::ostream& log)
	{
	VerifyReport rep;
	const std::vector<std::string> a = agent_lines(smaller);
	const std::vector<std::string> b = agent_lines(larger);

	if (a.size() != b.size())
		{
		log << "Error: Different number of agents (" << a.size() << " vs " << b.size() << ")\n";
		rep.countMismatch = true;
		return rep;
		}

	for (std::size_t i = 0; i < a.size(); ++i)
		{
		std::vector<std::string> fa, fb;
		CellSeq wa, wb;
		if (!parseAugmentedLine(a[i], fa, wa) || !parseAugmentedLine(b[i], fb, wb)) continue;

		if (fa != fb)
			{
			log << "Agent " << (i + 1) << ": Original data mismatch\n";
			++rep.mismatches;
			continue;
			}
		if (wb.size() < wa.size())
			{
			log << "Agent " << (i + 1) << ": second file has fewer waypoints (" << wb.size()
			    << ") than first (" << wa.size() << ")\n";
			++rep.mismatches;
			continue;
			}

		const CellSeq head(wb.begin(), wb.begin() + wa.size());
		if (head == wa)
			++rep.matches;
		else
			{
			log << "Agent " << (i + 1) << ": Waypoint mismatch\n"
			    << "  first:              " << wa << "\n"
			    << "  second, first " << wa.size() << ": " << head << "\n";
			++rep.mismatches;
			}
		}

	return rep;
	}
