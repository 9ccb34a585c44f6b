#include "ScenarioBuilder.hpp"
#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <utility>

#include "PositionCorrector.hpp"
#include "Reachability.hpp"
#include "UniquenessRegistry.hpp"
#include "WaypointAssigner.hpp"

static inline bool is_blank(const std::string& s)
	{
	return s.find_first_not_of(" \t") == std::string::npos;
	}

std::vector<int> normalizeCounts(const std::vector<int>& counts)
	{
	if (counts.empty()) throw std::invalid_argument("At least one waypoint count is required");

	std::vector<int> out(counts);
	std::sort(out.begin(), out.end());
	out.erase(std::unique(out.begin(), out.end()), out.end());
	if (out.front() < 0)
		throw std::invalid_argument("Waypoint counts must be non-negative, got " + std::to_string(out.front()));
	return out;
	}

CellSeq AgentResult::forCount(int count) const
	{
	const std::size_t n = std::min(waypoints.size(), (std::size_t)std::max(count, 0));
	return CellSeq(waypoints.begin(), waypoints.begin() + n);
	}

ScenarioBuilder::ScenarioBuilder(const GRID& grid, const GeneratorConfig& config, std::ostream& log)
	: ScenarioBuilder(grid, config, log, log)
	{
	}

ScenarioBuilder::ScenarioBuilder(const GRID& grid, const GeneratorConfig& config, std::ostream& log, std::ostream& err)
	: grid_(grid), config_(config), counts_(normalizeCounts(config.counts)), log_(log), err_(err)
	{
	}

// Snap start (and goal when configured). Returns false if no free cell exists.
bool ScenarioBuilder::correct(AgentResult& r, const std::string& key)
	{
	AGENT& a = r.agent;
	try
		{
		const Correction s = fixPosition(grid_, a.start);
		if (s.changed())
			{
			if (s.outOfBounds && s.blocked)
				log_ << "  Fixed agent " << r.line << " (" << correctionReason(s) << "): "
				     << s.original << " -> " << s.corrected << "\n";
			else if (s.outOfBounds)
				log_ << "  Fixed out-of-bounds agent " << r.line << ": " << s.original << " -> " << s.corrected << "\n";
			else
				log_ << "  Fixed agent " << r.line << " on obstacle: " << s.original << " -> " << s.corrected << "\n";
			a.setStart(s.corrected);
			++report_.fixedPositions;
			}

		if (config_.fixGoals)
			{
			const Correction g = fixPosition(grid_, a.goal);
			if (g.changed())
				{
				log_ << "  Fixed goal of agent " << r.line << " (" << correctionReason(g) << "): "
				     << g.original << " -> " << g.corrected << "\n";
				a.setGoal(g.corrected);
				++report_.fixedPositions;
				}
			}
		}
	catch (const NoFreeCellError& e)
		{
		err_ << "  Warning: Agent " << r.line << " in " << key << " left uncorrected: " << e.what() << "\n";
		return false;
		}
	return true;
	}

std::vector<ScenarioOutput> ScenarioBuilder::build(const std::vector<ScenarioInput>& files)
	{
	report_ = MapReport{};
	const int maxCount = counts_.back();

	std::vector<ScenarioOutput> outs(files.size());
	std::vector<std::vector<int>> comp(files.size());  // start component, parallel to outs[f].agents
	const ComponentIndex index = labelComponents(grid_);
	const CellSeq none;

	// Pass 1: parse, correct, look up the start's component.
	for (std::size_t f = 0; f < files.size(); ++f)
		{
		const ScenarioInput& in = files[f];
		outs[f].key = in.key;

		for (std::size_t i = 0; i < in.lines.size(); ++i)
			{
			const std::string& line = in.lines[i];
			if ((i == 0 && isVersionLine(line)) || is_blank(line)) continue;

			std::optional<AGENT> parsed = parseAgentLine(line);
			if (!parsed)
				{
				err_ << "  Warning: Could not parse line " << (i + 1) << " of " << in.key << ", copied unchanged\n";
				++report_.passthroughLines;
				continue;
				}

			AgentResult r;
			r.line = (int)i + 1;
			r.agent = std::move(*parsed);

			const int fixedBefore = report_.fixedPositions;
			int c = -1;
			if (correct(r, in.key))
				c = index.componentOf(r.agent.start);
			else
				r.skipped = true;
			outs[f].fixedPositions += report_.fixedPositions - fixedBefore;

			const CellSeq& rs = (c >= 0) ? index.cells[c] : none;
			if (rs.empty())
				{
				if (!r.skipped)
					err_ << "  Warning: Agent " << r.line << " start " << r.agent.start << " reaches no cell\n";
				++report_.unreachableAgents;
				}
			else if (maxCount > 0 && rs.size() < (std::size_t)maxCount)
				{
				err_ << "  Warning: Agent " << r.line << " has only " << rs.size()
				     << " reachable cells, need " << maxCount << "\n";
				}

			r.reachableCount = rs.size();
			outs[f].agents.push_back(std::move(r));
			comp[f].push_back(c);
			}
		}

	// Pass 2: one draw per agent at the largest count, shared registry for the map.
	UniquenessRegistry registry;
	for (std::size_t f = 0; f < outs.size(); ++f)
		{
		for (std::size_t k = 0; k < outs[f].agents.size(); ++k)
			{
			AgentResult& r = outs[f].agents[k];
			++report_.agents;
			if (maxCount == 0 || r.skipped) continue;

			const int c = comp[f][k];
			AssignResult a = assignWaypoints(config_.seed, r.line, outs[f].key,
				(c >= 0) ? index.cells[c] : none, registry, maxCount);
			r.waypoints    = std::move(a.waypoints);
			r.fallbackUsed = a.fallbackUsed;
			r.degraded     = a.degraded;

			if (a.fallbackUsed)
				{
				err_ << "  Warning: Agent " << r.line << " reuses " << a.reused
				     << " waypoint(s) already assigned on this map\n";
				++report_.fallbackAgents;
				report_.reusedWaypoints += a.reused;
				}
			if (a.degraded) ++report_.degradedAgents;
			}
		}

	for (std::size_t f = 0; f < outs.size(); ++f)
		{
		emit(outs[f], files[f]);
		if (outs[f].fixedPositions > 0)
			log_ << "  -> " << outs[f].key << ": processed " << outs[f].agents.size()
			     << " agents, fixed " << outs[f].fixedPositions << " invalid positions\n";
		else
			log_ << "  -> " << outs[f].key << ": processed " << outs[f].agents.size() << " agents\n";
		}

	return outs;
	}

// Rebuild the file once per count: header and unparsed lines verbatim, agents augmented.
void ScenarioBuilder::emit(ScenarioOutput& out, const ScenarioInput& in) const
	{
	for (int c : counts_)
		{
		std::vector<std::string>& lines = out.linesByCount[c];
		lines.reserve(in.lines.size());

		std::size_t next = 0;
		for (std::size_t i = 0; i < in.lines.size(); ++i)
			{
			if (next < out.agents.size() && out.agents[next].line == (int)i + 1)
				{
				const AgentResult& r = out.agents[next++];
				lines.push_back(formatAugmentedLine(r.agent, r.forCount(c)));
				}
			else
				lines.push_back(in.lines[i]);
			}
		}
	}
