#define BOOST_TEST_MODULE WaypointAssignerTests
#include <boost/test/unit_test.hpp>

#include <set>
#include <sstream>
#include <string>

#include "MapfIO.hpp"
#include "Reachability.hpp"
#include "UniquenessRegistry.hpp"
#include "WaypointAssigner.hpp"

static GRID gridFrom(const std::string& text)
	{
	std::istringstream in(text);
	GRID g;
	loadMap(in, g);
	return g;
	}

static const char* OPEN_3X3 =
	"type octile\n"
	"height 3\n"
	"width 3\n"
	"map\n"
	"...\n"
	"...\n"
	"...\n";

static const char* OPEN_5X5 =
	"type octile\n"
	"height 5\n"
	"width 5\n"
	"map\n"
	".....\n"
	".....\n"
	".....\n"
	".....\n"
	".....\n";

static bool allDistinct(const CellSeq& s)
	{
	return std::set<Cell>(s.begin(), s.end()).size() == s.size();
	}

BOOST_AUTO_TEST_SUITE(RegistryTests)

BOOST_AUTO_TEST_CASE(InsertOnlyOnce)
	{
	UniquenessRegistry reg;
	BOOST_CHECK(!reg.contains(Cell{1, 2}));
	BOOST_CHECK(reg.insert(Cell{1, 2}));
	BOOST_CHECK(!reg.insert(Cell{1, 2}));
	BOOST_CHECK(reg.contains(Cell{1, 2}));
	BOOST_CHECK(!reg.contains(Cell{2, 1}));
	BOOST_CHECK_EQUAL(reg.size(), 1u);
	}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SeedTests)

BOOST_AUTO_TEST_CASE(AgentSeedIsStable)
	{
	const uint64_t a = deriveAgentSeed(7, 2, "room-1.scen");
	BOOST_CHECK_EQUAL(a, deriveAgentSeed(7, 2, "room-1.scen"));
	BOOST_CHECK_NE(a, deriveAgentSeed(8, 2, "room-1.scen"));
	BOOST_CHECK_NE(a, deriveAgentSeed(7, 3, "room-1.scen"));
	BOOST_CHECK_NE(a, deriveAgentSeed(7, 2, "room-2.scen"));
	}

BOOST_AUTO_TEST_CASE(UniformBelowStaysInRange)
	{
	std::mt19937_64 gen(42);
	for (int i = 0; i < 1000; ++i)
		{
		BOOST_CHECK_EQUAL(uniformBelow(gen, 1), 0u);
		BOOST_CHECK_LT(uniformBelow(gen, 7), 7u);
		}
	}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(AssignTests)

BOOST_AUTO_TEST_CASE(DrawsDistinctReachableCells)
	{
	const GRID g = gridFrom(OPEN_5X5);
	const ReachableSet rs = reachable(g, Cell{0, 0});
	UniquenessRegistry reg;

	const AssignResult r = assignWaypoints(7, 2, "open.scen", rs.cells, reg, 8);
	BOOST_REQUIRE_EQUAL(r.waypoints.size(), 8u);
	BOOST_CHECK(allDistinct(r.waypoints));
	for (const Cell& c : r.waypoints) BOOST_CHECK(rs.contains(c));
	BOOST_CHECK(!r.fallbackUsed);
	BOOST_CHECK(!r.degraded);
	BOOST_CHECK_EQUAL(r.reused, 0u);
	BOOST_CHECK_EQUAL(reg.size(), 8u);
	}

BOOST_AUTO_TEST_CASE(SameSeedSameSequence)
	{
	const GRID g = gridFrom(OPEN_5X5);
	const ReachableSet rs = reachable(g, Cell{0, 0});
	UniquenessRegistry r1, r2;

	const AssignResult a = assignWaypoints(7, 2, "open.scen", rs.cells, r1, 8);
	const AssignResult b = assignWaypoints(7, 2, "open.scen", rs.cells, r2, 8);
	BOOST_CHECK(a.waypoints == b.waypoints);

	UniquenessRegistry r3;
	const AssignResult other = assignWaypoints(8, 2, "open.scen", rs.cells, r3, 8);
	BOOST_CHECK(a.waypoints != other.waypoints);
	}

BOOST_AUTO_TEST_CASE(SmallerDrawIsPrefixOfLarger)
	{
	const GRID g = gridFrom(OPEN_5X5);
	const ReachableSet rs = reachable(g, Cell{0, 0});
	UniquenessRegistry r1, r2;

	const AssignResult four  = assignWaypoints(3, 5, "open.scen", rs.cells, r1, 4);
	const AssignResult eight = assignWaypoints(3, 5, "open.scen", rs.cells, r2, 8);
	BOOST_CHECK(CellSeq(eight.waypoints.begin(), eight.waypoints.begin() + 4) == four.waypoints);
	}

BOOST_AUTO_TEST_CASE(AvoidsRegisteredCells)
	{
	const GRID g = gridFrom(OPEN_5X5);
	const ReachableSet rs = reachable(g, Cell{0, 0});
	UniquenessRegistry reg;
	for (int x = 0; x < 5; ++x)
		for (int y = 0; y < 3; ++y) reg.insert(Cell{x, y});

	// 10 cells left, 8 requested
	const AssignResult r = assignWaypoints(0, 1, "open.scen", rs.cells, reg, 8);
	BOOST_REQUIRE_EQUAL(r.waypoints.size(), 8u);
	BOOST_CHECK(!r.fallbackUsed);
	for (const Cell& c : r.waypoints) BOOST_CHECK_GE(c.y, 3);
	BOOST_CHECK_EQUAL(reg.size(), 23u);
	}

BOOST_AUTO_TEST_CASE(FallsBackWhenDistinctCellsRunOut)
	{
	const GRID g = gridFrom(OPEN_3X3);
	const ReachableSet rs = reachable(g, Cell{1, 1});
	UniquenessRegistry reg;
	const CellSeq taken{ Cell{0, 0}, Cell{1, 0}, Cell{2, 0}, Cell{0, 1}, Cell{1, 1} };
	for (const Cell& c : taken) reg.insert(c);

	const AssignResult r = assignWaypoints(1, 2, "tiny.scen", rs.cells, reg, 8);
	BOOST_REQUIRE_EQUAL(r.waypoints.size(), 8u);
	BOOST_CHECK(allDistinct(r.waypoints));
	BOOST_CHECK(r.fallbackUsed);
	BOOST_CHECK(!r.degraded);
	BOOST_CHECK_EQUAL(r.reused, 4u);

	// the four free cells come first, the reused ones after
	for (int i = 0; i < 4; ++i) BOOST_CHECK_GE(r.waypoints[i].y * 3 + r.waypoints[i].x, 5);
	for (int i = 4; i < 8; ++i) BOOST_CHECK_LT(r.waypoints[i].y * 3 + r.waypoints[i].x, 5);
	BOOST_CHECK_EQUAL(reg.size(), 9u);
	}

BOOST_AUTO_TEST_CASE(DegradesWhenTooFewReachable)
	{
	const GRID g = gridFrom(OPEN_3X3);
	const ReachableSet rs = reachable(g, Cell{0, 0});
	UniquenessRegistry reg;

	const AssignResult r = assignWaypoints(1, 2, "tiny.scen", rs.cells, reg, 12);
	BOOST_CHECK_EQUAL(r.waypoints.size(), 9u);
	BOOST_CHECK(allDistinct(r.waypoints));
	BOOST_CHECK(r.degraded);
	BOOST_CHECK(!r.fallbackUsed);
	}

BOOST_AUTO_TEST_CASE(NothingToDraw)
	{
	const GRID g = gridFrom(OPEN_3X3);
	UniquenessRegistry reg;

	BOOST_CHECK(assignWaypoints(1, 2, "tiny.scen", reachable(g, Cell{0, 0}).cells, reg, 0).waypoints.empty());
	BOOST_CHECK(assignWaypoints(1, 2, "tiny.scen", CellSeq{}, reg, 4).waypoints.empty());
	BOOST_CHECK_EQUAL(reg.size(), 0u);
	}

BOOST_AUTO_TEST_SUITE_END()
