#define BOOST_TEST_MODULE ReachabilityTests
#include <boost/test/unit_test.hpp>

#include <sstream>
#include <string>

#include "MapfIO.hpp"
#include "Reachability.hpp"

static GRID gridFrom(const std::string& text)
	{
	std::istringstream in(text);
	GRID g;
	loadMap(in, g);
	return g;
	}

struct WalledGridFixture
	{
	WalledGridFixture()
		: grid(gridFrom(
			"type octile\n"
			"height 3\n"
			"width 5\n"
			"map\n"
			"..@..\n"
			"..@..\n"
			"..@..\n"))
		{
		}

	GRID grid;
	};

BOOST_AUTO_TEST_SUITE(ReachabilityTestSuite)

BOOST_FIXTURE_TEST_CASE(WallSplitsTheGrid, WalledGridFixture)
	{
	const ReachableSet left = reachable(grid, Cell{0, 0});
	BOOST_CHECK_EQUAL(left.size(), 6u);
	BOOST_CHECK(left.contains(Cell{1, 2}));
	BOOST_CHECK(!left.contains(Cell{2, 1}));
	BOOST_CHECK(!left.contains(Cell{3, 0}));

	const ReachableSet right = reachable(grid, Cell{4, 2});
	BOOST_CHECK_EQUAL(right.size(), 6u);
	BOOST_CHECK(right.contains(Cell{3, 0}));
	BOOST_CHECK(!right.contains(Cell{0, 0}));
	}

BOOST_FIXTURE_TEST_CASE(CellsAreListedRowMajor, WalledGridFixture)
	{
	const ReachableSet left = reachable(grid, Cell{1, 2});
	const CellSeq expected{ Cell{0, 0}, Cell{1, 0}, Cell{0, 1}, Cell{1, 1}, Cell{0, 2}, Cell{1, 2} };
	BOOST_CHECK(left.cells == expected);

	// same set whichever cell of the component we start from
	BOOST_CHECK(reachable(grid, Cell{0, 0}).cells == expected);
	}

BOOST_FIXTURE_TEST_CASE(InvalidStartReachesNothing, WalledGridFixture)
	{
	BOOST_CHECK(reachable(grid, Cell{2, 1}).empty());   // obstacle
	BOOST_CHECK(reachable(grid, Cell{-1, 0}).empty());  // out of bounds
	BOOST_CHECK(reachable(grid, Cell{0, 3}).empty());

	const ReachableSet none = reachable(grid, Cell{5, 0});
	BOOST_CHECK(!none.contains(Cell{0, 0}));
	}

BOOST_AUTO_TEST_CASE(NoDiagonalMoves)
	{
	const GRID g = gridFrom(
		"type octile\n"
		"height 2\n"
		"width 2\n"
		"map\n"
		".@\n"
		"@.\n");
	const ReachableSet rs = reachable(g, Cell{0, 0});
	BOOST_CHECK_EQUAL(rs.size(), 1u);
	BOOST_CHECK(!rs.contains(Cell{1, 1}));
	}

BOOST_AUTO_TEST_CASE(OpenGridWithCentreObstacle)
	{
	const GRID g = gridFrom(
		"type octile\n"
		"height 5\n"
		"width 5\n"
		"map\n"
		".....\n"
		".....\n"
		"..@..\n"
		".....\n"
		".....\n");
	const ReachableSet rs = reachable(g, Cell{0, 0});
	BOOST_CHECK_EQUAL(rs.size(), 24u);
	BOOST_CHECK(!rs.contains(Cell{2, 2}));
	BOOST_CHECK(rs.contains(Cell{4, 4}));
	}

BOOST_FIXTURE_TEST_CASE(ComponentsMatchFloodFill, WalledGridFixture)
	{
	const ComponentIndex idx = labelComponents(grid);
	BOOST_REQUIRE_EQUAL(idx.cells.size(), 2u);

	for (const Cell& c : grid.freeCells)
		{
		const int id = idx.componentOf(c);
		BOOST_REQUIRE_GE(id, 0);
		BOOST_CHECK(idx.cells[id] == reachable(grid, c).cells);
		}

	BOOST_CHECK_EQUAL(idx.componentOf(Cell{2, 1}), -1);   // obstacle
	BOOST_CHECK_EQUAL(idx.componentOf(Cell{-1, 0}), -1);  // out of bounds
	BOOST_CHECK_EQUAL(idx.componentOf(Cell{5, 0}), -1);
	BOOST_CHECK_EQUAL(idx.componentOf(Cell{0, 3}), -1);
	}

BOOST_AUTO_TEST_CASE(IslandsGetTheirOwnComponents)
	{
	const GRID g = gridFrom(
		"type octile\n"
		"height 4\n"
		"width 4\n"
		"map\n"
		".@..\n"
		"@@@.\n"
		"..@@\n"
		".@.G\n");
	const ComponentIndex idx = labelComponents(g);

	// {(0,0)}, {(2,0),(3,0),(3,1)}, {(0,2),(1,2),(0,3)}, {(2,3),(3,3)}
	BOOST_REQUIRE_EQUAL(idx.cells.size(), 4u);
	std::size_t total = 0;
	for (const CellSeq& cs : idx.cells) total += cs.size();
	BOOST_CHECK_EQUAL(total, g.freeCells.size());

	const int top = idx.componentOf(Cell{3, 1});
	BOOST_CHECK(idx.cells[top] == (CellSeq{ Cell{2, 0}, Cell{3, 0}, Cell{3, 1} }));
	BOOST_CHECK_EQUAL(idx.componentOf(Cell{2, 3}), idx.componentOf(Cell{3, 3}));
	BOOST_CHECK_NE(idx.componentOf(Cell{0, 3}), idx.componentOf(Cell{2, 3}));
	BOOST_CHECK_NE(idx.componentOf(Cell{0, 0}), top);
	}

BOOST_AUTO_TEST_SUITE_END()
