#pragma once
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "structs.hpp"

// Map header or grid body disagrees with itself; the whole map is unusable.
struct MalformedMapError : std::runtime_error
	{
	using std::runtime_error::runtime_error;
	};

// The grid has no traversable cell at all.
struct NoFreeCellError : std::runtime_error
	{
	using std::runtime_error::runtime_error;
	};

struct GRID
	{
	int width  = 0;  // x dimension (columns)
	int height = 0;  // y dimension (rows), y=0 at top (file order)
	int obs    = 0;  // Number of obstacles
	// Row-major occupancy: free[y*width + x] ∈ {0,1}; 1 = traversable, 0 = blocked.
	std::vector<uint8_t> free;
	// Free cells in row-major scan order.
	std::vector<Cell> freeCells;

	inline bool inBounds(int x, int y) const
		{
		return (0 <= x && x < width && 0 <= y && y < height);
		}

	inline bool inBounds(const Cell& c) const { return inBounds(c.x, c.y); }

	inline uint8_t at(int x, int y) const { return free[(std::size_t)y * width + x]; }

	inline bool passable(const Cell& c) const { return inBounds(c) && at(c.x, c.y) != 0u; }
	};

/*
* One agent line of a MovingAI .scen file:
*   bucket map_name width height start_x start_y goal_x goal_y optimal_length
* The raw tokens are kept so an augmented line reproduces them verbatim;
* setStart/setGoal rewrite both the cell and its tokens.
*/
struct AGENT
	{
	std::vector<std::string> fields;  // the 9 original tokens
	int width = 0, height = 0;
	Cell start;
	Cell goal;
	double optlen = 0.0;

	const std::string& bucket()  const { return fields[0]; }
	const std::string& mapName() const { return fields[1]; }

	void setStart(const Cell& c);
	void setGoal(const Cell& c);
	};

/*
* Load a MovingAI .map ("type ...", "height H", "width W", "map", then H rows of W chars).
* '.' and 'G' are traversable, every other character is blocked.
* Throws MalformedMapError on header/row mismatches and NoFreeCellError when nothing is free.
*/

void loadMap(std::istream& in, GRID& out);

/*
* Same as above from a path. Returns false if the file cannot be opened.
*/

bool loadMap(const std::string& mapPath, GRID& out);

// "version 1" style header line at the top of a .scen file.
bool isVersionLine(const std::string& line);

/*
* Parse one scenario line into an AGENT. Returns nullopt when the line is not
* exactly 9 fields with integer width/height/coordinates and a numeric length;
* such lines are copied to the output unchanged.
*/

std::optional<AGENT> parseAgentLine(const std::string& line);

/*
* The 9 original fields, the waypoint count, then x y per waypoint; tab separated.
*/

std::string formatAugmentedLine(const AGENT& agent, const CellSeq& waypoints);

/*
* Inverse of formatAugmentedLine. Returns false if the line has fewer than 10
* fields or the waypoint block does not match its declared count.
*/

bool parseAugmentedLine(const std::string& line, std::vector<std::string>& fields_out, CellSeq& waypoints_out);

// Whole-file helpers; both return false on I/O failure. CR before LF is dropped on read.
bool readLines(const std::string& path, std::vector<std::string>& lines_out);
bool writeLines(const std::string& path, const std::vector<std::string>& lines);
