#include "MapfIO.hpp"
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

static inline void rstrip_cr(std::string& s)
	{
	if (!s.empty() && s.back() == '\r') s.pop_back(); // tolerate CRLF files
	}

// Whole token must be an integer; "3x" or "" is rejected.
static inline bool parse_int(const std::string& s, int& out)
	{
	if (s.empty()) return false;
	char* end = nullptr;
	errno = 0;
	const long v = std::strtol(s.c_str(), &end, 10);
	if (errno != 0 || end != s.c_str() + s.size()) return false;
	if (v < -2147483647L - 1 || v > 2147483647L) return false;
	out = (int)v;
	return true;
	}

static inline bool parse_num(const std::string& s, double& out)
	{
	if (s.empty()) return false;
	char* end = nullptr;
	errno = 0;
	const double v = std::strtod(s.c_str(), &end);
	if (errno != 0 || end != s.c_str() + s.size()) return false;
	out = v;
	return true;
	}

static inline std::vector<std::string> split_ws(const std::string& line)
	{
	std::istringstream iss(line);
	std::vector<std::string> out;
	std::string tok;
	while (iss >> tok) out.push_back(tok);
	return out;
	}

// "height H" / "width W"
static inline bool parse_kv_int(const std::string& line, std::string& key, int& value)
	{
	std::istringstream iss(line);
	std::string rest;
	if (!(iss >> key >> value)) return false;
	return !(iss >> rest);
	}

// MovingAI: treat '.' and 'G' as traversable for grid planning.
static inline bool is_free_char(char c) { return (c == '.' || c == 'G'); }

void AGENT::setStart(const Cell& c)
	{
	start = c;
	fields[4] = std::to_string(c.x);
	fields[5] = std::to_string(c.y);
	}

void AGENT::setGoal(const Cell& c)
	{
	goal = c;
	fields[6] = std::to_string(c.x);
	fields[7] = std::to_string(c.y);
	}

void loadMap(std::istream& in, GRID& out)
	{
	std::string line;

	// "type octile" (sanity check "type")
	if (!std::getline(in, line)) throw MalformedMapError("Empty map file");
	rstrip_cr(line);
	if (line.rfind("type", 0) != 0)
		throw MalformedMapError("Expected 'type ...' header");

	// "height H" and "width W" in either order, terminated by "map"
	int H = -1, W = -1;
	bool sawMap = false;
	while (std::getline(in, line))
		{
		rstrip_cr(line);
		if (line == "map") { sawMap = true; break; }

		std::string key; int value = 0;
		if (!parse_kv_int(line, key, value))
			throw MalformedMapError("Bad header line: " + line);
		if (key == "height") H = value;
		else if (key == "width") W = value;
		else throw MalformedMapError("Unexpected header key '" + key + "'");
		}

	if (!sawMap)  throw MalformedMapError("Expected 'map' header line");
	if (H <= 0 || W <= 0)
		throw MalformedMapError("Missing or non-positive height/width (" + std::to_string(H) + "x" + std::to_string(W) + ")");

	// Validate every row before sizing the grid from the header.
	std::vector<std::string> rows;
	for (int y = 0; y < H; ++y)
		{
		if (!std::getline(in, line))
			throw MalformedMapError("Expected " + std::to_string(H) + " rows, got " + std::to_string(y));
		rstrip_cr(line);
		if ((int)line.size() != W)
			throw MalformedMapError("Row width mismatch at row y=" + std::to_string(y)
				+ " (expected " + std::to_string(W) + ", got " + std::to_string(line.size()) + ")");
		rows.push_back(std::move(line));
		line.clear();
		}

	out.width = W;
	out.height = H;
	out.free.assign((std::size_t)W * H, 0);
	out.freeCells.clear();

	int count_obs = 0;
	for (int y = 0; y < H; ++y)
		for (int x = 0; x < W; ++x)
			{
			const uint8_t isfree = is_free_char(rows[y][x]) ? 1u : 0u;
			out.free[(std::size_t)y * W + x] = isfree;
			if (isfree) out.freeCells.push_back(Cell{x, y});
			else ++count_obs;
			}

	out.obs = count_obs;

	if (out.freeCells.empty())
		throw NoFreeCellError("Map has no traversable cells");
	}

bool loadMap(const std::string& mapPath, GRID& out)
	{
	std::ifstream in(mapPath);
	if (!in) return false;
	loadMap(in, out);
	return true;
	}

bool isVersionLine(const std::string& line)
	{
	return line.rfind("version", 0) == 0 || line.rfind("Version", 0) == 0;
	}

std::optional<AGENT> parseAgentLine(const std::string& line)
	{
	std::vector<std::string> f = split_ws(line);
	if (f.size() != 9) return std::nullopt;

	AGENT a;
	if (!parse_int(f[2], a.width) || !parse_int(f[3], a.height)) return std::nullopt;
	if (!parse_int(f[4], a.start.x) || !parse_int(f[5], a.start.y)) return std::nullopt;
	if (!parse_int(f[6], a.goal.x) || !parse_int(f[7], a.goal.y)) return std::nullopt;
	if (!parse_num(f[8], a.optlen)) return std::nullopt;

	a.fields = std::move(f);
	return a;
	}

std::string formatAugmentedLine(const AGENT& agent, const CellSeq& waypoints)
	{
	std::string out;
	for (const auto& f : agent.fields)
		{
		out += f;
		out += '\t';
		}
	out += std::to_string(waypoints.size());
	for (const auto& w : waypoints)
		{
		out += '\t'; out += std::to_string(w.x);
		out += '\t'; out += std::to_string(w.y);
		}
	return out;
	}

bool parseAugmentedLine(const std::string& line, std::vector<std::string>& fields_out, CellSeq& waypoints_out)
	{
	std::vector<std::string> f = split_ws(line);
	if (f.size() < 10) return false;

	int n = 0;
	if (!parse_int(f[9], n) || n < 0) return false;
	if (f.size() != 10 + 2 * (std::size_t)n) return false;

	CellSeq wps;
	wps.reserve(n);
	for (int i = 0; i < n; ++i)
		{
		Cell c;
		if (!parse_int(f[10 + 2 * i], c.x) || !parse_int(f[11 + 2 * i], c.y)) return false;
		wps.push_back(c);
		}

	fields_out.assign(f.begin(), f.begin() + 9);
	waypoints_out = std::move(wps);
	return true;
	}

bool readLines(const std::string& path, std::vector<std::string>& lines_out)
	{
	std::ifstream in(path);
	if (!in) return false;

	lines_out.clear();
	std::string line;
	while (std::getline(in, line))
		{
		rstrip_cr(line);
		lines_out.push_back(line);
		}
	return !in.bad();
	}

bool writeLines(const std::string& path, const std::vector<std::string>& lines)
	{
	std::ofstream out(path);
	if (!out) return false;
	for (const auto& l : lines) out << l << '\n';
	out.flush();
	return (bool)out;
	}
