#pragma once
#include <iosfwd>
#include <string>
#include <vector>

struct VerifyReport
	{
	int matches    = 0;
	int mismatches = 0;
	bool countMismatch = false;  // files hold a different number of agent lines

	int total() const { return matches + mismatches; }
	bool ok() const { return !countMismatch && mismatches == 0; }
	};

/*
* Check that every agent of `smaller` carries a prefix of the same agent's
* waypoints in `larger`. Header and blank lines are ignored; lines that are not
* augmented agent lines are skipped. Each mismatch is described on `log`.
*/
VerifyReport verifyPrefixConsistency(const std::vector<std::string>& smaller,
		const std::vector<std::string>& larger,
		std::ostream& log);
