#include "PATTERNS.h"
#include "ERRORS.h"

#include <algorithm>

///////////////////////////////////////////////////////////////////////
// catalog
///////////////////////////////////////////////////////////////////////

const vector<Pattern>& patternCatalog() {
	static const vector<Pattern> catalog = {

		// still lifes
		{ "block", {
			{0, 0}, {1, 0},
			{0, 1}, {1, 1} } },
		{ "beehive", {
			{1, 0}, {2, 0},
			{0, 1}, {3, 1},
			{1, 2}, {2, 2} } },
		{ "loaf", {
			{1, 0}, {2, 0},
			{0, 1}, {3, 1},
			{1, 2}, {3, 2},
			{2, 3} } },
		{ "boat", {
			{0, 0}, {1, 0},
			{0, 1}, {2, 1},
			{1, 2} } },
		{ "tub", {
			{1, 0},
			{0, 1}, {2, 1},
			{1, 2} } },

		// oscillators
		{ "blinker", {
			{0, 0}, {1, 0}, {2, 0} } },
		{ "toad", {
			{1, 0}, {2, 0}, {3, 0},
			{0, 1}, {1, 1}, {2, 1} } },
		{ "beacon", {
			{0, 0}, {1, 0},
			{0, 1},
			{3, 2},
			{2, 3}, {3, 3} } },
		{ "pulsar", {
			{2, 0}, {3, 0}, {4, 0}, {8, 0}, {9, 0}, {10, 0},
			{0, 2}, {5, 2}, {7, 2}, {12, 2},
			{0, 3}, {5, 3}, {7, 3}, {12, 3},
			{0, 4}, {5, 4}, {7, 4}, {12, 4},
			{2, 5}, {3, 5}, {4, 5}, {8, 5}, {9, 5}, {10, 5},
			{2, 7}, {3, 7}, {4, 7}, {8, 7}, {9, 7}, {10, 7},
			{0, 8}, {5, 8}, {7, 8}, {12, 8},
			{0, 9}, {5, 9}, {7, 9}, {12, 9},
			{0, 10}, {5, 10}, {7, 10}, {12, 10},
			{2, 12}, {3, 12}, {4, 12}, {8, 12}, {9, 12}, {10, 12} } },
		{ "pentadecathlon", {
			{1, 0},
			{0, 1}, {2, 1},
			{1, 2},
			{1, 3},
			{1, 4},
			{1, 5},
			{0, 6}, {2, 6},
			{1, 7} } },

		// spaceships
		{ "glider", {
			{1, 0},
			{2, 1},
			{0, 2}, {1, 2}, {2, 2} } },
		{ "lwss", {
			{1, 0}, {4, 0},
			{0, 1},
			{0, 2}, {4, 2},
			{0, 3}, {1, 3}, {2, 3}, {3, 3} } },
		{ "mwss", {
			{2, 0},
			{0, 1}, {4, 1},
			{0, 2},
			{0, 3}, {5, 3},
			{0, 4}, {1, 4}, {2, 4}, {3, 4}, {4, 4} } },
		{ "hwss", {
			{2, 0}, {3, 0},
			{0, 1}, {5, 1},
			{0, 2},
			{0, 3}, {6, 3},
			{0, 4}, {1, 4}, {2, 4}, {3, 4}, {4, 4}, {5, 4} } },
	};
	return catalog;
}

vector<string> patternNames() {
	vector<string> names;
	for (const auto& p : patternCatalog())
		names.push_back(p.name);
	return names;
}

const Pattern& findPattern(const string& name) {
	const auto& catalog = patternCatalog();
	auto it = find_if(catalog.begin(), catalog.end(),
					  [&](const Pattern& p) { return p.name == name; });
	if (it == catalog.end())
		throw PatternNotFound(name);
	return *it;
}

PatternBounds patternBounds(const Pattern& pattern) {
	PatternBounds b{ ivec2(0), ivec2(0) };
	if (pattern.cells.empty()) return b;

	b.lo = b.hi = pattern.cells[0];
	for (const auto& c : pattern.cells) {
		b.lo = glm::min(b.lo, c);
		b.hi = glm::max(b.hi, c);
	}
	return b;
}
