#ifndef PATTERNS_H
#define PATTERNS_H

#include "SETTINGS.h"

using namespace std;

// a named shape, offsets are relative and carry no origin
struct Pattern {
	string name;
	vector<ivec2> cells;
};

// min/max corners over both axes
struct PatternBounds { ivec2 lo, hi; };

const vector<Pattern>& patternCatalog();
vector<string> patternNames();

// throws PatternNotFound
const Pattern& findPattern(const string& name);

PatternBounds patternBounds(const Pattern& pattern);

#endif
