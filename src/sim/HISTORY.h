#ifndef HISTORY_H
#define HISTORY_H

#include "SETTINGS.h"

#include <cstdint>
#include <deque>

using namespace std;

enum EndKind { RUNNING, EXTINCTION, STABLE, PERIODIC };

// everything about the current run, reset on every reseed
struct EngineState {
	int  generation = 0;
	int  aliveCount = 0;
	bool hasEnded   = false;
	EndKind endKind = RUNNING;
	int  period     = 0;  // only for PERIODIC
	string endReason;

	deque<uint32_t> history; // oldest first, at most HISTORY_SIZE
};

///////////////////////////////////////////////////////////////////////
// state inspection
///////////////////////////////////////////////////////////////////////

int countAlive(const vector<GLubyte>& cells);

// base-31 polynomial over the row-major index of every alive cell
uint32_t fingerprint(const vector<GLubyte>& cells);

string endReasonString(EndKind kind, int period);

///////////////////////////////////////////////////////////////////////
// termination detection
//
// Runs once after a completed step. Extinction is checked first, then
// the fingerprint is looked up in the bounded history: a hit on the most
// recent entry is a fixed point, an earlier hit at distance d is a
// period-d loop. Periods longer than HISTORY_SIZE go unnoticed and a hash
// collision can end a run early; both are accepted.
//
// Returns true once the run has ended. An ended state is left untouched.
///////////////////////////////////////////////////////////////////////
bool detectTermination(EngineState& state, const vector<GLubyte>& cells);

// back to generation 0 with an empty history
void reseedState(EngineState& state, const vector<GLubyte>& cells);

#endif
