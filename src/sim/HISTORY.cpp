#include "HISTORY.h"

#include <sstream>

int countAlive(const vector<GLubyte>& cells) {
	int count = 0;
	for (GLubyte v : cells)
		if (isAlive(v)) count++;
	return count;
}

uint32_t fingerprint(const vector<GLubyte>& cells) {
	uint32_t hash = 0;
	for (size_t i = 0; i < cells.size(); i++) {
		if (isAlive(cells[i]))
			hash = hash * HASH_BASE + static_cast<uint32_t>(i); // wraps mod 2^32
	}
	return hash;
}

string endReasonString(EndKind kind, int period) {
	switch (kind) {
	case EXTINCTION:
		return "EXTINCTION - all cells dead";
	case STABLE:
		return "STABLE STATE - pattern unchanged";
	case PERIODIC: {
		stringstream ss;
		ss << "PERIODIC LOOP - period of " << period << " generations";
		return ss.str();
	}
	default:
		return "";
	}
}

static bool endWith(EngineState& state, EndKind kind, int period) {
	state.hasEnded  = true;
	state.endKind   = kind;
	state.period    = period;
	state.endReason = endReasonString(kind, period);
	return true;
}

bool detectTermination(EngineState& state, const vector<GLubyte>& cells) {
	if (state.hasEnded) return true;

	state.aliveCount = countAlive(cells);
	if (state.aliveCount == 0)
		return endWith(state, EXTINCTION, 0);

	const uint32_t hash = fingerprint(cells);
	const int len = (int)state.history.size();

	for (int i = 0; i < len; i++) {
		if (state.history[i] != hash) continue;

		if (i == len - 1) return endWith(state, STABLE, 0);
		return endWith(state, PERIODIC, len - i);
	}

	state.history.push_back(hash);
	if ((int)state.history.size() > HISTORY_SIZE)
		state.history.pop_front();

	return false;
}

void reseedState(EngineState& state, const vector<GLubyte>& cells) {
	state = EngineState();
	state.aliveCount = countAlive(cells);
}
