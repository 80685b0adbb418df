#include "CONWAY.h"
#include "KERNEL.h"
#include "ERRORS.h"

#include <algorithm>
#include <climits>
#include <sstream>

Conway::Conway(int width, int height, Backend backend) {
	if (width <= 0 || height <= 0) {
		stringstream ss;
		ss << "invalid grid dimensions " << width << "x" << height;
		throw ConfigurationError(ss.str());
	}
	// cells are addressed as y * W + x in an int
	if (width > INT_MAX / height) {
		stringstream ss;
		ss << "grid " << width << "x" << height << " has too many cells";
		throw ConfigurationError(ss.str());
	}

	_width   = width;
	_height  = height;
	_backend = backend;

	_buffers.reset(new StateBuffers(_width, _height));
	_rng.seed(random_device{}());

	reseedState(_state, _buffers->readCells());
}

Conway::~Conway() {
	if (_progLife != 0) glDeleteProgram(_progLife);
}

void Conway::init() {
	lock_guard<mutex> lock(_mutex);
	if (_backend == GPU_BACKEND) initGPU();
}

void Conway::setSeed(unsigned int seed) {
	lock_guard<mutex> lock(_mutex);
	_rng.seed(seed);
}

///////////////////////////////////////////////////////////////////////
// seeding functions
///////////////////////////////////////////////////////////////////////

void Conway::commitSeed() {
	_buffers->uploadRead();
	_hostStale = false;
	reseedState(_state, _buffers->readCells());
}

void Conway::randomize(double probability) {
	lock_guard<mutex> lock(_mutex);

	uniform_real_distribution<double> dist(0.0, 1.0);
	for (auto& c : _buffers->readCells())
		c = dist(_rng) < probability ? CELL_ALIVE : CELL_DEAD;

	commitSeed();
}

void Conway::clear() {
	lock_guard<mutex> lock(_mutex);

	auto& cells = _buffers->readCells();
	fill(cells.begin(), cells.end(), CELL_DEAD);

	commitSeed();
}

bool Conway::loadPattern(const string& name) {
	lock_guard<mutex> lock(_mutex);

	const Pattern* pattern = nullptr;
	try {
		pattern = &findPattern(name);
	} catch (const PatternNotFound& e) {
		cerr << e.what() << endl;
		return false;
	}

	auto& cells = _buffers->readCells();
	fill(cells.begin(), cells.end(), CELL_DEAD);

	// center the bounding box on the grid
	const PatternBounds b = patternBounds(*pattern);
	const ivec2 size   = b.hi - b.lo;
	const ivec2 origin = ivec2(_width / 2, _height / 2) - size / 2;

	for (const auto& p : pattern->cells) {
		const ivec2 q = origin + (p - b.lo);
		if (q.x < 0 || q.x >= _width || q.y < 0 || q.y >= _height) continue;
		cells[q.y * _width + q.x] = CELL_ALIVE;
	}

	commitSeed();
	return true;
}

bool Conway::drawCell(int x, int y, bool alive) {
	lock_guard<mutex> lock(_mutex);

	if (x < 0 || x >= _width || y < 0 || y >= _height) return false;

	// full read-back, one cell, full upload
	syncRead();
	_buffers->readCells()[y * _width + x] = alive ? CELL_ALIVE : CELL_DEAD;

	commitSeed();
	return true;
}

///////////////////////////////////////////////////////////////////////
// timestepping functions
///////////////////////////////////////////////////////////////////////

void Conway::cpuStep() {
	cpuPass(_buffers->readCells().data(), _buffers->writeCells().data(), _width, _height);

	// ping pong
	_buffers->swapRoles();
}

void Conway::step() {
	lock_guard<mutex> lock(_mutex);

	if (_backend == GPU_BACKEND) gpuStep();
	else                         cpuStep();

	_state.generation++;

	syncRead();
	_state.aliveCount = countAlive(_buffers->readCells());
}

bool Conway::checkTermination() {
	lock_guard<mutex> lock(_mutex);
	if (_state.hasEnded) return true;

	syncRead();
	return detectTermination(_state, _buffers->readCells());
}

EngineState Conway::queryState() {
	lock_guard<mutex> lock(_mutex);
	return _state;
}

GLuint Conway::readTexture() {
	lock_guard<mutex> lock(_mutex);
	return _buffers->readTexture();
}

const vector<GLubyte>& Conway::readBuffer() {
	lock_guard<mutex> lock(_mutex);
	syncRead();
	return _buffers->readCells();
}

void Conway::syncRead() {
	if (!_hostStale) return;

	_buffers->downloadRead();
	_hostStale = false;
}
