#ifndef CONWAY_H
#define CONWAY_H

#include "SETTINGS.h"
#include "BUFFERS.h"
#include "HISTORY.h"
#include "PATTERNS.h"
#include "./src/util/SHADER.h"

#include <memory>
#include <mutex>
#include <random>

using namespace std;

///////////////////////////////////////////////////////////////////////
// Conway's Game of Life on a W x H torus
//
// Owns the ping-pong buffers and the run state. Every public call holds
// the engine mutex, so a step never overlaps a seed, an edit or a
// read-back. The kernel itself runs either as an OpenMP pass on the host
// (CPU_BACKEND) or as a compute dispatch (GPU_BACKEND, needs a current
// GL 4.3 context when init() is called).
///////////////////////////////////////////////////////////////////////
class Conway {
public:

	// throws ConfigurationError when a dimension is not positive or the
	// cell count does not fit in an int
	Conway(int width, int height, Backend backend = CPU_BACKEND);
	~Conway();

	Conway(const Conway&) = delete;
	Conway& operator=(const Conway&) = delete;

	// builds GPU resources, throws ParallelEvaluatorFailure
	void init();

	int width()  const { return _width; };
	int height() const { return _height; };
	Backend backend() const { return _backend; };

	// seeding, each one starts a new run
	void randomize(double probability = DEFAULT_PROBABILITY);
	void clear();
	bool loadPattern(const string& name);
	bool drawCell(int x, int y, bool alive);
	void setSeed(unsigned int seed);

	// time stepping
	void step();
	bool checkTermination();

	EngineState queryState();

	// valid until the next call on this engine, do not write through it
	const vector<GLubyte>& readBuffer();
	GLuint readTexture(); // 0 on the CPU backend

private:

	void cpuStep();

	// GPU functions
	void initGPU();
	void createPrograms();
	void gpuStep();

	void syncRead();   // host copy of the read grid is current afterwards
	void commitSeed(); // upload the seeded read grid and reset the run

	int _width;
	int _height;
	Backend _backend;

	unique_ptr<StateBuffers> _buffers;
	bool _hostStale = false;

	EngineState _state;

	mt19937 _rng;
	mutex _mutex;

	// compute shaders
	GLuint _progLife = 0;
};

#endif
