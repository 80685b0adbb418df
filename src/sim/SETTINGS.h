#ifndef SETTINGS_H
#define SETTINGS_H

#include <vector>
#include <string>
#include <iostream>

#include <GL/glew.h>
#include <glm/glm.hpp>

#if _WIN32
#include <GL/freeglut.h>
#elif __APPLE__
#include <GLUT/glut.h>
#elif __linux__
#include <GL/freeglut.h>
#endif

typedef glm::ivec2 ivec2;

// grid defaults
#define GRID_SIZE 512
#define DEFAULT_PROBABILITY 0.3

// termination window
#define HISTORY_SIZE 10
#define HASH_BASE 31u

// tick cadence in generations per second
#define DEFAULT_SPEED 10
#define MIN_SPEED 1
#define MAX_SPEED 60
#define SPEED_STEP 5

// compute workgroup is WG x WG invocations
#define WG 16

// byte channel encoding of a cell
const GLubyte CELL_DEAD  = 0;
const GLubyte CELL_ALIVE = 255;

// anything above half intensity counts as alive, the compute kernel
// applies the same cut (> 0.5) to the normalized channel
inline bool isAlive(GLubyte v) { return v > 128; }

enum Backend { CPU_BACKEND, GPU_BACKEND };

#endif
