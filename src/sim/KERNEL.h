#ifndef KERNEL_H
#define KERNEL_H

#include "SETTINGS.h"

#define N_NBR 8

// Moore neighborhood offsets
static const int NBR_DX[N_NBR] = { -1,  0,  1, -1, 1, -1, 0, 1 };
static const int NBR_DY[N_NBR] = { -1, -1, -1,  0, 0,  1, 1, 1 };

// toroidal wrap, v may be negative
inline int wrap(int v, int n) { return (v % n + n) % n; }

int countNeighbors(const GLubyte* read, int W, int H, int x, int y);

// B3/S23 for a single cell, depends only on the read grid
GLubyte nextCellState(const GLubyte* read, int W, int H, int x, int y);

// evaluates every cell of read into write, in parallel
void cpuPass(const GLubyte* read, GLubyte* write, int W, int H);

#endif
