#include "KERNEL.h"

#ifdef _OPENMP
#include <omp.h>
#endif

int countNeighbors(const GLubyte* read, int W, int H, int x, int y) {
	int sum = 0;
	for (int k = 0; k < N_NBR; k++) {
		const int nx = wrap(x + NBR_DX[k], W);
		const int ny = wrap(y + NBR_DY[k], H);
		if (isAlive(read[ny * W + nx])) sum++;
	}
	return sum;
}

GLubyte nextCellState(const GLubyte* read, int W, int H, int x, int y) {
	const int n = countNeighbors(read, W, H, x, y);

	// survival on 2 or 3, birth on exactly 3
	bool next;
	if (isAlive(read[y * W + x])) next = (n == 2 || n == 3);
	else                          next = (n == 3);

	return next ? CELL_ALIVE : CELL_DEAD;
}

void cpuPass(const GLubyte* read, GLubyte* write, int W, int H) {
	// each lane owns exactly one output cell, no synchronization needed
	#pragma omp parallel for collapse(2) if(W * H > 1024)
	for (int y = 0; y < H; y++) {
		for (int x = 0; x < W; x++) {
			write[y * W + x] = nextCellState(read, W, H, x, y);
		}
	}
}
