#include "BUFFERS.h"

StateBuffers::StateBuffers(int width, int height) {
	_width  = width;
	_height = height;
	_nCells = width * height;

	// both grids live for the whole engine lifetime
	_cells[0].assign(_nCells, CELL_DEAD);
	_cells[1].assign(_nCells, CELL_DEAD);
}

StateBuffers::~StateBuffers() {
	if (hasGPU()) glDeleteTextures(2, _tex);
}

///////////////////////////////////////////////////////////////////////
// GPU textures
///////////////////////////////////////////////////////////////////////

void StateBuffers::initGPU() {
	if (hasGPU()) return;

	glGenTextures(2, _tex);
	for (int i = 0; i < 2; i++) {
		glBindTexture(GL_TEXTURE_2D, _tex[i]);

		// immutable storage so the texture can be bound as an image
		glTexStorage2D(GL_TEXTURE_2D, 1, GL_R8, _width, _height);
		glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
		glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
		glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_REPEAT);
		glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_REPEAT);

		glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
		glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, _width, _height,
						GL_RED, GL_UNSIGNED_BYTE, _cells[i].data());
	}
	glBindTexture(GL_TEXTURE_2D, 0);
}

void StateBuffers::uploadRead() {
	if (!hasGPU()) return;

	glBindTexture(GL_TEXTURE_2D, readTexture());
	glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
	glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, _width, _height,
					GL_RED, GL_UNSIGNED_BYTE, readCells().data());
	glBindTexture(GL_TEXTURE_2D, 0);
}

void StateBuffers::downloadRead() {
	if (!hasGPU()) return;

	// make sure every kernel write has landed before reading back
	glMemoryBarrier(GL_TEXTURE_UPDATE_BARRIER_BIT | GL_SHADER_IMAGE_ACCESS_BARRIER_BIT);
	glFinish();

	glBindTexture(GL_TEXTURE_2D, readTexture());
	glPixelStorei(GL_PACK_ALIGNMENT, 1);
	glGetTexImage(GL_TEXTURE_2D, 0, GL_RED, GL_UNSIGNED_BYTE, readCells().data());
	glBindTexture(GL_TEXTURE_2D, 0);
}
