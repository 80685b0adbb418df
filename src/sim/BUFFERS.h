#ifndef BUFFERS_H
#define BUFFERS_H

#include "SETTINGS.h"

using namespace std;

///////////////////////////////////////////////////////////////////////
// ping-pong pair of W x H cell grids
//
// One grid is tagged "read" and the other "write". A generation reads
// only from the read grid, writes only into the write grid, and the two
// tags are exchanged by swapRoles() once the whole pass is done.
//
// On the GPU backend each grid also has a GL_R8 texture that the compute
// kernel binds as an image and the display pass samples. The host arrays
// then act as staging copies for uploads and read-backs.
///////////////////////////////////////////////////////////////////////
class StateBuffers {
public:

	StateBuffers(int width, int height);
	~StateBuffers();

	StateBuffers(const StateBuffers&) = delete;
	StateBuffers& operator=(const StateBuffers&) = delete;

	int width()  const { return _width; };
	int height() const { return _height; };
	int nCells() const { return _nCells; };

	// host grids
	vector<GLubyte>&       readCells()       { return _cells[_read]; };
	const vector<GLubyte>& readCells() const { return _cells[_read]; };
	vector<GLubyte>&       writeCells()      { return _cells[1 - _read]; };

	int readIndex() const { return _read; };

	// the single role-exchange point
	void swapRoles() { _read = 1 - _read; };

	// GPU textures
	void initGPU();
	bool hasGPU() const { return _tex[0] != 0; };
	GLuint readTexture()  const { return _tex[_read]; };
	GLuint writeTexture() const { return _tex[1 - _read]; };

	void uploadRead();   // host read grid -> read texture
	void downloadRead(); // read texture -> host read grid

private:

	int _width;
	int _height;
	int _nCells;

	vector<GLubyte> _cells[2];
	int _read = 0;

	GLuint _tex[2] = {0, 0};
};

#endif
