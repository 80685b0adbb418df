#include "CONWAY.h"
#include "ERRORS.h"


///////////////////////////////////////////////////////////////////////
// GPU FUNCTIONS
///////////////////////////////////////////////////////////////////////


void Conway::initGPU() {
	// textures start out holding whatever the host grids hold
	_buffers->initGPU();

	createPrograms();

	checkGLError("initGPU");
}

void Conway::createPrograms() {
	if (_progLife == 0)
		_progLife = createComputeProgram("./src/compute/life.glsl");
}

///////////////////////////////////////////////////////////////////////
// gpu timestepping functions
///////////////////////////////////////////////////////////////////////

void Conway::gpuStep() {
	if (_progLife == 0 || !_buffers->hasGPU())
		throw ParallelEvaluatorFailure("GPU backend stepped before init()");

	// read image on unit 0, write image on unit 1
	glBindImageTexture(0, _buffers->readTexture(),  0, GL_FALSE, 0, GL_READ_ONLY,  GL_R8);
	glBindImageTexture(1, _buffers->writeTexture(), 0, GL_FALSE, 0, GL_WRITE_ONLY, GL_R8);

	glUseProgram(_progLife);
	glUniform2i(glGetUniformLocation(_progLife, "uResolution"), _width, _height);

	GLuint groupsX = (_width  + WG - 1) / WG;
	GLuint groupsY = (_height + WG - 1) / WG;
	glDispatchCompute(groupsX, groupsY, 1);

	// the whole pass must land before anyone sees the new roles
	glMemoryBarrier(GL_SHADER_IMAGE_ACCESS_BARRIER_BIT |
					GL_TEXTURE_FETCH_BARRIER_BIT |
					GL_TEXTURE_UPDATE_BARRIER_BIT);
	glUseProgram(0);

	checkGLError("life dispatch");

	// ping pong
	_buffers->swapRoles();
	_hostStale = true;
}
