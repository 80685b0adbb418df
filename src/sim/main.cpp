#include <iostream>
#include <cstdlib>
#include <cstdio>
#include <algorithm>

#include "CONWAY.h"
#include "ERRORS.h"
#include "INPUT.h"

#include <climits>

using namespace std;

// forward declarations
void runOnce();
void runEverytime();

// simulator
Conway *simulator = nullptr;

// settings, overridable from the command line
int gridW = GRID_SIZE;
int gridH = GRID_SIZE;
double probability = DEFAULT_PROBABILITY;
Backend backend = GPU_BACKEND;

// Text for the title bar of the window
string windowLabel("Conway's Game of Life");

// the resolution of the OpenGL window
int xScreenRes = 800;
int yScreenRes = 800;

// tick cadence
bool isRunning = false;
int speed = DEFAULT_SPEED;
int lastUpdateTime = 0;

// mouse drawing
bool isDrawing = false;

// index into the pattern catalog for n/p
int patternIndex = -1;

// display pass
GLuint displayProgram = 0;
GLuint quadVAO = 0, quadVBO = 0;
GLuint displayTex = 0; // host upload target for the CPU backend

///////////////////////////////////////////////////////////////////////
// status
///////////////////////////////////////////////////////////////////////
void printStatus()
{
  EngineState s = simulator->queryState();
  cout << "generation " << s.generation
       << "  alive " << s.aliveCount
       << "  speed " << speed << "/s"
       << (isRunning ? "  running" : "  paused") << endl;
}

void reportEnd()
{
  EngineState s = simulator->queryState();
  cout << "=== " << s.endReason << " (generation " << s.generation << ") ===" << endl;
}

///////////////////////////////////////////////////////////////////////
// advance one generation if the tick is due
///////////////////////////////////////////////////////////////////////
void tick()
{
  if (!isRunning) return;

  const int now = glutGet(GLUT_ELAPSED_TIME);
  const int interval = 1000 / speed;
  if (now - lastUpdateTime < interval) return;
  lastUpdateTime = now;

  simulator->step();
  if (simulator->checkTermination()) {
    isRunning = false;
    reportEnd();
    printStatus();
    return;
  }

  if (simulator->queryState().generation % speed == 0) printStatus();
}

///////////////////////////////////////////////////////////////////////
// GL and GLUT callbacks
///////////////////////////////////////////////////////////////////////
void glutDisplay()
{
  runEverytime();
}

void glutIdle()
{
  try {
    tick();
  } catch (const ParallelEvaluatorFailure& e) {
    cerr << "Parallel evaluator failed: " << e.what() << endl;
    exit(EXIT_FAILURE);
  }
  glutPostRedisplay();
}

void loadCatalogPattern(int delta)
{
  const vector<string> names = patternNames();
  const int n = (int)names.size();
  patternIndex = ((patternIndex + delta) % n + n) % n;

  if (simulator->loadPattern(names[patternIndex]))
    cout << "pattern: " << names[patternIndex] << endl;
}

///////////////////////////////////////////////////////////////////////
// map the keyboard keys to something here
///////////////////////////////////////////////////////////////////////
void glutKeyboard(unsigned char key, int x, int y)
{
  switch (key) {
  case ' ':
    if (!simulator->queryState().hasEnded)
      isRunning = !isRunning;
    break;
  case 'r':
  case 'R':
    simulator->randomize(probability);
    break;
  case 'c':
  case 'C':
    simulator->clear();
    break;
  case 'n':
    loadCatalogPattern(1);
    break;
  case 'p':
    loadCatalogPattern(-1);
    break;
  case 'q':
    exit(0);
    break;
  default:
    return;
  }

  printStatus();
  glutPostRedisplay();        // request redraw
}

///////////////////////////////////////////////////////////////////////
// arrow keys change the speed
///////////////////////////////////////////////////////////////////////
void onSpecial(int key, int, int)
{
  switch (key) {
    case GLUT_KEY_UP:   speed = min(MAX_SPEED, speed + SPEED_STEP); break;
    case GLUT_KEY_DOWN: speed = max(MIN_SPEED, speed - SPEED_STEP); break;
    default: return;
  }
  printStatus();
}

///////////////////////////////////////////////////////////////////////
// left button draws alive cells
///////////////////////////////////////////////////////////////////////
void drawAtPosition(int mx, int my)
{
  ivec2 cell;
  if (!windowToCell(mx, my, xScreenRes, yScreenRes, gridW, gridH, cell)) return;

  if (simulator->drawCell(cell.x, cell.y, true))
    glutPostRedisplay();
}

void onMouse(int button, int state, int x, int y)
{
  if (button != GLUT_LEFT_BUTTON) return;

  if (state == GLUT_DOWN) {
    isDrawing = true;
    drawAtPosition(x, y);
  } else {
    isDrawing = false;
    printStatus();
  }
}

void onMotion(int x, int y)
{
  if (isDrawing) drawAtPosition(x, y);
}

///////////////////////////////////////////////////////////////////////
// full screen quad for the display pass
///////////////////////////////////////////////////////////////////////
void initDisplay()
{
  displayProgram = createRenderProgram("./src/render/displayVert.glsl",
                                       "./src/render/displayFrag.glsl");

  // x, y, u, v
  const GLfloat quad[] = {
    -1.0f, -1.0f,  0.0f, 0.0f,
     1.0f, -1.0f,  1.0f, 0.0f,
    -1.0f,  1.0f,  0.0f, 1.0f,
    -1.0f,  1.0f,  0.0f, 1.0f,
     1.0f, -1.0f,  1.0f, 0.0f,
     1.0f,  1.0f,  1.0f, 1.0f
  };

  glGenVertexArrays(1, &quadVAO);
  glBindVertexArray(quadVAO);

  glGenBuffers(1, &quadVBO);
  glBindBuffer(GL_ARRAY_BUFFER, quadVBO);
  glBufferData(GL_ARRAY_BUFFER, sizeof(quad), quad, GL_STATIC_DRAW);
  glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 4*sizeof(GLfloat), (void*)0);
  glEnableVertexAttribArray(0);
  glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, 4*sizeof(GLfloat), (void*)(2*sizeof(GLfloat)));
  glEnableVertexAttribArray(1);

  glBindVertexArray(0);
  glBindBuffer(GL_ARRAY_BUFFER, 0);

  if (backend == CPU_BACKEND) {
    glGenTextures(1, &displayTex);
    glBindTexture(GL_TEXTURE_2D, displayTex);
    glTexStorage2D(GL_TEXTURE_2D, 1, GL_R8, gridW, gridH);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glBindTexture(GL_TEXTURE_2D, 0);
  }
}

void render()
{
  GLuint tex = 0;
  if (backend == GPU_BACKEND) {
    tex = simulator->readTexture();
  } else {
    const vector<GLubyte>& cells = simulator->readBuffer();
    glBindTexture(GL_TEXTURE_2D, displayTex);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, gridW, gridH, GL_RED, GL_UNSIGNED_BYTE, cells.data());
    tex = displayTex;
  }

  glUseProgram(displayProgram);
  glUniform1i(glGetUniformLocation(displayProgram, "uState"), 0);
  glActiveTexture(GL_TEXTURE0);
  glBindTexture(GL_TEXTURE_2D, tex);

  glBindVertexArray(quadVAO);
  glDrawArrays(GL_TRIANGLES, 0, 6);

  glBindVertexArray(0);
  glBindTexture(GL_TEXTURE_2D, 0);
  glUseProgram(0);
}

//////////////////////////////////////////////////////////////////////////////
// open the GLVU window
//////////////////////////////////////////////////////////////////////////////
int glvuWindow()
{
  glutInitDisplayMode(GLUT_DOUBLE | GLUT_RGBA);

  glutInitWindowSize(xScreenRes, yScreenRes);
  glutInitWindowPosition(10, 10);

  // compute shaders need OpenGL 4.3 core
  glutInitContextVersion(4, 3);
  glutInitContextProfile(GLUT_CORE_PROFILE);

  // create the context
  glutCreateWindow(windowLabel.c_str());

  // enable modern OpenGL extensions
  glewExperimental = GL_TRUE;
  if (glewInit() != GLEW_OK) {
      fprintf(stderr, "Failed to initialize GLEW\n");
      exit(EXIT_FAILURE);
  }
  // glewInit can leave a spurious GL_INVALID_ENUM behind on core profiles
  glGetError();

  // initialize everything
  try {
    runOnce();
  } catch (const ParallelEvaluatorFailure& e) {
    cerr << "Parallel evaluator failed: " << e.what() << endl;
    exit(EXIT_FAILURE);
  } catch (const ConfigurationError& e) {
    cerr << e.what() << endl;
    exit(EXIT_FAILURE);
  }

  glViewport(0, 0, (GLsizei)xScreenRes, (GLsizei)yScreenRes);
  glClearColor(0.0, 0.0, 0.0, 0);

  // register all the callbacks
  glutDisplayFunc(&glutDisplay);
  glutIdleFunc(&glutIdle);
  glutKeyboardFunc(&glutKeyboard);
  glutSpecialFunc(&onSpecial);
  glutMouseFunc(&onMouse);
  glutMotionFunc(&onMotion);

  // enter the infinite GL loop
  glutMainLoop();

  // Control flow will never reach here
  return EXIT_SUCCESS;
}

///////////////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////
void printCommands()
{
  cout << "=============================================================== " << endl;
  cout << " Conway's Game of Life" << endl;
  cout << "=============================================================== " << endl;
  cout << " q           - quit" << endl;
  cout << " space       - start/pause the simulation" << endl;
  cout << " r           - random fill" << endl;
  cout << " c           - clear the grid" << endl;
  cout << " n / p       - load the next/previous catalog pattern" << endl;
  cout << " up/down     - faster/slower (" << MIN_SPEED << "-" << MAX_SPEED << " gen/s)" << endl;
  cout << " left mouse  - draw live cells" << endl;
}

///////////////////////////////////////////////////////////////////////
// conway [width height [probability [speed]]] [--cpu]
///////////////////////////////////////////////////////////////////////
void parseArgs(int argc, char **argv)
{
  vector<string> positional;
  for (int i = 1; i < argc; i++) {
    string arg = argv[i];
    if (arg == "--cpu") backend = CPU_BACKEND;
    else positional.push_back(arg);
  }

  if (positional.size() == 1 || positional.size() > 4)
    throw ConfigurationError("usage: conway [width height [probability [speed]]] [--cpu]");

  if (positional.size() >= 2) {
    gridW = parseIntArg(positional[0], 1, INT_MAX, "width");
    gridH = parseIntArg(positional[1], 1, INT_MAX, "height");
  }
  if (positional.size() >= 3)
    probability = parseRealArg(positional[2], 0.0, 1.0, "probability");
  if (positional.size() == 4)
    speed = parseIntArg(positional[3], MIN_SPEED, MAX_SPEED, "speed");
}

int main(int argc, char **argv)
{
  // initialize GLUT and GL, this strips the GLUT options from argv
  glutInit(&argc, argv);

  try {
    parseArgs(argc, argv);
  } catch (const ConfigurationError& e) {
    cerr << e.what() << endl;
    return EXIT_FAILURE;
  }

  // open the GL window
  glvuWindow();
  return 0;
}

///////////////////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////

void runOnce()
{
  printCommands();

  // construct simulator
  simulator = new Conway(gridW, gridH, backend);
  simulator->init();
  simulator->randomize(probability);

  initDisplay();
  checkGLError("initDisplay");

  printStatus();
}

void runEverytime()
{
  glClear(GL_COLOR_BUFFER_BIT);

  // always render
  render();

  glutSwapBuffers();
}
