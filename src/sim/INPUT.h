#ifndef INPUT_H
#define INPUT_H

#include "SETTINGS.h"

using namespace std;

///////////////////////////////////////////////////////////////////////
// window and command line input, kept free of GLUT so it can be tested
///////////////////////////////////////////////////////////////////////

// maps a window pixel (origin top-left) to a grid cell (origin bottom-left).
// Returns false when the pixel lies outside the window, which happens
// while a drag leaves it.
bool windowToCell(int mx, int my, int winW, int winH,
                  int gridW, int gridH, ivec2& cell);

// whole decimal integer in [lo, hi], throws ConfigurationError otherwise
int parseIntArg(const string& arg, int lo, int hi, const string& what);

// decimal number in [lo, hi], throws ConfigurationError otherwise
double parseRealArg(const string& arg, double lo, double hi, const string& what);

#endif
