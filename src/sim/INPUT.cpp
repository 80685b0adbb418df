#include "INPUT.h"
#include "ERRORS.h"

#include <sstream>

bool windowToCell(int mx, int my, int winW, int winH,
                  int gridW, int gridH, ivec2& cell)
{
  if (mx < 0 || my < 0 || mx >= winW || my >= winH) return false;

  const int x = (int)((long long)mx * gridW / winW);
  const int y = (int)((long long)my * gridH / winH);

  // window rows grow downwards, grid rows grow upwards on screen
  cell = ivec2(x, gridH - 1 - y);
  return true;
}

int parseIntArg(const string& arg, int lo, int hi, const string& what)
{
  stringstream ss(arg);
  long long v;
  ss >> v;
  if (ss.fail() || !ss.eof())
    throw ConfigurationError(what + " is not an integer: " + arg);

  if (v < lo || v > hi) {
    stringstream msg;
    msg << what << " must be in [" << lo << "," << hi << "], got " << arg;
    throw ConfigurationError(msg.str());
  }
  return (int)v;
}

double parseRealArg(const string& arg, double lo, double hi, const string& what)
{
  stringstream ss(arg);
  double v;
  ss >> v;
  if (ss.fail() || !ss.eof())
    throw ConfigurationError(what + " is not a number: " + arg);

  // written so that NaN fails too
  if (!(v >= lo && v <= hi)) {
    stringstream msg;
    msg << what << " must be in [" << lo << "," << hi << "], got " << arg;
    throw ConfigurationError(msg.str());
  }
  return v;
}
