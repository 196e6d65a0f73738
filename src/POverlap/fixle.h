//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// fixle - test the overlap of two types of a labeled
// interval set by randomly reassigning one type
//
#ifndef FIXLE_H
#define FIXLE_H
#include <getopt.h>
#include "config.h"

// functions
int fixleMain(int argc, char** argv);
void parseFixleOptions(int argc, char** argv);

#endif
