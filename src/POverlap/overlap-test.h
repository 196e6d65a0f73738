//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// overlap-test - test whether two interval sets overlap more than
// expected by chance
//
#ifndef OVERLAP_TEST_H
#define OVERLAP_TEST_H
#include <getopt.h>
#include "config.h"

// functions
int poverlapMain(int argc, char** argv);
void parsePoverlapOptions(int argc, char** argv);

#endif
