//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// extend - pad the intervals of a BED file
//
#ifndef EXTEND_H
#define EXTEND_H
#include <getopt.h>
#include "config.h"

// functions
int extendMain(int argc, char** argv);
void parseExtendOptions(int argc, char** argv);

#endif
