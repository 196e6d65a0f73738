//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// bed-sample - choose random lines from a BED file
//
#ifndef BED_SAMPLE_H
#define BED_SAMPLE_H
#include <getopt.h>
#include "config.h"

// functions
int bedSampleMain(int argc, char** argv);
void parseBedSampleOptions(int argc, char** argv);

#endif
