//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// distance-shuffle - move intervals within a distance of their location
//
#ifndef DISTANCE_SHUFFLE_H
#define DISTANCE_SHUFFLE_H
#include <getopt.h>
#include "config.h"

// functions
int distanceShuffleMain(int argc, char** argv);
void parseDistanceShuffleOptions(int argc, char** argv);

#endif
