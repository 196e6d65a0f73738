//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL license
//-----------------------------------------------
//
// POverlapCommon.h - Common definitions used in the
// poverlap subprograms
//

#ifndef POVERLAPCOMMON_H
#define POVERLAPCOMMON_H

#include <time.h>
#include <stdexcept>
#include "Util.h"

// Default values
#define DEFAULT_SHUFFLE_DISTANCE 500000
#define DEFAULT_TYPE_COLUMN 4
#define DEFAULT_SAMPLE_SIZE 1000

// Report an error raised by a subprogram and exit
inline void exitWithError(const char* subprogram, const std::exception& e)
{
    std::cerr << subprogram << ": error: " << e.what() << "\n";
    exit(EXIT_FAILURE);
}

// A seed of zero means seed from the clock
inline uint64_t resolveSeed(uint64_t seed)
{
    return seed == 0 ? (uint64_t)time(NULL) : seed;
}

#endif
