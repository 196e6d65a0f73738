//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// Util - Common data structures and functions
//
#ifndef UTIL_H
#define UTIL_H

#include <vector>
#include <string>
#include <istream>
#include <fstream>
#include <cassert>
#include <sstream>
#include <cstring>
#include <cstdlib>
#include <stdint.h>
#include <iostream>
#include <random>
#include "config.h"

#if HAVE_GZSTREAM
#include <gzstream.h>
#endif

#define GZIP_EXT ".gz"

//
// Typedef
//
typedef std::vector<size_t> SizeTVec;
typedef std::vector<bool> BoolVec;
typedef std::vector<std::string> StringVector;

// Each permutation round owns one of these, seeded from the master seed
typedef std::mt19937_64 RandomEngine;

//
// Functions
//
bool isGzip(const std::string& filename);

// Wrapper function for opening a reader of compressed or uncompressed file
// The caller is responsible for freeing the handle
std::istream* createReader(const std::string& filename, std::ios_base::openmode mode = std::ios_base::in);
std::ostream* createWriter(const std::string& filename,
                           std::ios_base::openmode mode = std::ios_base::out);

void assertFileOpen(std::ifstream& fh, const std::string& fn);
void assertFileOpen(std::ofstream& fh, const std::string& fn);

StringVector split(std::string in, char delimiter);

// Remove any trailing newline or carriage return characters
void chomp(std::string& line);

// Parse a base-10 integer occupying all of str, optionally preceded
// by '-'. Returns false for anything else, including surrounding
// whitespace, a leading '+' or a value that overflows
bool parseInteger(const std::string& str, int64_t& out);

// Number of hardware threads available, at least 1
int getNumHardwareThreads();

// Uniform integer in the closed range [lo, hi]
inline int64_t randomInRange(RandomEngine& rng, int64_t lo, int64_t hi)
{
    assert(lo <= hi);
    std::uniform_int_distribution<int64_t> dist(lo, hi);
    return dist(rng);
}

#endif
