//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// IntervalShuffler - Abstract interface for the strategies
// that produce a randomized copy of an interval set for
// one round of a permutation test
//
#ifndef INTERVALSHUFFLER_H
#define INTERVALSHUFFLER_H

#include "BedRecord.h"

class IntervalShuffler
{
    public:
        virtual ~IntervalShuffler() {}

        // Return a randomized version of records using rng as the only source
        // of randomness. Implementations must be safe to call concurrently
        // from several threads, each with its own rng.
        virtual BedRecordVector shuffle(const BedRecordVector& records, RandomEngine& rng) const = 0;

        // Short human-readable description used in the test report
        virtual std::string getDescription() const = 0;
};

#endif
