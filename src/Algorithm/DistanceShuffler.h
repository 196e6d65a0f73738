//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// DistanceShuffler - Move every interval to a random
// position within a fixed distance of where it is.
// This keeps the local structure of the set, unlike
// shuffling over the whole genome. Chromosome lengths
// are not consulted.
//
#ifndef DISTANCESHUFFLER_H
#define DISTANCESHUFFLER_H

#include "IntervalShuffler.h"

class DistanceShuffler : public IntervalShuffler
{
    public:
        // A negative distance is treated as its absolute value. The
        // smallest int64_t has none and raises a ConfigurationError.
        DistanceShuffler(int64_t maxDistance);

        // Each record is shifted by an independent offset drawn uniformly
        // from [-maxDistance, maxDistance]. The start is clamped at zero, and
        // far enough from the int64_t limit that the end is placed with the
        // width unchanged.
        virtual BedRecordVector shuffle(const BedRecordVector& records, RandomEngine& rng) const;
        virtual std::string getDescription() const;

        BedRecord shuffleRecord(const BedRecord& record, RandomEngine& rng) const;
        int64_t getMaxDistance() const { return m_maxDistance; }

    private:
        int64_t m_maxDistance;
};

#endif
