//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// IntervalExtender - Pad intervals symmetrically so that
// intervals within a given distance of each other overlap
//
#ifndef INTERVALEXTENDER_H
#define INTERVALEXTENDER_H

#include "BedRecord.h"

namespace IntervalExtender
{
    // Move the start left and the end right by floor(bases / 2), clamping
    // both at zero. If the interval inverts (only possible for negative
    // bases) it collapses to a zero-width interval at its midpoint.
    BedRecord extendRecord(const BedRecord& record, int64_t bases);

    // Extend every record of the set
    BedRecordVector extend(const BedRecordVector& records, int64_t bases);
};

#endif
