//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// OverlapService - In-process overlap counting
//
#include "OverlapService.h"
#include "IntervalIndex.h"

//
size_t IndexedOverlapService::countOverlaps(const BedRecordVector& a, const BedRecordVector& b) const
{
    IntervalIndex index(b);
    size_t count = 0;
    for(size_t i = 0; i < a.size(); ++i)
    {
        if(index.hasOverlap(a[i]))
            count += 1;
    }
    return count;
}

//
BoolVec IndexedOverlapService::getOverlapMembership(const BedRecordVector& a, const BedRecordVector& b) const
{
    IntervalIndex index(b);
    BoolVec out(a.size(), false);
    for(size_t i = 0; i < a.size(); ++i)
        out[i] = index.hasOverlap(a[i]);
    return out;
}
