//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// IntervalExtender - Pad intervals symmetrically
//
#include <algorithm>
#include "IntervalExtender.h"

// Division rounding towards negative infinity
static int64_t floorDivide(int64_t a, int64_t b)
{
    int64_t q = a / b;
    if((a % b != 0) && ((a < 0) != (b < 0)))
        q -= 1;
    return q;
}

//
BedRecord IntervalExtender::extendRecord(const BedRecord& record, int64_t bases)
{
    int64_t half = floorDivide(bases, 2);
    int64_t start = std::max((int64_t)0, record.start - half);
    int64_t end = std::max((int64_t)0, record.end + half);

    if(start > end)
        start = end = (start + end) / 2;

    assert(0 <= start && start <= end);
    return record.withCoordinates(start, end);
}

//
BedRecordVector IntervalExtender::extend(const BedRecordVector& records, int64_t bases)
{
    BedRecordVector out;
    out.reserve(records.size());
    for(size_t i = 0; i < records.size(); ++i)
        out.push_back(extendRecord(records[i], bases));
    return out;
}
