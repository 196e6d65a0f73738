//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// OverlapService - Abstract interface to the overlap
// counter used by the region filter and the permutation
// engine. Two records overlap when they are on the same
// chromosome and share at least one base.
//
#ifndef OVERLAPSERVICE_H
#define OVERLAPSERVICE_H

#include "BedRecord.h"

class OverlapService
{
    public:
        virtual ~OverlapService() {}

        // Number of records of a that overlap at least one record of b.
        // Failures are reported with an ExternalServiceError.
        virtual size_t countOverlaps(const BedRecordVector& a, const BedRecordVector& b) const = 0;

        // One flag per record of a, in order, true iff that record
        // overlaps at least one record of b
        virtual BoolVec getOverlapMembership(const BedRecordVector& a, const BedRecordVector& b) const = 0;
};

// Overlap counting performed in-process with an IntervalIndex
// built over the second set. Stateless, so one instance can be
// shared by all worker threads.
class IndexedOverlapService : public OverlapService
{
    public:
        virtual size_t countOverlaps(const BedRecordVector& a, const BedRecordVector& b) const;
        virtual BoolVec getOverlapMembership(const BedRecordVector& a, const BedRecordVector& b) const;
};

#endif
