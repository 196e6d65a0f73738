//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// RegionFilter - Restrict an interval set to the records
// that do (include) or do not (exclude) overlap a mask
//
#ifndef REGIONFILTER_H
#define REGIONFILTER_H

#include "BedRecord.h"
#include "OverlapService.h"

enum RegionFilterMode
{
    RFM_EXCLUDE,
    RFM_INCLUDE
};

namespace RegionFilter
{
    // Filter records by mask using the overlap membership reported by
    // pService. The size of the set before and after is reported on stderr
    // using setName and maskName. A NULL mask returns the records unchanged.
    BedRecordVector filter(const BedRecordVector& records,
                           const BedRecordVector* pMask,
                           RegionFilterMode mode,
                           const OverlapService* pService,
                           const std::string& setName = "intervals",
                           const std::string& maskName = "mask");

    // Percentage of records removed, 0 for an empty input
    double getPercentReduced(size_t numBefore, size_t numAfter);
};

#endif
