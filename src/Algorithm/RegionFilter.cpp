//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// RegionFilter - Restrict an interval set by a mask
//
#include "RegionFilter.h"
#include "Verbosity.h"

//
BedRecordVector RegionFilter::filter(const BedRecordVector& records,
                                     const BedRecordVector* pMask,
                                     RegionFilterMode mode,
                                     const OverlapService* pService,
                                     const std::string& setName,
                                     const std::string& maskName)
{
    if(pMask == NULL)
        return records;

    BoolVec overlaps = pService->getOverlapMembership(records, *pMask);
    assert(overlaps.size() == records.size());

    bool keepOverlapping = mode == RFM_INCLUDE;
    BedRecordVector out;
    for(size_t i = 0; i < records.size(); ++i)
    {
        if(overlaps[i] == keepOverlapping)
            out.push_back(records[i]);
    }

    Verbosity::log(VL_QUIET, "filter", "reduced %s from %zu to %zu %.3f%% by %s %s",
                   setName.c_str(), records.size(), out.size(),
                   getPercentReduced(records.size(), out.size()),
                   keepOverlapping ? "including" : "excluding",
                   maskName.c_str());
    return out;
}

//
double RegionFilter::getPercentReduced(size_t numBefore, size_t numAfter)
{
    if(numBefore == 0)
        return 0.0f;
    return 100.0 * (double)(numBefore - numAfter) / numBefore;
}
