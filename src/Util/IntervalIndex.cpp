//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// Data structure for performing overlap queries
// against a set of intervals
//
#include <algorithm>
#include "IntervalIndex.h"

static bool compareStart(const Interval& a, const Interval& b)
{
    return a.start < b.start;
}

// End coordinate used for the overlap test
static inline int64_t effectiveEnd(int64_t start, int64_t end)
{
    return end == start ? start + 1 : end;
}

IntervalIndex::IntervalIndex(const BedRecordVector& records) : m_numIntervals(records.size())
{
    for(size_t i = 0; i < records.size(); ++i)
        m_map[records[i].chrom].intervals.push_back(records[i].getInterval());

    for(IntervalIndexMap::iterator iter = m_map.begin(); iter != m_map.end(); ++iter)
    {
        IntervalVector& intervals = iter->second.intervals;
        Int64Vector& maxEnds = iter->second.maxEnds;
        std::sort(intervals.begin(), intervals.end(), compareStart);

        maxEnds.resize(intervals.size());
        int64_t maxEnd = 0;
        for(size_t j = 0; j < intervals.size(); ++j)
        {
            maxEnd = std::max(maxEnd, effectiveEnd(intervals[j].start, intervals[j].end));
            maxEnds[j] = maxEnd;
        }
    }
}

bool IntervalIndex::hasOverlap(const std::string& chromosome, int64_t start, int64_t end) const
{
    IntervalIndexMap::const_iterator iter = m_map.find(chromosome);
    if(iter == m_map.end())
        return false;

    // Only intervals starting before the query ends can overlap it. Of
    // those, one overlaps iff the largest end is past the query start.
    const ChromosomeIntervals& chr = iter->second;
    Interval query(effectiveEnd(start, end), 0);
    IntervalVector::const_iterator upper = std::lower_bound(chr.intervals.begin(), chr.intervals.end(), query, compareStart);
    size_t numCandidates = upper - chr.intervals.begin();
    if(numCandidates == 0)
        return false;
    return chr.maxEnds[numCandidates - 1] > start;
}
