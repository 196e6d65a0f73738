//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// Data structure for performing overlap queries
// against a set of intervals
//
#ifndef INTERVALINDEX_H
#define INTERVALINDEX_H
#include <map>
#include "BedRecord.h"

typedef std::vector<Interval> IntervalVector;
typedef std::vector<int64_t> Int64Vector;

// The intervals of one chromosome sorted by start. maxEnds[i] is
// the largest end of intervals [0, i], with zero-length intervals
// counted as covering one base
struct ChromosomeIntervals
{
    IntervalVector intervals;
    Int64Vector maxEnds;
};

// map from chromosome to its sorted intervals
typedef std::map<std::string, ChromosomeIntervals> IntervalIndexMap;

class IntervalIndex
{
    public:
        //
        IntervalIndex(const BedRecordVector& records);

        // Return true if [start, end) on chromosome shares a base with any
        // indexed interval. O(log n) per query.
        bool hasOverlap(const std::string& chromosome, int64_t start, int64_t end) const;
        bool hasOverlap(const BedRecord& record) const { return hasOverlap(record.chrom, record.start, record.end); }

        size_t getNumIntervals() const { return m_numIntervals; }

    private:

        //
        IntervalIndexMap m_map;
        size_t m_numIntervals;
};

#endif
