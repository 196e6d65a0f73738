//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL license
//-----------------------------------------------
//
// Interval - A pair of integers denoting a half-open
// range [start, end) of bases on a chromosome
//

#ifndef INTERVAL_H
#define INTERVAL_H

#include "Util.h"

struct Interval
{
    // constructors
    Interval() : start(0), end(0) {}
    Interval(int64_t s, int64_t e) : start(s), end(e) {}

    int64_t length() const { return end - start; }

    // Precondition: s1 <= e1 and s2 <= e2
    // Return true if [s1, e1) and [s2, e2) share a base. A zero-length
    // interval is considered to cover the single base at its start.
    template<class T>
    static bool isIntersecting(const T s1, T e1, const T s2, T e2)
    {
        assert(s1 <= e1 && s2 <= e2);
        if(e1 == s1)
            e1 = s1 + 1;
        if(e2 == s2)
            e2 = s2 + 1;
        return s1 < e2 && s2 < e1;
    }

    bool isIntersecting(const Interval& other) const
    {
        return isIntersecting(start, end, other.start, other.end);
    }

    // data members
    int64_t start;
    int64_t end;
};

#endif
