///-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// PermutationProcess - Run one randomization round of
// the overlap permutation test: shuffle, then count
//
#ifndef PERMUTATIONPROCESS_H
#define PERMUTATIONPROCESS_H

#include "Util.h"
#include "BedRecord.h"
#include "TrialWorkItem.h"
#include "IntervalShuffler.h"
#include "OverlapService.h"

// Returns the simulated overlap count of a round. Errors raised by the
// shuffler or the overlap service propagate to the process framework,
// which fails that round.
class PermutationProcess
{
    public:
        PermutationProcess(const BedRecordVector* pA,
                           const BedRecordVector* pB,
                           const IntervalShuffler* pShuffler,
                           const OverlapService* pService,
                           bool bShuffleBoth);
        ~PermutationProcess();

        size_t process(const TrialWorkItem& item);

    private:

        const BedRecordVector* m_pA;
        const BedRecordVector* m_pB;
        const IntervalShuffler* m_pShuffler;
        const OverlapService* m_pService;
        const bool m_bShuffleBoth;
};

// Collect the simulated counts in round order
class PermutationPostProcess
{
    public:
        PermutationPostProcess(size_t numTrials);
        ~PermutationPostProcess();

        void process(const TrialWorkItem& item, size_t count);

        const SizeTVec& getCounts() const { return m_counts; }

    private:

        SizeTVec m_counts;
};

#endif
