///-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// PermutationProcess - Run one randomization round of
// the overlap permutation test
//
#include "PermutationProcess.h"

//
//
//
PermutationProcess::PermutationProcess(const BedRecordVector* pA,
                                       const BedRecordVector* pB,
                                       const IntervalShuffler* pShuffler,
                                       const OverlapService* pService,
                                       bool bShuffleBoth) :
                                        m_pA(pA),
                                        m_pB(pB),
                                        m_pShuffler(pShuffler),
                                        m_pService(pService),
                                        m_bShuffleBoth(bShuffleBoth)
{

}

//
PermutationProcess::~PermutationProcess()
{

}

//
size_t PermutationProcess::process(const TrialWorkItem& item)
{
    RandomEngine rng(item.seed);
    BedRecordVector shuffledB = m_pShuffler->shuffle(*m_pB, rng);
    if(!m_bShuffleBoth)
        return m_pService->countOverlaps(*m_pA, shuffledB);

    BedRecordVector shuffledA = m_pShuffler->shuffle(*m_pA, rng);
    return m_pService->countOverlaps(shuffledA, shuffledB);
}

//
//
//
PermutationPostProcess::PermutationPostProcess(size_t numTrials) : m_counts(numTrials, 0)
{

}

//
PermutationPostProcess::~PermutationPostProcess()
{

}

//
void PermutationPostProcess::process(const TrialWorkItem& item, size_t count)
{
    assert(item.idx < m_counts.size());
    m_counts[item.idx] = count;
}
