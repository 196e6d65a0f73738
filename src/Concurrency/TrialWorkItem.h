//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// TrialWorkItem - Definition of the data structure used in the generic
// functions to run one randomization round of a permutation test
//
#ifndef TRIALWORKITEM_H
#define TRIALWORKITEM_H

#include "Util.h"

struct TrialWorkItem
{
    TrialWorkItem() : idx(0), seed(0) {}
    TrialWorkItem(size_t i, uint64_t s) : idx(i), seed(s) {}
    size_t idx;

    // Seed for the random engine of this round. Seeds are drawn in round
    // order from the master seed so the outcome of each round does not
    // depend on which thread runs it.
    uint64_t seed;
};

// Generate numTrials work items
class TrialGenerator
{
    public:

        TrialGenerator(size_t numTrials, uint64_t masterSeed) : m_numTrials(numTrials),
                                                                m_seedEngine(masterSeed),
                                                                m_numConsumed(0) {}

        // Returns false once every trial has been generated
        bool generate(TrialWorkItem& out)
        {
            if(m_numConsumed >= m_numTrials)
                return false;

            out.idx = m_numConsumed++;
            out.seed = m_seedEngine();
            return true;
        }

    private:

        size_t m_numTrials;
        RandomEngine m_seedEngine;
        size_t m_numConsumed;
};

#endif
