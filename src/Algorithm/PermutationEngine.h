//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// PermutationEngine - Monte Carlo test of whether two
// interval sets overlap more than expected by chance.
//
// The observed number of records of A overlapping B is
// compared to the counts obtained after randomizing B
// (and optionally A) numTrials times. The p-value is the
// fraction of rounds with a count at least as large as
// the observed count, so ties count against significance.
//
#ifndef PERMUTATIONENGINE_H
#define PERMUTATIONENGINE_H

#include "Util.h"
#include "BedRecord.h"
#include "IntervalShuffler.h"
#include "OverlapService.h"

const int DEFAULT_NUM_TRIALS = 1000;

struct PermutationParameters
{
    PermutationParameters();

    int numTrials;
    int numThreads;
    bool bShuffleBoth;
    uint64_t seed;

    // Optional masks applied to both sets before the test, exclude first
    const BedRecordVector* pExclude;
    const BedRecordVector* pInclude;

    // When non-zero both sets are extended by this many bases so that
    // intervals within the distance count as overlapping
    int64_t overlapDistance;

    // Names used in diagnostics
    std::string aName;
    std::string bName;
    std::string excludeName;
    std::string includeName;
};

struct PermutationResult
{
    PermutationResult() : observed(0), mean(0.0f), pValue(1.0f) {}

    size_t observed;
    SizeTVec simulated;
    double mean;
    double pValue;
    std::string description;

    // Write the report in the "> key: value" format
    void write(std::ostream& out) const;
};

class PermutationEngine
{
    public:
        PermutationEngine(const OverlapService* pService, const PermutationParameters& params);

        // Apply the exclude and include masks and the extension to both
        // sets, then run the test with the configured number of trials
        PermutationResult run(const BedRecordVector& a,
                              const BedRecordVector& b,
                              const IntervalShuffler* pShuffler) const;

        // Run the permutation test on a and b as given. Throws a
        // ConfigurationError if numTrials < 1, a DegenerateInputError if
        // either set is empty and an ExternalServiceError if any round failed.
        PermutationResult runTest(const BedRecordVector& a,
                                  const BedRecordVector& b,
                                  int numTrials,
                                  const IntervalShuffler* pShuffler,
                                  bool bShuffleBoth) const;

        // Filter and extend one set as run() does
        BedRecordVector prepare(const BedRecordVector& records, const std::string& name) const;

        // mean of the simulated counts
        static double computeMean(const SizeTVec& simulated);

        // count(s >= observed) / |simulated|
        static double computePValue(size_t observed, const SizeTVec& simulated);

    private:
        const OverlapService* m_pService;
        PermutationParameters m_params;
};

#endif
