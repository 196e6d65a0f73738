//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// PermutationEngine - Monte Carlo test of whether two
// interval sets overlap more than expected by chance
//
#include <stdio.h>
#include <algorithm>
#include "PermutationEngine.h"
#include "PermutationProcess.h"
#include "ProcessFramework.h"
#include "RegionFilter.h"
#include "IntervalExtender.h"
#include "PoverlapErrors.h"
#include "Timer.h"

//
PermutationParameters::PermutationParameters() : numTrials(DEFAULT_NUM_TRIALS),
                                                 numThreads(getNumHardwareThreads()),
                                                 bShuffleBoth(false),
                                                 seed(0),
                                                 pExclude(NULL),
                                                 pInclude(NULL),
                                                 overlapDistance(0),
                                                 aName("a"),
                                                 bName("b"),
                                                 excludeName("exclude"),
                                                 includeName("include")
{

}

//
void PermutationResult::write(std::ostream& out) const
{
    char buffer[64];
    out << "> shuffle strategy: " << description << "\n";
    out << "> observed number of overlaps: " << observed << "\n";

    snprintf(buffer, sizeof(buffer), "%.1f", mean);
    out << "> simulated overlap mean: " << buffer << "\n";

    snprintf(buffer, sizeof(buffer), "%.3g", pValue);
    out << "> simulated p-value: " << buffer << "\n";

    out << "> [";
    for(size_t i = 0; i < simulated.size(); ++i)
        out << (i > 0 ? ", " : "") << simulated[i];
    out << "]\n";
}

//
PermutationEngine::PermutationEngine(const OverlapService* pService,
                                     const PermutationParameters& params) : m_pService(pService),
                                                                            m_params(params)
{

}

//
BedRecordVector PermutationEngine::prepare(const BedRecordVector& records, const std::string& name) const
{
    BedRecordVector out = RegionFilter::filter(records, m_params.pExclude, RFM_EXCLUDE, m_pService, name, m_params.excludeName);
    out = RegionFilter::filter(out, m_params.pInclude, RFM_INCLUDE, m_pService, name, m_params.includeName);

    if(m_params.overlapDistance != 0)
        out = IntervalExtender::extend(out, m_params.overlapDistance);
    return out;
}

//
PermutationResult PermutationEngine::run(const BedRecordVector& a,
                                         const BedRecordVector& b,
                                         const IntervalShuffler* pShuffler) const
{
    BedRecordVector preparedA = prepare(a, m_params.aName);
    BedRecordVector preparedB = prepare(b, m_params.bName);
    return runTest(preparedA, preparedB, m_params.numTrials, pShuffler, m_params.bShuffleBoth);
}

//
PermutationResult PermutationEngine::runTest(const BedRecordVector& a,
                                             const BedRecordVector& b,
                                             int numTrials,
                                             const IntervalShuffler* pShuffler,
                                             bool bShuffleBoth) const
{
    if(numTrials < 1)
    {
        std::stringstream ss;
        ss << "invalid number of trials " << numTrials << ", must be greater than zero";
        throw ConfigurationError(ss.str());
    }

    if(a.empty() || b.empty())
        throw DegenerateInputError("cannot test the overlap of an empty interval set (" + std::string(a.empty() ? m_params.aName : m_params.bName) + ")");

    Timer timer("PermutationEngine::runTest");
    PermutationResult result;
    result.description = pShuffler->getDescription();
    result.observed = m_pService->countOverlaps(a, b);

    TrialGenerator generator(numTrials, m_params.seed);
    PermutationPostProcess postProcessor(numTrials);
    ProcessFramework::ProcessSummary summary;

    if(m_params.numThreads <= 1)
    {
        // Serial mode
        PermutationProcess processor(&a, &b, pShuffler, m_pService, bShuffleBoth);
        summary = ProcessFramework::processWorkSerial<TrialWorkItem,
                                                      size_t,
                                                      TrialGenerator,
                                                      PermutationProcess,
                                                      PermutationPostProcess>(generator, &processor, &postProcessor);
    }
    else
    {
        // Parallel mode
        int numThreads = std::min(m_params.numThreads, numTrials);
        std::vector<PermutationProcess*> processorVector;
        for(int i = 0; i < numThreads; ++i)
        {
            PermutationProcess* pProcessor = new PermutationProcess(&a, &b, pShuffler, m_pService, bShuffleBoth);
            processorVector.push_back(pProcessor);
        }

        // Size the buffers so the rounds are spread over every thread
        size_t bufferSize = (numTrials + numThreads - 1) / numThreads;
        bufferSize = std::min(bufferSize, ProcessFramework::DEFAULT_BUFFER_SIZE);

        summary = ProcessFramework::processWorkParallel<TrialWorkItem,
                                                        size_t,
                                                        TrialGenerator,
                                                        PermutationProcess,
                                                        PermutationPostProcess>(generator, processorVector, &postProcessor, bufferSize);

        for(int i = 0; i < numThreads; ++i)
            delete processorVector[i];
    }

    // A short list of counts would bias the p-value so any failure is fatal
    if(summary.hasFailed())
    {
        std::stringstream ss;
        ss << summary.numFailed << " of " << numTrials << " permutation rounds failed: " << summary.firstError;
        throw ExternalServiceError(ss.str());
    }
    assert(summary.numProcessed == (size_t)numTrials);

    result.simulated = postProcessor.getCounts();
    result.mean = computeMean(result.simulated);
    result.pValue = computePValue(result.observed, result.simulated);
    return result;
}

//
double PermutationEngine::computeMean(const SizeTVec& simulated)
{
    if(simulated.empty())
        return 0.0f;

    double sum = 0.0f;
    for(size_t i = 0; i < simulated.size(); ++i)
        sum += simulated[i];
    return sum / simulated.size();
}

//
double PermutationEngine::computePValue(size_t observed, const SizeTVec& simulated)
{
    if(simulated.empty())
        throw ConfigurationError("cannot compute a p-value without simulated counts");

    size_t numAsExtreme = 0;
    for(size_t i = 0; i < simulated.size(); ++i)
    {
        if(simulated[i] >= observed)
            numAsExtreme += 1;
    }
    return (double)numAsExtreme / simulated.size();
}
