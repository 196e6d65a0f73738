//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// ProcessFramework - Run a Processor over every work item
// produced by a Generator, on the calling thread or on a
// pool of worker threads.
//
// A Generator provides
//      bool generate(Input& out);
// and must not throw. A Processor provides
//      Output process(const Input& item);
// and may throw a std::exception to fail that item. A PostProcessor provides
//      void process(const Input& item, const Output& output);
// and only sees the items that succeeded. It always runs on the calling
// thread. Failed items are reported in the returned ProcessSummary.
//
#ifndef PROCESSFRAMEWORK_H
#define PROCESSFRAMEWORK_H

#include "ThreadWorker.h"
#include "Timer.h"
#include "Verbosity.h"

namespace ProcessFramework
{

const size_t DEFAULT_BUFFER_SIZE = 1000;

struct ProcessSummary
{
    ProcessSummary() : numProcessed(0), numFailed(0) {}

    bool hasFailed() const { return numFailed > 0; }

    size_t numProcessed;
    size_t numFailed;

    // message of the first failed item, in generation order
    std::string firstError;
};

// Hand the successful items of a batch to the post processor and
// account for the failures
template<class Input, class Output, class PostProcessor>
void postProcessBatch(const WorkBatch<Input, Output>& batch, PostProcessor* pPostProcessor, ProcessSummary& summary)
{
    for(size_t i = 0; i < batch.items.size(); ++i)
    {
        if(!batch.failed[i])
            pPostProcessor->process(batch.items[i], batch.outputs[i]);
    }

    summary.numProcessed += batch.items.size();
    summary.numFailed += batch.numFailed;
}

//
inline void printProgress(const ProcessSummary& summary, int numThreads, double proc_time_secs)
{
    Verbosity::log(VL_PROGRESS, "process", "processed %zu work items (%zu failed) on %d thread(s) in %lfs (%lf items/s)",
                   summary.numProcessed, summary.numFailed, numThreads, proc_time_secs,
                   (double)summary.numProcessed / proc_time_secs);
}

// Process every item on the calling thread, bufferSize items at a time
template<class Input, class Output, class Generator, class Processor, class PostProcessor>
ProcessSummary processWorkSerial(Generator& generator,
                                 Processor* pProcessor,
                                 PostProcessor* pPostProcessor,
                                 size_t bufferSize = DEFAULT_BUFFER_SIZE)
{
    Timer timer("ProcessWork", true);
    WorkQueue<Input, Output, Generator> queue(&generator, bufferSize, 1);
    ProcessSummary summary;

    WorkBatch<Input, Output>* pBatch;
    while((pBatch = queue.takeBatch()) != NULL)
    {
        processBatch(pProcessor, *pBatch);
        if(pBatch->numFailed > 0 && !summary.hasFailed())
            summary.firstError = pBatch->firstError;
        postProcessBatch(*pBatch, pPostProcessor, summary);
        delete pBatch;
    }

    printProgress(summary, 1, timer.getElapsedWallTime());
    return summary;
}

// One worker thread is started per processor in processPtrVector. The
// workers take batches of bufferSize items from the generator in turn
// and return them once processed; the calling thread post-processes
// finished batches as they arrive and returns when the generator is
// exhausted and every batch has been post-processed.
//
// Batches can finish out of order so the post processor must not depend
// on the order it sees items in. The first error is taken from the
// failed batch holding the earliest item.
template<class Input, class Output, class Generator, class Processor, class PostProcessor>
ProcessSummary processWorkParallel(Generator& generator,
                                   const std::vector<Processor*>& processPtrVector,
                                   PostProcessor* pPostProcessor,
                                   size_t bufferSize = DEFAULT_BUFFER_SIZE)
{
    typedef WorkQueue<Input, Output, Generator> Queue;
    typedef ThreadWorker<Input, Output, Generator, Processor> Thread;

    Timer timer("ProcessWork", true);
    int numThreads = processPtrVector.size();
    Queue queue(&generator, bufferSize, numThreads);

    std::vector<Thread*> threadVec(numThreads);
    for(int i = 0; i < numThreads; ++i)
    {
        threadVec[i] = new Thread(&queue, processPtrVector[i]);
        threadVec[i]->start();
    }

    ProcessSummary summary;
    size_t firstErrorBatch = 0;
    typename Queue::BatchPtrVector completed;
    while(queue.waitCompleted(completed))
    {
        for(size_t i = 0; i < completed.size(); ++i)
        {
            WorkBatch<Input, Output>* pBatch = completed[i];
            if(pBatch->numFailed > 0 && (!summary.hasFailed() || pBatch->index < firstErrorBatch))
            {
                summary.firstError = pBatch->firstError;
                firstErrorBatch = pBatch->index;
            }
            postProcessBatch(*pBatch, pPostProcessor, summary);
            delete pBatch;
        }
    }

    for(int i = 0; i < numThreads; ++i)
    {
        threadVec[i]->join();
        delete threadVec[i];
    }

    printProgress(summary, numThreads, timer.getElapsedWallTime());
    return summary;
}

};

#endif
