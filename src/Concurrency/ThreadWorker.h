///-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// ThreadWorker - pthread worker that pulls batches of
// work items from a WorkQueue shared with the other
// workers, runs the Processor on each item and hands
// the finished batch back to the queue for the master
// thread to post-process.
//
// An exception thrown by the Processor marks that item
// as failed in its batch; it never leaves the worker.
//
#ifndef THREADWORKER_H
#define THREADWORKER_H

#include <pthread.h>
#include <stdexcept>
#include "Util.h"

// Print an error and exit if a pthread call failed
inline void checkThreadCall(int ret, const char* what)
{
    if(ret != 0)
    {
        std::cerr << what << " failed with error " << ret << ", aborting" << std::endl;
        exit(EXIT_FAILURE);
    }
}

// A batch of consecutive work items and their results
template<class Input, class Output>
struct WorkBatch
{
    WorkBatch() : index(0), numFailed(0) {}

    // position of the batch in generation order
    size_t index;
    std::vector<Input> items;
    std::vector<Output> outputs;

    // failed[i] is set when processing items[i] threw
    BoolVec failed;
    size_t numFailed;
    std::string firstError;
};

// Run the processor over every item of the batch, recording failures
template<class Input, class Output, class Processor>
void processBatch(Processor* pProcessor, WorkBatch<Input, Output>& batch)
{
    size_t n = batch.items.size();
    batch.outputs.resize(n);
    batch.failed.assign(n, false);
    for(size_t i = 0; i < n; ++i)
    {
        try
        {
            batch.outputs[i] = pProcessor->process(batch.items[i]);
        }
        catch(std::exception& e)
        {
            batch.failed[i] = true;
            if(batch.numFailed == 0)
                batch.firstError = e.what();
            batch.numFailed += 1;
        }
    }
}

// Hands out batches drawn from the generator and collects the
// finished ones. The generator is only called with the lock held
// so batches are numbered in generation order whatever thread
// asks for them.
template<class Input, class Output, class Generator>
class WorkQueue
{
    public:
        typedef WorkBatch<Input, Output> Batch;
        typedef std::vector<Batch*> BatchPtrVector;

        WorkQueue(Generator* pGenerator, size_t batchSize, int numWorkers);
        ~WorkQueue();

        // Worker side. Returns NULL once the generator is exhausted.
        Batch* takeBatch();
        void pushCompleted(Batch* pBatch);
        void workerFinished();

        // Master side. Blocks until finished batches are available and
        // moves them into out. Returns false once every worker has
        // finished and no batch is left.
        bool waitCompleted(BatchPtrVector& out);

    private:
        pthread_mutex_t m_mutex;
        pthread_cond_t m_completedCond;

        Generator* m_pGenerator;
        size_t m_batchSize;
        bool m_exhausted;
        size_t m_numBatches;
        int m_numActiveWorkers;
        BatchPtrVector m_completed;
};

template<class Input, class Output, class Generator, class Processor>
class ThreadWorker
{
    public:
        typedef WorkQueue<Input, Output, Generator> Queue;

        ThreadWorker(Queue* pQueue, Processor* pProcessor) : m_pQueue(pQueue), m_pProcessor(pProcessor) {}

        void start();
        void join();

    private:

        // Main work loop
        void run();

        // Thread entry point
        static void* startThread(void* obj);

        pthread_t m_thread;
        Queue* m_pQueue;
        Processor* m_pProcessor;
};

//
// WorkQueue
//
template<class Input, class Output, class Generator>
WorkQueue<Input, Output, Generator>::WorkQueue(Generator* pGenerator,
                                               size_t batchSize,
                                               int numWorkers) : m_pGenerator(pGenerator),
                                                                 m_batchSize(batchSize),
                                                                 m_exhausted(false),
                                                                 m_numBatches(0),
                                                                 m_numActiveWorkers(numWorkers)
{
    checkThreadCall(pthread_mutex_init(&m_mutex, NULL), "Mutex initialization");
    checkThreadCall(pthread_cond_init(&m_completedCond, NULL), "Condition initialization");
}

//
template<class Input, class Output, class Generator>
WorkQueue<Input, Output, Generator>::~WorkQueue()
{
    for(size_t i = 0; i < m_completed.size(); ++i)
        delete m_completed[i];
    pthread_cond_destroy(&m_completedCond);
    pthread_mutex_destroy(&m_mutex);
}

//
template<class Input, class Output, class Generator>
typename WorkQueue<Input, Output, Generator>::Batch* WorkQueue<Input, Output, Generator>::takeBatch()
{
    Batch* pBatch = new Batch;
    pBatch->items.reserve(m_batchSize);

    pthread_mutex_lock(&m_mutex);
    pBatch->index = m_numBatches++;
    Input item;
    while(!m_exhausted && pBatch->items.size() < m_batchSize)
    {
        if(m_pGenerator->generate(item))
            pBatch->items.push_back(item);
        else
            m_exhausted = true;
    }
    pthread_mutex_unlock(&m_mutex);

    if(pBatch->items.empty())
    {
        delete pBatch;
        return NULL;
    }
    return pBatch;
}

//
template<class Input, class Output, class Generator>
void WorkQueue<Input, Output, Generator>::pushCompleted(Batch* pBatch)
{
    pthread_mutex_lock(&m_mutex);
    m_completed.push_back(pBatch);
    pthread_cond_signal(&m_completedCond);
    pthread_mutex_unlock(&m_mutex);
}

//
template<class Input, class Output, class Generator>
void WorkQueue<Input, Output, Generator>::workerFinished()
{
    pthread_mutex_lock(&m_mutex);
    m_numActiveWorkers -= 1;
    pthread_cond_signal(&m_completedCond);
    pthread_mutex_unlock(&m_mutex);
}

//
template<class Input, class Output, class Generator>
bool WorkQueue<Input, Output, Generator>::waitCompleted(BatchPtrVector& out)
{
    out.clear();
    pthread_mutex_lock(&m_mutex);
    while(m_completed.empty() && m_numActiveWorkers > 0)
        pthread_cond_wait(&m_completedCond, &m_mutex);
    out.swap(m_completed);
    pthread_mutex_unlock(&m_mutex);
    return !out.empty();
}

//
// ThreadWorker
//
template<class Input, class Output, class Generator, class Processor>
void ThreadWorker<Input, Output, Generator, Processor>::start()
{
    checkThreadCall(pthread_create(&m_thread, NULL, &ThreadWorker::startThread, this), "Thread creation");
}

//
template<class Input, class Output, class Generator, class Processor>
void ThreadWorker<Input, Output, Generator, Processor>::join()
{
    checkThreadCall(pthread_join(m_thread, NULL), "Thread join");
}

// Take batches until the generator runs dry
template<class Input, class Output, class Generator, class Processor>
void ThreadWorker<Input, Output, Generator, Processor>::run()
{
    typename Queue::Batch* pBatch;
    while((pBatch = m_pQueue->takeBatch()) != NULL)
    {
        processBatch(m_pProcessor, *pBatch);
        m_pQueue->pushCompleted(pBatch);
    }
    m_pQueue->workerFinished();
}

//
template<class Input, class Output, class Generator, class Processor>
void* ThreadWorker<Input, Output, Generator, Processor>::startThread(void* obj)
{
    reinterpret_cast<ThreadWorker*>(obj)->run();
    return NULL;
}

#endif
