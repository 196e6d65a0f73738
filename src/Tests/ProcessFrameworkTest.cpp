//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// ProcessFrameworkTest - Tests of the serial and threaded
// work loops and their handling of failed items
//
#include <catch2/catch.hpp>
#include <stdexcept>
#include "ProcessFramework.h"

// Hands out the numbers 0 .. n-1
class CountingGenerator
{
    public:
        CountingGenerator(size_t n) : m_n(n), m_next(0) {}

        bool generate(size_t& out)
        {
            if(m_next >= m_n)
                return false;
            out = m_next++;
            return true;
        }

    private:
        size_t m_n;
        size_t m_next;
};

// Squares its input. Multiples of failEvery throw, other than zero.
class SquareProcess
{
    public:
        SquareProcess(size_t failEvery) : m_failEvery(failEvery) {}

        size_t process(const size_t& item)
        {
            if(m_failEvery > 0 && item > 0 && item % m_failEvery == 0)
            {
                std::stringstream ss;
                ss << "item " << item << " rejected";
                throw std::runtime_error(ss.str());
            }
            return item * item;
        }

    private:
        size_t m_failEvery;
};

// Counts how often each item is seen
class TallyPostProcess
{
    public:
        TallyPostProcess(size_t n) : m_seen(n, 0), m_numBad(0) {}

        void process(const size_t& item, const size_t& output)
        {
            m_seen[item] += 1;
            if(output != item * item)
                m_numBad += 1;
        }

        SizeTVec m_seen;
        size_t m_numBad;
};

static ProcessFramework::ProcessSummary runWork(size_t n, size_t failEvery, int numThreads,
                                                size_t bufferSize, TallyPostProcess& post)
{
    CountingGenerator generator(n);
    if(numThreads <= 1)
    {
        SquareProcess processor(failEvery);
        return ProcessFramework::processWorkSerial<size_t, size_t, CountingGenerator,
                                                   SquareProcess, TallyPostProcess>(generator, &processor, &post, bufferSize);
    }

    std::vector<SquareProcess*> processors;
    for(int i = 0; i < numThreads; ++i)
        processors.push_back(new SquareProcess(failEvery));

    ProcessFramework::ProcessSummary summary =
        ProcessFramework::processWorkParallel<size_t, size_t, CountingGenerator,
                                              SquareProcess, TallyPostProcess>(generator, processors, &post, bufferSize);
    for(int i = 0; i < numThreads; ++i)
        delete processors[i];
    return summary;
}

TEST_CASE("every item is processed exactly once", "[framework]")
{
    const size_t n = 103;
    int threads[] = { 1, 2, 4 };
    size_t buffers[] = { 1, 7, 1000 };
    for(size_t t = 0; t < 3; ++t)
    {
        for(size_t b = 0; b < 3; ++b)
        {
            TallyPostProcess post(n);
            ProcessFramework::ProcessSummary summary = runWork(n, 0, threads[t], buffers[b], post);

            CHECK(summary.numProcessed == n);
            CHECK(summary.numFailed == 0);
            CHECK_FALSE(summary.hasFailed());
            CHECK(summary.firstError.empty());
            CHECK(post.m_numBad == 0);
            for(size_t i = 0; i < n; ++i)
                CHECK(post.m_seen[i] == 1);
        }
    }
}

TEST_CASE("failed items are counted and skipped by the post processor", "[framework]")
{
    const size_t n = 100;
    const size_t failEvery = 3;

    // 3, 6, ..., 99
    const size_t expectedFailed = 33;

    int threads[] = { 1, 2, 4 };
    for(size_t t = 0; t < 3; ++t)
    {
        TallyPostProcess post(n);
        ProcessFramework::ProcessSummary summary = runWork(n, failEvery, threads[t], 5, post);

        CHECK(summary.numProcessed == n);
        CHECK(summary.numFailed == expectedFailed);
        CHECK(summary.hasFailed());

        // the error of the earliest failed item is reported whatever the thread count
        CHECK(summary.firstError == "item 3 rejected");

        CHECK(post.m_numBad == 0);
        for(size_t i = 0; i < n; ++i)
        {
            bool bFails = i > 0 && i % failEvery == 0;
            CHECK(post.m_seen[i] == (bFails ? 0u : 1u));
        }
    }
}

TEST_CASE("an empty generator does no work", "[framework]")
{
    TallyPostProcess post(0);
    ProcessFramework::ProcessSummary serial = runWork(0, 0, 1, 10, post);
    CHECK(serial.numProcessed == 0);
    CHECK_FALSE(serial.hasFailed());

    ProcessFramework::ProcessSummary parallel = runWork(0, 0, 3, 10, post);
    CHECK(parallel.numProcessed == 0);
    CHECK_FALSE(parallel.hasFailed());
}
