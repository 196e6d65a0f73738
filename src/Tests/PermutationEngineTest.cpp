//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// PermutationEngineTest - Tests of the permutation test driver
// in serial and threaded mode
//
#include <catch2/catch.hpp>
#include "PermutationEngine.h"
#include "DistanceShuffler.h"
#include "PoverlapErrors.h"

// Returns the records unchanged
class IdentityShuffler : public IntervalShuffler
{
    public:
        virtual BedRecordVector shuffle(const BedRecordVector& records, RandomEngine& /*rng*/) const { return records; }
        virtual std::string getDescription() const { return "identity"; }
};

// Fails every round
class FailingShuffler : public IntervalShuffler
{
    public:
        virtual BedRecordVector shuffle(const BedRecordVector& /*records*/, RandomEngine& /*rng*/) const
        {
            throw ExternalServiceError("shuffle service unavailable");
        }
        virtual std::string getDescription() const { return "failing"; }
};

static PermutationParameters makeParameters(int numThreads)
{
    PermutationParameters params;
    params.numThreads = numThreads;
    params.seed = 1234;
    return params;
}

static void makeSets(BedRecordVector& a, BedRecordVector& b)
{
    a.clear();
    b.clear();
    a.push_back(BedRecord("chr1", 100, 200));
    b.push_back(BedRecord("chr1", 150, 250));
    b.push_back(BedRecord("chr1", 10, 20));
}

TEST_CASE("an identity shuffle reproduces the observed count", "[engine]")
{
    BedRecordVector a, b;
    makeSets(a, b);

    IdentityShuffler shuffler;
    IndexedOverlapService service;
    CHECK(service.countOverlaps(a, b) == 1);

    int threads[] = { 1, 4 };
    for(size_t t = 0; t < 2; ++t)
    {
        PermutationEngine engine(&service, makeParameters(threads[t]));
        PermutationResult result = engine.runTest(a, b, 100, &shuffler, false);

        CHECK(result.observed == 1);
        REQUIRE(result.simulated.size() == 100);
        CHECK(result.mean == Approx(1.0));
        CHECK(result.pValue == Approx(1.0));
        CHECK(result.description == "identity");
    }
}

TEST_CASE("invalid trial counts and empty sets are rejected", "[engine]")
{
    BedRecordVector a, b;
    makeSets(a, b);
    BedRecordVector empty;

    IdentityShuffler shuffler;
    IndexedOverlapService service;
    PermutationEngine engine(&service, makeParameters(1));

    CHECK_THROWS_AS(engine.runTest(a, b, 0, &shuffler, false), ConfigurationError);
    CHECK_THROWS_AS(engine.runTest(a, b, -5, &shuffler, false), ConfigurationError);
    CHECK_THROWS_AS(engine.runTest(empty, b, 10, &shuffler, false), DegenerateInputError);
    CHECK_THROWS_AS(engine.runTest(a, empty, 10, &shuffler, false), DegenerateInputError);
}

TEST_CASE("a failing round fails the whole test", "[engine]")
{
    BedRecordVector a, b;
    makeSets(a, b);

    FailingShuffler shuffler;
    IndexedOverlapService service;

    int threads[] = { 1, 3 };
    for(size_t t = 0; t < 2; ++t)
    {
        PermutationEngine engine(&service, makeParameters(threads[t]));
        try
        {
            engine.runTest(a, b, 20, &shuffler, false);
            FAIL("expected an ExternalServiceError");
        }
        catch(ExternalServiceError& e)
        {
            std::string msg = e.what();
            CHECK(msg.find("20 of 20") != std::string::npos);
            CHECK(msg.find("shuffle service unavailable") != std::string::npos);
        }
    }
}

TEST_CASE("results for a fixed seed do not depend on the number of threads", "[engine]")
{
    BedRecordVector a, b;
    RandomEngine rng(77);
    for(int i = 0; i < 200; ++i)
    {
        int64_t start = randomInRange(rng, 0, 100000);
        a.push_back(BedRecord("chr1", start, start + 500));
        start = randomInRange(rng, 0, 100000);
        b.push_back(BedRecord("chr1", start, start + 300));
    }

    DistanceShuffler shuffler(20000);
    IndexedOverlapService service;

    PermutationEngine serial(&service, makeParameters(1));
    PermutationEngine parallel(&service, makeParameters(4));

    PermutationResult serialResult = serial.runTest(a, b, 250, &shuffler, true);
    PermutationResult parallelResult = parallel.runTest(a, b, 250, &shuffler, true);

    REQUIRE(serialResult.simulated.size() == 250);
    CHECK(serialResult.observed == parallelResult.observed);
    CHECK(serialResult.simulated == parallelResult.simulated);
    CHECK(serialResult.pValue == parallelResult.pValue);

    // a different seed gives a different null distribution
    PermutationParameters other = makeParameters(4);
    other.seed = 4321;
    PermutationEngine reseeded(&service, other);
    CHECK(reseeded.runTest(a, b, 250, &shuffler, true).simulated != serialResult.simulated);

    if(serialResult.observed > 0)
    {
        CHECK(serialResult.pValue >= 1.0 / 250);
        CHECK(serialResult.pValue <= 1.0);
    }
}

TEST_CASE("run filters and extends both sets before testing", "[engine]")
{
    BedRecordVector a;
    a.push_back(BedRecord("chr1", 100, 110));
    a.push_back(BedRecord("chr1", 5000, 5010));

    BedRecordVector b;
    b.push_back(BedRecord("chr1", 115, 120));
    b.push_back(BedRecord("chr1", 4990, 5000));

    BedRecordVector exclude;
    exclude.push_back(BedRecord("chr1", 4000, 6000));

    IdentityShuffler shuffler;
    IndexedOverlapService service;

    // without extension the remaining pair is 5 bases apart
    PermutationParameters params = makeParameters(1);
    params.numTrials = 10;
    params.pExclude = &exclude;
    PermutationEngine plain(&service, params);
    CHECK(plain.run(a, b, &shuffler).observed == 0);

    params.overlapDistance = 10;
    PermutationEngine extended(&service, params);
    PermutationResult result = extended.run(a, b, &shuffler);
    CHECK(result.observed == 1);
    CHECK(result.simulated.size() == 10);

    BedRecordVector prepared = extended.prepare(a, "a");
    REQUIRE(prepared.size() == 1);
    CHECK(prepared[0].start == 95);
    CHECK(prepared[0].end == 115);
}

TEST_CASE("p-value counts ties as not significant", "[engine]")
{
    SizeTVec simulated;
    simulated.push_back(1);
    simulated.push_back(2);
    simulated.push_back(3);
    simulated.push_back(0);

    CHECK(PermutationEngine::computePValue(2, simulated) == Approx(0.5));
    CHECK(PermutationEngine::computePValue(4, simulated) == Approx(0.0));
    CHECK(PermutationEngine::computePValue(0, simulated) == Approx(1.0));
    CHECK(PermutationEngine::computeMean(simulated) == Approx(1.5));

    SizeTVec zeros(10, 0);
    CHECK(PermutationEngine::computePValue(0, zeros) == Approx(1.0));
}

TEST_CASE("the report lists the counts of every round", "[engine]")
{
    PermutationResult result;
    result.description = "identity";
    result.observed = 3;
    result.simulated.push_back(1);
    result.simulated.push_back(4);
    result.mean = 2.5;
    result.pValue = 0.5;

    std::stringstream ss;
    result.write(ss);
    CHECK(ss.str() == "> shuffle strategy: identity\n"
                      "> observed number of overlaps: 3\n"
                      "> simulated overlap mean: 2.5\n"
                      "> simulated p-value: 0.5\n"
                      "> [1, 4]\n");
}
