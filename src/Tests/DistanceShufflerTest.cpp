//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// DistanceShufflerTest
//
#include <catch2/catch.hpp>
#include <limits>
#include "DistanceShuffler.h"
#include "PoverlapErrors.h"

TEST_CASE("distance shuffling keeps the width and a non-negative start", "[distance]")
{
    BedRecordVector records;
    records.push_back(BedRecord("chr1", 10, 60));
    records.push_back(BedRecord("chr1", 1000000, 1000500));
    records.push_back(BedRecord("chr2", 0, 0));
    records[1].fields.push_back("peak");

    DistanceShuffler shuffler(5000);
    RandomEngine rng(99);
    for(int r = 0; r < 100; ++r)
    {
        BedRecordVector shuffled = shuffler.shuffle(records, rng);
        REQUIRE(shuffled.size() == records.size());
        for(size_t i = 0; i < shuffled.size(); ++i)
        {
            CHECK(shuffled[i].start >= 0);
            CHECK(shuffled[i].getWidth() == records[i].getWidth());
            CHECK(shuffled[i].chrom == records[i].chrom);
        }

        // far from zero the offset is bounded by the distance
        CHECK(std::abs(shuffled[1].start - records[1].start) <= 5000);
        CHECK(shuffled[1].fields == records[1].fields);
    }
}

TEST_CASE("a negative distance behaves like its absolute value", "[distance]")
{
    DistanceShuffler shuffler(-300);
    CHECK(shuffler.getMaxDistance() == 300);
    CHECK(shuffler.getDescription() == "distance-shuffle within 300bp");
}

TEST_CASE("a zero distance leaves records in place", "[distance]")
{
    DistanceShuffler shuffler(0);
    RandomEngine rng(1);
    BedRecord moved = shuffler.shuffleRecord(BedRecord("chr1", 40, 50), rng);
    CHECK(moved.start == 40);
    CHECK(moved.end == 50);
}

TEST_CASE("distances at the limits of int64_t", "[distance]")
{
    CHECK_THROWS_AS(DistanceShuffler(std::numeric_limits<int64_t>::min()), ConfigurationError);

    const int64_t maxValue = std::numeric_limits<int64_t>::max();
    DistanceShuffler shuffler(-maxValue);
    CHECK(shuffler.getMaxDistance() == maxValue);

    // huge offsets are clamped to the representable range
    RandomEngine rng(3);
    BedRecord record("chr1", maxValue - 1000, maxValue - 900);
    for(int r = 0; r < 100; ++r)
    {
        BedRecord moved = shuffler.shuffleRecord(record, rng);
        CHECK(moved.start >= 0);
        CHECK(moved.start <= maxValue - 100);
        CHECK(moved.getWidth() == 100);
    }
}
