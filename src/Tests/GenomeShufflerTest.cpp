//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// GenomeShufflerTest
//
#include <catch2/catch.hpp>
#include "GenomeShuffler.h"
#include "PoverlapErrors.h"

static GenomeSizes makeGenome()
{
    GenomeSizes genome;
    genome.add("chr1", 1000);
    genome.add("chr2", 500);
    return genome;
}

TEST_CASE("shuffled intervals keep their width and fit on the chromosome", "[genome-shuffle]")
{
    GenomeSizes genome = makeGenome();
    GenomeShuffler shuffler(genome, false, NULL, NULL);

    BedRecordVector records;
    records.push_back(BedRecord("chr1", 0, 100));
    records.push_back(BedRecord("chr2", 10, 11));
    records.push_back(BedRecord("chr9", 0, 400));
    records[0].fields.push_back("a");

    RandomEngine rng(3);
    size_t numOnChr2 = 0;
    for(int r = 0; r < 200; ++r)
    {
        BedRecordVector shuffled = shuffler.shuffle(records, rng);
        REQUIRE(shuffled.size() == records.size());
        for(size_t i = 0; i < shuffled.size(); ++i)
        {
            int idx = genome.getIndex(shuffled[i].chrom);
            REQUIRE(idx >= 0);
            CHECK(shuffled[i].getWidth() == records[i].getWidth());
            CHECK(shuffled[i].start >= 0);
            CHECK(shuffled[i].end <= genome.getChromosome(idx).length);
            if(shuffled[i].chrom == "chr2")
                numOnChr2 += 1;
        }
        CHECK(shuffled[0].fields == records[0].fields);
    }

    // both chromosomes are used
    CHECK(numOnChr2 > 0);
    CHECK(numOnChr2 < 600);
}

TEST_CASE("within-chromosome shuffling keeps each interval on its chromosome", "[genome-shuffle]")
{
    GenomeShuffler shuffler(makeGenome(), true, NULL, NULL);
    RandomEngine rng(4);
    for(int r = 0; r < 100; ++r)
    {
        BedRecord moved = shuffler.shuffleRecord(BedRecord("chr2", 10, 60), rng);
        CHECK(moved.chrom == "chr2");
        CHECK(moved.end <= 500);
    }

    CHECK_THROWS_AS(shuffler.shuffleRecord(BedRecord("chr9", 10, 60), rng), ExternalServiceError);
}

TEST_CASE("included regions receive every shuffled interval", "[genome-shuffle]")
{
    BedRecordVector include;
    include.push_back(BedRecord("chr2", 100, 200));
    include.push_back(BedRecord("chr7", 0, 100000));

    GenomeShuffler shuffler(makeGenome(), false, NULL, &include);
    RandomEngine rng(5);
    for(int r = 0; r < 100; ++r)
    {
        BedRecord moved = shuffler.shuffleRecord(BedRecord("chr1", 0, 20), rng);
        CHECK(moved.chrom == "chr2");
        CHECK(moved.start >= 100);
        CHECK(moved.start < 200);
        CHECK(moved.end <= 500);
    }
}

TEST_CASE("excluded regions are never hit", "[genome-shuffle]")
{
    BedRecordVector exclude;
    exclude.push_back(BedRecord("chr1", 0, 900));

    GenomeShuffler shuffler(makeGenome(), true, &exclude, NULL);
    RandomEngine rng(6);
    for(int r = 0; r < 100; ++r)
    {
        BedRecord moved = shuffler.shuffleRecord(BedRecord("chr1", 0, 10), rng);
        CHECK(moved.chrom == "chr1");
        CHECK(moved.start >= 900);
        CHECK(moved.end <= 1000);
    }
}

TEST_CASE("impossible placements and missing genomes are errors", "[genome-shuffle]")
{
    GenomeShuffler shuffler(makeGenome(), false, NULL, NULL);
    RandomEngine rng(8);
    CHECK_THROWS_AS(shuffler.shuffleRecord(BedRecord("chr1", 0, 5000), rng), ExternalServiceError);

    GenomeSizes empty;
    CHECK_THROWS_AS(GenomeShuffler(empty, false, NULL, NULL), ConfigurationError);

    BedRecordVector offGenome;
    offGenome.push_back(BedRecord("chr5", 0, 100));
    offGenome.push_back(BedRecord("chr1", 5000, 6000));
    CHECK_THROWS_AS(GenomeShuffler(makeGenome(), false, NULL, &offGenome), ConfigurationError);
}
