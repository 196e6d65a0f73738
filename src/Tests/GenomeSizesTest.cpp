//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// GenomeSizesTest
//
#include <catch2/catch.hpp>
#include "GenomeSizes.h"
#include "PoverlapErrors.h"

TEST_CASE("genome files are parsed in order", "[genome]")
{
    std::istringstream in("# genome\n"
                          "chr1\t1000\n"
                          "chr2\t500\textra\n"
                          "\n"
                          "chrM\t16\n");
    GenomeSizes genome = GenomeSizes::parse(in, "test.genome");

    REQUIRE(genome.getNumChromosomes() == 3);
    CHECK(genome.getChromosome(0).name == "chr1");
    CHECK(genome.getChromosome(1).length == 500);
    CHECK(genome.getTotalLength() == 1516);
    CHECK(genome.getIndex("chrM") == 2);
    CHECK(genome.getIndex("chr3") == -1);
    CHECK_FALSE(genome.empty());
}

TEST_CASE("malformed genome files raise a ParseError", "[genome]")
{
    std::istringstream noLength("chr1\n");
    CHECK_THROWS_AS(GenomeSizes::parse(noLength, "a"), ParseError);

    std::istringstream badLength("chr1\tlong\n");
    CHECK_THROWS_AS(GenomeSizes::parse(badLength, "b"), ParseError);

    std::istringstream zeroLength("chr1\t0\n");
    CHECK_THROWS_AS(GenomeSizes::parse(zeroLength, "c"), ParseError);

    std::istringstream duplicate("chr1\t100\nchr1\t200\n");
    CHECK_THROWS_AS(GenomeSizes::parse(duplicate, "d"), ParseError);
}
