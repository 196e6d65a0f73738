//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// BedRecordTest - Parsing and writing of BED records
//
#include <catch2/catch.hpp>
#include "BedRecord.h"
#include "BedReader.h"
#include "PoverlapErrors.h"

TEST_CASE("BED lines with extra columns are parsed and written back unchanged", "[bed]")
{
    std::string line = "chr1\t100\t200\tpeak_1\t37.5\t+";
    BedRecord record;
    std::string errorMsg;
    REQUIRE(BedRecord::parse(line, record, errorMsg));

    CHECK(record.chrom == "chr1");
    CHECK(record.start == 100);
    CHECK(record.end == 200);
    CHECK(record.getWidth() == 100);
    REQUIRE(record.fields.size() == 3);
    CHECK(record.getNumColumns() == 6);
    CHECK(record.toString() == line);

    std::string column;
    REQUIRE(record.getColumn(4, column));
    CHECK(column == "peak_1");
    REQUIRE(record.getColumn(2, column));
    CHECK(column == "100");
    CHECK_FALSE(record.getColumn(7, column));
    CHECK_FALSE(record.getColumn(0, column));
}

TEST_CASE("malformed BED lines are rejected", "[bed]")
{
    BedRecord record;
    std::string errorMsg;

    CHECK_FALSE(BedRecord::parse("chr1\t100", record, errorMsg));
    CHECK_FALSE(BedRecord::parse("chr1\tabc\t200", record, errorMsg));
    CHECK_FALSE(BedRecord::parse("chr1\t-5\t200", record, errorMsg));
    CHECK_FALSE(BedRecord::parse("chr1\t300\t200", record, errorMsg));
    CHECK_FALSE(BedRecord::parse("\t100\t200", record, errorMsg));
    CHECK_FALSE(errorMsg.empty());

    // zero-width records are valid
    CHECK(BedRecord::parse("chr1\t200\t200", record, errorMsg));
}

TEST_CASE("withCoordinates keeps the chromosome and extra columns", "[bed]")
{
    BedRecord record("chr2", 10, 20);
    record.fields.push_back("CTCF");

    BedRecord moved = record.withCoordinates(50, 70);
    CHECK(moved.chrom == "chr2");
    CHECK(moved.start == 50);
    CHECK(moved.end == 70);
    REQUIRE(moved.fields.size() == 1);
    CHECK(moved.fields[0] == "CTCF");

    // the source is untouched
    CHECK(record.start == 10);
}

TEST_CASE("half-open overlap with zero-width intervals covering one base", "[bed]")
{
    BedRecord a("chr1", 100, 200);
    CHECK(a.isOverlapping(BedRecord("chr1", 150, 250)));
    CHECK(a.isOverlapping(BedRecord("chr1", 199, 300)));
    CHECK_FALSE(a.isOverlapping(BedRecord("chr1", 200, 300)));
    CHECK_FALSE(a.isOverlapping(BedRecord("chr1", 0, 100)));
    CHECK_FALSE(a.isOverlapping(BedRecord("chr2", 150, 250)));

    CHECK(a.isOverlapping(BedRecord("chr1", 100, 100)));
    CHECK(a.isOverlapping(BedRecord("chr1", 199, 199)));
    CHECK_FALSE(a.isOverlapping(BedRecord("chr1", 200, 200)));
}

TEST_CASE("BedReader skips header lines and reports the line of a parse error", "[bed]")
{
    std::istringstream good("track name=peaks\n"
                            "# comment\n"
                            "\n"
                            "chr1\t10\t20\n"
                            "browser position chr1\n"
                            "chr2\t30\t40\tCTCF\n");
    BedReader reader(&good, "good.bed");
    BedRecordVector records = reader.readAll();
    REQUIRE(records.size() == 2);
    CHECK(reader.getNumConsumed() == 2);
    CHECK(records[1].chrom == "chr2");
    CHECK(records[1].fields[0] == "CTCF");

    std::istringstream bad("chr1\t10\t20\n"
                           "chr1\t30\n");
    BedReader badReader(&bad, "bad.bed");
    BedRecord record;
    REQUIRE(badReader.generate(record));
    try
    {
        badReader.generate(record);
        FAIL("expected a ParseError");
    }
    catch(ParseError& e)
    {
        CHECK(std::string(e.what()).find("bad.bed:2:") == 0);
    }
}

TEST_CASE("records written by writeBedRecords read back identically", "[bed]")
{
    BedRecordVector records;
    records.push_back(BedRecord("chr1", 0, 5));
    records.push_back(BedRecord("chrX", 1000, 2000));
    records.back().fields.push_back("name");
    records.back().fields.push_back("");
    records.back().fields.push_back("-");

    std::stringstream ss;
    writeBedRecords(ss, records);

    BedReader reader(&ss, "stream");
    BedRecordVector readBack = reader.readAll();
    REQUIRE(readBack.size() == records.size());
    for(size_t i = 0; i < records.size(); ++i)
        CHECK(readBack[i].toString() == records[i].toString());
}
