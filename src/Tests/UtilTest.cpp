//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// UtilTest - Integer parsing and the package information
// printed by the version and usage messages
//
#include <catch2/catch.hpp>
#include <limits>
#include "Util.h"
#include "BedRecord.h"

TEST_CASE("parseInteger accepts plain and negative integers", "[util]")
{
    int64_t value = 0;
    REQUIRE(parseInteger("42", value));
    CHECK(value == 42);
    REQUIRE(parseInteger("-5", value));
    CHECK(value == -5);
    REQUIRE(parseInteger("0", value));
    CHECK(value == 0);
    REQUIRE(parseInteger("9223372036854775807", value));
    CHECK(value == std::numeric_limits<int64_t>::max());
}

TEST_CASE("parseInteger rejects signs, whitespace and junk", "[util]")
{
    int64_t value = 7;
    CHECK_FALSE(parseInteger("", value));
    CHECK_FALSE(parseInteger(" 100", value));
    CHECK_FALSE(parseInteger("\t100", value));
    CHECK_FALSE(parseInteger("+100", value));
    CHECK_FALSE(parseInteger("100 ", value));
    CHECK_FALSE(parseInteger("-", value));
    CHECK_FALSE(parseInteger("1e3", value));
    CHECK_FALSE(parseInteger("9223372036854775808", value));

    // out is untouched on failure
    CHECK(value == 7);
}

TEST_CASE("BED coordinates with a sign or padding are malformed", "[util][bed]")
{
    BedRecord record;
    std::string errorMsg;
    CHECK_FALSE(BedRecord::parse("chr1\t 100\t200", record, errorMsg));
    CHECK_FALSE(BedRecord::parse("chr1\t+100\t200", record, errorMsg));
    CHECK_FALSE(BedRecord::parse("chr1\t100\t+200", record, errorMsg));
    CHECK(BedRecord::parse("chr1\t100\t200", record, errorMsg));
}

TEST_CASE("package information names this project", "[util]")
{
    CHECK(std::string(PACKAGE_NAME) == "poverlap");
    CHECK(std::string(PACKAGE_AUTHOR) == "The poverlap authors");
    CHECK_FALSE(std::string(PACKAGE_VERSION).empty());
    CHECK_FALSE(std::string(PACKAGE_BUGREPORT).empty());
}
