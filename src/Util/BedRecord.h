//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// BedRecord - A single line of a BED file. The first
// three columns are parsed into a chromosome and a
// half-open range, any further columns are kept verbatim
//
#ifndef BEDRECORD_H
#define BEDRECORD_H

#include "Util.h"
#include "Interval.h"

struct BedRecord
{
    BedRecord() : start(0), end(0) {}
    BedRecord(const std::string& c, int64_t s, int64_t e) : chrom(c), start(s), end(e) {}

    int64_t getWidth() const { return end - start; }
    Interval getInterval() const { return Interval(start, end); }

    // Returns a copy of this record with new coordinates. The auxiliary
    // columns are carried over unchanged.
    BedRecord withCoordinates(int64_t s, int64_t e) const;

    // Returns true if the records are on the same chromosome and share a base
    bool isOverlapping(const BedRecord& other) const
    {
        return chrom == other.chrom && Interval::isIntersecting(start, end, other.start, other.end);
    }

    // Total number of columns, including chrom/start/end
    size_t getNumColumns() const { return 3 + fields.size(); }

    // Get the text of a column, using 1-based BED column numbering.
    // Returns false if the record does not have that column.
    bool getColumn(size_t column, std::string& out) const;

    // Parse a tab-delimited line. On failure, false is returned
    // and the reason is written to errorMsg.
    static bool parse(const std::string& line, BedRecord& out, std::string& errorMsg);

    // Returns true for lines that do not hold a record (empty,
    // comments and track/browser lines)
    static bool isHeaderLine(const std::string& line);

    void write(std::ostream& out) const;
    std::string toString() const;

    // data
    std::string chrom;
    int64_t start;
    int64_t end;
    StringVector fields;
};
typedef std::vector<BedRecord> BedRecordVector;

#endif
