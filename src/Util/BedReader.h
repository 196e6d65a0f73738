//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// BedReader - Read the records of a BED file one
// at a time. This class conforms to the generator
// interface used by the ReservoirSampler and the
// ProcessFramework concurrency lib
//
#ifndef BED_READER_H
#define BED_READER_H

#include <string>
#include <iostream>
#include <vector>
#include "BedRecord.h"

class BedReader
{
    public:
        // Open the file, which may be gzipped. A filename of "-" reads stdin.
        BedReader(const std::string& filename);

        // Read from an already-open stream, which is not owned by the reader.
        // name is used in error messages.
        BedReader(std::istream* pStream, const std::string& name);
        ~BedReader();

        // Read the next record into out. Returns false at the end of the
        // input. Malformed lines throw a ParseError.
        bool generate(BedRecord& out);

        // Read all remaining records
        BedRecordVector readAll();

        // Number of records read so far
        inline size_t getNumConsumed() const { return m_numConsumed; }
        inline const std::string& getName() const { return m_name; }

    private:

        std::istream* m_pReader;
        bool m_ownsReader;
        std::string m_name;
        size_t m_lineNumber;
        size_t m_numConsumed;
};

// Load every record of a BED file
BedRecordVector loadBedFile(const std::string& filename);

// Write the records to a file, which is gzipped if the name ends in .gz.
// A filename of "-" or an empty name writes to stdout.
void writeBedFile(const std::string& filename, const BedRecordVector& records);
void writeBedRecords(std::ostream& out, const BedRecordVector& records);

#endif
