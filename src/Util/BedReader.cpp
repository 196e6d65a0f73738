//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// BedReader - Read the records of a BED file one
// at a time
//
#include "BedReader.h"
#include "PoverlapErrors.h"
#include "Util.h"

//
BedReader::BedReader(const std::string& filename) : m_name(filename),
                                                    m_lineNumber(0),
                                                    m_numConsumed(0)
{
    if(filename == "-")
    {
        m_pReader = &std::cin;
        m_ownsReader = false;
    }
    else
    {
        m_pReader = createReader(filename);
        m_ownsReader = true;
    }
}

//
BedReader::BedReader(std::istream* pStream, const std::string& name) : m_pReader(pStream),
                                                                       m_ownsReader(false),
                                                                       m_name(name),
                                                                       m_lineNumber(0),
                                                                       m_numConsumed(0)
{

}

BedReader::~BedReader()
{
    if(m_ownsReader)
        delete m_pReader;
}

// Read the next record, skipping header lines.
bool BedReader::generate(BedRecord& out)
{
    std::string line;
    while(getline(*m_pReader, line))
    {
        ++m_lineNumber;
        chomp(line);
        if(BedRecord::isHeaderLine(line))
            continue;

        std::string errorMsg;
        if(!BedRecord::parse(line, out, errorMsg))
        {
            std::stringstream ss;
            ss << m_name << ":" << m_lineNumber << ": " << errorMsg << " in line: " << line;
            throw ParseError(ss.str());
        }

        m_numConsumed += 1;
        return true;
    }
    return false;
}

//
BedRecordVector BedReader::readAll()
{
    BedRecordVector out;
    BedRecord record;
    while(generate(record))
        out.push_back(record);
    return out;
}

//
BedRecordVector loadBedFile(const std::string& filename)
{
    BedReader reader(filename);
    return reader.readAll();
}

//
void writeBedRecords(std::ostream& out, const BedRecordVector& records)
{
    for(size_t i = 0; i < records.size(); ++i)
        records[i].write(out);
}

//
void writeBedFile(const std::string& filename, const BedRecordVector& records)
{
    if(filename.empty() || filename == "-")
    {
        writeBedRecords(std::cout, records);
        std::cout.flush();
    }
    else
    {
        std::ostream* pWriter = createWriter(filename);
        writeBedRecords(*pWriter, records);
        delete pWriter;
    }
}
