//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// GenomeSizes - The table of chromosome lengths read
// from a genome file
//
#include "GenomeSizes.h"
#include "PoverlapErrors.h"

//
GenomeSizes GenomeSizes::load(const std::string& filename)
{
    std::istream* pReader = createReader(filename);
    try
    {
        GenomeSizes genome = parse(*pReader, filename);
        delete pReader;
        return genome;
    }
    catch(...)
    {
        delete pReader;
        throw;
    }
}

//
GenomeSizes GenomeSizes::parse(std::istream& in, const std::string& name)
{
    GenomeSizes genome;
    std::string line;
    size_t lineNumber = 0;
    while(getline(in, line))
    {
        ++lineNumber;
        chomp(line);
        if(line.empty() || line[0] == '#')
            continue;

        StringVector tokens = split(line, '\t');
        int64_t length;
        if(tokens.size() < 2 || tokens[0].empty() || !parseInteger(tokens[1], length))
        {
            std::stringstream ss;
            ss << name << ":" << lineNumber << ": expected chromosome name and length in line: " << line;
            throw ParseError(ss.str());
        }

        try
        {
            genome.add(tokens[0], length);
        }
        catch(ParseError& e)
        {
            std::stringstream ss;
            ss << name << ":" << lineNumber << ": " << e.what();
            throw ParseError(ss.str());
        }
    }
    return genome;
}

//
void GenomeSizes::add(const std::string& name, int64_t length)
{
    if(length <= 0)
        throw ParseError("chromosome " + name + " must have a positive length");

    if(m_indexMap.find(name) != m_indexMap.end())
        throw ParseError("chromosome " + name + " is listed twice");

    ChromosomeSize cs = { name, length };
    m_indexMap[name] = m_chromosomes.size();
    m_chromosomes.push_back(cs);
    m_totalLength += length;
}

//
int GenomeSizes::getIndex(const std::string& name) const
{
    std::map<std::string, int>::const_iterator iter = m_indexMap.find(name);
    if(iter == m_indexMap.end())
        return -1;
    return iter->second;
}
