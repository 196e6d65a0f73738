//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// BedRecord - A single line of a BED file
//
#include "BedRecord.h"

//
BedRecord BedRecord::withCoordinates(int64_t s, int64_t e) const
{
    BedRecord out(*this);
    out.start = s;
    out.end = e;
    return out;
}

//
bool BedRecord::getColumn(size_t column, std::string& out) const
{
    if(column == 0 || column > getNumColumns())
        return false;

    if(column == 1)
    {
        out = chrom;
    }
    else if(column <= 3)
    {
        std::stringstream ss;
        ss << (column == 2 ? start : end);
        out = ss.str();
    }
    else
    {
        out = fields[column - 4];
    }
    return true;
}

//
bool BedRecord::isHeaderLine(const std::string& line)
{
    if(line.empty() || line[0] == '#')
        return true;
    return line.compare(0, 5, "track") == 0 || line.compare(0, 7, "browser") == 0;
}

//
bool BedRecord::parse(const std::string& line, BedRecord& out, std::string& errorMsg)
{
    StringVector tokens = split(line, '\t');
    if(tokens.size() < 3)
    {
        errorMsg = "expected at least 3 tab-separated columns";
        return false;
    }

    if(tokens[0].empty())
    {
        errorMsg = "empty chromosome name";
        return false;
    }

    int64_t start;
    int64_t end;
    if(!parseInteger(tokens[1], start) || start < 0)
    {
        errorMsg = "invalid start coordinate '" + tokens[1] + "'";
        return false;
    }

    if(!parseInteger(tokens[2], end))
    {
        errorMsg = "invalid end coordinate '" + tokens[2] + "'";
        return false;
    }

    if(end < start)
    {
        errorMsg = "end coordinate is less than the start coordinate";
        return false;
    }

    out.chrom = tokens[0];
    out.start = start;
    out.end = end;
    out.fields.assign(tokens.begin() + 3, tokens.end());
    return true;
}

//
void BedRecord::write(std::ostream& out) const
{
    out << chrom << "\t" << start << "\t" << end;
    for(size_t i = 0; i < fields.size(); ++i)
        out << "\t" << fields[i];
    out << "\n";
}

//
std::string BedRecord::toString() const
{
    std::stringstream ss;
    write(ss);
    std::string str = ss.str();
    chomp(str);
    return str;
}
