//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// Util - Common data structures and functions
//
#include <iostream>
#include <cerrno>
#include <cctype>
#include <unistd.h>
#include "Util.h"

// Returns true if the filename has an extension indicating it is compressed
bool isGzip(const std::string& filename)
{
    size_t suffix_length = sizeof(GZIP_EXT) - 1;

    // Assume files without an extension are not compressed
    if(filename.length() < suffix_length)
        return false;

    return filename.compare(filename.length() - suffix_length, suffix_length, GZIP_EXT) == 0;
}

#if HAVE_GZSTREAM
static void assertGZOpen(gzstreambase& gh, const std::string& fn)
{
    if(!gh.good())
    {
        std::cerr << "Error: could not open " << fn << std::endl;
        exit(EXIT_FAILURE);
    }
}
#endif

// Open a file that may or may not be gzipped for reading
// The caller is responsible for freeing the handle
std::istream* createReader(const std::string& filename, std::ios_base::openmode mode)
{
    if(isGzip(filename))
    {
#if HAVE_GZSTREAM
        igzstream* pGZ = new igzstream(filename.c_str(), mode);
        assertGZOpen(*pGZ, filename);
        return pGZ;
#else
        std::cerr << "Error: cannot read " << filename << ", " << PACKAGE_NAME << " was compiled without gzip support\n";
        exit(EXIT_FAILURE);
#endif
    }
    else
    {
        std::ifstream* pReader = new std::ifstream(filename.c_str(), mode);
        assertFileOpen(*pReader, filename);
        return pReader;
    }
}

// Open a file that may or may not be gzipped for writing
// The caller is responsible for freeing the handle
std::ostream* createWriter(const std::string& filename,
                           std::ios_base::openmode mode)
{
    if(isGzip(filename))
    {
#if HAVE_GZSTREAM
        ogzstream* pGZ = new ogzstream(filename.c_str(), mode);
        assertGZOpen(*pGZ, filename);
        return pGZ;
#else
        std::cerr << "Error: cannot write " << filename << ", " << PACKAGE_NAME << " was compiled without gzip support\n";
        exit(EXIT_FAILURE);
#endif
    }
    else
    {
        std::ofstream* pWriter = new std::ofstream(filename.c_str(), mode);
        assertFileOpen(*pWriter, filename);
        return pWriter;
    }
}

// Ensure a filehandle is open
void assertFileOpen(std::ifstream& fh, const std::string& fn)
{
    if(!fh.is_open())
    {
        std::cerr << "Error: could not open " << fn << " for read\n";
        exit(EXIT_FAILURE);
    }
}

// Ensure a filehandle is open
void assertFileOpen(std::ofstream& fh, const std::string& fn)
{
    if(!fh.is_open())
    {
        std::cerr << "Error: could not open " << fn << " for write\n";
        exit(EXIT_FAILURE);
    }
}

// Split a string into parts based on the delimiter
StringVector split(std::string in, char delimiter)
{
    StringVector out;
    size_t lastPos = 0;
    size_t pos = in.find_first_of(delimiter);

    while(pos != std::string::npos)
    {
        out.push_back(in.substr(lastPos, pos - lastPos));
        lastPos = pos + 1;
        pos = in.find_first_of(delimiter, lastPos);
    }
    out.push_back(in.substr(lastPos));
    return out;
}

//
void chomp(std::string& line)
{
    while(!line.empty() && (line[line.size() - 1] == '\n' || line[line.size() - 1] == '\r'))
        line.erase(line.size() - 1);
}

//
bool parseInteger(const std::string& str, int64_t& out)
{
    // strtoll skips leading whitespace and takes a '+'
    if(str.empty() || (!isdigit((unsigned char)str[0]) && str[0] != '-'))
        return false;

    const char* pStart = str.c_str();
    char* pEnd = NULL;
    errno = 0;
    long long value = strtoll(pStart, &pEnd, 10);
    if(errno == ERANGE || pEnd == pStart || *pEnd != '\0')
        return false;

    out = value;
    return true;
}

//
int getNumHardwareThreads()
{
    long n = sysconf(_SC_NPROCESSORS_ONLN);
    return n > 0 ? (int)n : 1;
}
