//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// GenomeSizes - The table of chromosome lengths read
// from a genome file (chrom<TAB>length per line)
//
#ifndef GENOMESIZES_H
#define GENOMESIZES_H

#include <map>
#include "Util.h"

struct ChromosomeSize
{
    std::string name;
    int64_t length;
};
typedef std::vector<ChromosomeSize> ChromosomeSizeVector;

class GenomeSizes
{
    public:
        GenomeSizes() : m_totalLength(0) {}

        // Load the genome description from a file
        static GenomeSizes load(const std::string& filename);

        // Parse from a stream. name is used in error messages.
        static GenomeSizes parse(std::istream& in, const std::string& name);

        // Add a chromosome. Throws a ParseError on duplicate names
        // or non-positive lengths.
        void add(const std::string& name, int64_t length);

        // Returns the index of the chromosome or -1 if it is not in the genome
        int getIndex(const std::string& name) const;

        const ChromosomeSize& getChromosome(size_t idx) const { return m_chromosomes[idx]; }
        size_t getNumChromosomes() const { return m_chromosomes.size(); }
        int64_t getTotalLength() const { return m_totalLength; }
        bool empty() const { return m_chromosomes.empty(); }

    private:

        ChromosomeSizeVector m_chromosomes;
        std::map<std::string, int> m_indexMap;
        int64_t m_totalLength;
};

#endif
