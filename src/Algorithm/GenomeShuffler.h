//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// GenomeShuffler - Place every interval at a uniformly
// random position of the genome, keeping its width.
// Placement can be restricted to the interval's own
// chromosome, to a set of included regions and away
// from a set of excluded regions.
//
#ifndef GENOMESHUFFLER_H
#define GENOMESHUFFLER_H

#include "IntervalShuffler.h"
#include "IntervalIndex.h"
#include "GenomeSizes.h"

// A set of (chromosome, interval) pairs that can be drawn
// from with probability proportional to interval length
struct WeightedRegions
{
    WeightedRegions() : totalWeight(0) {}

    void add(int chromIdx, const Interval& region);
    bool empty() const { return regions.empty(); }

    // Returns the index of the drawn region
    size_t pick(RandomEngine& rng) const;

    std::vector<int> chromIndices;
    IntervalVector regions;
    Int64Vector cumulativeWeights;
    int64_t totalWeight;
};

class GenomeShuffler : public IntervalShuffler
{
    public:
        // Throws a ConfigurationError if the genome is empty.
        // The masks are copied and may be NULL.
        GenomeShuffler(const GenomeSizes& genome,
                       bool withinChromosome,
                       const BedRecordVector* pExclude,
                       const BedRecordVector* pInclude);
        ~GenomeShuffler();

        // Throws an ExternalServiceError if a record cannot be placed
        virtual BedRecordVector shuffle(const BedRecordVector& records, RandomEngine& rng) const;
        virtual std::string getDescription() const;

        BedRecord shuffleRecord(const BedRecord& record, RandomEngine& rng) const;

        // Number of placements tried per record before giving up
        static const int MAX_TRIES = 1000;

    private:

        // Not copyable, the exclude index is owned
        GenomeShuffler(const GenomeShuffler&);
        GenomeShuffler& operator=(const GenomeShuffler&);

        // Draw a candidate start for the record. Returns false if the
        // candidate does not fit on the chosen chromosome.
        bool drawPlacement(const BedRecord& record, int recordChromIdx, RandomEngine& rng, int& chromIdx, int64_t& start) const;

        GenomeSizes m_genome;
        bool m_withinChromosome;
        IntervalIndex* m_pExcludeIndex;
        bool m_hasInclude;

        // Whole chromosomes, used when there are no included regions
        WeightedRegions m_chromosomes;

        // Included regions over the whole genome and split by chromosome
        WeightedRegions m_includeRegions;
        std::vector<WeightedRegions> m_includeByChromosome;
};

#endif
