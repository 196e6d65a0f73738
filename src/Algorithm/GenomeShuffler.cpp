//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// GenomeShuffler - Place every interval at a uniformly
// random position of the genome
//
#include <algorithm>
#include "GenomeShuffler.h"
#include "PoverlapErrors.h"

//
void WeightedRegions::add(int chromIdx, const Interval& region)
{
    // zero-length regions can still receive a start position
    int64_t weight = std::max((int64_t)1, region.length());
    totalWeight += weight;
    chromIndices.push_back(chromIdx);
    regions.push_back(region);
    cumulativeWeights.push_back(totalWeight);
}

//
size_t WeightedRegions::pick(RandomEngine& rng) const
{
    assert(!empty());
    int64_t r = randomInRange(rng, 0, totalWeight - 1);
    Int64Vector::const_iterator iter = std::upper_bound(cumulativeWeights.begin(), cumulativeWeights.end(), r);
    assert(iter != cumulativeWeights.end());
    return iter - cumulativeWeights.begin();
}

//
GenomeShuffler::GenomeShuffler(const GenomeSizes& genome,
                               bool withinChromosome,
                               const BedRecordVector* pExclude,
                               const BedRecordVector* pInclude) : m_genome(genome),
                                                                  m_withinChromosome(withinChromosome),
                                                                  m_pExcludeIndex(NULL),
                                                                  m_hasInclude(pInclude != NULL)
{
    if(m_genome.empty())
        throw ConfigurationError("a genome file with at least one chromosome is required to shuffle over the genome");

    for(size_t i = 0; i < m_genome.getNumChromosomes(); ++i)
        m_chromosomes.add(i, Interval(0, m_genome.getChromosome(i).length));

    if(pInclude != NULL)
    {
        m_includeByChromosome.resize(m_genome.getNumChromosomes());
        for(size_t i = 0; i < pInclude->size(); ++i)
        {
            const BedRecord& region = (*pInclude)[i];
            int chromIdx = m_genome.getIndex(region.chrom);

            // regions off the genome cannot receive intervals
            if(chromIdx < 0 || region.start >= m_genome.getChromosome(chromIdx).length)
                continue;

            Interval clipped(region.start, std::min(region.end, m_genome.getChromosome(chromIdx).length));
            m_includeRegions.add(chromIdx, clipped);
            m_includeByChromosome[chromIdx].add(chromIdx, clipped);
        }

        if(m_includeRegions.empty())
            throw ConfigurationError("none of the included regions lie on a chromosome of the genome");
    }

    if(pExclude != NULL)
        m_pExcludeIndex = new IntervalIndex(*pExclude);
}

//
GenomeShuffler::~GenomeShuffler()
{
    delete m_pExcludeIndex;
    m_pExcludeIndex = NULL;
}

//
bool GenomeShuffler::drawPlacement(const BedRecord& record, int recordChromIdx, RandomEngine& rng, int& chromIdx, int64_t& start) const
{
    int64_t width = record.getWidth();
    if(!m_hasInclude)
    {
        chromIdx = m_withinChromosome ? recordChromIdx : m_chromosomes.chromIndices[m_chromosomes.pick(rng)];
        int64_t length = m_genome.getChromosome(chromIdx).length;
        if(width > length)
            return false;
        start = randomInRange(rng, 0, length - width);
        return true;
    }

    const WeightedRegions& candidates = m_withinChromosome ? m_includeByChromosome[recordChromIdx] : m_includeRegions;
    if(candidates.empty())
        return false;

    size_t regionIdx = candidates.pick(rng);
    const Interval& region = candidates.regions[regionIdx];
    chromIdx = candidates.chromIndices[regionIdx];
    start = region.length() > 0 ? randomInRange(rng, region.start, region.end - 1) : region.start;
    return start + width <= m_genome.getChromosome(chromIdx).length;
}

//
BedRecord GenomeShuffler::shuffleRecord(const BedRecord& record, RandomEngine& rng) const
{
    int recordChromIdx = -1;
    if(m_withinChromosome)
    {
        recordChromIdx = m_genome.getIndex(record.chrom);
        if(recordChromIdx < 0)
            throw ExternalServiceError("chromosome " + record.chrom + " is not in the genome file");
    }

    for(int i = 0; i < MAX_TRIES; ++i)
    {
        int chromIdx;
        int64_t start;
        if(!drawPlacement(record, recordChromIdx, rng, chromIdx, start))
            continue;

        int64_t end = start + record.getWidth();
        const std::string& chrom = m_genome.getChromosome(chromIdx).name;
        if(m_pExcludeIndex != NULL && m_pExcludeIndex->hasOverlap(chrom, start, end))
            continue;

        BedRecord out = record.withCoordinates(start, end);
        out.chrom = chrom;
        return out;
    }

    std::stringstream ss;
    ss << "could not place interval " << record.toString() << " after " << MAX_TRIES << " attempts";
    throw ExternalServiceError(ss.str());
}

//
BedRecordVector GenomeShuffler::shuffle(const BedRecordVector& records, RandomEngine& rng) const
{
    BedRecordVector out;
    out.reserve(records.size());
    for(size_t i = 0; i < records.size(); ++i)
        out.push_back(shuffleRecord(records[i], rng));
    return out;
}

//
std::string GenomeShuffler::getDescription() const
{
    std::stringstream ss;
    ss << "genome shuffle over " << m_genome.getNumChromosomes() << " chromosomes";
    if(m_withinChromosome)
        ss << ", within chromosome";
    if(m_pExcludeIndex != NULL)
        ss << ", excluding " << m_pExcludeIndex->getNumIntervals() << " regions";
    if(m_hasInclude)
        ss << ", including " << m_includeRegions.regions.size() << " regions";
    return ss.str();
}
