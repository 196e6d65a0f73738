//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// DistanceShuffler - Move every interval to a random
// position within a fixed distance of where it is
//
#include <algorithm>
#include <limits>
#include "DistanceShuffler.h"
#include "PoverlapErrors.h"

//
DistanceShuffler::DistanceShuffler(int64_t maxDistance) : m_maxDistance(0)
{
    // the magnitude of the smallest int64_t is not representable
    if(maxDistance == std::numeric_limits<int64_t>::min())
    {
        std::stringstream ss;
        ss << "invalid shuffle distance " << maxDistance;
        throw ConfigurationError(ss.str());
    }
    m_maxDistance = maxDistance < 0 ? -maxDistance : maxDistance;
}

//
BedRecord DistanceShuffler::shuffleRecord(const BedRecord& record, RandomEngine& rng) const
{
    int64_t offset = randomInRange(rng, -m_maxDistance, m_maxDistance);
    int64_t width = record.getWidth();

    // Clamp to [0, INT64_MAX - width] without overflowing
    int64_t maxStart = std::numeric_limits<int64_t>::max() - std::max((int64_t)0, width);
    int64_t start;
    if(offset > maxStart - record.start)
        start = maxStart;
    else
        start = std::max((int64_t)0, record.start + offset);
    return record.withCoordinates(start, start + width);
}

//
BedRecordVector DistanceShuffler::shuffle(const BedRecordVector& records, RandomEngine& rng) const
{
    BedRecordVector out;
    out.reserve(records.size());
    for(size_t i = 0; i < records.size(); ++i)
        out.push_back(shuffleRecord(records[i], rng));
    return out;
}

//
std::string DistanceShuffler::getDescription() const
{
    std::stringstream ss;
    ss << "distance-shuffle within " << m_maxDistance << "bp";
    return ss.str();
}
