//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// TypeSwapShuffler - The "fixle" randomization
//
#include "TypeSwapShuffler.h"
#include "ReservoirSampler.h"
#include "PoverlapErrors.h"

//
FixlePartition TypeSwapShuffler::partition(const BedRecordVector& records,
                                           const std::string& keepLabel,
                                           const std::string& swapLabel,
                                           size_t labelColumn)
{
    if(labelColumn <= 3)
    {
        std::stringstream ss;
        ss << "invalid type column " << labelColumn << ", the type must be in column 4 or above";
        throw ConfigurationError(ss.str());
    }

    FixlePartition out;
    std::string label;
    for(size_t i = 0; i < records.size(); ++i)
    {
        if(!records[i].getColumn(labelColumn, label))
        {
            std::stringstream ss;
            ss << "type column " << labelColumn << " is missing from record: " << records[i].toString();
            throw ConfigurationError(ss.str());
        }

        if(label == keepLabel)
        {
            out.fixed.push_back(records[i]);
        }
        else
        {
            out.background.push_back(records[i]);
            if(label == swapLabel)
                out.swapped.push_back(records[i]);
        }
    }

    if(out.swapped.empty())
        throw ConfigurationError("no intervals found for " + swapLabel);
    return out;
}

//
TypeSwapShuffler::TypeSwapShuffler(const BedRecordVector& background) : m_background(background)
{
    if(m_background.empty())
        throw DegenerateInputError("the background pool for the type swap is empty");
}

//
BedRecordVector TypeSwapShuffler::shuffle(const BedRecordVector& records, RandomEngine& rng) const
{
    return ReservoirSampler<BedRecord>::sample(m_background, records.size(), rng);
}

//
std::string TypeSwapShuffler::getDescription() const
{
    std::stringstream ss;
    ss << "type swap over a background of " << m_background.size() << " intervals";
    return ss.str();
}
