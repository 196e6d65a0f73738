//-----------------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------------
//
// TypeSwapShuffler - The "fixle" randomization from
// Haiminen et al, BMC Bioinformatics 2008, 9:336.
//
// A labeled BED file holds, e.g., binding sites of several
// factors with the factor named in one column. Sites of the
// query type stay where they are, and the label of the
// swapped type is reassigned at random to any of the rows
// that are not of the query type.
//
#ifndef TYPESWAPSHUFFLER_H
#define TYPESWAPSHUFFLER_H

#include "IntervalShuffler.h"

// The three subsets of a labeled interval set
struct FixlePartition
{
    // rows labeled with the type that is kept fixed
    BedRecordVector fixed;

    // every other row; the swapped type is redrawn from these
    BedRecordVector background;

    // the rows labeled with the swapped type
    BedRecordVector swapped;
};

class TypeSwapShuffler : public IntervalShuffler
{
    public:
        // Split records by the label in labelColumn (1-based BED column).
        // Throws a ConfigurationError if labelColumn is not an auxiliary
        // column of every record or if no record is labeled swapLabel.
        static FixlePartition partition(const BedRecordVector& records,
                                        const std::string& keepLabel,
                                        const std::string& swapLabel,
                                        size_t labelColumn);

        // The shuffler draws from the background pool of the partition
        TypeSwapShuffler(const BedRecordVector& background);

        // Return a sample, without replacement, of records.size() rows
        // of the background pool
        virtual BedRecordVector shuffle(const BedRecordVector& records, RandomEngine& rng) const;
        virtual std::string getDescription() const;

    private:
        BedRecordVector m_background;
};

#endif
