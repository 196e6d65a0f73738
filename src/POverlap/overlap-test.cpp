//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// overlap-test - test whether two interval sets overlap more than
// expected by chance
//
#include <iostream>
#include <fstream>
#include "overlap-test.h"
#include "POverlapCommon.h"
#include "Util.h"
#include "Timer.h"
#include "Verbosity.h"
#include "PoverlapErrors.h"
#include "BedReader.h"
#include "GenomeSizes.h"
#include "GenomeShuffler.h"
#include "DistanceShuffler.h"
#include "OverlapService.h"
#include "PermutationEngine.h"

// functions
void runOverlapTest();
void runEngine(const BedRecordVector& a, const BedRecordVector& b,
               const BedRecordVector* pExclude, const BedRecordVector* pInclude,
               const IntervalShuffler* pShuffler);

//
// Getopt
//
#define SUBPROGRAM "poverlap"
static const char *POVERLAP_VERSION_MESSAGE =
SUBPROGRAM " Version " PACKAGE_VERSION "\n"
"Written by " PACKAGE_AUTHOR ".\n"
"\n"
"Copyright 2026 " PACKAGE_AUTHOR "\n";

static const char *POVERLAP_USAGE_MESSAGE =
"Usage: " PACKAGE_NAME " " SUBPROGRAM " [OPTION] ... A_BED B_BED\n"
"Test whether the intervals in A_BED overlap the intervals in B_BED more often than expected\n"
"by chance. B_BED (and A_BED with --shuffle-both) is shuffled NUM times and the number of\n"
"overlaps after each shuffle is compared to the observed number.\n"
"\n"
"  -v, --verbose                        display verbose output\n"
"      --help                           display this help and exit\n"
"      --version                        display version information and exit\n"
"  -g, --genome=FILE                    tab-delimited chromosome names and lengths used to shuffle the\n"
"                                       intervals over the genome. Required unless --shuffle-distance is given\n"
"  -n, --num-trials=NUM                 perform NUM shuffles (default: 1000)\n"
"  -t, --threads=NUM                    use NUM worker threads (default: number of cores)\n"
"      --chrom                          keep each shuffled interval on its own chromosome\n"
"      --exclude=FILE                   remove intervals overlapping the regions in FILE and never\n"
"                                       shuffle into them\n"
"      --include=FILE                   keep only intervals overlapping the regions in FILE and only\n"
"                                       shuffle into them\n"
"      --shuffle-both                   shuffle A_BED as well as B_BED in every round\n"
"      --overlap-distance=N             count intervals within N bases of each other as overlapping\n"
"                                       by extending both sets (default: 0)\n"
"      --shuffle-distance=N             move each interval at most N bases from its original location\n"
"                                       instead of shuffling over the genome\n"
"      --seed=N                         set random seed (default: seed from the clock)\n"
"\nReport bugs to " PACKAGE_BUGREPORT "\n\n";

namespace opt
{
    static unsigned int verbose;
    static std::string aFile;
    static std::string bFile;
    static std::string genomeFile;
    static std::string excludeFile;
    static std::string includeFile;
    static int numTrials = DEFAULT_NUM_TRIALS;
    static int numThreads = 0;
    static bool bWithinChromosome = false;
    static bool bShuffleBoth = false;
    static int64_t overlapDistance = 0;
    static bool bDistanceShuffle = false;
    static int64_t shuffleDistance = DEFAULT_SHUFFLE_DISTANCE;
    static uint64_t seed = 0;
}

static const char* shortopts = "g:n:t:v";

enum { OPT_HELP = 1, OPT_VERSION, OPT_CHROM, OPT_EXCLUDE, OPT_INCLUDE,
       OPT_SHUFFLE_BOTH, OPT_OVERLAP_DISTANCE, OPT_SHUFFLE_DISTANCE, OPT_SEED };

static const struct option longopts[] = {
    { "verbose",          no_argument,       NULL, 'v' },
    { "genome",           required_argument, NULL, 'g' },
    { "num-trials",       required_argument, NULL, 'n' },
    { "threads",          required_argument, NULL, 't' },
    { "chrom",            no_argument,       NULL, OPT_CHROM },
    { "exclude",          required_argument, NULL, OPT_EXCLUDE },
    { "include",          required_argument, NULL, OPT_INCLUDE },
    { "shuffle-both",     no_argument,       NULL, OPT_SHUFFLE_BOTH },
    { "overlap-distance", required_argument, NULL, OPT_OVERLAP_DISTANCE },
    { "shuffle-distance", required_argument, NULL, OPT_SHUFFLE_DISTANCE },
    { "seed",             required_argument, NULL, OPT_SEED },
    { "help",             no_argument,       NULL, OPT_HELP },
    { "version",          no_argument,       NULL, OPT_VERSION },
    { NULL, 0, NULL, 0 }
};

//
// Main
//
int poverlapMain(int argc, char** argv)
{
    parsePoverlapOptions(argc, argv);

    try
    {
        Timer timer(PACKAGE_NAME " " SUBPROGRAM);
        runOverlapTest();
    }
    catch(std::exception& e)
    {
        exitWithError(SUBPROGRAM, e);
    }
    return 0;
}

//
void runOverlapTest()
{
    BedRecordVector a = loadBedFile(opt::aFile);
    BedRecordVector b = loadBedFile(opt::bFile);

    BedRecordVector exclude;
    BedRecordVector include;
    if(!opt::excludeFile.empty())
        exclude = loadBedFile(opt::excludeFile);
    if(!opt::includeFile.empty())
        include = loadBedFile(opt::includeFile);

    const BedRecordVector* pExclude = opt::excludeFile.empty() ? NULL : &exclude;
    const BedRecordVector* pInclude = opt::includeFile.empty() ? NULL : &include;

    // Choose the shuffle strategy
    if(opt::bDistanceShuffle)
    {
        DistanceShuffler shuffler(opt::shuffleDistance);
        runEngine(a, b, pExclude, pInclude, &shuffler);
    }
    else
    {
        if(opt::genomeFile.empty())
            throw ConfigurationError("a genome file (--genome) is required to shuffle over the genome");

        GenomeSizes genome = GenomeSizes::load(opt::genomeFile);
        GenomeShuffler shuffler(genome, opt::bWithinChromosome, pExclude, pInclude);
        runEngine(a, b, pExclude, pInclude, &shuffler);
    }
}

//
void runEngine(const BedRecordVector& a, const BedRecordVector& b,
               const BedRecordVector* pExclude, const BedRecordVector* pInclude,
               const IntervalShuffler* pShuffler)
{
    PermutationParameters params;
    params.numTrials = opt::numTrials;
    params.numThreads = opt::numThreads;
    params.bShuffleBoth = opt::bShuffleBoth;
    params.seed = opt::seed;
    params.pExclude = pExclude;
    params.pInclude = pInclude;
    params.overlapDistance = opt::overlapDistance;
    params.aName = opt::aFile;
    params.bName = opt::bFile;
    params.excludeName = opt::excludeFile;
    params.includeName = opt::includeFile;

    IndexedOverlapService service;
    PermutationEngine engine(&service, params);
    PermutationResult result = engine.run(a, b, pShuffler);
    result.write(std::cout);
}

//
// Handle command line arguments
//
void parsePoverlapOptions(int argc, char** argv)
{
    opt::numThreads = getNumHardwareThreads();

    bool die = false;
    for (char c; (c = getopt_long(argc, argv, shortopts, longopts, NULL)) != -1;)
    {
        std::istringstream arg(optarg != NULL ? optarg : "");
        switch (c)
        {
            case 'g': arg >> opt::genomeFile; break;
            case 'n': arg >> opt::numTrials; break;
            case 't': arg >> opt::numThreads; break;
            case 'v': opt::verbose++; break;
            case OPT_CHROM: opt::bWithinChromosome = true; break;
            case OPT_EXCLUDE: arg >> opt::excludeFile; break;
            case OPT_INCLUDE: arg >> opt::includeFile; break;
            case OPT_SHUFFLE_BOTH: opt::bShuffleBoth = true; break;
            case OPT_OVERLAP_DISTANCE: arg >> opt::overlapDistance; break;
            case OPT_SHUFFLE_DISTANCE: arg >> opt::shuffleDistance; opt::bDistanceShuffle = true; break;
            case OPT_SEED: arg >> opt::seed; break;
            case '?': die = true; break;
            case OPT_HELP:
                std::cout << POVERLAP_USAGE_MESSAGE;
                exit(EXIT_SUCCESS);
            case OPT_VERSION:
                std::cout << POVERLAP_VERSION_MESSAGE;
                exit(EXIT_SUCCESS);
        }
    }

    if (argc - optind < 2)
    {
        std::cerr << SUBPROGRAM ": missing arguments\n";
        die = true;
    }
    else if (argc - optind > 2)
    {
        std::cerr << SUBPROGRAM ": too many arguments\n";
        die = true;
    }

    if(opt::numTrials <= 0)
    {
        std::cerr << SUBPROGRAM ": invalid number of trials: " << opt::numTrials << ", must be greater than zero\n";
        die = true;
    }

    if(opt::numThreads <= 0)
    {
        std::cerr << SUBPROGRAM ": invalid number of threads: " << opt::numThreads << "\n";
        die = true;
    }

    if (die)
    {
        std::cout << "\n" << POVERLAP_USAGE_MESSAGE;
        exit(EXIT_FAILURE);
    }

    opt::aFile = argv[optind++];
    opt::bFile = argv[optind++];

    opt::seed = resolveSeed(opt::seed);
    Verbosity::Instance().setPrintLevel(opt::verbose);

    if(opt::verbose > 0)
    {
        std::cerr << "Parameters:\n";
        std::cerr << "A: " << opt::aFile << "\n";
        std::cerr << "B: " << opt::bFile << "\n";
        std::cerr << "NumTrials: " << opt::numTrials << "\n";
        std::cerr << "NumThreads: " << opt::numThreads << "\n";
        std::cerr << "Strategy: " << (opt::bDistanceShuffle ? "distance" : "genome") << "\n";
    }
    std::cerr << "Seed: " << opt::seed << "\n";
}
