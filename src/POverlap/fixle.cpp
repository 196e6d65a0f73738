//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// fixle - test the overlap of two types of a labeled
// interval set by randomly reassigning one type
//
#include <iostream>
#include "fixle.h"
#include "POverlapCommon.h"
#include "Util.h"
#include "Timer.h"
#include "Verbosity.h"
#include "BedReader.h"
#include "TypeSwapShuffler.h"
#include "OverlapService.h"
#include "PermutationEngine.h"

// functions
void runFixle();

//
// Getopt
//
#define SUBPROGRAM "fixle"
static const char *FIXLE_VERSION_MESSAGE =
SUBPROGRAM " Version " PACKAGE_VERSION "\n"
"Written by " PACKAGE_AUTHOR ".\n"
"\n"
"Copyright 2026 " PACKAGE_AUTHOR "\n";

static const char *FIXLE_USAGE_MESSAGE =
"Usage: " PACKAGE_NAME " " SUBPROGRAM " [OPTION] ... BED ATYPE BTYPE\n"
"Test whether the intervals of type ATYPE overlap the intervals of type BTYPE more often\n"
"than expected by chance. The type of each interval of BED is read from the type column.\n"
"The ATYPE intervals are kept fixed and in each round the BTYPE intervals are replaced by\n"
"a random sample of the intervals that are not of type ATYPE.\n"
"\n"
"  -v, --verbose                        display verbose output\n"
"      --help                           display this help and exit\n"
"      --version                        display version information and exit\n"
"  -c, --type-column=N                  read the type of each interval from BED column N (default: 4)\n"
"  -n, --num-trials=NUM                 perform NUM shuffles (default: 1000)\n"
"  -t, --threads=NUM                    use NUM worker threads (default: number of cores)\n"
"      --seed=N                         set random seed (default: seed from the clock)\n"
"\nReport bugs to " PACKAGE_BUGREPORT "\n\n";

namespace opt
{
    static unsigned int verbose;
    static std::string bedFile;
    static std::string keepType;
    static std::string swapType;
    static int typeColumn = DEFAULT_TYPE_COLUMN;
    static int numTrials = DEFAULT_NUM_TRIALS;
    static int numThreads = 0;
    static uint64_t seed = 0;
}

static const char* shortopts = "c:n:t:v";

enum { OPT_HELP = 1, OPT_VERSION, OPT_SEED };

static const struct option longopts[] = {
    { "verbose",        no_argument,       NULL, 'v' },
    { "type-column",    required_argument, NULL, 'c' },
    { "num-trials",     required_argument, NULL, 'n' },
    { "threads",        required_argument, NULL, 't' },
    { "seed",           required_argument, NULL, OPT_SEED },
    { "help",           no_argument,       NULL, OPT_HELP },
    { "version",        no_argument,       NULL, OPT_VERSION },
    { NULL, 0, NULL, 0 }
};

//
// Main
//
int fixleMain(int argc, char** argv)
{
    parseFixleOptions(argc, argv);

    try
    {
        Timer timer(PACKAGE_NAME " " SUBPROGRAM);
        runFixle();
    }
    catch(std::exception& e)
    {
        exitWithError(SUBPROGRAM, e);
    }
    return 0;
}

//
void runFixle()
{
    BedRecordVector records = loadBedFile(opt::bedFile);
    FixlePartition partition = TypeSwapShuffler::partition(records, opt::keepType, opt::swapType, opt::typeColumn);

    Verbosity::log(VL_PROGRESS, SUBPROGRAM, "%zu %s, %zu %s, %zu in the background pool",
                   partition.fixed.size(), opt::keepType.c_str(),
                   partition.swapped.size(), opt::swapType.c_str(),
                   partition.background.size());

    TypeSwapShuffler shuffler(partition.background);

    PermutationParameters params;
    params.numTrials = opt::numTrials;
    params.numThreads = opt::numThreads;
    params.seed = opt::seed;
    params.aName = opt::keepType;
    params.bName = opt::swapType;

    IndexedOverlapService service;
    PermutationEngine engine(&service, params);
    PermutationResult result = engine.runTest(partition.fixed, partition.swapped, opt::numTrials, &shuffler, false);
    result.write(std::cout);
}

//
// Handle command line arguments
//
void parseFixleOptions(int argc, char** argv)
{
    opt::numThreads = getNumHardwareThreads();

    bool die = false;
    for (char c; (c = getopt_long(argc, argv, shortopts, longopts, NULL)) != -1;)
    {
        std::istringstream arg(optarg != NULL ? optarg : "");
        switch (c)
        {
            case 'c': arg >> opt::typeColumn; break;
            case 'n': arg >> opt::numTrials; break;
            case 't': arg >> opt::numThreads; break;
            case 'v': opt::verbose++; break;
            case OPT_SEED: arg >> opt::seed; break;
            case '?': die = true; break;
            case OPT_HELP:
                std::cout << FIXLE_USAGE_MESSAGE;
                exit(EXIT_SUCCESS);
            case OPT_VERSION:
                std::cout << FIXLE_VERSION_MESSAGE;
                exit(EXIT_SUCCESS);
        }
    }

    if (argc - optind < 3)
    {
        std::cerr << SUBPROGRAM ": missing arguments\n";
        die = true;
    }
    else if (argc - optind > 3)
    {
        std::cerr << SUBPROGRAM ": too many arguments\n";
        die = true;
    }

    if(opt::typeColumn <= 3)
    {
        std::cerr << SUBPROGRAM ": invalid type column: " << opt::typeColumn << ", the type must be read from column 4 or later\n";
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
        std::cout << "\n" << FIXLE_USAGE_MESSAGE;
        exit(EXIT_FAILURE);
    }

    opt::bedFile = argv[optind++];
    opt::keepType = argv[optind++];
    opt::swapType = argv[optind++];

    opt::seed = resolveSeed(opt::seed);
    Verbosity::Instance().setPrintLevel(opt::verbose);

    if(opt::verbose > 0)
    {
        std::cerr << "Parameters:\n";
        std::cerr << "BED: " << opt::bedFile << "\n";
        std::cerr << "Fixed type: " << opt::keepType << "\n";
        std::cerr << "Swapped type: " << opt::swapType << "\n";
        std::cerr << "TypeColumn: " << opt::typeColumn << "\n";
        std::cerr << "NumTrials: " << opt::numTrials << "\n";
        std::cerr << "NumThreads: " << opt::numThreads << "\n";
    }
    std::cerr << "Seed: " << opt::seed << "\n";
}
