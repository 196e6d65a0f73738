//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// distance-shuffle - move intervals within a distance of their location
//
#include <iostream>
#include "distance-shuffle.h"
#include "POverlapCommon.h"
#include "Util.h"
#include "BedReader.h"
#include "DistanceShuffler.h"

//
// Getopt
//
#define SUBPROGRAM "distance-shuffle"
static const char *DISTANCESHUFFLE_VERSION_MESSAGE =
SUBPROGRAM " Version " PACKAGE_VERSION "\n"
"Written by " PACKAGE_AUTHOR ".\n"
"\n"
"Copyright 2026 " PACKAGE_AUTHOR "\n";

static const char *DISTANCESHUFFLE_USAGE_MESSAGE =
"Usage: " PACKAGE_NAME " " SUBPROGRAM " [OPTION] ... BED\n"
"Move every interval of BED by a random offset of at most N bases in either direction.\n"
"The width and the extra columns of each interval are kept.\n"
"\n"
"      --help                           display this help and exit\n"
"      --version                        display version information and exit\n"
"  -d, --distance=N                     move intervals at most N bases (default: 500000)\n"
"  -o, --out=FILE                       write the shuffled intervals to FILE (default: stdout)\n"
"      --seed=N                         set random seed (default: seed from the clock)\n"
"\nReport bugs to " PACKAGE_BUGREPORT "\n\n";

namespace opt
{
    static std::string bedFile;
    static std::string outFile;
    static int64_t distance = DEFAULT_SHUFFLE_DISTANCE;
    static uint64_t seed = 0;
}

static const char* shortopts = "d:o:";

enum { OPT_HELP = 1, OPT_VERSION, OPT_SEED };

static const struct option longopts[] = {
    { "distance",       required_argument, NULL, 'd' },
    { "out",            required_argument, NULL, 'o' },
    { "seed",           required_argument, NULL, OPT_SEED },
    { "help",           no_argument,       NULL, OPT_HELP },
    { "version",        no_argument,       NULL, OPT_VERSION },
    { NULL, 0, NULL, 0 }
};

//
// Main
//
int distanceShuffleMain(int argc, char** argv)
{
    parseDistanceShuffleOptions(argc, argv);

    try
    {
        RandomEngine rng(opt::seed);
        DistanceShuffler shuffler(opt::distance);
        BedRecordVector records = loadBedFile(opt::bedFile);
        writeBedFile(opt::outFile, shuffler.shuffle(records, rng));
    }
    catch(std::exception& e)
    {
        exitWithError(SUBPROGRAM, e);
    }
    return 0;
}

//
// Handle command line arguments
//
void parseDistanceShuffleOptions(int argc, char** argv)
{
    bool die = false;
    for (char c; (c = getopt_long(argc, argv, shortopts, longopts, NULL)) != -1;)
    {
        std::istringstream arg(optarg != NULL ? optarg : "");
        switch (c)
        {
            case 'd': arg >> opt::distance; break;
            case 'o': arg >> opt::outFile; break;
            case OPT_SEED: arg >> opt::seed; break;
            case '?': die = true; break;
            case OPT_HELP:
                std::cout << DISTANCESHUFFLE_USAGE_MESSAGE;
                exit(EXIT_SUCCESS);
            case OPT_VERSION:
                std::cout << DISTANCESHUFFLE_VERSION_MESSAGE;
                exit(EXIT_SUCCESS);
        }
    }

    if (argc - optind < 1)
    {
        std::cerr << SUBPROGRAM ": missing arguments\n";
        die = true;
    }
    else if (argc - optind > 1)
    {
        std::cerr << SUBPROGRAM ": too many arguments\n";
        die = true;
    }

    if (die)
    {
        std::cout << "\n" << DISTANCESHUFFLE_USAGE_MESSAGE;
        exit(EXIT_FAILURE);
    }

    opt::bedFile = argv[optind++];
    opt::seed = resolveSeed(opt::seed);
    std::cerr << "Seed: " << opt::seed << "\n";
}
