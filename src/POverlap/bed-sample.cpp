//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// bed-sample - choose random lines from a BED file
//
#include <iostream>
#include "bed-sample.h"
#include "POverlapCommon.h"
#include "Util.h"
#include "Verbosity.h"
#include "BedReader.h"
#include "ReservoirSampler.h"

//
// Getopt
//
#define SUBPROGRAM "bed-sample"
static const char *BEDSAMPLE_VERSION_MESSAGE =
SUBPROGRAM " Version " PACKAGE_VERSION "\n"
"Written by " PACKAGE_AUTHOR ".\n"
"\n"
"Copyright 2026 " PACKAGE_AUTHOR "\n";

static const char *BEDSAMPLE_USAGE_MESSAGE =
"Usage: " PACKAGE_NAME " " SUBPROGRAM " [OPTION] ... BED\n"
"Choose NUM lines of BED uniformly at random in a single pass over the file.\n"
"If BED is - the records are read from standard input.\n"
"\n"
"  -v, --verbose                        display verbose output\n"
"      --help                           display this help and exit\n"
"      --version                        display version information and exit\n"
"  -n, --num=NUM                        choose NUM lines (default: 1000)\n"
"  -o, --out=FILE                       write the chosen lines to FILE (default: stdout)\n"
"      --seed=N                         set random seed (default: seed from the clock)\n"
"\nReport bugs to " PACKAGE_BUGREPORT "\n\n";

namespace opt
{
    static unsigned int verbose;
    static std::string bedFile;
    static std::string outFile;
    static int64_t numSamples = DEFAULT_SAMPLE_SIZE;
    static uint64_t seed = 0;
}

static const char* shortopts = "n:o:v";

enum { OPT_HELP = 1, OPT_VERSION, OPT_SEED };

static const struct option longopts[] = {
    { "verbose",        no_argument,       NULL, 'v' },
    { "num",            required_argument, NULL, 'n' },
    { "out",            required_argument, NULL, 'o' },
    { "seed",           required_argument, NULL, OPT_SEED },
    { "help",           no_argument,       NULL, OPT_HELP },
    { "version",        no_argument,       NULL, OPT_VERSION },
    { NULL, 0, NULL, 0 }
};

//
// Main
//
int bedSampleMain(int argc, char** argv)
{
    parseBedSampleOptions(argc, argv);

    try
    {
        RandomEngine rng(opt::seed);
        BedReader reader(opt::bedFile);
        BedRecordVector samples = ReservoirSampler<BedRecord>::sampleStream(reader, opt::numSamples, rng);

        Verbosity::log(VL_PROGRESS, SUBPROGRAM, "sampled %zu of %zu records", samples.size(), reader.getNumConsumed());

        writeBedFile(opt::outFile, samples);
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
void parseBedSampleOptions(int argc, char** argv)
{
    bool die = false;
    for (char c; (c = getopt_long(argc, argv, shortopts, longopts, NULL)) != -1;)
    {
        std::istringstream arg(optarg != NULL ? optarg : "");
        switch (c)
        {
            case 'n': arg >> opt::numSamples; break;
            case 'o': arg >> opt::outFile; break;
            case 'v': opt::verbose++; break;
            case OPT_SEED: arg >> opt::seed; break;
            case '?': die = true; break;
            case OPT_HELP:
                std::cout << BEDSAMPLE_USAGE_MESSAGE;
                exit(EXIT_SUCCESS);
            case OPT_VERSION:
                std::cout << BEDSAMPLE_VERSION_MESSAGE;
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

    if(opt::numSamples <= 0)
    {
        std::cerr << SUBPROGRAM ": invalid number of lines: " << opt::numSamples << ", must be greater than zero\n";
        die = true;
    }

    if (die)
    {
        std::cout << "\n" << BEDSAMPLE_USAGE_MESSAGE;
        exit(EXIT_FAILURE);
    }

    opt::bedFile = argv[optind++];
    opt::seed = resolveSeed(opt::seed);
    Verbosity::Instance().setPrintLevel(opt::verbose);

    std::cerr << "Seed: " << opt::seed << "\n";
}
