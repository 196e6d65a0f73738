//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// extend - pad the intervals of a BED file
//
#include <iostream>
#include "extend.h"
#include "POverlapCommon.h"
#include "Util.h"
#include "BedReader.h"
#include "IntervalExtender.h"

//
// Getopt
//
#define SUBPROGRAM "extend"
static const char *EXTEND_VERSION_MESSAGE =
SUBPROGRAM " Version " PACKAGE_VERSION "\n"
"Written by " PACKAGE_AUTHOR ".\n"
"\n"
"Copyright 2026 " PACKAGE_AUTHOR "\n";

static const char *EXTEND_USAGE_MESSAGE =
"Usage: " PACKAGE_NAME " " SUBPROGRAM " [OPTION] ... BED\n"
"Widen every interval of BED by N bases, N/2 on each side. Coordinates are clamped at zero.\n"
"\n"
"      --help                           display this help and exit\n"
"      --version                        display version information and exit\n"
"  -b, --bases=N                        widen the intervals by N bases (default: 0)\n"
"  -o, --out=FILE                       write the extended intervals to FILE (default: stdout)\n"
"\nReport bugs to " PACKAGE_BUGREPORT "\n\n";

namespace opt
{
    static std::string bedFile;
    static std::string outFile;
    static int64_t bases = 0;
}

static const char* shortopts = "b:o:";

enum { OPT_HELP = 1, OPT_VERSION };

static const struct option longopts[] = {
    { "bases",          required_argument, NULL, 'b' },
    { "out",            required_argument, NULL, 'o' },
    { "help",           no_argument,       NULL, OPT_HELP },
    { "version",        no_argument,       NULL, OPT_VERSION },
    { NULL, 0, NULL, 0 }
};

//
// Main
//
int extendMain(int argc, char** argv)
{
    parseExtendOptions(argc, argv);

    try
    {
        BedRecordVector records = loadBedFile(opt::bedFile);
        writeBedFile(opt::outFile, IntervalExtender::extend(records, opt::bases));
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
void parseExtendOptions(int argc, char** argv)
{
    bool die = false;
    for (char c; (c = getopt_long(argc, argv, shortopts, longopts, NULL)) != -1;)
    {
        std::istringstream arg(optarg != NULL ? optarg : "");
        switch (c)
        {
            case 'b': arg >> opt::bases; break;
            case 'o': arg >> opt::outFile; break;
            case '?': die = true; break;
            case OPT_HELP:
                std::cout << EXTEND_USAGE_MESSAGE;
                exit(EXIT_SUCCESS);
            case OPT_VERSION:
                std::cout << EXTEND_VERSION_MESSAGE;
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
        std::cout << "\n" << EXTEND_USAGE_MESSAGE;
        exit(EXIT_FAILURE);
    }

    opt::bedFile = argv[optind++];
}
