//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// poverlap - Main driver program for the interval
// overlap permutation tests
//
#include <string>
#include <iostream>
#include "config.h"
#include "overlap-test.h"
#include "fixle.h"
#include "bed-sample.h"
#include "distance-shuffle.h"
#include "extend.h"

#define PROGRAM_BIN "poverlap"

static const char *POVERLAP_VERSION_MESSAGE =
"Permutation tests of interval overlap (poverlap) Version " PACKAGE_VERSION "\n"
"Written by " PACKAGE_AUTHOR ".\n"
"\n"
"Copyright 2026 " PACKAGE_AUTHOR "\n";

static const char *POVERLAP_USAGE_MESSAGE =
"Program: " PACKAGE_NAME "\n"
"Version: " PACKAGE_VERSION "\n"
"Contact: " PACKAGE_BUGREPORT "\n"
"Usage: " PROGRAM_BIN " <command> [options]\n\n"
"Commands:\n"
"           poverlap                 test whether two interval sets overlap more than expected by chance\n"
"           fixle                    test the overlap of two types of a labeled interval set by swapping labels\n"
"\n\nUtility commands:\n"
"           bed-sample               choose random lines from a BED file using reservoir sampling\n"
"           distance-shuffle         move each interval of a BED file within a distance of its location\n"
"           extend                   pad each interval of a BED file by a number of bases\n"
"\nReport bugs to " PACKAGE_BUGREPORT "\n\n";

int main(int argc, char** argv)
{
    if(argc <= 1)
    {
        std::cout << POVERLAP_USAGE_MESSAGE;
        return 0;
    }
    else
    {
        std::string command(argv[1]);
        if(command == "help" || command == "--help")
        {
            std::cout << POVERLAP_USAGE_MESSAGE;
            return 0;
        }
        else if(command == "version" || command == "--version")
        {
            std::cout << POVERLAP_VERSION_MESSAGE;
            return 0;
        }

        if(command == "poverlap")
            poverlapMain(argc - 1, argv + 1);
        else if(command == "fixle")
            fixleMain(argc - 1, argv + 1);
        else if(command == "bed-sample")
            bedSampleMain(argc - 1, argv + 1);
        else if(command == "distance-shuffle")
            distanceShuffleMain(argc - 1, argv + 1);
        else if(command == "extend")
            extendMain(argc - 1, argv + 1);
        else
        {
            std::cerr << "Unrecognized command: " << command << "\n";
            return 1;
        }
    }

    return 0;
}
