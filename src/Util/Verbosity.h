///----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL
//-----------------------------------------------
//
// Verbosity - Singleton object holding the verbosity
// level for the entire program, and the printer for
// the "[poverlap::component]" progress lines that
// are written to stderr at or above a level.
//
#ifndef VERBOSITY_H
#define VERBOSITY_H

#include <stdio.h>
#include <stdarg.h>
#include "config.h"

enum VerbosityLevel
{
    VL_QUIET = 0,    // results and filter summaries only
    VL_PROGRESS,     // progress and timings
    VL_DEBUG
};

class Verbosity
{
    public:

        // Get singleton object
        static Verbosity& Instance()
        {
            static Verbosity instance;
            return instance;
        }

        static bool isEnabled(int level)
        {
            return Instance().m_level >= level;
        }

        // Print a progress line tagged with the component name
        static void log(int level, const char* component, const char* format, ...)
        {
            if(!isEnabled(level))
                return;

            va_list args;
            va_start(args, format);
            fprintf(stderr, "[%s::%s] ", PACKAGE_NAME, component);
            vfprintf(stderr, format, args);
            fputc('\n', stderr);
            va_end(args);
        }

        int getPrintLevel() const { return m_level; }
        void setPrintLevel(int l) { m_level = l; }

    private:
        Verbosity() : m_level(VL_QUIET) {}
        int m_level;
};

#endif
