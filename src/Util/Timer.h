//-----------------------------------------------
// Copyright 2026 The poverlap authors
// Released under the GPL license
//-----------------------------------------------
//
// Timer - Measures the lifetime of a scope. On destruction
// the wall clock and CPU time are reported as a
// "[poverlap::timer]" line when progress output is on.
//
#ifndef TIMER_H
#define TIMER_H

#include <string>
#include <time.h>
#include <sys/time.h>
#include "Verbosity.h"

class Timer
{
    public:
        Timer(const std::string& desc, bool silent = false) : m_desc(desc), m_silent(silent)
        {
            reset();
        }

        ~Timer()
        {
            if(!m_silent)
                Verbosity::log(VL_PROGRESS, "timer", "%s wall clock: %.2lfs CPU: %.2lfs", m_desc.c_str(), getElapsedWallTime(), getElapsedCPUTime());
        }

        double getElapsedWallTime() const
        {
            timeval now;
            gettimeofday(&now, NULL);
            return (now.tv_sec - m_wallStart.tv_sec) + (double(now.tv_usec - m_wallStart.tv_usec) / 1000000);
        }

        // CPU time of the process, summed over all worker threads
        double getElapsedCPUTime() const
        {
            return (double)(clock() - m_cpuStart) / CLOCKS_PER_SEC;
        }

        void reset()
        {
            gettimeofday(&m_wallStart, NULL);
            m_cpuStart = clock();
        }

    private:
        std::string m_desc;
        bool m_silent;
        timeval m_wallStart;
        clock_t m_cpuStart;
};

#endif
