/*
 * File: timer.h
 * Created Data: 2020-5-12
 * Author: fxzhao
 * Contact: <zhaofuxiang@genomics.cn>
 *
 * Copyright (c) 2020 BGI-Research
 */

#pragma once

#include <chrono>

// Phase timer. toc() returns the time of the current phase and starts the next one,
// total() returns the time since construction.
class Timer
{
public:
    Timer() : start(clock::now()), last(start) {}

    void tic()
    {
        last = clock::now();
    }

    // Set div as default 1, the time unit is millisecond.
    // If set div as 1000, the time unit is second
    double toc(int div = 1)
    {
        auto   now      = clock::now();
        double duration = elapsed(last, now, div);
        last            = now;
        return duration;
    }

    double total(int div = 1) const
    {
        return elapsed(start, clock::now(), div);
    }

private:
    typedef std::chrono::steady_clock clock;
    typedef std::chrono::microseconds res;

    static double elapsed(clock::time_point t1, clock::time_point t2, int div)
    {
        double duration = std::chrono::duration_cast< res >(t2 - t1).count() / 1e3;
        duration /= div;
        if (duration < 0.01)
            duration = 0.0;
        return duration;
    }

    clock::time_point start;
    clock::time_point last;
};
