/*
 * File: threshold.h
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "density/kde.hpp"
#include "genotypeTable.h"

enum class ThresholdMethod
{
    QUANTILE,
    BIMODAL
};

// Parse "quantile" or "bimodal", throw std::invalid_argument otherwise.
ThresholdMethod parseThresholdMethod(const std::string& s);
std::string     thresholdMethodToString(ThresholdMethod method);

// Read-support cutoff on total_dups_wt_mut of classified observations.
class ThresholdEstimator
{
public:
    virtual ~ThresholdEstimator() {}

    virtual double      estimate(const std::vector< GenotypeObservation >& observations) = 0;
    virtual std::string name() const                                                   = 0;
};

// p-th quantile of the OtherGene observations.
class QuantileThreshold : public ThresholdEstimator
{
public:
    explicit QuantileThreshold(double p_ = 0.8) : p(p_) {}

    double      estimate(const std::vector< GenotypeObservation >& observations) override;
    std::string name() const override
    {
        return "quantile";
    }

private:
    double p;
};

/**
 * Local minimum of the density of log10(total_dups_wt_mut) of the NoGene observations,
 * searched inside [lo, hi] of log10 scale. The threshold is 10^minimum.
 */
class BimodalMinimumThreshold : public ThresholdEstimator
{
public:
    BimodalMinimumThreshold(double lo_ = 0, double hi_ = 3) : lo(lo_), hi(hi_), fitted(false) {}

    double      estimate(const std::vector< GenotypeObservation >& observations) override;
    std::string name() const override
    {
        return "bimodal";
    }

    // The density curve of the last estimate, empty if it failed.
    bool hasDensity() const
    {
        return fitted;
    }
    const KDE& getDensity() const
    {
        return kde;
    }

private:
    double lo, hi;
    KDE    kde;
    bool   fitted;
};

std::unique_ptr< ThresholdEstimator > makeThresholdEstimator(ThresholdMethod method, double quantile_p);
