/*
 * File: threshold.cpp
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#include "threshold.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <spdlog/spdlog.h>

ThresholdMethod parseThresholdMethod(const std::string& s)
{
    if (s == "quantile")
        return ThresholdMethod::QUANTILE;
    if (s == "bimodal")
        return ThresholdMethod::BIMODAL;
    throw std::invalid_argument("Unknown threshold method: " + s);
}

std::string thresholdMethodToString(ThresholdMethod method)
{
    return method == ThresholdMethod::QUANTILE ? "quantile" : "bimodal";
}

static std::vector< double > collectValues(const std::vector< GenotypeObservation >& observations, MatchClass mc)
{
    std::vector< double > values;
    for (auto& obs : observations)
        if (obs.match_class == mc)
            values.push_back(obs.total_dups_wt_mut);
    return values;
}

double QuantileThreshold::estimate(const std::vector< GenotypeObservation >& observations)
{
    std::vector< double > values = collectValues(observations, MatchClass::OTHER_GENE);
    if (values.empty())
    {
        spdlog::warn("No OtherGene observations for quantile threshold, use threshold 0");
        return 0;
    }
    double threshold = quantile(values, p);
    spdlog::info("Quantile threshold p:{} values:{} threshold:{}", p, values.size(), threshold);
    return threshold;
}

double BimodalMinimumThreshold::estimate(const std::vector< GenotypeObservation >& observations)
{
    fitted                       = false;
    std::vector< double > values = collectValues(observations, MatchClass::NO_GENE);
    if (!kde.run(values))
    {
        spdlog::warn("Less than 2 positive NoGene observations for bimodal threshold, use threshold 0");
        return 0;
    }
    fitted = true;

    if (kde.find_local_minima().empty())
        spdlog::warn("Density of NoGene observations has no local minimum, the threshold may be meaningless");

    double x = kde.local_minimum(lo, hi);
    if (std::isnan(x))
    {
        spdlog::warn("Density range [{},{}] does not overlap [{},{}], use threshold 0", kde.get_x().front(),
                     kde.get_x().back(), lo, hi);
        return 0;
    }

    double threshold = std::pow(10.0, x);
    if (x < kde.get_min() || x > kde.get_max())
        spdlog::warn("Bimodal threshold:{} is outside the observed range [{},{}]", threshold,
                     std::pow(10.0, kde.get_min()), std::pow(10.0, kde.get_max()));
    spdlog::info("Bimodal threshold values:{} bandwidth:{} log10 minimum:{} threshold:{}", values.size(),
                 kde.get_bandwidth(), x, threshold);
    return threshold;
}

std::unique_ptr< ThresholdEstimator > makeThresholdEstimator(ThresholdMethod method, double quantile_p)
{
    if (method == ThresholdMethod::BIMODAL)
        return std::unique_ptr< ThresholdEstimator >(new BimodalMinimumThreshold());
    return std::unique_ptr< ThresholdEstimator >(new QuantileThreshold(quantile_p));
}
