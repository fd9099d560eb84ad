/*
 * File: testThreshold.cpp
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

#include "testHelper.h"
#include "threshold.h"

static std::vector< GenotypeObservation > makeReads(const std::vector< int >& reads, MatchClass mc)
{
    std::vector< GenotypeObservation > observations;
    for (auto r : reads)
        observations.push_back(makeObservation("AAAA", "ACGT", GenotypeCall::WT, mc, r, 0));
    return observations;
}

TEST(Quantile, LinearInterpolation)
{
    EXPECT_DOUBLE_EQ(quantile({ 1, 2, 3, 4, 5, 6, 7, 8, 9, 10 }, 0.8), 8.2);
    EXPECT_DOUBLE_EQ(quantile({ 10, 1, 5 }, 0.5), 5);
    EXPECT_DOUBLE_EQ(quantile({ 3 }, 0.8), 3);
    EXPECT_DOUBLE_EQ(quantile({ 1, 2 }, 1.0), 2);
    EXPECT_DOUBLE_EQ(quantile({ 1, 2 }, 0.0), 1);
    EXPECT_TRUE(std::isnan(quantile({}, 0.5)));
}

TEST(QuantileThreshold, UsesOtherGeneOnly)
{
    std::vector< GenotypeObservation > observations =
        makeReads({ 10, 9, 8, 7, 6, 5, 4, 3, 2, 1 }, MatchClass::OTHER_GENE);
    for (auto& obs : makeReads({ 1000, 2000 }, MatchClass::NO_GENE))
        observations.push_back(obs);
    for (auto& obs : makeReads({ 500 }, MatchClass::EXACT))
        observations.push_back(obs);

    QuantileThreshold estimator(0.8);
    EXPECT_DOUBLE_EQ(estimator.estimate(observations), 8.2);
    // Deterministic
    EXPECT_DOUBLE_EQ(estimator.estimate(observations), 8.2);
    EXPECT_EQ(estimator.name(), "quantile");
}

TEST(QuantileThreshold, EmptyInput)
{
    QuantileThreshold estimator(0.8);
    EXPECT_DOUBLE_EQ(estimator.estimate(makeReads({ 5, 6 }, MatchClass::NO_GENE)), 0);
    EXPECT_DOUBLE_EQ(estimator.estimate({}), 0);
}

TEST(BimodalMinimumThreshold, SplitsTwoModes)
{
    std::vector< int > reads;
    for (int i = 0; i < 100; ++i)
    {
        reads.push_back(2);
        reads.push_back(3);
        reads.push_back(4);
        reads.push_back(200);
        reads.push_back(300);
        reads.push_back(400);
    }
    std::vector< GenotypeObservation > observations = makeReads(reads, MatchClass::NO_GENE);
    // OtherGene observations are ignored
    for (auto& obs : makeReads({ 20, 30, 40 }, MatchClass::OTHER_GENE))
        observations.push_back(obs);

    BimodalMinimumThreshold estimator;
    double                  threshold = estimator.estimate(observations);
    EXPECT_GT(threshold, 10);
    EXPECT_LT(threshold, 100);
    EXPECT_TRUE(estimator.hasDensity());
    EXPECT_FALSE(estimator.getDensity().find_local_minima().empty());
    EXPECT_EQ(estimator.name(), "bimodal");

    BimodalMinimumThreshold again;
    EXPECT_DOUBLE_EQ(again.estimate(observations), threshold);
}

TEST(BimodalMinimumThreshold, DegenerateInput)
{
    BimodalMinimumThreshold estimator;
    EXPECT_DOUBLE_EQ(estimator.estimate(makeReads({ 5 }, MatchClass::NO_GENE)), 0);
    EXPECT_FALSE(estimator.hasDensity());
    // Zero reads are not positive
    EXPECT_DOUBLE_EQ(estimator.estimate(makeReads({ 0, 0, 7 }, MatchClass::NO_GENE)), 0);

    // Identical values still give a number
    double threshold = estimator.estimate(makeReads({ 5, 5, 5, 5 }, MatchClass::NO_GENE));
    EXPECT_TRUE(std::isfinite(threshold));
    EXPECT_TRUE(estimator.hasDensity());
}

TEST(ThresholdEstimator, Factory)
{
    EXPECT_EQ(parseThresholdMethod("quantile"), ThresholdMethod::QUANTILE);
    EXPECT_EQ(parseThresholdMethod("bimodal"), ThresholdMethod::BIMODAL);
    EXPECT_THROW(parseThresholdMethod("otsu"), std::invalid_argument);
    EXPECT_EQ(makeThresholdEstimator(ThresholdMethod::QUANTILE, 0.5)->name(), "quantile");
    EXPECT_EQ(makeThresholdEstimator(ThresholdMethod::BIMODAL, 0.5)->name(), "bimodal");
}
