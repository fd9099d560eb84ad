/*
 * File: genotypeAggregator.h
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "genotypeTable.h"

enum class FilterLevel
{
    UNFILTERED,
    GENE_FILTERED,
    THRESHOLD_FILTERED
};

static const int FILTER_LEVEL_NUM = 3;

static const FilterLevel FILTER_LEVELS[FILTER_LEVEL_NUM] = { FilterLevel::UNFILTERED, FilterLevel::GENE_FILTERED,
                                                             FilterLevel::THRESHOLD_FILTERED };

std::string filterLevelToString(FilterLevel level);

// Genotype labels
static const std::string LABEL_NO_DATA = "No Data";
static const std::string LABEL_MUT     = "MUT";
static const std::string LABEL_WT      = "WT";
static const std::string LABEL_NA      = "NA";

// Keep rule of one observation under the filter level
bool keepObservation(const GenotypeObservation& obs, FilterLevel level, double threshold);

// Calls of one barcode under one filter level
struct LevelCalls
{
    LevelCalls() : genotype(LABEL_NO_DATA), has_counts(false), wt(0), mut(0), amb(0), total(0) {}

    std::string genotype;
    bool        has_counts;  // false means the barcode is absent from the genotyping table
    int         wt;
    int         mut;
    int         amb;
    int         total;
};

struct BarcodeSummary
{
    std::string barcode;
    LevelCalls  levels[FILTER_LEVEL_NUM];
};

// {barcode: calls} of one filter level
using LevelTable = std::unordered_map< std::string, LevelCalls >;

class GenotypeAggregator
{
public:
    explicit GenotypeAggregator(double threshold_) : threshold(threshold_) {}

    // Recount the calls of each barcode over the kept observations.
    LevelTable aggregate(const std::vector< GenotypeObservation >& observations, FilterLevel level) const;

    // One summary per reference barcode, in the order of reference_barcodes.
    std::vector< BarcodeSummary > summarize(const std::vector< std::string >&         reference_barcodes,
                                            const std::vector< GenotypeObservation >& observations) const;

    // Set keep flag of each observation with the full keep rule.
    void markKept(std::vector< GenotypeObservation >& observations) const;

    static std::string deriveLabel(int wt, int mut, int total);

private:
    double threshold;
};
