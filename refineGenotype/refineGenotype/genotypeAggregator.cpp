/*
 * File: genotypeAggregator.cpp
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#include "genotypeAggregator.h"
#include "timer.h"

#include <unordered_set>

#include <spdlog/spdlog.h>

std::string filterLevelToString(FilterLevel level)
{
    switch (level)
    {
    case FilterLevel::UNFILTERED:
        return "unfiltered";
    case FilterLevel::GENE_FILTERED:
        return "gene_filtered";
    default:
        return "threshold_filtered";
    }
}

bool keepObservation(const GenotypeObservation& obs, FilterLevel level, double threshold)
{
    if (level == FilterLevel::UNFILTERED)
        return true;
    switch (obs.match_class)
    {
    case MatchClass::EXACT:
    case MatchClass::APPROX:
        return true;
    case MatchClass::OTHER_GENE:
        return false;
    default:
        // NoGene observations are dropped only by the read-support threshold
        if (level == FilterLevel::GENE_FILTERED)
            return true;
        return obs.total_dups_wt_mut > threshold;
    }
}

std::string GenotypeAggregator::deriveLabel(int wt, int mut, int total)
{
    if (total == 0)
        return LABEL_NO_DATA;
    if (mut > 0)
        return LABEL_MUT;
    if (wt >= 1)
        return LABEL_WT;
    return LABEL_NA;
}

LevelTable GenotypeAggregator::aggregate(const std::vector< GenotypeObservation >& observations,
                                         FilterLevel                               level) const
{
    LevelTable table;
    for (auto& obs : observations)
    {
        // Every barcode of the table has counts, even if all observations are dropped
        LevelCalls& calls = table[obs.barcode];
        calls.has_counts  = true;
        if (!keepObservation(obs, level, threshold))
            continue;
        switch (obs.call)
        {
        case GenotypeCall::WT:
            ++calls.wt;
            break;
        case GenotypeCall::MUT:
            ++calls.mut;
            break;
        default:
            ++calls.amb;
            break;
        }
        ++calls.total;
    }
    for (auto& [barcode, calls] : table)
        calls.genotype = deriveLabel(calls.wt, calls.mut, calls.total);
    return table;
}

std::vector< BarcodeSummary > GenotypeAggregator::summarize(const std::vector< std::string >&         reference_barcodes,
                                                            const std::vector< GenotypeObservation >& observations) const
{
    Timer      timer;
    LevelTable tables[FILTER_LEVEL_NUM];
    for (int i = 0; i < FILTER_LEVEL_NUM; ++i)
        tables[i] = aggregate(observations, FILTER_LEVELS[i]);

    std::vector< BarcodeSummary > res;
    res.reserve(reference_barcodes.size());
    std::unordered_set< std::string > reference_set;
    for (auto& barcode : reference_barcodes)
    {
        reference_set.insert(barcode);
        BarcodeSummary summary;
        summary.barcode = barcode;
        for (int i = 0; i < FILTER_LEVEL_NUM; ++i)
        {
            auto it = tables[i].find(barcode);
            if (it != tables[i].end())
                summary.levels[i] = it->second;
        }
        res.push_back(std::move(summary));
    }

    size_t missing = 0;
    for (auto& p : tables[0])
        if (reference_set.count(p.first) == 0)
            ++missing;
    if (missing != 0)
        spdlog::warn("Barcodes of genotyping table not in reference barcodes:{}", missing);

    spdlog::info("Summarize reference barcodes:{} genotyped barcodes:{} time(s):{:.2f}", res.size(),
                 tables[0].size(), timer.toc(1000));
    return res;
}

void GenotypeAggregator::markKept(std::vector< GenotypeObservation >& observations) const
{
    for (auto& obs : observations)
        obs.keep = keepObservation(obs, FilterLevel::THRESHOLD_FILTERED, threshold);
}
