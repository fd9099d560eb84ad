/*
 * File: outputWriter.cpp
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#include "outputWriter.h"
#include "density/kde.hpp"
#include "gzIO.h"
#include "utils.h"

#include <cmath>
#include <map>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace OutputWriter
{
static bool dump(const std::string& filename, const std::string& content, const std::string& desc)
{
    if (skip_existing_output(filename))
        return false;
    if (!dumpFile(filename, content))
        throw std::runtime_error("Failed to write " + desc + " file: " + filename);
    spdlog::info("Success dump {} file:{}", desc, filename);
    return true;
}

static void appendCount(std::ostringstream& oss, const LevelCalls& calls, int value)
{
    oss << '\t';
    if (calls.has_counts)
        oss << value;
    else
        oss << LABEL_NA;
}

std::string formatSummary(const std::vector< BarcodeSummary >& summaries)
{
    std::ostringstream oss;
    oss << "BC";
    for (auto& level : FILTER_LEVELS)
    {
        std::string prefix = filterLevelToString(level);
        oss << '\t' << prefix << ".Genotype\t" << prefix << ".WT.calls\t" << prefix << ".MUT.calls\t" << prefix
            << ".amb.calls\t" << prefix << ".total.calls";
    }
    oss << '\n';

    for (auto& summary : summaries)
    {
        oss << summary.barcode;
        for (auto& calls : summary.levels)
        {
            oss << '\t' << calls.genotype;
            appendCount(oss, calls, calls.wt);
            appendCount(oss, calls, calls.mut);
            appendCount(oss, calls, calls.amb);
            appendCount(oss, calls, calls.total);
        }
        oss << '\n';
    }
    return oss.str();
}

bool writeSummary(const std::string& filename, const std::vector< BarcodeSummary >& summaries)
{
    return dump(filename, formatSummary(summaries), "summary");
}

std::string formatObservations(const std::vector< GenotypeObservation >& observations)
{
    std::ostringstream oss;
    oss << "BC\tUMI\tumi.code\tcall\tnum.WT.in.dups\tnum.MUT.in.dups\tnum.amb.in.dups\ttotal.dups\t"
           "total.dups.wt.mut\texact\tapprox\tin.gex\tgene\tmatch.class\tkeep\n";
    for (auto& obs : observations)
    {
        oss << obs.barcode << '\t' << obs.umi << '\t' << obs.umi_code << '\t' << callToString(obs.call) << '\t'
            << obs.dups.wt << '\t' << obs.dups.mut << '\t' << obs.dups.amb << '\t' << obs.total_dups << '\t'
            << obs.total_dups_wt_mut << '\t' << obs.exact << '\t' << obs.approx << '\t' << obs.in_gex << '\t'
            << (obs.in_gex ? obs.gene_label : LABEL_NA) << '\t' << matchClassToString(obs.match_class) << '\t'
            << obs.keep << '\n';
    }
    return oss.str();
}

bool writeObservations(const std::string& filename, const std::vector< GenotypeObservation >& observations)
{
    return dump(filename, formatObservations(observations), "observation");
}

std::string formatDiagnostic(const std::vector< GenotypeObservation >& observations, const std::string& method,
                             double threshold)
{
    std::ostringstream oss;
    oss << "## threshold=" << threshold << " method=" << method << '\n';
    oss << "match_class\ttotal_dups_wt_mut\tlog10_reads\n";
    for (auto& obs : observations)
    {
        oss << matchClassToString(obs.match_class) << '\t' << obs.total_dups_wt_mut << '\t';
        if (obs.total_dups_wt_mut > 0)
            oss << std::log10(double(obs.total_dups_wt_mut));
        else
            oss << LABEL_NA;
        oss << '\n';
    }
    return oss.str();
}

bool writeDiagnostic(const std::string& filename, const std::vector< GenotypeObservation >& observations,
                     const std::string& method, double threshold)
{
    return dump(filename, formatDiagnostic(observations, method, threshold), "diagnostic");
}

bool writeDensity(const std::string& filename, const KDE& kde)
{
    std::ostringstream oss;
    oss << "## bandwidth=" << kde.get_bandwidth() << '\n';
    oss << "log10_reads\tdensity\n";
    const auto& x = kde.get_x();
    const auto& y = kde.get_density();
    for (size_t i = 0; i < x.size(); ++i)
        oss << x[i] << '\t' << y[i] << '\n';
    return dump(filename, oss.str(), "density");
}

std::string formatMetrics(const RefineMetrics& metrics, const std::vector< BarcodeSummary >& summaries)
{
    std::ostringstream oss;
    oss << "## INPUT METRICS\n"
           "REFERENCE_BARCODES\tTABLE_ROWS\tDROPPED_ROWS\tMOLECULES\tTARGET_MOLECULES\tCOLLAPSED_MOLECULES\n";
    oss << metrics.reference_barcodes << '\t' << metrics.table_rows << '\t' << metrics.dropped_rows << '\t'
        << metrics.molecules << '\t' << metrics.target_molecules << '\t' << metrics.collapsed_molecules << '\n';

    size_t total = metrics.match.exact + metrics.match.approx + metrics.match.other_gene + metrics.match.no_gene;
    oss << "## MATCH METRICS\n"
           "OBSERVATIONS\tEXACT\tAPPROX\tOTHER_GENE\tNO_GENE\tKEPT\n";
    oss << total << '\t' << metrics.match.exact << '\t' << metrics.match.approx << '\t' << metrics.match.other_gene
        << '\t' << metrics.match.no_gene << '\t' << metrics.kept << '\n';

    oss << "## THRESHOLD METRICS\n"
           "METHOD\tTHRESHOLD\n";
    oss << metrics.threshold_method << '\t' << metrics.threshold << '\n';

    oss << "## GENOTYPE METRICS\n"
           "LEVEL\tMUT\tWT\tNA\tNO_DATA\n";
    for (int i = 0; i < FILTER_LEVEL_NUM; ++i)
    {
        std::map< std::string, size_t > counts;
        for (auto& summary : summaries)
            ++counts[summary.levels[i].genotype];
        oss << filterLevelToString(FILTER_LEVELS[i]) << '\t' << counts[LABEL_MUT] << '\t' << counts[LABEL_WT] << '\t'
            << counts[LABEL_NA] << '\t' << counts[LABEL_NO_DATA] << '\n';
    }
    return oss.str();
}

bool writeMetrics(const std::string& filename, const RefineMetrics& metrics,
                  const std::vector< BarcodeSummary >& summaries)
{
    return dump(filename, formatMetrics(metrics, summaries), "metrics");
}

}  // namespace OutputWriter
