/*
 * File: outputWriter.h
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#pragma once

#include <string>
#include <vector>

#include "genotypeAggregator.h"
#include "genotypeTable.h"
#include "matchClassifier.h"

class KDE;

struct RefineMetrics
{
    RefineMetrics()
        : reference_barcodes(0), table_rows(0), dropped_rows(0), molecules(0), target_molecules(0),
          collapsed_molecules(0), threshold(0), kept(0)
    {
    }
    size_t       reference_barcodes;
    size_t       table_rows;
    size_t       dropped_rows;
    size_t       molecules;
    size_t       target_molecules;
    size_t       collapsed_molecules;
    MatchMetrics match;
    std::string  threshold_method;
    double       threshold;
    size_t       kept;
};

// Every writer returns false if the file already exists and is skipped,
// and throws std::runtime_error if the file failed to write.
namespace OutputWriter
{
// Tab-separated summary of each reference barcode, null counts are written as "NA".
std::string formatSummary(const std::vector< BarcodeSummary >& summaries);
bool        writeSummary(const std::string& filename, const std::vector< BarcodeSummary >& summaries);

// One row per classified observation.
std::string formatObservations(const std::vector< GenotypeObservation >& observations);
bool        writeObservations(const std::string& filename, const std::vector< GenotypeObservation >& observations);

// Data behind the read-support chart, the first line records the threshold.
std::string formatDiagnostic(const std::vector< GenotypeObservation >& observations, const std::string& method,
                             double threshold);
bool        writeDiagnostic(const std::string& filename, const std::vector< GenotypeObservation >& observations,
                            const std::string& method, double threshold);

bool writeDensity(const std::string& filename, const KDE& kde);

std::string formatMetrics(const RefineMetrics& metrics, const std::vector< BarcodeSummary >& summaries);
bool        writeMetrics(const std::string& filename, const RefineMetrics& metrics,
                         const std::vector< BarcodeSummary >& summaries);
}  // namespace OutputWriter
