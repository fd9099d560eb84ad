/*
 * File: refineGenotype.cpp
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#include <functional>
#include <future>
#include <stdexcept>
#include <string>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "genotypeAggregator.h"
#include "genotypeTable.h"
#include "matchClassifier.h"
#include "moleculeInfo.h"
#include "refineGenotype.h"
#include "threadpool.h"
#include "timer.h"
#include "umiCodec.h"
#include "utils.h"

// Load molecule info and resolve the records of barcodes in the genotyping table
static size_t loadMolecules(const std::string& filename, const std::unordered_set< std::string >* barcodes,
                            MoleculeIndex* index)
{
    MoleculeArchive archive = MoleculeInfoReader::load(filename);
    index->build(archive, *barcodes);
    return archive.umi.size();
}

int RefineGenotype::doWork()
{
    if (createPath() != 0)
        return -2;

    spdlog::info("Using threads num:{}", cpu_cores);
    Timer total_timer;

    std::vector< std::string > reference_barcodes = load_barcodes(barcode_filename, table_config.suffix_sep);
    metrics.reference_barcodes                    = reference_barcodes.size();

    GenotypeTable table(umi_config.umi_len, table_config.list_sep);
    table.load(genotype_filename);
    metrics.table_rows                               = table.getRows().size();
    metrics.dropped_rows                             = table.droppedRows();
    std::unordered_set< std::string > table_barcodes = table.getBarcodes();

    // The index outlives the pool which fills it
    MoleculeIndex index(target_gene, umi_config.umi_len, table_config.antibody_markers);

    // Using theadpool to accelerate process
    std::threadpool executor{ static_cast< unsigned short >(cpu_cores) };

    // Load molecule info while expanding the genotyping table
    std::future< size_t > molecule_result =
        executor.commit(std::bind(loadMolecules, molecule_filename, &table_barcodes, &index));
    std::vector< GenotypeObservation > observations = table.expand();
    metrics.molecules                               = molecule_result.get();
    spdlog::info("Load inputs time(s):{:.2f}", total_timer.toc(1000));

    TargetGeneSet  target_set      = index.targetGeneSet(target_gene);
    CollapsedIndex collapsed_index = index.collapsedIndex(table_barcodes);
    metrics.target_molecules       = target_set.size();
    for (auto& p : collapsed_index)
        metrics.collapsed_molecules += p.second.size();
    spdlog::debug("Index max memory(KB):{}", physical_memory_used_by_process());

    MatchClassifier classifier(target_set, collapsed_index, target_gene, umi_config.max_dist);
    metrics.match = classifier.classify(observations, cpu_cores);

    auto   estimator         = makeThresholdEstimator(threshold_config.method, threshold_config.quantile_p);
    double threshold         = estimator->estimate(observations);
    metrics.threshold_method = estimator->name();
    metrics.threshold        = threshold;

    GenotypeAggregator aggregator(threshold);
    aggregator.markKept(observations);
    for (auto& obs : observations)
        metrics.kept += obs.keep;
    std::vector< BarcodeSummary > summaries = aggregator.summarize(reference_barcodes, observations);
    spdlog::info("Classify and summarize time(s):{:.2f}", total_timer.toc(1000));

    // Dump all outputs to disk, the existing files are kept
    OutputWriter::writeSummary(outputFile(SUMMARY_FILE).string(), summaries);
    OutputWriter::writeObservations(outputFile(OBSERVATION_FILE).string(), observations);
    OutputWriter::writeDiagnostic(outputFile(DIAGNOSTIC_FILE).string(), observations, estimator->name(), threshold);
    if (threshold_config.method == ThresholdMethod::BIMODAL)
    {
        auto bimodal = static_cast< BimodalMinimumThreshold* >(estimator.get());
        if (bimodal->hasDensity())
            OutputWriter::writeDensity(outputFile(DENSITY_FILE).string(), bimodal->getDensity());
    }
    OutputWriter::writeMetrics(outputFile(METRICS_FILE).string(), metrics, summaries);

    spdlog::debug("Process max memory(KB):{}", physical_memory_used_by_process());
    spdlog::info("Dump outputs time(s):{:.2f}", total_timer.toc(1000));
    spdlog::debug("Finish doWork");
    return 0;
}

int RefineGenotype::createPath()
{
    std::error_code ec;
    if (!fs::exists(out_path) && !fs::create_directories(out_path, ec))
    {
        spdlog::error("Failed create directories:{} error:{}", out_path.string(), ec.message());
        return -1;
    }
    return 0;
}

void RefineGenotype::setUmiConfig(int umi_len, int max_dist)
{
    if (umi_len <= 0 || size_t(umi_len) > MAX_UMI_LEN)
        throw std::invalid_argument("Invalid umi length: " + std::to_string(umi_len));
    umi_config.umi_len  = umi_len;
    umi_config.max_dist = max_dist;
}

void RefineGenotype::setThresholdConfig(const std::string& method, double quantile_p)
{
    threshold_config.method     = parseThresholdMethod(method);
    threshold_config.quantile_p = quantile_p;
}

void RefineGenotype::setTableConfig(char list_sep, char suffix_sep, const std::vector< std::string >& antibody_markers)
{
    table_config.list_sep         = list_sep;
    table_config.suffix_sep       = suffix_sep;
    table_config.antibody_markers = antibody_markers;
}

void RefineGenotype::setExtraConfig(int cores)
{
    cpu_cores = cores < 1 ? 1 : cores;
}
