/*
 * File: refineGenotype.h
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#pragma once

#include <string>
using std::string;
#include <filesystem>  // C++17 only
#include <vector>
namespace fs = std::filesystem;

#include "outputWriter.h"
#include "threshold.h"

struct UmiConfig
{
    size_t umi_len;   // length of umi in molecule info
    int    max_dist;  // the maximum edit distance of approximate matching
};

struct ThresholdConfig
{
    ThresholdMethod method;
    double          quantile_p;  // used by quantile method
};

struct TableConfig
{
    char                       list_sep;          // separator of per-molecule lists
    char                       suffix_sep;        // separator of barcode suffix, e.g. '-' of "-1"
    std::vector< std::string > antibody_markers;  // substrings of antibody feature names
};

// Output filenames under the output directory
static const char SUMMARY_FILE[]     = "genotype_summary.tsv.gz";
static const char OBSERVATION_FILE[] = "umi_observations.tsv.gz";
static const char DIAGNOSTIC_FILE[]  = "read_support.tsv";
static const char DENSITY_FILE[]     = "read_support_density.tsv";
static const char METRICS_FILE[]     = "metrics.txt";

class RefineGenotype
{
public:
    RefineGenotype(string barcode_filename_, string molecule_filename_, string genotype_filename_, string out_path_,
                   string target_gene_)
        : barcode_filename(barcode_filename_), molecule_filename(molecule_filename_),
          genotype_filename(genotype_filename_), out_path(out_path_), target_gene(target_gene_),
          umi_config{ 12, 2 }, threshold_config{ ThresholdMethod::QUANTILE, 0.8 }, table_config{ ';', '-', { "TotalSeq" } },
          cpu_cores(1)
    {
    }

    int doWork();

    int createPath();

    void setUmiConfig(int umi_len, int max_dist);
    void setThresholdConfig(const std::string& method, double quantile_p);
    void setTableConfig(char list_sep, char suffix_sep, const std::vector< std::string >& antibody_markers);
    void setExtraConfig(int cores);

    fs::path outputFile(const char* name) const
    {
        return out_path / name;
    }

private:
    string   barcode_filename;
    string   molecule_filename;
    string   genotype_filename;
    fs::path out_path;
    string   target_gene;

    UmiConfig       umi_config;
    ThresholdConfig threshold_config;
    TableConfig     table_config;

    int cpu_cores;

    RefineMetrics metrics;
};
