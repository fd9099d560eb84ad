/*
 * File: main.cpp
 * Created Data: 2020-5-12
 * Author: fxzhao
 * Contact: <zhaofuxiang@genomics.cn>
 *
 * Copyright (c) 2020 BGI-Research
 */

#include "refineGenotype.h"
#include "timer.h"
#include "utils.h"

#include <ctime>

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
namespace fs = std::filesystem;

#include <CLI/CLI.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

static const std::string version = "1.0.0";

int main(int argc, char** argv)
{
    Timer timer;
    // Parse the command line parameters.
    CLI::App app{ "RefineGenotype: refine the genotype calls of cell barcodes by the umis "
                  "observed in gene expression library." };
    app.footer("RefineGenotype version: " + version);
    app.get_formatter()->column_width(40);

    string barcode_file, molecule_file, genotype_file, out_path, target_gene;
    // Required parameters
    app.add_option("-B,-b", barcode_file, "Input reference barcodes filename")->check(CLI::ExistingFile)->required();
    app.add_option("-M,-m", molecule_file, "Input molecule info filename(h5)")->check(CLI::ExistingFile)->required();
    app.add_option("-G,-g", genotype_file, "Input genotyping summary table filename")
        ->check(CLI::ExistingFile)
        ->required();
    app.add_option("-O,-o", out_path, "Output directory")->required();
    app.add_option("-T,-t", target_gene, "Target gene symbol, e.g. CALR")->required();
    // Optional parameters
    int umi_len = 12;
    app.add_option("--umi_len", umi_len, "Length of umi in molecule info, default 12")->check(CLI::Range(1, 32));
    int max_dist = 2;
    app.add_option("--max_dist", max_dist, "Maximum edit distance of approximate matching, default 2")
        ->check(CLI::NonNegativeNumber);
    std::string threshold_method = "quantile";
    app.add_option("--threshold_method", threshold_method, "Read support threshold method, default quantile")
        ->check(CLI::IsMember({ "quantile", "bimodal" }));
    double quantile_p = 0.8;
    app.add_option("--quantile", quantile_p, "Quantile of OtherGene reads for quantile method, default 0.8")
        ->check(CLI::Range(0.0, 1.0));
    auto single_char = CLI::Validator(
        [](std::string& s) { return s.size() == 1 ? std::string() : "Expect one character: " + s; }, "CHAR");
    std::string list_sep = ";";
    app.add_option("--list_sep", list_sep, "Separator of per-umi lists in genotyping table, default ';'")
        ->check(single_char);
    std::string suffix_sep = "-";
    app.add_option("--suffix_sep", suffix_sep, "Separator of barcode suffix in reference barcodes, default '-'")
        ->check(single_char);
    std::vector< std::string > antibody_markers{ "TotalSeq" };
    app.add_option("--antibody_markers", antibody_markers, "Substrings of antibody feature names, default TotalSeq")
        ->delimiter(',');
    int cpu_cores = std::thread::hardware_concurrency();
    app.add_option("-C,-c", cpu_cores, "Set cpu cores, default detect")->check(CLI::PositiveNumber);
    std::string log_level = "info";
    app.add_option("--log_level", log_level, "Log level, default info")
        ->check(CLI::IsMember({ "trace", "debug", "info", "warn", "error" }));

    CLI11_PARSE(app, argc, argv);

    // Set the default logger to file logger.
    std::time_t        t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::ostringstream ostr;
    ostr << "RefineGenotype_" << std::put_time(std::localtime(&t), "%Y%m%d_%H%M%S") << ".log";
    fs::path log_file = fs::path(out_path) / "logs" / ostr.str();
    try
    {
        auto file_sink      = std::make_shared< spdlog::sinks::basic_file_sink_mt >(log_file.string());
        auto main_logger    = std::make_shared< spdlog::logger >("main", file_sink);
        auto gex_logger     = std::make_shared< spdlog::logger >("gex", file_sink);
        auto process_logger = std::make_shared< spdlog::logger >("process", file_sink);
        spdlog::register_logger(main_logger);
        spdlog::register_logger(gex_logger);
        spdlog::register_logger(process_logger);
        spdlog::set_default_logger(process_logger);
    }
    catch (const spdlog::spdlog_ex& ex)
    {
        std::cerr << "Log init failed: " << ex.what() << std::endl;
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(log_level));  // Set global log level.
    spdlog::flush_on(spdlog::level::info);
    spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e %L %n: %v");

    std::string markers;
    for (auto& m : antibody_markers)
        markers += (markers.empty() ? "" : ",") + m;
    spdlog::get("main")->info("{} BARCODES={} MOLECULE_INFO={} GENOTYPE_TABLE={} OUTPUT={} TARGET_GENE={} UMI_LEN={} "
                              "MAX_DIST={} THRESHOLD_METHOD={} QUANTILE={} LIST_SEP={} SUFFIX_SEP={} "
                              "ANTIBODY_MARKERS={} CPU_CORES={}",
                              argv[0], barcode_file, molecule_file, genotype_file, out_path, target_gene, umi_len,
                              max_dist, threshold_method, quantile_p, list_sep, suffix_sep,
                              markers, cpu_cores);

    int ret = 0;
    try
    {
        RefineGenotype refineGenotype(barcode_file, molecule_file, genotype_file, out_path, target_gene);
        refineGenotype.setUmiConfig(umi_len, max_dist);
        refineGenotype.setThresholdConfig(threshold_method, quantile_p);
        refineGenotype.setTableConfig(list_sep[0], suffix_sep[0], antibody_markers);
        refineGenotype.setExtraConfig(cpu_cores);
        ret = refineGenotype.doWork();
    }
    catch (const std::exception& e)
    {
        spdlog::error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        ret = 1;
    }

    spdlog::get("main")->info("RefineGenotype done. Elapsed time(s):{:.2f}", timer.total(1000));

    return ret == 0 ? 0 : 1;
}
