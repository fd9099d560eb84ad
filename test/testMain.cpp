/*
 * File: testMain.cpp
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#include <gtest/gtest.h>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);

    // Same named loggers as the command line tool, but nothing is written
    auto sink = std::make_shared< spdlog::sinks::null_sink_mt >();
    spdlog::register_logger(std::make_shared< spdlog::logger >("main", sink));
    spdlog::register_logger(std::make_shared< spdlog::logger >("gex", sink));
    auto process_logger = std::make_shared< spdlog::logger >("process", sink);
    spdlog::register_logger(process_logger);
    spdlog::set_default_logger(process_logger);

    return RUN_ALL_TESTS();
}
