/*
 * File: testUtils.cpp
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#include <gtest/gtest.h>

#include <stdexcept>

#include "gzIO.h"
#include "testHelper.h"
#include "timer.h"
#include "utils.h"

TEST(Utils, SplitString)
{
    EXPECT_EQ(split_str("a;b;;c", ';'), (vector< string >{ "a", "b", "c" }));
    EXPECT_EQ(split_str("a;b;;c", ';', false), (vector< string >{ "a", "b", "", "c" }));
    EXPECT_EQ(split_str("a\tb\t", '\t', false), (vector< string >{ "a", "b", "" }));
    EXPECT_TRUE(split_str("", ';', false).empty());
}

TEST(Utils, StripSuffix)
{
    EXPECT_EQ(strip_suffix("AAACCTGAGAAGGCCT-1", '-'), "AAACCTGAGAAGGCCT");
    EXPECT_EQ(strip_suffix("AAACCTGAGAAGGCCT", '-'), "AAACCTGAGAAGGCCT");
    EXPECT_EQ(strip_suffix("A-B-2", '-'), "A-B");
}

TEST(Utils, LoadBarcodes)
{
    TempDir     dir("load_barcodes");
    std::string filename = dir.write("barcodes.tsv", "CCCC-1\nAAAA-1\r\n\nCCCC-2\nGGGG");
    vector< string > barcodes = load_barcodes(filename, '-');
    EXPECT_EQ(barcodes, (vector< string >{ "CCCC", "AAAA", "GGGG" }));
}

TEST(Utils, LoadGzipBarcodes)
{
    TempDir     dir("load_barcodes_gz");
    std::string filename = dir.file("barcodes.tsv.gz");
    ASSERT_TRUE(dumpFile(filename, "AAAA-1\nCCCC-1\n"));
    EXPECT_EQ(load_barcodes(filename, '-'), (vector< string >{ "AAAA", "CCCC" }));
    EXPECT_THROW(load_barcodes(dir.file("not_exists.tsv"), '-'), std::runtime_error);
}

TEST(Utils, LongLine)
{
    TempDir     dir("long_line");
    std::string line(300000, 'A');
    std::string filename = dir.write("long.txt", line + "\nshort\n");
    GzLineReader reader(filename);
    std::string  l;
    ASSERT_TRUE(reader.next(l));
    EXPECT_EQ(l.size(), line.size());
    ASSERT_TRUE(reader.next(l));
    EXPECT_EQ(l, "short");
    EXPECT_FALSE(reader.next(l));
}

TEST(Utils, SkipExistingOutput)
{
    TempDir dir("skip_existing");
    EXPECT_FALSE(skip_existing_output(dir.file("new.tsv")));
    EXPECT_TRUE(skip_existing_output(dir.write("old.tsv", "x")));
}

TEST(Utils, Timer)
{
    Timer timer;
    EXPECT_GE(timer.toc(), 0.0);
    EXPECT_GE(timer.total(1000), 0.0);
}
