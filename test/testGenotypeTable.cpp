/*
 * File: testGenotypeTable.cpp
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#include <gtest/gtest.h>

#include "genotypeException.h"
#include "genotypeTable.h"
#include "testHelper.h"

static const std::string HEADER =
    "BC\tUMI\tWT.calls\tMUT.calls\tamb.calls\tcall.in.dups\tnum.WT.in.dups\tnum.MUT.in.dups\tnum.amb.in.dups\n";

TEST(GenotypeTable, ExpandRows)
{
    TempDir     dir("genotype_table");
    std::string filename = dir.write("genotype.tsv", HEADER
                                                         + "AAAA\tACGT;ACGA\t1\t1\t0\tWT;MUT\t3;0\t0;2\t1;0\n"
                                                           "BBBB\tTTTT;GGGG;CCCC\t1\t0\t2\tWT;amb;AMB\t2;1;0\t0;0;1\t0;4;3\n");
    GenotypeTable table(4);
    table.load(filename);
    ASSERT_EQ(table.getRows().size(), 2u);

    std::vector< GenotypeObservation > observations = table.expand();
    ASSERT_EQ(observations.size(), 5u);

    const GenotypeObservation& first = observations[0];
    EXPECT_EQ(first.barcode, "AAAA");
    EXPECT_EQ(first.umi, "ACGT");
    EXPECT_EQ(first.call, GenotypeCall::WT);
    EXPECT_EQ(first.dups.wt, 3);
    EXPECT_EQ(first.dups.mut, 0);
    EXPECT_EQ(first.dups.amb, 1);
    EXPECT_EQ(first.total_dups, 4);
    EXPECT_EQ(first.total_dups_wt_mut, 3);
    EXPECT_EQ(first.match_class, MatchClass::UNCLASSIFIED);

    EXPECT_EQ(observations[1].call, GenotypeCall::MUT);
    EXPECT_EQ(observations[1].total_dups_wt_mut, 2);

    // Calls are case-insensitive
    EXPECT_EQ(observations[3].call, GenotypeCall::AMB);
    EXPECT_EQ(observations[4].call, GenotypeCall::AMB);
    EXPECT_EQ(observations[4].barcode, "BBBB");
    EXPECT_EQ(observations[4].total_dups, 4);
    EXPECT_EQ(observations[4].total_dups_wt_mut, 1);
}

TEST(GenotypeTable, DropRowsWithoutUmi)
{
    TempDir     dir("genotype_table_drop");
    std::string filename =
        dir.write("genotype.tsv", HEADER + "AAAA\tACGT\t1\t0\t0\tWT\t1\t0\t0\n"
                                           "BBBB\t\t0\t0\t0\t\t\t\t\n"
                                           "CCCC\tNA\t0\t0\t0\tNA\tNA\tNA\tNA\n");
    GenotypeTable table(4);
    table.load(filename);
    EXPECT_EQ(table.getRows().size(), 1u);
    EXPECT_EQ(table.droppedRows(), 2u);
    EXPECT_EQ(table.expand().size(), 1u);

    auto barcodes = table.getBarcodes();
    EXPECT_EQ(barcodes.size(), 1u);
    EXPECT_EQ(barcodes.count("AAAA"), 1u);
}

TEST(GenotypeTable, QuotedHeaderAndColumnOrder)
{
    TempDir     dir("genotype_table_quoted");
    std::string filename = dir.write("genotype.tsv",
                                     "\"UMI\"\t\"BC\"\t\"WT.calls\"\t\"MUT.calls\"\t\"amb.calls\"\t\"call.in.dups\"\t"
                                     "\"num.WT.in.dups\"\t\"num.MUT.in.dups\"\t\"num.amb.in.dups\"\t\"extra\"\n"
                                     "\"ACGT\"\t\"AAAA\"\t0\t1\t0\t\"MUT\"\t0\t5\t0\tx\n");
    GenotypeTable table(4);
    table.load(filename);
    auto observations = table.expand();
    ASSERT_EQ(observations.size(), 1u);
    EXPECT_EQ(observations[0].barcode, "AAAA");
    EXPECT_EQ(observations[0].umi, "ACGT");
    EXPECT_EQ(observations[0].call, GenotypeCall::MUT);
    EXPECT_EQ(observations[0].total_dups_wt_mut, 5);
}

TEST(GenotypeTable, CustomListSeparator)
{
    TempDir     dir("genotype_table_sep");
    std::string filename = dir.write("genotype.tsv", HEADER + "AAAA\tACGT,ACGA\t2\t0\t0\tWT,WT\t1,2\t0,0\t0,0\n");
    GenotypeTable table(4, ',');
    table.load(filename);
    EXPECT_EQ(table.expand().size(), 2u);
}

TEST(GenotypeTable, MissingColumn)
{
    TempDir     dir("genotype_table_missing");
    std::string filename = dir.write("genotype.tsv", "BC\tUMI\tWT.calls\tMUT.calls\tamb.calls\tcall.in.dups\t"
                                                     "num.WT.in.dups\tnum.MUT.in.dups\n"
                                                     "AAAA\tACGT\t1\t0\t0\tWT\t1\t0\n");
    GenotypeTable table(4);
    try
    {
        table.load(filename);
        FAIL() << "Expected GenotypeTableException";
    }
    catch (const GenotypeTableException& e)
    {
        EXPECT_NE(std::string(e.what()).find("num.amb.in.dups"), std::string::npos);
    }
}

TEST(GenotypeTable, ListLengthMismatchNamesBarcode)
{
    TempDir     dir("genotype_table_mismatch");
    std::string filename = dir.write("genotype.tsv", HEADER + "AAAA\tACGT\t1\t0\t0\tWT\t1\t0\t0\n"
                                                              "CCCC\tAAAA;CCCC\t1\t0\t0\tWT\t1\t0\t0\n");
    GenotypeTable table(4);
    table.load(filename);
    try
    {
        table.expand();
        FAIL() << "Expected GenotypeTableException";
    }
    catch (const GenotypeTableException& e)
    {
        EXPECT_NE(std::string(e.what()).find("CCCC"), std::string::npos);
    }
}

TEST(GenotypeTable, InvalidValues)
{
    TempDir dir("genotype_table_invalid");

    GenotypeTable bad_count(4);
    bad_count.load(dir.write("count.tsv", HEADER + "AAAA\tACGT\t1\t0\t0\tWT\tx\t0\t0\n"));
    EXPECT_THROW(bad_count.expand(), GenotypeTableException);

    GenotypeTable bad_call(4);
    bad_call.load(dir.write("call.tsv", HEADER + "AAAA\tACGT\t1\t0\t0\tHET\t1\t0\t0\n"));
    EXPECT_THROW(bad_call.expand(), GenotypeTableException);

    GenotypeTable bad_scalar(4);
    EXPECT_THROW(bad_scalar.load(dir.write("scalar.tsv", HEADER + "AAAA\tACGT\t-1\t0\t0\tWT\t1\t0\t0\n")),
                 GenotypeTableException);

    GenotypeTable bad_columns(4);
    EXPECT_THROW(bad_columns.load(dir.write("columns.tsv", HEADER + "AAAA\tACGT\t1\n")), GenotypeTableException);

    GenotypeTable empty(4);
    EXPECT_THROW(empty.load(dir.write("empty.tsv", "")), GenotypeTableException);
}

TEST(GenotypeTable, UmiLengthMismatch)
{
    TempDir dir("genotype_table_umi_len");

    // A short umi would share the code of its 'A' padded form
    GenotypeTable short_umi(4);
    short_umi.load(dir.write("short.tsv", HEADER + "AAAA\tACGT\t1\t0\t0\tWT\t1\t0\t0\n"
                                                   "CCCC\tCGT;ACGT\t2\t0\t0\tWT;WT\t1;1\t0;0\t0;0\n"));
    try
    {
        short_umi.expand();
        FAIL() << "Expected EncodingError";
    }
    catch (const EncodingError& e)
    {
        EXPECT_NE(std::string(e.what()).find("CCCC"), std::string::npos);
    }

    // Empty element inside the list
    GenotypeTable empty_umi(4);
    empty_umi.load(dir.write("empty.tsv", HEADER + "GGGG\tACGT;;TTTT\t3\t0\t0\tWT;WT;WT\t1;1;1\t0;0;0\t0;0;0\n"));
    EXPECT_THROW(empty_umi.expand(), EncodingError);

    GenotypeTable long_umi(4);
    long_umi.load(dir.write("long.tsv", HEADER + "GGGG\tACGTA\t1\t0\t0\tWT\t1\t0\t0\n"));
    EXPECT_THROW(long_umi.expand(), EncodingError);

    GenotypeTable longer_config(5);
    longer_config.load(dir.write("five.tsv", HEADER + "GGGG\tACGTA\t1\t0\t0\tWT\t1\t0\t0\n"));
    EXPECT_EQ(longer_config.expand().size(), 1u);
}
