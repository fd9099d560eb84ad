/*
 * File: testUmiCodec.cpp
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#include <gtest/gtest.h>

#include <random>

#include "genotypeException.h"
#include "umiCodec.h"

TEST(UmiCodec, EncodeBases)
{
    EXPECT_EQ(encodeUmi("A"), 0u);
    EXPECT_EQ(encodeUmi("T"), 3u);
    // 00 01 10 11
    EXPECT_EQ(encodeUmi("ACGT"), 27u);
    EXPECT_EQ(encodeUmi(""), 0u);
}

TEST(UmiCodec, DecodeRestoresSequence)
{
    std::string umi = "AAACGTACGTAC";
    EXPECT_EQ(decodeUmi(encodeUmi(umi), umi.size()), umi);
    EXPECT_EQ(decodeUmi(27, 4), "ACGT");
    // Leading A bases are restored by padding
    EXPECT_EQ(decodeUmi(27, 6), "AAACGT");
    std::string longest(MAX_UMI_LEN, 'T');
    EXPECT_EQ(decodeUmi(encodeUmi(longest), MAX_UMI_LEN), longest);
}

TEST(UmiCodec, RoundTripAllShortUmis)
{
    const char bases[] = "ACGT";
    for (size_t len = 1; len <= 6; ++len)
    {
        for (uint64_t n = 0; n < (uint64_t(1) << (2 * len)); ++n)
        {
            std::string umi(len, 'A');
            uint64_t    v = n;
            for (size_t i = len; i > 0; --i, v >>= 2)
                umi[i - 1] = bases[v & 3];
            ASSERT_EQ(encodeUmi(umi), n) << umi;
            ASSERT_EQ(decodeUmi(n, len), umi);
        }
    }
}

TEST(UmiCodec, RoundTripRandomUmis)
{
    std::mt19937 rng(20210315);
    const char   bases[] = "ACGT";
    for (size_t len = 1; len <= MAX_UMI_LEN; ++len)
    {
        for (int i = 0; i < 200; ++i)
        {
            std::string umi(len, 'A');
            for (auto& c : umi)
                c = bases[rng() % 4];
            EXPECT_EQ(decodeUmi(encodeUmi(umi), len), umi);
        }
    }
}

TEST(UmiCodec, InvalidBase)
{
    EXPECT_THROW(encodeUmi("ACGN"), EncodingError);
    EXPECT_THROW(encodeUmi("acgt"), EncodingError);
    EXPECT_THROW(encodeUmi(std::string(MAX_UMI_LEN + 1, 'A')), EncodingError);
}

TEST(UmiCodec, CodeTooLarge)
{
    // 27 needs 5 bits
    EXPECT_THROW(decodeUmi(27, 2), DecodingError);
    EXPECT_NO_THROW(decodeUmi(15, 2));
    EXPECT_THROW(decodeUmi(0, MAX_UMI_LEN + 1), DecodingError);
}
