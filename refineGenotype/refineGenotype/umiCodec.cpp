/*
 * File: umiCodec.cpp
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#include "umiCodec.h"
#include "genotypeException.h"

static const char BASES_DECODE[] = "ACGT";

static const int BITS_PER_BASE = 2;

namespace
{
struct BaseTable
{
    BaseTable()
    {
        for (auto& v : base2i)
            v = -1;
        base2i['A'] = 0;
        base2i['C'] = 1;
        base2i['G'] = 2;
        base2i['T'] = 3;
    }
    int base2i[256];
};
const BaseTable BASES_ENCODE;
}  // namespace

uint64_t encodeUmi(std::string_view umi)
{
    if (umi.size() > MAX_UMI_LEN)
        throw EncodingError("Umi is too long to encode: " + std::string(umi));

    uint64_t res = 0;
    for (auto& s : umi)
    {
        int b = BASES_ENCODE.base2i[( unsigned char )s];
        if (b < 0)
            throw EncodingError("Invalid base '" + std::string(1, s) + "' in umi: " + std::string(umi));
        res = (res << BITS_PER_BASE) | b;
    }
    return res;
}

std::string decodeUmi(uint64_t code, size_t len)
{
    if (len > MAX_UMI_LEN)
        throw DecodingError("Umi length is too long to decode: " + std::to_string(len));

    // Check the unpadded bit length of code fits in 2*len bits
    size_t bits = 0;
    for (uint64_t v = code; v != 0; v >>= 1)
        ++bits;
    if (bits > BITS_PER_BASE * len)
        throw DecodingError("Umi code " + std::to_string(code) + " does not fit length " + std::to_string(len));

    std::string umi(len, 'A');
    for (size_t i = 0; i < len; ++i)
    {
        umi[len - 1 - i] = BASES_DECODE[code & 3];
        code >>= BITS_PER_BASE;
    }
    return umi;
}
