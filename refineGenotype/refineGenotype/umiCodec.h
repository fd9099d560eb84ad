/*
 * File: umiCodec.h
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#pragma once

#include <stdint.h>

#include <string>
#include <string_view>

// The largest umi that fits in a 64 bits code.
constexpr size_t MAX_UMI_LEN = 32;

/**
 * Encode umi sequence to integer, 2 bits per base: A=00 C=01 G=10 T=11.
 * The first base occupies the highest bits.
 *
 * @throw EncodingError if any base is outside ACGT or the umi is longer than MAX_UMI_LEN
 */
uint64_t encodeUmi(std::string_view umi);

/**
 * Decode integer to umi sequence of the given length, left padded with 'A'.
 *
 * @throw DecodingError if the value needs more than 2*len bits
 */
std::string decodeUmi(uint64_t code, size_t len);
