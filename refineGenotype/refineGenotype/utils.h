/*
 * File: utils.h
 * Created Data: 2020-5-12
 * Author: fxzhao
 * Contact: <zhaofuxiang@genomics.cn>
 *
 * Copyright (c) 2020 BGI-Research
 */

#pragma once

#include <string>
#include <unordered_set>
#include <vector>
using namespace std;

// Get physical memory used by process in real time
// Only support linux
size_t physical_memory_used_by_process();

vector< string > split_str(const std::string& str, char delim = ' ', bool skip_empty = true);

// Remove the suffix start from the last delim, e.g. "AAACCTGAGAAGGCCT-1" -> "AAACCTGAGAAGGCCT"
std::string strip_suffix(const std::string& str, char delim);

// Load the reference barcodes, one barcode per line, suffix of barcode is removed.
// Keep the input order and drop the duplicates.
vector< string > load_barcodes(const std::string& filename, char suffix_sep);

// Return true if the file exists and we should not overwrite it
bool skip_existing_output(const std::string& filename);
