/*
 * File: utils.cpp
 * Created Data: 2020-5-12
 * Author: fxzhao
 * Contact: <zhaofuxiang@genomics.cn>
 *
 * Copyright (c) 2020 BGI-Research
 */

#include "utils.h"
#include "gzIO.h"

#include <cctype>
#include <sstream>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <filesystem>
namespace fs = std::filesystem;

#include <spdlog/spdlog.h>

size_t physical_memory_used_by_process()
{
    int   result = 0;
    FILE* file   = fopen("/proc/self/status", "r");
    if (file == nullptr)
        return result;
    char line[128];
    while (fgets(line, 128, file) != nullptr)
    {
        if (strncmp(line, "VmRSS:", 6) == 0)
        {
            int len = strlen(line);

            const char* p = line;
            for (; std::isdigit(*p) == false; ++p)
            {
            }

            line[len - 3] = 0;
            result        = atoi(p);

            break;
        }
    }
    fclose(file);

    return result;
}

vector< string > split_str(const std::string& str, char delim, bool skip_empty)
{
    std::istringstream iss(str);
    vector< string >   res;
    for (std::string item; getline(iss, item, delim);)
        if (skip_empty && item.empty())
            continue;
        else
            res.push_back(item);
    // getline drops the empty field after a trailing delim
    if (!skip_empty && !str.empty() && str.back() == delim)
        res.push_back("");
    return res;
}

std::string strip_suffix(const std::string& str, char delim)
{
    size_t pos = str.find_last_of(delim);
    if (pos == std::string::npos)
        return str;
    return str.substr(0, pos);
}

vector< string > load_barcodes(const std::string& filename, char suffix_sep)
{
    GzLineReader            reader(filename);
    vector< string >        barcodes;
    unordered_set< string > seen;
    string                  line;
    while (reader.next(line))
    {
        if (line.empty())
            continue;
        string barcode = strip_suffix(line, suffix_sep);
        if (seen.count(barcode) != 0)
        {
            spdlog::debug("Duplicate barcode in reference list: {}", line);
            continue;
        }
        seen.insert(barcode);
        barcodes.push_back(std::move(barcode));
    }
    spdlog::info("Load {} reference barcodes from: {}", barcodes.size(), filename);
    return barcodes;
}

bool skip_existing_output(const std::string& filename)
{
    if (fs::exists(filename))
    {
        spdlog::warn("Output file already exists, skip writing: {}", filename);
        return true;
    }
    return false;
}
