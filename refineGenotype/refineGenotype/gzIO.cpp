/*
 * File: gzIO.cpp
 * Created Data: 2020-7-9
 * Author: fxzhao
 * Contact: <zhaofuxiang@genomics.cn>
 *
 * Copyright (c) 2020 BGI-Research
 */

#include "gzIO.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
namespace fs = std::filesystem;

#include <spdlog/spdlog.h>

static const int READ_BUF_SIZE = 1 << 16;

bool readline(gzFile f, string& l)
{
    l.clear();
    char buf[READ_BUF_SIZE];
    while (gzgets(f, buf, sizeof(buf)) != Z_NULL)
    {
        l += buf;
        if (!l.empty() && l.back() == '\n')
        {
            l.pop_back();
            if (!l.empty() && l.back() == '\r')
                l.pop_back();
            return true;
        }
    }

    // end-of-file or error
    int         err;
    const char* msg = gzerror(f, &err);
    if (err != Z_OK && err != Z_STREAM_END)
        throw std::runtime_error("read gz file error, error_code: " + std::to_string(err) + " error_msg: " + msg);

    // The last line without newline
    return !l.empty();
}

GzLineReader::GzLineReader(const string& filename_) : filename(filename_), fp(nullptr), line_num(0)
{
    fp = gzopen(filename.c_str(), "rb");
    if (fp == nullptr)
        throw std::runtime_error("Error opening file: " + filename);
    gzbuffer(fp, READ_BUF_SIZE * 4);
}

GzLineReader::~GzLineReader()
{
    if (fp != nullptr)
    {
        gzclose(fp);
        fp = nullptr;
    }
}

bool GzLineReader::next(string& line)
{
    if (!readline(fp, line))
        return false;
    ++line_num;
    return true;
}

bool dumpFile(const string& filename, const string& content)
{
    fs::path p(filename);
    if (p.extension() == ".gz")
    {
        cmpFile out;
        out = cmpOpen(p.c_str());
        if (out == nullptr)
        {
            spdlog::error("Error opening file:{}", filename);
            return false;
        }
        // gzputs is limited to int length, write by blocks
        bool   ok  = true;
        size_t pos = 0;
        while (pos < content.size())
        {
            size_t len = std::min(content.size() - pos, size_t(1) << 30);
            if (gzwrite(out, content.data() + pos, len) != int(len))
            {
                ok = false;
                break;
            }
            pos += len;
        }
        if (cmpClose(out) != Z_OK || !ok)
        {
            spdlog::error("Error writing file:{}", filename);
            return false;
        }
    }
    else
    {
        ofstream ofs(filename, std::ofstream::out);
        if (!ofs.is_open())
        {
            spdlog::error("Error opening file:{}", filename);
            return false;
        }
        ofs << content;
        ofs.close();
        if (ofs.fail())
        {
            spdlog::error("Error writing file:{}", filename);
            return false;
        }
    }
    return true;
}
