/*
 * File: gzIO.h
 * Created Data: 2020-7-9
 * Author: fxzhao
 * Contact: <zhaofuxiang@genomics.cn>
 *
 * Copyright (c) 2020 BGI-Research
 */

#pragma once

#include <zlib.h>

#define cmpFile gzFile
#define cmpOpen(x) gzopen(x, "wb")
#define cmpClose(x) gzclose(x)

#include <string>
using namespace std;

// Read one line without the trailing newline, the line length is unlimited.
// Return false at the end of file.
bool readline(gzFile f, string& l);

// Line reader of plain text or gzip file, zlib reads plain text transparently.
class GzLineReader
{
public:
    GzLineReader(const string& filename_);
    ~GzLineReader();

    // DIsable assignment/copy operations.
    GzLineReader(const GzLineReader& other) = delete;
    GzLineReader& operator=(const GzLineReader&) = delete;

    bool next(string& line);

    size_t lineNum()
    {
        return line_num;
    }

private:
    string filename;
    gzFile fp;
    size_t line_num;
};

// Dump content to file, compress it if the filename ends with ".gz".
bool dumpFile(const string& filename, const string& content);
