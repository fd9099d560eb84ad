/*
 * File: genotypeTable.cpp
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#include "genotypeTable.h"
#include "genotypeException.h"
#include "gzIO.h"
#include "timer.h"
#include "utils.h"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

std::string callToString(GenotypeCall call)
{
    switch (call)
    {
    case GenotypeCall::WT:
        return "WT";
    case GenotypeCall::MUT:
        return "MUT";
    default:
        return "AMB";
    }
}

std::string matchClassToString(MatchClass mc)
{
    switch (mc)
    {
    case MatchClass::EXACT:
        return "Exact";
    case MatchClass::APPROX:
        return "Approx";
    case MatchClass::OTHER_GENE:
        return "OtherGene";
    case MatchClass::NO_GENE:
        return "NoGene";
    default:
        return "Unclassified";
    }
}

// Remove the quotes written by R's write.table
static std::string unquote(const std::string& s)
{
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"')
        return s.substr(1, s.size() - 2);
    return s;
}

static int parseCount(const std::string& s, const std::string& column, const std::string& barcode)
{
    size_t pos = 0;
    int    value;
    try
    {
        value = std::stoi(s, &pos);
    }
    catch (const std::exception&)
    {
        throw GenotypeTableException("Invalid number '" + s + "' in column " + column + " of barcode " + barcode);
    }
    if (pos != s.size() || value < 0)
        throw GenotypeTableException("Invalid number '" + s + "' in column " + column + " of barcode " + barcode);
    return value;
}

static GenotypeCall parseCall(const std::string& s, const std::string& barcode)
{
    std::string upper(s);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });
    if (upper == "WT")
        return GenotypeCall::WT;
    if (upper == "MUT")
        return GenotypeCall::MUT;
    if (upper == "AMB")
        return GenotypeCall::AMB;
    throw GenotypeTableException("Invalid call '" + s + "' of barcode " + barcode);
}

void GenotypeTable::parseHeader(const std::string& line)
{
    vector< string > header = split_str(line, col_sep, false);
    header_num              = header.size();
    for (int i = 0; i < GENOTYPE_COLUMN_NUM; ++i)
    {
        column_idx[i] = -1;
        for (size_t j = 0; j < header.size(); ++j)
        {
            if (unquote(header[j]) == GENOTYPE_SCHEMA[i].name)
            {
                column_idx[i] = j;
                break;
            }
        }
        if (column_idx[i] == -1)
            throw GenotypeTableException(std::string("Missing column in genotyping table: ") + GENOTYPE_SCHEMA[i].name);
    }
}

void GenotypeTable::parseRow(const std::string& line, size_t line_num)
{
    vector< string > items = split_str(line, col_sep, false);
    if (items.size() != header_num)
        throw GenotypeTableException("Invalid column number " + std::to_string(items.size()) + " at line "
                                     + std::to_string(line_num) + ", expect " + std::to_string(header_num));

    GenotypeRow row;
    for (int i = 0; i < GENOTYPE_COLUMN_NUM; ++i)
        row.fields[i] = unquote(items[column_idx[i]]);

    const std::string& barcode = row.fields[COL_BC];
    // No umi supports this barcode
    if (row.fields[COL_UMI].empty() || row.fields[COL_UMI] == "NA")
    {
        ++dropped_rows;
        return;
    }

    row.wt_calls  = parseCount(row.fields[COL_WT_CALLS], GENOTYPE_SCHEMA[COL_WT_CALLS].name, barcode);
    row.mut_calls = parseCount(row.fields[COL_MUT_CALLS], GENOTYPE_SCHEMA[COL_MUT_CALLS].name, barcode);
    row.amb_calls = parseCount(row.fields[COL_AMB_CALLS], GENOTYPE_SCHEMA[COL_AMB_CALLS].name, barcode);
    rows.push_back(std::move(row));
}

int GenotypeTable::load(const std::string& filename)
{
    Timer timer;
    rows.clear();
    dropped_rows = 0;

    GzLineReader reader(filename);
    std::string  line;
    if (!reader.next(line))
        throw GenotypeTableException("Empty genotyping table: " + filename);
    parseHeader(line);

    while (reader.next(line))
    {
        if (line.empty())
            continue;
        parseRow(line, reader.lineNum());
    }

    spdlog::info("Load genotyping table:{} rows:{} dropped rows without umi:{} time(s):{:.2f}", filename, rows.size(),
                 dropped_rows, timer.toc(1000));
    return 0;
}

void GenotypeTable::expandRow(size_t row_idx, std::vector< GenotypeObservation >& observations) const
{
    const GenotypeRow& row     = rows[row_idx];
    const std::string& barcode = row.fields[COL_BC];
    size_t             n       = row.wt_calls + row.mut_calls + row.amb_calls;

    // Split all per-molecule columns, each of them must have n elements
    std::vector< std::string > lists[GENOTYPE_COLUMN_NUM];
    for (int i = 0; i < GENOTYPE_COLUMN_NUM; ++i)
    {
        if (!GENOTYPE_SCHEMA[i].per_molecule)
            continue;
        lists[i] = split_str(row.fields[i], list_sep, false);
        if (lists[i].size() != n)
        {
            throw GenotypeTableException("Column " + std::string(GENOTYPE_SCHEMA[i].name) + " of barcode " + barcode
                                         + " has " + std::to_string(lists[i].size()) + " elements, expect "
                                         + std::to_string(n) + " (WT.calls+MUT.calls+amb.calls)");
        }
    }

    for (size_t k = 0; k < n; ++k)
    {
        GenotypeObservation obs;
        obs.barcode  = barcode;
        obs.umi      = lists[COL_UMI][k];
        // Umi codes are only unique among umis of the same length
        if (obs.umi.size() != umi_len)
            throw EncodingError("Umi '" + obs.umi + "' of barcode " + barcode + " has " + std::to_string(obs.umi.size())
                                + " bases, expect " + std::to_string(umi_len));
        obs.umi_code = 0;
        obs.call     = parseCall(lists[COL_CALL_IN_DUPS][k], barcode);
        obs.dups.wt  = parseCount(lists[COL_NUM_WT_IN_DUPS][k], GENOTYPE_SCHEMA[COL_NUM_WT_IN_DUPS].name, barcode);
        obs.dups.mut = parseCount(lists[COL_NUM_MUT_IN_DUPS][k], GENOTYPE_SCHEMA[COL_NUM_MUT_IN_DUPS].name, barcode);
        obs.dups.amb = parseCount(lists[COL_NUM_AMB_IN_DUPS][k], GENOTYPE_SCHEMA[COL_NUM_AMB_IN_DUPS].name, barcode);
        obs.total_dups        = obs.dups.wt + obs.dups.mut + obs.dups.amb;
        obs.total_dups_wt_mut = obs.dups.wt + obs.dups.mut;

        obs.exact       = false;
        obs.approx      = false;
        obs.in_gex      = false;
        obs.match_class = MatchClass::UNCLASSIFIED;
        obs.keep        = true;
        observations.push_back(std::move(obs));
    }
}

std::vector< GenotypeObservation > GenotypeTable::expand() const
{
    Timer                              timer;
    std::vector< GenotypeObservation > observations;
    for (size_t i = 0; i < rows.size(); ++i)
        expandRow(i, observations);
    spdlog::info("Expand genotyping rows:{} to umi observations:{} time(s):{:.2f}", rows.size(), observations.size(),
                 timer.toc(1000));
    return observations;
}

std::unordered_set< std::string > GenotypeTable::getBarcodes() const
{
    std::unordered_set< std::string > res;
    for (auto& row : rows)
        res.insert(row.fields[COL_BC]);
    return res;
}
