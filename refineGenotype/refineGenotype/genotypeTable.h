/*
 * File: genotypeTable.h
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#pragma once

#include <stdint.h>

#include <string>
#include <unordered_set>
#include <vector>

enum class GenotypeCall
{
    WT,
    MUT,
    AMB
};

enum class MatchClass
{
    UNCLASSIFIED,
    EXACT,
    APPROX,
    OTHER_GENE,
    NO_GENE
};

std::string callToString(GenotypeCall call);
std::string matchClassToString(MatchClass mc);

// Reads of each call within a PCR-duplicate group
struct DupCounts
{
    int wt;
    int mut;
    int amb;
};

// One supporting umi of a barcode
struct GenotypeObservation
{
    std::string  barcode;
    std::string  umi;
    uint64_t     umi_code;
    GenotypeCall call;
    DupCounts    dups;
    int          total_dups;
    int          total_dups_wt_mut;

    // Filled by MatchClassifier
    bool        exact;
    bool        approx;
    bool        in_gex;
    std::string gene_label;
    MatchClass  match_class;

    // Filled after the threshold is known
    bool keep;
};

// Columns of the genotyping summary table.
enum GENOTYPE_COLUMNS
{
    COL_BC,
    COL_UMI,
    COL_WT_CALLS,
    COL_MUT_CALLS,
    COL_AMB_CALLS,
    COL_CALL_IN_DUPS,
    COL_NUM_WT_IN_DUPS,
    COL_NUM_MUT_IN_DUPS,
    COL_NUM_AMB_IN_DUPS,
    GENOTYPE_COLUMN_NUM
};

struct ColumnSchema
{
    const char* name;
    bool        per_molecule;  // true: list of one value per umi, false: one value per barcode
};

static const ColumnSchema GENOTYPE_SCHEMA[GENOTYPE_COLUMN_NUM] = {
    { "BC", false },
    { "UMI", true },
    { "WT.calls", false },
    { "MUT.calls", false },
    { "amb.calls", false },
    { "call.in.dups", true },
    { "num.WT.in.dups", true },
    { "num.MUT.in.dups", true },
    { "num.amb.in.dups", true },
};

// One row of the summary table, the per-molecule fields are still joined by list separator.
struct GenotypeRow
{
    std::string fields[GENOTYPE_COLUMN_NUM];
    int         wt_calls;
    int         mut_calls;
    int         amb_calls;
};

class GenotypeTable
{
public:
    explicit GenotypeTable(size_t umi_len_, char list_sep_ = ';', char col_sep_ = '\t')
        : umi_len(umi_len_), list_sep(list_sep_), col_sep(col_sep_)
    {
    }

    // Load the table and check the header against GENOTYPE_SCHEMA,
    // rows with empty umi are dropped.
    int load(const std::string& filename);

    // One observation per umi of each row.
    // @throw EncodingError if any umi is not umi_len bases long
    std::vector< GenotypeObservation > expand() const;

    const std::vector< GenotypeRow >& getRows() const
    {
        return rows;
    }

    std::unordered_set< std::string > getBarcodes() const;

    size_t droppedRows() const
    {
        return dropped_rows;
    }

private:
    void parseHeader(const std::string& line);
    void parseRow(const std::string& line, size_t line_num);
    void expandRow(size_t row_idx, std::vector< GenotypeObservation >& observations) const;

private:
    size_t                     umi_len;
    char                       list_sep;
    char                       col_sep;
    int                        column_idx[GENOTYPE_COLUMN_NUM];
    size_t                     header_num;
    size_t                     dropped_rows = 0;
    std::vector< GenotypeRow > rows;
};
