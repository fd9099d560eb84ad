/*
 * File: moleculeInfo.h
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#pragma once

#include <stdint.h>

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Label of the molecule whose umi is observed against more than one gene.
static const std::string MULTIPLE_GENE = "Multiple";
// Suffix of the multiple label when one of the genes is an antibody channel.
static const std::string ANTIBODY_SUFFIX = "_Ab";
// Feature type of antibody channel in molecule info.
static const std::string ANTIBODY_FEATURE_TYPE = "Antibody Capture";

/**
 * Raw columns of molecule info archive, index arrays are zero-based.
 * feature_types is empty if the archive does not store it.
 */
struct MoleculeArchive
{
    std::vector< uint64_t >    barcode_idx;
    std::vector< uint64_t >    feature_idx;
    std::vector< uint64_t >    umi;
    std::vector< uint32_t >    count;
    std::vector< std::string > barcodes;
    std::vector< std::string > feature_names;
    std::vector< std::string > feature_ids;
    std::vector< std::string > feature_types;
};

class MoleculeInfoReader
{
public:
    // Load molecule_info.h5 generated by cellranger(v3 and later).
    static MoleculeArchive load(const std::string& filename);
};

struct MoleculeRecord
{
    std::string barcode;
    uint64_t    umi_code;
    std::string gene_id;
    std::string gene_name;
    uint32_t    read_count;
    bool        antibody;
};

// One (barcode, umi) after collapsing the genes observed with it.
struct CollapsedMolecule
{
    std::string gene;
    uint32_t    read_count;  // from the first record of the group
    size_t      gene_num;
};

// {barcode: {umi code: molecule}}
using CollapsedIndex = std::unordered_map< std::string, std::unordered_map< uint64_t, CollapsedMolecule > >;

// Barcode/umi pairs of one gene.
struct TargetGeneSet
{
    bool contains(const std::string& barcode, const std::string& umi) const
    {
        return keys.count(barcode + '\t' + umi) != 0;
    }

    size_t size() const
    {
        return keys.size();
    }

    void insert(const std::string& barcode, const std::string& umi)
    {
        if (keys.insert(barcode + '\t' + umi).second)
            sequences.push_back(barcode + umi);
    }

    std::unordered_set< std::string > keys;
    // Concatenation of barcode and umi, used by approximate matching.
    std::vector< std::string > sequences;
};

class MoleculeIndex
{
public:
    MoleculeIndex(std::string target_gene_, size_t umi_len_,
                  std::vector< std::string > antibody_markers_ = { "TotalSeq" })
        : target_gene(target_gene_), umi_len(umi_len_), antibody_markers(antibody_markers_)
    {
    }

    // Resolve the index arrays of archive to records, only the barcodes in barcode_filter
    // are kept, keep all barcodes if barcode_filter is empty.
    int build(const MoleculeArchive& archive, const std::unordered_set< std::string >& barcode_filter);

    // All the barcode/umi pairs of gene_name, umi is decoded with umi_len.
    TargetGeneSet targetGeneSet(const std::string& gene_name) const;

    // Collapse records of barcode_universe to one gene label per (barcode, umi).
    CollapsedIndex collapsedIndex(const std::unordered_set< std::string >& barcode_universe) const;

    const std::vector< MoleculeRecord >& getRecords() const
    {
        return records;
    }

    const std::string& getTargetGene() const
    {
        return target_gene;
    }

    // Label of a group contains target gene, e.g. "Multiple_CALR"
    std::string multipleTargetLabel(bool antibody) const
    {
        return MULTIPLE_GENE + "_" + target_gene + (antibody ? ANTIBODY_SUFFIX : "");
    }

private:
    bool isAntibody(const std::string& gene_name, const std::string& feature_type) const;

private:
    std::string                       target_gene;
    size_t                            umi_len;
    std::vector< std::string >        antibody_markers;
    std::vector< MoleculeRecord >     records;
    std::unordered_set< std::string > feature_names;
};
