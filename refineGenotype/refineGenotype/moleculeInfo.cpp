/*
 * File: moleculeInfo.cpp
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#include "moleculeInfo.h"
#include "genotypeException.h"
#include "timer.h"
#include "umiCodec.h"

#include <string.h>

#include <H5Cpp.h>
#include <spdlog/spdlog.h>

template < class T >
static void readIntegers(H5::H5File& file, const std::string& name, const H5::PredType& type, std::vector< T >& data)
{
    H5::DataSet   ds    = file.openDataSet(name);
    H5::DataSpace space = ds.getSpace();
    if (space.getSimpleExtentNdims() != 1)
        throw MoleculeInfoException("Dataset is not one dimensional: " + name);
    hsize_t dims[1];
    space.getSimpleExtentDims(dims, nullptr);
    data.resize(dims[0]);
    if (dims[0] > 0)
        ds.read(data.data(), type);
}

// Both fixed-length and variable-length string dataset are supported.
static std::vector< std::string > readStrings(H5::H5File& file, const std::string& name)
{
    H5::DataSet   ds    = file.openDataSet(name);
    H5::DataSpace space = ds.getSpace();
    if (space.getSimpleExtentNdims() != 1)
        throw MoleculeInfoException("Dataset is not one dimensional: " + name);
    hsize_t dims[1];
    space.getSimpleExtentDims(dims, nullptr);
    size_t n = dims[0];

    std::vector< std::string > res;
    res.reserve(n);
    if (n == 0)
        return res;

    H5::StrType type = ds.getStrType();
    if (type.isVariableStr())
    {
        std::vector< char* > buf(n, nullptr);
        ds.read(buf.data(), type);
        for (auto& p : buf)
            res.emplace_back(p == nullptr ? "" : p);
        H5::DataSet::vlenReclaim(buf.data(), type, space);
    }
    else
    {
        size_t              len = type.getSize();
        std::vector< char > buf(n * len);
        ds.read(buf.data(), type);
        for (size_t i = 0; i < n; ++i)
        {
            const char* p = buf.data() + i * len;
            res.emplace_back(p, strnlen(p, len));
        }
    }
    return res;
}

MoleculeArchive MoleculeInfoReader::load(const std::string& filename)
{
    Timer timer;
    H5::Exception::dontPrint();

    MoleculeArchive archive;
    try
    {
        H5::H5File file(filename, H5F_ACC_RDONLY);
        readIntegers(file, "barcode_idx", H5::PredType::NATIVE_UINT64, archive.barcode_idx);
        readIntegers(file, "feature_idx", H5::PredType::NATIVE_UINT64, archive.feature_idx);
        readIntegers(file, "umi", H5::PredType::NATIVE_UINT64, archive.umi);
        readIntegers(file, "count", H5::PredType::NATIVE_UINT32, archive.count);
        archive.barcodes      = readStrings(file, "barcodes");
        archive.feature_names = readStrings(file, "features/name");
        archive.feature_ids   = readStrings(file, "features/id");
        // Old archive does not have feature type
        if (H5Lexists(file.getId(), "features/feature_type", H5P_DEFAULT) > 0)
            archive.feature_types = readStrings(file, "features/feature_type");
    }
    catch (const H5::Exception& e)
    {
        throw MoleculeInfoException("Failed reading molecule info " + filename + ": " + e.getFuncName() + " "
                                    + e.getDetailMsg());
    }

    spdlog::get("gex")->info("Load molecule info:{} molecules:{} barcodes:{} features:{} time(s):{:.2f}", filename,
                             archive.umi.size(), archive.barcodes.size(), archive.feature_names.size(),
                             timer.toc(1000));
    return archive;
}

bool MoleculeIndex::isAntibody(const std::string& gene_name, const std::string& feature_type) const
{
    if (feature_type == ANTIBODY_FEATURE_TYPE)
        return true;
    for (auto& marker : antibody_markers)
    {
        if (!marker.empty() && gene_name.find(marker) != std::string::npos)
            return true;
    }
    return false;
}

int MoleculeIndex::build(const MoleculeArchive& archive, const std::unordered_set< std::string >& barcode_filter)
{
    Timer  timer;
    size_t n = archive.umi.size();
    if (archive.barcode_idx.size() != n || archive.feature_idx.size() != n || archive.count.size() != n)
    {
        throw MoleculeInfoException("Different length of molecule info arrays, barcode_idx:"
                                    + std::to_string(archive.barcode_idx.size())
                                    + " feature_idx:" + std::to_string(archive.feature_idx.size())
                                    + " umi:" + std::to_string(n) + " count:" + std::to_string(archive.count.size()));
    }
    if (archive.feature_ids.size() != archive.feature_names.size()
        || (!archive.feature_types.empty() && archive.feature_types.size() != archive.feature_names.size()))
        throw MoleculeInfoException("Different length of molecule info feature tables");

    feature_names.clear();
    feature_names.insert(archive.feature_names.begin(), archive.feature_names.end());

    // Mark the barcodes we want, the index is same as archive.barcodes
    std::vector< char > keep_barcode(archive.barcodes.size(), barcode_filter.empty() ? 1 : 0);
    if (!barcode_filter.empty())
    {
        for (size_t i = 0; i < archive.barcodes.size(); ++i)
            if (barcode_filter.count(archive.barcodes[i]) != 0)
                keep_barcode[i] = 1;
    }

    std::vector< char > antibody(archive.feature_names.size(), 0);
    for (size_t i = 0; i < archive.feature_names.size(); ++i)
        antibody[i] = isAntibody(archive.feature_names[i], archive.feature_types.empty() ? "" : archive.feature_types[i]);

    records.clear();
    for (size_t i = 0; i < n; ++i)
    {
        uint64_t bi = archive.barcode_idx[i];
        uint64_t fi = archive.feature_idx[i];
        if (bi >= archive.barcodes.size())
            throw MoleculeInfoException("Barcode index out of range: " + std::to_string(bi) + " at molecule "
                                        + std::to_string(i));
        if (fi >= archive.feature_names.size())
            throw MoleculeInfoException("Feature index out of range: " + std::to_string(fi) + " at molecule "
                                        + std::to_string(i));
        if (!keep_barcode[bi])
            continue;

        MoleculeRecord record;
        record.barcode    = archive.barcodes[bi];
        record.umi_code   = archive.umi[i];
        record.gene_id    = archive.feature_ids[fi];
        record.gene_name  = archive.feature_names[fi];
        record.read_count = archive.count[i];
        record.antibody   = antibody[fi];
        records.push_back(std::move(record));
    }

    spdlog::get("gex")->info("Resolve molecule records:{} of total:{} time(s):{:.2f}", records.size(), n,
                             timer.toc(1000));
    return 0;
}

TargetGeneSet MoleculeIndex::targetGeneSet(const std::string& gene_name) const
{
    if (feature_names.count(gene_name) == 0)
        throw MoleculeInfoException("Gene not found in molecule info features: " + gene_name);

    TargetGeneSet res;
    for (auto& record : records)
    {
        if (record.gene_name != gene_name)
            continue;
        res.insert(record.barcode, decodeUmi(record.umi_code, umi_len));
    }
    spdlog::get("gex")->info("Barcode/umi pairs of gene {}: {}", gene_name, res.size());
    return res;
}

CollapsedIndex MoleculeIndex::collapsedIndex(const std::unordered_set< std::string >& barcode_universe) const
{
    Timer timer;

    // Group the records by (barcode, umi), keep the order of records in each group
    std::unordered_map< std::string, std::unordered_map< uint64_t, std::vector< size_t > > > groups;
    for (size_t i = 0; i < records.size(); ++i)
    {
        auto& record = records[i];
        if (barcode_universe.count(record.barcode) == 0)
            continue;
        groups[record.barcode][record.umi_code].push_back(i);
    }

    CollapsedIndex res;
    size_t         multiple_num = 0, multiple_target_num = 0;
    for (auto& [barcode, umis] : groups)
    {
        auto& collapsed = res[barcode];
        for (auto& [umi, idxs] : umis)
        {
            const MoleculeRecord& first = records[idxs.front()];

            CollapsedMolecule molecule;
            molecule.read_count = first.read_count;
            molecule.gene_num   = idxs.size();
            if (idxs.size() == 1)
            {
                molecule.gene = first.gene_name;
            }
            else
            {
                bool has_target = false, has_antibody = false;
                for (auto& idx : idxs)
                {
                    has_target |= records[idx].gene_name == target_gene;
                    has_antibody |= records[idx].antibody;
                }
                molecule.gene = has_target ? multipleTargetLabel(has_antibody) : MULTIPLE_GENE;
                ++multiple_num;
                if (has_target)
                    ++multiple_target_num;
            }
            collapsed.emplace(umi, std::move(molecule));
        }
    }

    spdlog::get("gex")->info("Collapse molecules barcodes:{} multiple gene umis:{} multiple with {}:{} time(s):{:.2f}",
                             res.size(), multiple_num, target_gene, multiple_target_num, timer.toc(1000));
    return res;
}
