/*
 * File: matchClassifier.h
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "genotypeTable.h"
#include "moleculeInfo.h"

/**
 * Levenshtein distance of two strings, stop early when the distance exceeds max_dist.
 *
 * @return the distance if it is not larger than max_dist, otherwise max_dist + 1
 */
int boundedLevenshtein(const std::string& s1, const std::string& s2, int max_dist);

/**
 * Exact seeds of a set of sequences for searching neighbors within max_dist edits.
 * Each sequence is split into max_dist+1 pieces, a query within max_dist edits of the
 * sequence contains at least one of the pieces at a position shifted by at most max_dist.
 */
class SeedIndex
{
public:
    SeedIndex(const std::vector< std::string >& seqs_, int max_dist_);

    // Return true if any sequence is within max_dist edits of query.
    bool hasNeighbor(const std::string& query) const;

private:
    // <start, length> of each piece
    static std::vector< std::pair< size_t, size_t > > pieces(size_t len, int n);

private:
    const std::vector< std::string >& seqs;
    int                               max_dist;
    // {sequence length: [{piece: sequence indexes}]}
    std::unordered_map< size_t, std::vector< std::unordered_map< std::string, std::vector< size_t > > > > seeds;
    // Sequences too short to split
    std::vector< size_t > short_seqs;
};

// Match result of one observation
struct MatchResult
{
    uint64_t    umi_code;
    bool        exact;
    bool        approx;
    bool        in_gex;
    std::string gene_label;
    MatchClass  match_class;
};

struct MatchMetrics
{
    MatchMetrics() : exact(0), approx(0), other_gene(0), no_gene(0) {}
    size_t exact;
    size_t approx;
    size_t other_gene;
    size_t no_gene;
};

class MatchClassifier
{
public:
    MatchClassifier(const TargetGeneSet& target_set_, const CollapsedIndex& collapsed_index_, std::string target_gene_,
                    int max_dist_ = 2)
        : target_set(target_set_), collapsed_index(collapsed_index_), target_gene(target_gene_), max_dist(max_dist_),
          seed_index(target_set_.sequences, max_dist_)
    {
    }

    // Classify one observation, it does not modify any shared state.
    MatchResult match(const GenotypeObservation& obs) const;

    // Classify all observations with a pool of threads, the results are
    // written back by the original index.
    MatchMetrics classify(std::vector< GenotypeObservation >& observations, int threads) const;

private:
    std::vector< MatchResult > matchRange(const std::vector< GenotypeObservation >& observations, size_t begin,
                                          size_t end) const;

private:
    const TargetGeneSet&  target_set;
    const CollapsedIndex& collapsed_index;
    std::string           target_gene;
    int                   max_dist;
    SeedIndex             seed_index;
};
