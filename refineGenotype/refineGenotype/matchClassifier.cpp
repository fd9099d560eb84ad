/*
 * File: matchClassifier.cpp
 * Created Data: 2026-10-18
 *
 * Copyright (c) 2026 BGI-Research
 */

#include "matchClassifier.h"
#include "threadpool.h"
#include "timer.h"
#include "umiCodec.h"

#include <algorithm>
#include <cstdlib>
#include <functional>
#include <future>
#include <unordered_set>

#include <spdlog/spdlog.h>

// Minimum observations handled by one task
static const size_t MIN_CHUNK_SIZE = 256;
// Tasks committed for each thread
static const size_t CHUNKS_PER_THREAD = 4;

int boundedLevenshtein(const std::string& s1, const std::string& s2, int max_dist)
{
    int n = s1.size(), m = s2.size();
    if (std::abs(n - m) > max_dist)
        return max_dist + 1;

    // Only the cells within max_dist of the diagonal are needed
    const int          inf = max_dist + 1;
    std::vector< int > prev(m + 1, inf), curr(m + 1, inf);
    for (int j = 0; j <= std::min(m, max_dist); ++j)
        prev[j] = j;
    for (int i = 1; i <= n; ++i)
    {
        int lo = std::max(1, i - max_dist), hi = std::min(m, i + max_dist);
        std::fill(curr.begin(), curr.end(), inf);
        curr[0]     = i <= max_dist ? i : inf;
        int row_min = curr[0];
        for (int j = lo; j <= hi; ++j)
        {
            int cost = s1[i - 1] == s2[j - 1] ? 0 : 1;
            int d    = std::min({ prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost });
            curr[j]  = std::min(d, inf);
            row_min  = std::min(row_min, curr[j]);
        }
        if (row_min > max_dist)
            return inf;
        std::swap(prev, curr);
    }
    return std::min(prev[m], inf);
}

std::vector< std::pair< size_t, size_t > > SeedIndex::pieces(size_t len, int n)
{
    std::vector< std::pair< size_t, size_t > > res;
    size_t                                     start = 0;
    for (int i = 0; i < n; ++i)
    {
        // The first pieces take the remainder
        size_t l = len / n + (size_t(i) < len % n ? 1 : 0);
        res.push_back({ start, l });
        start += l;
    }
    return res;
}

SeedIndex::SeedIndex(const std::vector< std::string >& seqs_, int max_dist_) : seqs(seqs_), max_dist(max_dist_)
{
    if (max_dist < 0)
        return;
    int n = max_dist + 1;
    for (size_t i = 0; i < seqs.size(); ++i)
    {
        const std::string& s = seqs[i];
        if (s.size() < size_t(n))
        {
            short_seqs.push_back(i);
            continue;
        }
        auto& piece_seeds = seeds[s.size()];
        if (piece_seeds.empty())
            piece_seeds.resize(n);
        auto parts = pieces(s.size(), n);
        for (int p = 0; p < n; ++p)
            piece_seeds[p][s.substr(parts[p].first, parts[p].second)].push_back(i);
    }
}

bool SeedIndex::hasNeighbor(const std::string& query) const
{
    if (max_dist < 0)
        return false;

    std::unordered_set< size_t > checked;
    auto                         verify = [&](size_t idx) {
        if (!checked.insert(idx).second)
            return false;
        return boundedLevenshtein(query, seqs[idx], max_dist) <= max_dist;
    };

    long qlen = query.size();
    for (auto& [len, piece_seeds] : seeds)
    {
        if (std::abs(long(len) - qlen) > max_dist)
            continue;
        auto parts = pieces(len, max_dist + 1);
        for (size_t p = 0; p < parts.size(); ++p)
        {
            for (int d = -max_dist; d <= max_dist; ++d)
            {
                long start = long(parts[p].first) + d;
                long plen  = parts[p].second;
                if (start < 0 || start + plen > qlen)
                    continue;
                auto it = piece_seeds[p].find(query.substr(start, plen));
                if (it == piece_seeds[p].end())
                    continue;
                for (auto& idx : it->second)
                    if (verify(idx))
                        return true;
            }
        }
    }

    for (auto& idx : short_seqs)
        if (verify(idx))
            return true;
    return false;
}

MatchResult MatchClassifier::match(const GenotypeObservation& obs) const
{
    MatchResult res;
    res.umi_code = encodeUmi(obs.umi);
    res.exact    = target_set.contains(obs.barcode, obs.umi);
    // Not short-circuited by exact match
    res.approx = seed_index.hasNeighbor(obs.barcode + obs.umi);

    res.in_gex = false;
    auto it    = collapsed_index.find(obs.barcode);
    if (it != collapsed_index.end())
    {
        auto umi_it = it->second.find(res.umi_code);
        if (umi_it != it->second.end())
        {
            res.in_gex     = true;
            res.gene_label = umi_it->second.gene;
        }
    }

    if (res.exact)
        res.match_class = MatchClass::EXACT;
    else if (res.approx)
        res.match_class = MatchClass::APPROX;
    else if (res.in_gex && res.gene_label != target_gene)
        res.match_class = MatchClass::OTHER_GENE;
    else
        res.match_class = MatchClass::NO_GENE;
    return res;
}

std::vector< MatchResult > MatchClassifier::matchRange(const std::vector< GenotypeObservation >& observations,
                                                       size_t begin, size_t end) const
{
    std::vector< MatchResult > res;
    res.reserve(end - begin);
    for (size_t i = begin; i < end; ++i)
        res.push_back(match(observations[i]));
    return res;
}

MatchMetrics MatchClassifier::classify(std::vector< GenotypeObservation >& observations, int threads) const
{
    Timer timer;
    threads = std::max(1, threads);
    size_t chunk =
        std::max(MIN_CHUNK_SIZE, (observations.size() + threads * CHUNKS_PER_THREAD - 1) / (threads * CHUNKS_PER_THREAD));

    // Using theadpool to accelerate process
    std::threadpool executor{ static_cast< unsigned short >(threads) };

    std::vector< std::future< std::vector< MatchResult > > > results;
    for (size_t begin = 0; begin < observations.size(); begin += chunk)
    {
        size_t end = std::min(begin + chunk, observations.size());
        results.emplace_back(
            executor.commit(std::bind(&MatchClassifier::matchRange, this, std::cref(observations), begin, end)));
    }

    // Join the results by the original order
    MatchMetrics metrics;
    size_t       idx = 0;
    for (auto&& result : results)
    {
        for (auto& r : result.get())
        {
            GenotypeObservation& obs = observations[idx++];
            obs.umi_code             = r.umi_code;
            obs.exact                = r.exact;
            obs.approx               = r.approx;
            obs.in_gex               = r.in_gex;
            obs.gene_label           = std::move(r.gene_label);
            obs.match_class          = r.match_class;
            switch (r.match_class)
            {
            case MatchClass::EXACT:
                ++metrics.exact;
                break;
            case MatchClass::APPROX:
                ++metrics.approx;
                break;
            case MatchClass::OTHER_GENE:
                ++metrics.other_gene;
                break;
            default:
                ++metrics.no_gene;
                break;
            }
        }
    }

    spdlog::info("Classify umi observations:{} exact:{} approx:{} other gene:{} no gene:{} time(s):{:.2f}",
                 observations.size(), metrics.exact, metrics.approx, metrics.other_gene, metrics.no_gene,
                 timer.toc(1000));
    return metrics;
}
