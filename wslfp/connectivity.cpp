#include <algorithm>
#include <cmath>
#include <numeric>
#include <tuple>
#include <utility>
#include <vector>

#include <wslfp/connectivity.hpp>
#include <wslfp/wslfpexcept.hpp>

#include "util/strprintf.hpp"

namespace wslfp {

using util::pprintf;

sparse_connectivity::sparse_connectivity(size_type num_sources, size_type num_targets,
                                         std::vector<size_type> offsets,
                                         std::vector<index_type> tgts,
                                         std::vector<double> wgts):
    num_sources_(num_sources),
    num_targets_(num_targets),
    row_offsets_(std::move(offsets)),
    targets_(std::move(tgts)),
    weights_(std::move(wgts))
{
    if (row_offsets_.size()!=std::size_t(num_sources_)+1) {
        throw bad_connectivity(pprintf("{} row offsets for {} sources", row_offsets_.size(), num_sources_));
    }
    if (row_offsets_.front()!=0 || row_offsets_.back()!=targets_.size()) {
        throw bad_connectivity("row offsets must start at 0 and end at the number of connections");
    }
    if (!std::is_sorted(row_offsets_.begin(), row_offsets_.end())) {
        throw bad_connectivity("row offsets must be non-decreasing");
    }
    if (targets_.size()!=weights_.size()) {
        throw bad_connectivity(pprintf("{} target indices but {} weights", targets_.size(), weights_.size()));
    }
    for (index_type i = 0; i<num_sources_; ++i) {
        auto row = targets(i);
        for (std::size_t k = 0; k<row.size(); ++k) {
            if (row[k]>=num_targets_) {
                throw bad_connectivity(pprintf("source {} connects to target {}, but there are only {} targets",
                                               i, row[k], num_targets_));
            }
            if (k>0 && !(row[k-1]<row[k])) {
                throw bad_connectivity(pprintf("targets of source {} must be sorted and unique", i));
            }
        }
    }
    if (!std::all_of(weights_.begin(), weights_.end(), [](double w) { return std::isfinite(w); })) {
        throw bad_connectivity("non-finite weight");
    }
}

sparse_connectivity sparse_connectivity::from_entries(size_type num_sources, size_type num_targets,
                                                      std::vector<connection_entry> entries)
{
    for (const auto& e: entries) {
        if (e.source>=num_sources || e.target>=num_targets) {
            throw bad_connectivity(pprintf("connection ({}, {}) outside {}×{} matrix",
                                           e.source, e.target, num_sources, num_targets));
        }
    }

    std::sort(entries.begin(), entries.end(),
        [](const auto& a, const auto& b) { return std::tie(a.source, a.target)<std::tie(b.source, b.target); });

    std::vector<size_type> offsets(std::size_t(num_sources)+1, 0);
    std::vector<index_type> targets;
    std::vector<double> weights;

    for (auto it = entries.begin(); it!=entries.end();) {
        auto src = it->source;
        auto tgt = it->target;
        double w = 0;
        for (; it!=entries.end() && it->source==src && it->target==tgt; ++it) {
            w += it->weight;
        }
        if (w==0) continue;
        targets.push_back(tgt);
        weights.push_back(w);
        ++offsets[src+1];
    }
    std::partial_sum(offsets.begin(), offsets.end(), offsets.begin());

    return sparse_connectivity(num_sources, num_targets, std::move(offsets), std::move(targets), std::move(weights));
}

sparse_connectivity sparse_connectivity::from_dense(const dense_matrix<double>& weights) {
    std::vector<connection_entry> entries;
    for (index_type i = 0; i<weights.rows(); ++i) {
        for (index_type j = 0; j<weights.cols(); ++j) {
            if (double w = weights(i, j); w!=0) {
                entries.push_back({i, j, w});
            }
        }
    }
    return from_entries(weights.rows(), weights.cols(), std::move(entries));
}

double sparse_connectivity::weight(index_type source, index_type target) const {
    if (source>=num_sources_) return 0;
    auto row = targets(source);
    auto it = std::lower_bound(row.begin(), row.end(), target);
    if (it==row.end() || *it!=target) return 0;
    return weights(source)[it-row.begin()];
}

} // namespace wslfp
