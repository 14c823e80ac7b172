#pragma once

#include <span>
#include <vector>

#include <wslfp/common_types.hpp>
#include <wslfp/dense_matrix.hpp>
#include <wslfp/export.hpp>

namespace wslfp {

// A single weighted connection from a presynaptic source to a postsynaptic target.
struct connection_entry {
    index_type source;
    index_type target;
    double weight;
};

// Compressed sparse row representation of a (num_sources × num_targets)
// weight matrix. Rows are presynaptic sources; within a row, targets are
// sorted and unique.
class WSLFP_SYMBOL_VISIBLE sparse_connectivity {
public:
    sparse_connectivity() = default;

    // Validating constructor from raw CSR arrays; throws bad_connectivity.
    sparse_connectivity(size_type num_sources, size_type num_targets,
                        std::vector<size_type> offsets,
                        std::vector<index_type> tgts,
                        std::vector<double> wgts);

    // Entries with the same (source, target) are summed; zero weights are dropped.
    static sparse_connectivity from_entries(size_type num_sources, size_type num_targets,
                                            std::vector<connection_entry> entries);

    static sparse_connectivity from_dense(const dense_matrix<double>& weights);

    size_type num_sources() const { return num_sources_; }
    size_type num_targets() const { return num_targets_; }
    std::size_t num_connections() const { return targets_.size(); }

    std::span<const index_type> targets(index_type source) const {
        return {targets_.data()+row_offsets_[source], targets_.data()+row_offsets_[source+1]};
    }

    std::span<const double> weights(index_type source) const {
        return {weights_.data()+row_offsets_[source], weights_.data()+row_offsets_[source+1]};
    }

    // Weight of the connection (source, target), or zero if absent.
    double weight(index_type source, index_type target) const;

private:
    size_type num_sources_ = 0;
    size_type num_targets_ = 0;
    std::vector<size_type> row_offsets_ = {0};
    std::vector<index_type> targets_;
    std::vector<double> weights_;
};

} // namespace wslfp
