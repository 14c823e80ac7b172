#pragma once

#include <cstddef>
#include <span>
#include <utility>
#include <vector>

namespace wslfp {

// Row-major dense matrix with contiguous storage.
//
// Used for (source × electrode) amplitude matrices and for
// (time × source) or (time × electrode) sample matrices.
template <typename T>
class dense_matrix {
public:
    using value_type = T;
    using size_type = std::size_t;

    dense_matrix() = default;

    dense_matrix(size_type rows, size_type cols, const T& value = T{}):
        rows_(rows), cols_(cols), data_(rows*cols, value)
    {}

    // Take ownership of row-major data; the caller guarantees data.size() == rows*cols.
    dense_matrix(size_type rows, size_type cols, std::vector<T> data):
        rows_(rows), cols_(cols), data_(std::move(data))
    {}

    size_type rows() const { return rows_; }
    size_type cols() const { return cols_; }
    size_type size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    T& operator()(size_type i, size_type j) { return data_[i*cols_+j]; }
    const T& operator()(size_type i, size_type j) const { return data_[i*cols_+j]; }

    std::span<T> row(size_type i) { return {data_.data()+i*cols_, cols_}; }
    std::span<const T> row(size_type i) const { return {data_.data()+i*cols_, cols_}; }

    T* data() { return data_.data(); }
    const T* data() const { return data_.data(); }

    const std::vector<T>& values() const { return data_; }

    bool operator==(const dense_matrix&) const = default;

private:
    size_type rows_ = 0;
    size_type cols_ = 0;
    std::vector<T> data_;
};

// Amplitude weights indexed by (source, electrode).
using amplitude_matrix = dense_matrix<double>;

// Samples indexed by (time, column), where columns are sources, electrodes
// or synaptic targets depending on context.
using sample_matrix = dense_matrix<double>;

} // namespace wslfp
