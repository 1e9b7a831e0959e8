// Minimal N-dimensional, row-major tensor with value semantics.

#pragma once

#include "errors.hpp"

#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

using Shape = std::vector<std::size_t>;

/**
 * @brief Renders a shape as "(d0, d1, ...)" for error messages.
 */
inline std::string shape_to_string(const Shape& shape) {
    std::string s = "(";
    for (std::size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) {
            s += ", ";
        }
        s += std::to_string(shape[i]);
    }
    return s + ")";
}

inline std::size_t shape_numel(const Shape& shape) {
    std::size_t n = 1;
    for (const std::size_t d : shape) {
        n *= d;
    }
    return n;
}

/**
 * @class BasicTensor
 * @brief An N-dimensional array of T with a shape descriptor.
 *
 * Elements are stored contiguously in row-major order, so the last axis is
 * the fastest varying one. Copies are deep: two tensors never share storage.
 *
 * Example usage:
 * @code
 *   Tensor x({2, 3, 4});          // zero filled
 *   x.at({1, 2, 3}) = 1.0f;
 *   const float* row = x.data() + (1 * 3 + 2) * 4;
 * @endcode
 */
template <typename T>
class BasicTensor {
public:
    // Empty rank-1 tensor of shape (0).
    BasicTensor() : shape_{0} {}

    explicit BasicTensor(Shape shape, const T& value = T())
        : shape_(std::move(shape)), data_(shape_numel(shape_), value) {}

    /**
     * @brief Wraps existing row-major data.
     * @throws ShapeError if data.size() does not match the shape.
     */
    BasicTensor(Shape shape, std::vector<T> data)
        : shape_(std::move(shape)), data_(std::move(data))
    {
        if (data_.size() != shape_numel(shape_)) {
            throw ShapeError("Tensor data of size " + std::to_string(data_.size()) +
                             " does not match shape " + shape_to_string(shape_));
        }
    }

    const Shape& shape() const { return shape_; }
    std::size_t rank() const { return shape_.size(); }
    std::size_t numel() const { return data_.size(); }

    std::size_t dim(const std::size_t axis) const {
        if (axis >= shape_.size()) {
            throw IndexError("Axis " + std::to_string(axis) + " out of range for shape " +
                             shape_to_string(shape_));
        }
        return shape_[axis];
    }

    T* data() { return data_.data(); }
    const T* data() const { return data_.data(); }
    const std::vector<T>& values() const { return data_; }

    T& operator[](const std::size_t i) { return data_[i]; }
    const T& operator[](const std::size_t i) const { return data_[i]; }

    T& at(std::initializer_list<std::size_t> index) { return data_[offset(index)]; }
    const T& at(std::initializer_list<std::size_t> index) const { return data_[offset(index)]; }

    void fill(const T& value) {
        for (T& v : data_) {
            v = value;
        }
    }

    bool operator==(const BasicTensor& other) const {
        return shape_ == other.shape_ && data_ == other.data_;
    }
    bool operator!=(const BasicTensor& other) const { return !(*this == other); }

private:
    std::size_t offset(std::initializer_list<std::size_t> index) const {
        if (index.size() != shape_.size()) {
            throw IndexError("Index of rank " + std::to_string(index.size()) +
                             " used on tensor of shape " + shape_to_string(shape_));
        }
        std::size_t off = 0;
        std::size_t axis = 0;
        for (const std::size_t i : index) {
            if (i >= shape_[axis]) {
                throw IndexError("Index " + std::to_string(i) + " out of range on axis " +
                                 std::to_string(axis) + " of shape " + shape_to_string(shape_));
            }
            off = off * shape_[axis] + i;
            ++axis;
        }
        return off;
    }

    Shape shape_;
    std::vector<T> data_;
};

using Tensor = BasicTensor<float>;
using IndexTensor = BasicTensor<int>;
