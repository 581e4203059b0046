// File: src/core/pattern.hpp
#pragma once

#include "core/types.hpp"
#include <initializer_list>
#include <string>
#include <vector>

namespace resonance {

// Pattern: Immutable fixed-length input vector
//
// Components are expected in [0, 1]. Complement coding concatenates the
// original values with their complements so that the L1 norm of every
// coded pattern equals the original dimension.
class Pattern {
public:
    using ValueType = double;
    using StorageType = std::vector<ValueType>;

    // Constructors (reject empty and non-finite input)
    explicit Pattern(const StorageType& data);
    explicit Pattern(StorageType&& data);
    Pattern(std::initializer_list<ValueType> values);

    // Complement-code raw values in [0, 1]: [x, 1 - x]
    static Pattern ComplementCoded(const StorageType& values);

    // Get dimension
    size_t Dimension() const { return data_.size(); }

    // Element access
    ValueType operator[](size_t index) const { return data_[index]; }

    // Get raw data
    const StorageType& Data() const { return data_; }

    // |p| = sum of components
    double L1Norm() const;

    // Fuzzy AND (component-wise minimum) with a weight vector
    WeightVector FuzzyAnd(const WeightVector& weights) const;

    // |p ∧ w| without materialising the intersection
    double FuzzyAndNorm(const WeightVector& weights) const;

    // True if every component lies in [0, 1]
    bool IsNormalized() const;

    // Complement-code this pattern
    Pattern ComplementCoded() const;

    // Equality comparison (exact)
    bool operator==(const Pattern& other) const { return data_ == other.data_; }
    bool operator!=(const Pattern& other) const { return !(*this == other); }

    // String representation
    std::string ToString(size_t max_elements = 10) const;

private:
    void Validate() const;

    StorageType data_;
};

// L1 norm of a weight vector
double L1Norm(const WeightVector& weights);

} // namespace resonance
