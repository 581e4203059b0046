// File: src/core/pattern.cpp
#include "core/pattern.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace resonance {

// ============================================================================
// Pattern Implementation
// ============================================================================

Pattern::Pattern(const StorageType& data) : data_(data) {
    Validate();
}

Pattern::Pattern(StorageType&& data) : data_(std::move(data)) {
    Validate();
}

Pattern::Pattern(std::initializer_list<ValueType> values) : data_(values) {
    Validate();
}

void Pattern::Validate() const {
    if (data_.empty()) {
        throw std::invalid_argument("Pattern cannot be empty");
    }
    for (size_t i = 0; i < data_.size(); ++i) {
        if (!std::isfinite(data_[i])) {
            throw std::invalid_argument(
                "Pattern component " + std::to_string(i) + " is not finite");
        }
    }
}

Pattern Pattern::ComplementCoded(const StorageType& values) {
    if (values.empty()) {
        throw std::invalid_argument("Cannot complement-code an empty vector");
    }

    StorageType coded(values.size() * 2);
    for (size_t i = 0; i < values.size(); ++i) {
        double v = std::clamp(values[i], 0.0, 1.0);
        coded[i] = v;
        coded[i + values.size()] = 1.0 - v;
    }
    return Pattern(std::move(coded));
}

Pattern Pattern::ComplementCoded() const {
    return ComplementCoded(data_);
}

double Pattern::L1Norm() const {
    double sum = 0.0;
    for (double v : data_) {
        sum += std::abs(v);
    }
    return sum;
}

WeightVector Pattern::FuzzyAnd(const WeightVector& weights) const {
    if (weights.size() != data_.size()) {
        throw std::invalid_argument("Dimensions must match for fuzzy AND");
    }

    WeightVector result(data_.size());
    for (size_t i = 0; i < data_.size(); ++i) {
        result[i] = std::min(data_[i], weights[i]);
    }
    return result;
}

double Pattern::FuzzyAndNorm(const WeightVector& weights) const {
    if (weights.size() != data_.size()) {
        throw std::invalid_argument("Dimensions must match for fuzzy AND");
    }

    double sum = 0.0;
    for (size_t i = 0; i < data_.size(); ++i) {
        sum += std::min(data_[i], weights[i]);
    }
    return sum;
}

bool Pattern::IsNormalized() const {
    return std::all_of(data_.begin(), data_.end(),
                       [](double v) { return v >= 0.0 && v <= 1.0; });
}

std::string Pattern::ToString(size_t max_elements) const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4);
    oss << "Pattern(dim=" << data_.size() << ", [";

    size_t n = std::min(max_elements, data_.size());
    for (size_t i = 0; i < n; ++i) {
        if (i > 0) oss << ", ";
        oss << data_[i];
    }
    if (data_.size() > max_elements) {
        oss << ", ...";
    }
    oss << "])";
    return oss.str();
}

double L1Norm(const WeightVector& weights) {
    double sum = 0.0;
    for (double w : weights) {
        sum += std::abs(w);
    }
    return sum;
}

} // namespace resonance
