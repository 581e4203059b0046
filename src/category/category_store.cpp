// File: src/category/category_store.cpp
#include "category/category_store.hpp"
#include <stdexcept>
#include <string>

namespace resonance {

CategoryStore::CategoryStore(size_t dimension, size_t max_categories)
    : dimension_(dimension), max_categories_(max_categories) {
    if (dimension_ == 0) {
        throw std::invalid_argument("CategoryStore dimension must be greater than 0");
    }
    if (max_categories_ == 0) {
        throw std::invalid_argument("CategoryStore max_categories must be greater than 0");
    }
}

std::optional<CategoryIndex> CategoryStore::Append(WeightVector prototype) {
    if (prototype.size() != dimension_) {
        throw std::invalid_argument(
            "Prototype dimension " + std::to_string(prototype.size()) +
            " does not match store dimension " + std::to_string(dimension_));
    }

    if (IsFull()) {
        return std::nullopt;
    }

    CategoryIndex index = categories_.size();

    Category category;
    category.weights = std::move(prototype);
    category.creation_index = next_creation_index_++;
    category.usage_count = 0;
    category.last_used_at = std::chrono::steady_clock::now();

    categories_.push_back(std::move(category));
    learning_state_.emplace_back();

    return index;
}

const Category& CategoryStore::Get(CategoryIndex index) const {
    CheckIndex(index);
    return categories_[index];
}

Category& CategoryStore::GetMut(CategoryIndex index) {
    CheckIndex(index);
    return categories_[index];
}

const LearningState& CategoryStore::GetLearningState(CategoryIndex index) const {
    CheckIndex(index);
    return learning_state_[index];
}

LearningState& CategoryStore::GetLearningStateMut(CategoryIndex index) {
    CheckIndex(index);
    return learning_state_[index];
}

void CategoryStore::ResetLearningState() {
    for (auto& state : learning_state_) {
        state = LearningState{};
    }
}

IndexRemap CategoryStore::Retain(const std::vector<bool>& keep) {
    if (keep.size() != categories_.size()) {
        throw std::invalid_argument(
            "Retain: mask of " + std::to_string(keep.size()) +
            " entries for a store of " + std::to_string(categories_.size()));
    }

    IndexRemap remap(categories_.size(), kNoCategory);
    CategoryIndex next = 0;
    for (CategoryIndex i = 0; i < categories_.size(); ++i) {
        if (!keep[i]) {
            continue;
        }
        if (next != i) {
            categories_[next] = std::move(categories_[i]);
            learning_state_[next] = learning_state_[i];
        }
        remap[i] = next++;
    }

    categories_.resize(next);
    learning_state_.resize(next);
    return remap;
}

void CategoryStore::Clear() {
    categories_.clear();
    learning_state_.clear();
    next_creation_index_ = 0;
}

void CategoryStore::CheckIndex(CategoryIndex index) const {
    if (index >= categories_.size()) {
        throw std::out_of_range(
            "Category index " + std::to_string(index) +
            " out of range (size " + std::to_string(categories_.size()) + ")");
    }
}

} // namespace resonance
