// File: src/category/category_store.hpp
#pragma once

#include "category/category.hpp"
#include "core/types.hpp"
#include <optional>
#include <vector>

namespace resonance {

/// Old index -> new index after a compaction; kNoCategory if removed
using IndexRemap = std::vector<CategoryIndex>;

/// CategoryStore: Append-only ordered collection of categories
///
/// Indices are assigned in append order and stay valid until Clear() or
/// Retain(). The store never compacts or evicts on its own: when Size()
/// reaches Capacity(), Append() reports the condition by returning
/// std::nullopt and leaves the decision to the caller.
///
/// Not thread-safe. A store has a single writer; distinct stores may
/// be used from different threads.
class CategoryStore {
public:
    /// @param dimension Weight-vector dimension of every category
    /// @param max_categories Capacity (must be > 0)
    CategoryStore(size_t dimension, size_t max_categories);

    /// Append a new category initialised from a prototype
    /// @return Index of the new category, or std::nullopt if full
    std::optional<CategoryIndex> Append(WeightVector prototype);

    /// Read access to a category
    const Category& Get(CategoryIndex index) const;

    /// Write access to a category (weights and usage count)
    Category& GetMut(CategoryIndex index);

    /// Learning-rule side state for a category
    const LearningState& GetLearningState(CategoryIndex index) const;
    LearningState& GetLearningStateMut(CategoryIndex index);

    /// Restore every side-state entry to its defaults
    void ResetLearningState();

    /// Keep only the categories whose `keep` flag is set
    ///
    /// Survivors keep their relative order and their learning state.
    /// @return Remap from old to new indices
    /// @throws std::invalid_argument if keep.size() != Size()
    IndexRemap Retain(const std::vector<bool>& keep);

    /// Remove every category
    void Clear();

    size_t Size() const { return categories_.size(); }
    size_t Capacity() const { return max_categories_; }
    size_t Dimension() const { return dimension_; }
    bool IsEmpty() const { return categories_.empty(); }
    bool IsFull() const { return categories_.size() >= max_categories_; }

    /// Iterator support
    using const_iterator = std::vector<Category>::const_iterator;
    const_iterator begin() const { return categories_.begin(); }
    const_iterator end() const { return categories_.end(); }

private:
    void CheckIndex(CategoryIndex index) const;

    size_t dimension_;
    size_t max_categories_;
    CategoryIndex next_creation_index_{0};
    std::vector<Category> categories_;
    std::vector<LearningState> learning_state_;
};

} // namespace resonance
