#pragma once

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace escrow {

// -----------------------------------------------------------------------------
// EnumerableSet<T>
// -----------------------------------------------------------------------------
//
// @brief  Set with O(1) membership, O(1) insert, O(1) erase, and a compact,
//         index-addressable list of its members.
//
// @details
// Storage is a dense std::vector of members plus an index map from member to
// its position in the vector:
//
//   items_  = [ A, B, C, D ]
//   index_  = { A:0, B:1, C:2, D:3 }
//
// erase(B) moves the last member into B's slot, fixes the moved member's
// index entry, and shrinks the vector (swap-and-pop):
//
//   items_  = [ A, D, C ]
//   index_  = { A:0, D:1, C:2 }
//
// The list order is therefore insertion order until the first erase, and
// after that an implementation-defined but stable order: it only changes when
// the set is mutated. Callers (AllowlistRegistry, ClaimableLedger) expose it
// as such.
//
// Invariants:
//   - items_.size() == index_.size()
//   - index_[items_[i]] == i for every i
//   - no duplicates in items_
//
// Value semantics: copyable and movable, so owners can be captured by value
// for rollback.
// -----------------------------------------------------------------------------
template <typename T, typename Hash = std::hash<T>>
class EnumerableSet {
 public:
  bool contains(const T& value) const { return index_.count(value) != 0; }

  // Returns false (and does nothing) if the value is already present.
  bool insert(const T& value) {
    if (contains(value)) {
      return false;
    }
    index_.emplace(value, items_.size());
    items_.push_back(value);
    return true;
  }

  // Returns false (and does nothing) if the value is absent.
  bool erase(const T& value) {
    auto it = index_.find(value);
    if (it == index_.end()) {
      return false;
    }

    const std::size_t slot = it->second;
    const std::size_t last = items_.size() - 1;

    // Drop the index entry first: `value` may alias an element of items_.
    index_.erase(it);

    if (slot != last) {
      items_[slot] = std::move(items_[last]);
      index_[items_[slot]] = slot;
    }

    items_.pop_back();
    return true;
  }

  const std::vector<T>& values() const { return items_; }
  const T& back() const { return items_.back(); }

  std::size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }

 private:
  std::vector<T> items_;
  std::unordered_map<T, std::size_t, Hash> index_;
};

}  // namespace escrow
