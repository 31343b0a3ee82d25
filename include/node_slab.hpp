#ifndef REVHIST_NODE_SLAB_HPP
#define REVHIST_NODE_SLAB_HPP

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "linked_node.hpp"

namespace revhist {

/**
 * Slab of LinkedNode slots with free list support
 * Provides O(1) acquire/release with slot reuse
 *
 * Nodes are addressed by NodeIndex instead of pointers, so growing the
 * underlying vector never invalidates a link. A released slot is emptied
 * immediately and its index goes onto the free list; the next acquire()
 * takes the most recently released slot.
 */
template <typename V>
class NodeSlab {
 public:
  explicit NodeSlab(size_t initial_capacity = 0) {
    slots_.reserve(initial_capacity);
  }

  NodeSlab(const NodeSlab&) = default;
  NodeSlab& operator=(const NodeSlab&) = default;
  NodeSlab(NodeSlab&&) = default;
  NodeSlab& operator=(NodeSlab&&) = default;

  /**
   * Place a new node into a free slot (or a fresh one)
   * @return Index of the node
   */
  NodeIndex acquire(std::optional<Revision> key, V value,
                    NodeIndex prev = NULL_INDEX, NodeIndex next = NULL_INDEX) {
    if (!free_slots_.empty()) {
      const NodeIndex index = free_slots_.back();
      free_slots_.pop_back();
      slots_[index].emplace(key, std::move(value), prev, next);
      ++live_count_;
      return index;
    }
    slots_.emplace_back(std::in_place, key, std::move(value), prev, next);
    ++live_count_;
    return slots_.size() - 1;
  }

  /**
   * Empty a slot and hand the node back to the caller
   * Caller must have unlinked it from its neighbors already
   */
  LinkedNode<V> release(NodeIndex index) {
    LinkedNode<V> node = std::move(*slots_[index]);
    slots_[index].reset();
    free_slots_.push_back(index);
    --live_count_;
    return node;
  }

  LinkedNode<V>& operator[](NodeIndex index) { return *slots_[index]; }
  const LinkedNode<V>& operator[](NodeIndex index) const {
    return *slots_[index];
  }

  bool is_live(NodeIndex index) const {
    return index < slots_.size() && slots_[index].has_value();
  }

  /**
   * Drop every node; slot storage is kept for reuse
   */
  void clear() {
    slots_.clear();
    free_slots_.clear();
    live_count_ = 0;
  }

  void reserve(size_t capacity) { slots_.reserve(capacity); }

  // Statistics
  size_t get_live_count() const { return live_count_; }
  size_t get_slot_count() const { return slots_.size(); }
  size_t get_free_slot_count() const { return free_slots_.size(); }

 private:
  std::vector<std::optional<LinkedNode<V>>> slots_;
  std::vector<NodeIndex> free_slots_;
  size_t live_count_ = 0;
};

}  // namespace revhist

#endif  // REVHIST_NODE_SLAB_HPP
