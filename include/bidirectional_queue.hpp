#ifndef REVHIST_BIDIRECTIONAL_QUEUE_HPP
#define REVHIST_BIDIRECTIONAL_QUEUE_HPP

#include <arrow/result.h>
#include <arrow/status.h>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <utility>

#include "errors.hpp"
#include "linked_node.hpp"
#include "node_slab.hpp"

namespace revhist {

template <typename V>
struct RevisionEntry {
  Revision rev;
  V value;

  bool operator==(const RevisionEntry& other) const = default;
};

// Read-only (revision, value) pair produced while iterating a queue
template <typename V>
struct EntryView {
  Revision rev;
  const V& value;
};

/**
 * Doubly-linked list of (revision, value) entries with deque-like access.
 *
 * Nodes live in a NodeSlab owned by the queue; head_ and tail_ are slab
 * indices. The size counter is maintained on every mutation, never
 * recomputed by walking the chain.
 *
 * Entries are not reordered by the queue itself: keeping revisions
 * ascending is the job of whoever pushes into it.
 */
template <typename V>
class BidirectionalQueue {
 public:
  using Entry = RevisionEntry<V>;

  class const_iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = EntryView<V>;
    using difference_type = std::ptrdiff_t;
    using reference = EntryView<V>;

    const_iterator() = default;
    const_iterator(const NodeSlab<V>* slab, NodeIndex index)
        : slab_(slab), index_(index) {}

    EntryView<V> operator*() const {
      const LinkedNode<V>& node = (*slab_)[index_];
      return EntryView<V>{*node.key, node.value};
    }

    const_iterator& operator++() {
      index_ = (*slab_)[index_].next;
      return *this;
    }

    const_iterator operator++(int) {
      const_iterator tmp = *this;
      ++(*this);
      return tmp;
    }

    bool operator==(const const_iterator& other) const {
      return index_ == other.index_;
    }
    bool operator!=(const const_iterator& other) const {
      return index_ != other.index_;
    }

   private:
    const NodeSlab<V>* slab_ = nullptr;
    NodeIndex index_ = NULL_INDEX;
  };

  explicit BidirectionalQueue(size_t initial_capacity = 0)
      : slab_(initial_capacity) {}

  void push_back(Revision rev, V value) {
    const NodeIndex index =
        slab_.acquire(rev, std::move(value), tail_, NULL_INDEX);
    if (tail_ == NULL_INDEX) {
      head_ = index;
    } else {
      slab_[tail_].next = index;
    }
    tail_ = index;
    ++size_;
  }

  void push_front(Revision rev, V value) {
    const NodeIndex index =
        slab_.acquire(rev, std::move(value), NULL_INDEX, head_);
    if (head_ == NULL_INDEX) {
      tail_ = index;
    } else {
      slab_[head_].prev = index;
    }
    head_ = index;
    ++size_;
  }

  void push_back(Entry entry) {
    push_back(entry.rev, std::move(entry.value));
  }
  void push_front(Entry entry) {
    push_front(entry.rev, std::move(entry.value));
  }

  // Non-failing removal for internal rebalancing; nullopt when empty
  std::optional<Entry> take_back() {
    if (tail_ == NULL_INDEX) {
      return std::nullopt;
    }
    return unlink(tail_);
  }

  std::optional<Entry> take_front() {
    if (head_ == NULL_INDEX) {
      return std::nullopt;
    }
    return unlink(head_);
  }

  arrow::Result<Entry> pop_back() {
    std::optional<Entry> entry = take_back();
    if (!entry) {
      return out_of_range("pop_back from an empty queue");
    }
    return std::move(*entry);
  }

  arrow::Result<Entry> pop_front() {
    std::optional<Entry> entry = take_front();
    if (!entry) {
      return out_of_range("pop_front from an empty queue");
    }
    return std::move(*entry);
  }

  /**
   * Remove up to n entries from the tail.
   * @return The removed run, in the order it had in this queue
   */
  BidirectionalQueue pop_back_n(size_t n) {
    BidirectionalQueue scratch;
    while (n-- > 0) {
      std::optional<Entry> entry = take_back();
      if (!entry) break;
      scratch.push_front(std::move(*entry));
    }
    return scratch;
  }

  /**
   * Remove up to n entries from the head.
   * @return The removed run, in the order it had in this queue
   */
  BidirectionalQueue pop_front_n(size_t n) {
    BidirectionalQueue scratch;
    while (n-- > 0) {
      std::optional<Entry> entry = take_front();
      if (!entry) break;
      scratch.push_back(std::move(*entry));
    }
    return scratch;
  }

  /**
   * Copy of the entry at index; 0 is the head, -1 the tail.
   * Walks from whichever end is nearer.
   */
  arrow::Result<Entry> at(int64_t index) const {
    ARROW_ASSIGN_OR_RAISE(const NodeIndex node, locate(index));
    return Entry{*slab_[node].key, slab_[node].value};
  }

  // Overwrite the value at index, keeping its revision
  arrow::Status set_value(int64_t index, V value) {
    ARROW_ASSIGN_OR_RAISE(const NodeIndex node, locate(index));
    slab_[node].value = std::move(value);
    return arrow::Status::OK();
  }

  std::optional<Revision> front_revision() const {
    if (head_ == NULL_INDEX) return std::nullopt;
    return slab_[head_].key;
  }

  std::optional<Revision> back_revision() const {
    if (tail_ == NULL_INDEX) return std::nullopt;
    return slab_[tail_].key;
  }

  // Precondition: !empty()
  V& front_value() { return slab_[head_].value; }
  const V& front_value() const { return slab_[head_].value; }
  V& back_value() { return slab_[tail_].value; }
  const V& back_value() const { return slab_[tail_].value; }

  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }

  void clear() {
    slab_.clear();
    head_ = NULL_INDEX;
    tail_ = NULL_INDEX;
    size_ = 0;
  }

  const_iterator begin() const { return const_iterator(&slab_, head_); }
  const_iterator end() const { return const_iterator(&slab_, NULL_INDEX); }

  bool operator==(const BidirectionalQueue& other) const {
    if (size_ != other.size_) {
      return false;
    }
    NodeIndex a = head_;
    NodeIndex b = other.head_;
    while (a != NULL_INDEX) {
      const LinkedNode<V>& lhs = slab_[a];
      const LinkedNode<V>& rhs = other.slab_[b];
      if (lhs.key != rhs.key || !(lhs.value == rhs.value)) {
        return false;
      }
      a = lhs.next;
      b = rhs.next;
    }
    return true;
  }

  /**
   * Walk the chain in both directions and compare with the counter.
   * Returns an InvariantViolation status describing the first defect found.
   */
  arrow::Status check_invariants() const {
    if ((head_ == NULL_INDEX) != (tail_ == NULL_INDEX) ||
        (head_ == NULL_INDEX) != (size_ == 0)) {
      return invariant_violation("head/tail/size disagree: size=", size_);
    }
    if (slab_.get_live_count() != size_) {
      return invariant_violation("slab holds ", slab_.get_live_count(),
                                 " nodes but size is ", size_);
    }
    if (size_ == 0) {
      return arrow::Status::OK();
    }
    if (slab_[head_].prev != NULL_INDEX || slab_[tail_].next != NULL_INDEX) {
      return invariant_violation("chain ends have dangling links");
    }

    size_t forward = 0;
    NodeIndex prev = NULL_INDEX;
    for (NodeIndex i = head_; i != NULL_INDEX; i = slab_[i].next) {
      if (!slab_.is_live(i) || slab_[i].prev != prev || !slab_[i].key) {
        return invariant_violation("broken link at node ", i);
      }
      if (++forward > size_) {
        return invariant_violation("forward walk exceeds size ", size_);
      }
      prev = i;
    }
    if (prev != tail_ || forward != size_) {
      return invariant_violation("forward walk ended after ", forward,
                                 " nodes, expected ", size_);
    }

    size_t backward = 0;
    for (NodeIndex i = tail_; i != NULL_INDEX; i = slab_[i].prev) {
      if (++backward > size_) {
        return invariant_violation("backward walk exceeds size ", size_);
      }
    }
    if (backward != size_) {
      return invariant_violation("backward walk ended after ", backward,
                                 " nodes, expected ", size_);
    }
    return arrow::Status::OK();
  }

#ifdef TESTING_ENABLED
  NodeSlab<V>& get_slab_for_testing() { return slab_; }
  void set_size_for_testing(size_t size) { size_ = size; }
#endif

 private:
  arrow::Result<NodeIndex> locate(int64_t index) const {
    const auto length = static_cast<int64_t>(size_);
    const int64_t normalized = index < 0 ? index + length : index;
    if (normalized < 0 || normalized >= length) {
      return out_of_range("queue index ", index, " out of range for size ",
                          size_);
    }

    NodeIndex node;
    if (normalized <= length - 1 - normalized) {
      node = head_;
      for (int64_t i = 0; i < normalized; ++i) {
        node = slab_[node].next;
      }
    } else {
      node = tail_;
      for (int64_t i = length - 1; i > normalized; --i) {
        node = slab_[node].prev;
      }
    }
    return node;
  }

  Entry unlink(NodeIndex index) {
    LinkedNode<V> node = slab_.release(index);
    if (node.prev == NULL_INDEX) {
      head_ = node.next;
    } else {
      slab_[node.prev].next = node.next;
    }
    if (node.next == NULL_INDEX) {
      tail_ = node.prev;
    } else {
      slab_[node.next].prev = node.prev;
    }
    --size_;
    return Entry{*node.key, std::move(node.value)};
  }

  NodeSlab<V> slab_;
  NodeIndex head_ = NULL_INDEX;
  NodeIndex tail_ = NULL_INDEX;
  size_t size_ = 0;
};

}  // namespace revhist

#endif  // REVHIST_BIDIRECTIONAL_QUEUE_HPP
