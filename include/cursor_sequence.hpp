#ifndef REVHIST_CURSOR_SEQUENCE_HPP
#define REVHIST_CURSOR_SEQUENCE_HPP

#include <arrow/result.h>
#include <arrow/status.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "linked_node.hpp"
#include "logger.hpp"
#include "node_slab.hpp"

namespace revhist {

/**
 * Doubly-linked sequence with a persistent cursor (the "waist").
 *
 * The waist remembers the last node visited, so reads, inserts and removals
 * near it are O(1) and a relative seek costs O(|delta|). Indexing walks from
 * whichever of head, tail or waist is nearest to the target.
 *
 * The waist is either null (empty sequence) or a node in the chain. Removing
 * the node under it moves it to the following node, or to the preceding one
 * when the tail was removed.
 */
template <typename T>
class CursorSequence {
 public:
  class const_iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using reference = const T&;

    const_iterator() = default;
    const_iterator(const NodeSlab<T>* slab, NodeIndex index)
        : slab_(slab), index_(index) {}

    const T& operator*() const { return (*slab_)[index_].value; }

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
    const NodeSlab<T>* slab_ = nullptr;
    NodeIndex index_ = NULL_INDEX;
  };

  explicit CursorSequence(HistoryConfig config = {})
      : config_(config), slab_(config.get_initial_capacity()) {}

  explicit CursorSequence(std::vector<T> items, HistoryConfig config = {})
      : CursorSequence(config) {
    slab_.reserve(items.size());
    for (T& item : items) {
      push_back(std::move(item));
    }
  }

  CursorSequence(std::initializer_list<T> items, HistoryConfig config = {})
      : CursorSequence(config) {
    for (const T& item : items) {
      push_back(item);
    }
  }

  void push_back(T value) {
    const NodeIndex index =
        slab_.acquire(std::nullopt, std::move(value), tail_, NULL_INDEX);
    if (tail_ == NULL_INDEX) {
      head_ = index;
    } else {
      slab_[tail_].next = index;
    }
    tail_ = index;
    if (waist_ == NULL_INDEX) {
      waist_ = index;
      waist_pos_ = 0;
    }
    ++size_;
  }

  void push_front(T value) {
    const NodeIndex index =
        slab_.acquire(std::nullopt, std::move(value), NULL_INDEX, head_);
    if (head_ == NULL_INDEX) {
      tail_ = index;
    } else {
      slab_[head_].prev = index;
    }
    head_ = index;
    if (waist_ == NULL_INDEX) {
      waist_ = index;
      waist_pos_ = 0;
    } else {
      ++waist_pos_;
    }
    ++size_;
  }

  arrow::Result<T> pop_back() {
    if (tail_ == NULL_INDEX) {
      return out_of_range("pop_back from an empty sequence");
    }
    T value = remove_node(tail_, false);
    ARROW_RETURN_NOT_OK(verify());
    return value;
  }

  arrow::Result<T> pop_front() {
    if (head_ == NULL_INDEX) {
      return out_of_range("pop_front from an empty sequence");
    }
    T value = remove_node(head_, head_ != waist_);
    ARROW_RETURN_NOT_OK(verify());
    return value;
  }

  // Copy of the element at index; negative indices count from the tail
  arrow::Result<T> at(int64_t index) const {
    ARROW_ASSIGN_OR_RAISE(const size_t position, normalize(index));
    return slab_[node_at(position)].value;
  }

  /**
   * Overwrite the element at index. index == size() appends when the
   * config allows set-or-grow, otherwise it is out of range like any other.
   */
  arrow::Status set(int64_t index, T value) {
    if (index >= 0 && static_cast<size_t>(index) == size_ &&
        config_.is_append_at_size_allowed()) {
      push_back(std::move(value));
      return verify();
    }
    ARROW_ASSIGN_OR_RAISE(const size_t position, normalize(index));
    slab_[node_at(position)].value = std::move(value);
    return arrow::Status::OK();
  }

  /**
   * Move the cursor delta positions from where it is now and return the
   * value under it. On failure the cursor stays put.
   */
  arrow::Result<T> seek(int64_t delta) {
    if (waist_ == NULL_INDEX) {
      return out_of_range("seek on an empty sequence");
    }
    // Compare against the room on each side first; waist_pos_ + delta may
    // not be representable
    const bool fits =
        delta >= 0 ? static_cast<uint64_t>(delta) < size_ - waist_pos_
                   : static_cast<uint64_t>(-(delta + 1)) < waist_pos_;
    if (!fits) {
      return out_of_range("seek by ", delta, " from position ", waist_pos_,
                          " leaves a sequence of size ", size_);
    }
    const size_t position =
        delta >= 0 ? waist_pos_ + static_cast<size_t>(delta)
                   : waist_pos_ - static_cast<size_t>(-(delta + 1)) - 1;
    waist_ = node_at(position);
    waist_pos_ = position;
    return slab_[waist_].value;
  }

  arrow::Result<T> cursor_value() const {
    if (waist_ == NULL_INDEX) {
      return out_of_range("no cursor on an empty sequence");
    }
    return slab_[waist_].value;
  }

  arrow::Status set_cursor_value(T value) {
    if (waist_ == NULL_INDEX) {
      return out_of_range("no cursor on an empty sequence");
    }
    slab_[waist_].value = std::move(value);
    return arrow::Status::OK();
  }

  std::optional<size_t> cursor_position() const {
    if (waist_ == NULL_INDEX) return std::nullopt;
    return waist_pos_;
  }

  void reset_cursor() {
    waist_ = head_;
    waist_pos_ = 0;
  }

  /**
   * Link value right after the cursor and move the cursor onto it, so that
   * successive calls keep their order. On an empty sequence the value
   * becomes the only element.
   */
  arrow::Status insert_at_cursor(T value) {
    if (waist_ == NULL_INDEX) {
      push_back(std::move(value));
      return verify();
    }
    const NodeIndex next = slab_[waist_].next;
    const NodeIndex index =
        slab_.acquire(std::nullopt, std::move(value), waist_, next);
    slab_[waist_].next = index;
    if (next == NULL_INDEX) {
      tail_ = index;
    } else {
      slab_[next].prev = index;
    }
    waist_ = index;
    ++waist_pos_;
    ++size_;
    return verify();
  }

  // Remove the element under the cursor and return it
  arrow::Result<T> remove_at_cursor() {
    if (waist_ == NULL_INDEX) {
      return out_of_range("remove_at_cursor on an empty sequence");
    }
    T value = remove_node(waist_, false);
    ARROW_RETURN_NOT_OK(verify());
    return value;
  }

  arrow::Status insert_at(int64_t offset, T value) {
    if (waist_ == NULL_INDEX && offset == 0) {
      return insert_at_cursor(std::move(value));
    }
    ARROW_RETURN_NOT_OK(seek(offset).status());
    return insert_at_cursor(std::move(value));
  }

  arrow::Result<T> remove_at(int64_t offset) {
    ARROW_RETURN_NOT_OK(seek(offset).status());
    return remove_at_cursor();
  }

  void clear() {
    slab_.clear();
    head_ = tail_ = waist_ = NULL_INDEX;
    waist_pos_ = 0;
    size_ = 0;
  }

  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }

  // Nodes traversed by indexing and seeking since construction
  size_t get_steps_walked() const { return steps_walked_; }

  const_iterator begin() const { return const_iterator(&slab_, head_); }
  const_iterator end() const { return const_iterator(&slab_, NULL_INDEX); }

  std::vector<T> to_vector() const {
    std::vector<T> out;
    out.reserve(size_);
    for (const T& value : *this) {
      out.push_back(value);
    }
    return out;
  }

  bool operator==(const CursorSequence& other) const {
    if (size_ != other.size_) return false;
    auto it = other.begin();
    for (const T& value : *this) {
      if (!(value == *it)) return false;
      ++it;
    }
    return true;
  }

  /**
   * Check links, counters and that the waist sits in the chain at the
   * position it claims.
   */
  arrow::Status check_invariants() const {
    if ((head_ == NULL_INDEX) != (size_ == 0) ||
        (tail_ == NULL_INDEX) != (size_ == 0) ||
        (waist_ == NULL_INDEX) != (size_ == 0)) {
      return invariant_violation("head/tail/waist/size disagree: size=",
                                 size_);
    }
    if (slab_.get_live_count() != size_) {
      return invariant_violation("slab holds ", slab_.get_live_count(),
                                 " nodes but size is ", size_);
    }

    size_t position = 0;
    bool waist_seen = false;
    NodeIndex prev = NULL_INDEX;
    for (NodeIndex i = head_; i != NULL_INDEX; i = slab_[i].next) {
      if (!slab_.is_live(i) || slab_[i].prev != prev) {
        return invariant_violation("broken link at node ", i);
      }
      if (i == waist_) {
        if (position != waist_pos_) {
          return invariant_violation("waist found at ", position,
                                     " but recorded at ", waist_pos_);
        }
        waist_seen = true;
      }
      if (++position > size_) {
        return invariant_violation("forward walk exceeds size ", size_);
      }
      prev = i;
    }
    if (prev != tail_ || position != size_) {
      return invariant_violation("forward walk ended after ", position,
                                 " nodes, expected ", size_);
    }
    if (size_ > 0 && !waist_seen) {
      return invariant_violation("waist references node ", waist_,
                                 " outside the chain");
    }
    return arrow::Status::OK();
  }

#ifdef TESTING_ENABLED
  const NodeSlab<T>& get_slab_for_testing() const { return slab_; }
  NodeIndex get_waist_index_for_testing() const { return waist_; }
  void set_waist_for_testing(NodeIndex waist, size_t position) {
    waist_ = waist;
    waist_pos_ = position;
  }
#endif

 private:
  static const ContextLogger& logger() {
    static const ContextLogger instance("CursorSequence");
    return instance;
  }

  arrow::Result<size_t> normalize(int64_t index) const {
    const auto length = static_cast<int64_t>(size_);
    const int64_t normalized = index < 0 ? index + length : index;
    if (normalized < 0 || normalized >= length) {
      return out_of_range("sequence index ", index, " out of range for size ",
                          size_);
    }
    return static_cast<size_t>(normalized);
  }

  // Node at an in-range position, walking from the nearest anchor
  NodeIndex node_at(size_t position) const {
    const size_t from_head = position;
    const size_t from_tail = size_ - 1 - position;
    const size_t from_waist = position > waist_pos_ ? position - waist_pos_
                                                    : waist_pos_ - position;

    NodeIndex node;
    size_t at;
    if (from_waist <= from_head && from_waist <= from_tail) {
      node = waist_;
      at = waist_pos_;
    } else if (from_head <= from_tail) {
      node = head_;
      at = 0;
    } else {
      node = tail_;
      at = size_ - 1;
    }

    while (at < position) {
      node = slab_[node].next;
      ++at;
      ++steps_walked_;
    }
    while (at > position) {
      node = slab_[node].prev;
      --at;
      ++steps_walked_;
    }
    return node;
  }

  /**
   * Unlink and free a node, re-homing the waist when it pointed there.
   * before_waist tells whether the node sits ahead of the waist, in which
   * case the waist position shifts down by one.
   */
  T remove_node(NodeIndex index, bool before_waist) {
    LinkedNode<T> node = slab_.release(index);

    if (index == waist_) {
      if (node.next != NULL_INDEX) {
        waist_ = node.next;
      } else if (node.prev != NULL_INDEX) {
        waist_ = node.prev;
        --waist_pos_;
      } else {
        waist_ = NULL_INDEX;
        waist_pos_ = 0;
      }
      logger().debug("cursor re-homed to position {}", waist_pos_);
    } else if (before_waist) {
      --waist_pos_;
    }

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
    return std::move(node.value);
  }

  arrow::Status verify() const {
    if (!config_.is_invariant_verification_enabled()) {
      return arrow::Status::OK();
    }
    arrow::Status status = check_invariants();
    if (!status.ok()) {
      logger().warn("{}", status.ToString());
    }
    return status;
  }

  HistoryConfig config_;
  NodeSlab<T> slab_;
  NodeIndex head_ = NULL_INDEX;
  NodeIndex tail_ = NULL_INDEX;
  NodeIndex waist_ = NULL_INDEX;
  size_t waist_pos_ = 0;
  size_t size_ = 0;
  mutable size_t steps_walked_ = 0;
};

}  // namespace revhist

#endif  // REVHIST_CURSOR_SEQUENCE_HPP
