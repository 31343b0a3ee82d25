#ifndef REVHIST_WINDOWED_MAP_HPP
#define REVHIST_WINDOWED_MAP_HPP

#include <arrow/result.h>
#include <arrow/status.h>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "bidirectional_queue.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "linked_node.hpp"
#include "logger.hpp"

namespace revhist {

/**
 * Value recorded at one revision. std::nullopt is the "unset" marker: the
 * attribute has no value from that revision on, until the next set entry.
 */
template <typename V>
using Slot = std::optional<V>;

/**
 * Revision-keyed map that answers "what was the value as of revision R".
 *
 * The history is split in two queues: past_ holds every entry at or before
 * the most recently sought revision, future_ everything after it. Reading
 * past_ ++ future_ head to tail always gives strictly ascending revisions.
 * seek() moves entries across the split point one at a time, so repeated
 * lookups at the same or neighboring revisions cost O(1) amortized and a
 * jump costs O(entries crossed).
 *
 * Not thread-safe; seek() mutates even on reads. Use HistoryStore for
 * shared access.
 */
template <typename V>
class RevisionWindowedMap {
 public:
  using Queue = BidirectionalQueue<Slot<V>>;
  using Entry = RevisionEntry<Slot<V>>;

  // Ascending walk over past_ then future_; never moves the window
  class const_iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = EntryView<Slot<V>>;
    using difference_type = std::ptrdiff_t;
    using reference = EntryView<Slot<V>>;

    const_iterator() = default;
    const_iterator(const Queue* past, const Queue* future, bool at_end)
        : future_(future) {
      if (at_end) {
        in_past_ = false;
        it_ = future->end();
      } else {
        in_past_ = true;
        it_ = past->begin();
        past_end_ = past->end();
        cross_split();
      }
    }

    reference operator*() const { return *it_; }

    const_iterator& operator++() {
      ++it_;
      cross_split();
      return *this;
    }

    const_iterator operator++(int) {
      const_iterator tmp = *this;
      ++(*this);
      return tmp;
    }

    bool operator==(const const_iterator& other) const {
      return in_past_ == other.in_past_ && it_ == other.it_;
    }
    bool operator!=(const const_iterator& other) const {
      return !(*this == other);
    }

   private:
    void cross_split() {
      if (in_past_ && it_ == past_end_) {
        in_past_ = false;
        it_ = future_->begin();
      }
    }

    const Queue* future_ = nullptr;
    typename Queue::const_iterator it_;
    typename Queue::const_iterator past_end_;
    bool in_past_ = false;
  };

  class KeysView {
   public:
    class iterator {
     public:
      using iterator_category = std::input_iterator_tag;
      using value_type = Revision;
      using difference_type = std::ptrdiff_t;
      using reference = Revision;

      iterator() = default;
      explicit iterator(const_iterator it) : it_(it) {}

      Revision operator*() const { return (*it_).rev; }
      iterator& operator++() {
        ++it_;
        return *this;
      }
      iterator operator++(int) {
        iterator tmp = *this;
        ++it_;
        return tmp;
      }
      bool operator==(const iterator& other) const { return it_ == other.it_; }
      bool operator!=(const iterator& other) const { return it_ != other.it_; }

     private:
      const_iterator it_;
    };

    explicit KeysView(const RevisionWindowedMap* map) : map_(map) {}

    iterator begin() const { return iterator(map_->begin()); }
    iterator end() const { return iterator(map_->end()); }
    size_t size() const { return map_->size(); }

    // True iff rev is a recorded revision (set or unset)
    bool contains(Revision rev) const {
      for (const Revision recorded : *this) {
        if (recorded == rev) return true;
        if (recorded > rev) return false;
      }
      return false;
    }

   private:
    const RevisionWindowedMap* map_;
  };

  class ValuesView {
   public:
    class iterator {
     public:
      using iterator_category = std::input_iterator_tag;
      using value_type = Slot<V>;
      using difference_type = std::ptrdiff_t;
      using reference = const Slot<V>&;

      iterator() = default;
      explicit iterator(const_iterator it) : it_(it) {}

      const Slot<V>& operator*() const { return (*it_).value; }
      iterator& operator++() {
        ++it_;
        return *this;
      }
      iterator operator++(int) {
        iterator tmp = *this;
        ++it_;
        return tmp;
      }
      bool operator==(const iterator& other) const { return it_ == other.it_; }
      bool operator!=(const iterator& other) const { return it_ != other.it_; }

     private:
      const_iterator it_;
    };

    explicit ValuesView(const RevisionWindowedMap* map) : map_(map) {}

    iterator begin() const { return iterator(map_->begin()); }
    iterator end() const { return iterator(map_->end()); }
    size_t size() const { return map_->size(); }

    bool contains(const Slot<V>& slot) const {
      return std::any_of(begin(), end(),
                         [&](const Slot<V>& v) { return v == slot; });
    }

   private:
    const RevisionWindowedMap* map_;
  };

  class ItemsView {
   public:
    explicit ItemsView(const RevisionWindowedMap* map) : map_(map) {}

    const_iterator begin() const { return map_->begin(); }
    const_iterator end() const { return map_->end(); }
    size_t size() const { return map_->size(); }

    /**
     * True iff the slot in effect at rev equals slot. Anything below the
     * lowest recorded revision is never contained.
     */
    bool contains(Revision rev, const Slot<V>& slot) const {
      const Slot<V>* effective = map_->effective_slot(rev);
      return effective != nullptr && *effective == slot;
    }

   private:
    const RevisionWindowedMap* map_;
  };

  explicit RevisionWindowedMap(HistoryConfig config = {})
      : config_(config),
        past_(config.get_initial_capacity()),
        future_(config.get_initial_capacity()) {}

  /**
   * Build from an unordered mapping; entries are sorted once into past_.
   */
  explicit RevisionWindowedMap(const std::unordered_map<Revision, V>& data,
                               HistoryConfig config = {})
      : RevisionWindowedMap(config) {
    std::vector<std::pair<Revision, const V*>> sorted;
    sorted.reserve(data.size());
    for (const auto& [rev, value] : data) {
      sorted.emplace_back(rev, &value);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    for (const auto& [rev, value] : sorted) {
      past_.push_back(rev, Slot<V>(*value));
    }
    logger().debug("built from {} unordered entries", sorted.size());
  }

  /**
   * Build from a list of (revision, slot) pairs in any order.
   * Duplicate revisions are an OrderingViolation.
   */
  static arrow::Result<RevisionWindowedMap> from_entries(
      std::vector<std::pair<Revision, Slot<V>>> entries,
      HistoryConfig config = {}) {
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    RevisionWindowedMap map(config);
    for (auto& [rev, slot] : entries) {
      if (map.past_.back_revision() == rev) {
        logger().warn("duplicate revision {} in initial entries", rev);
        return ordering_violation("duplicate revision ", rev,
                                  " in initial entries");
      }
      map.past_.push_back(rev, std::move(slot));
    }
    return map;
  }

  /**
   * Rebalance the window so that past_ ends at the last entry <= rev and
   * future_ starts at the first entry > rev. Entries are only relocated
   * across the split point, never reordered or dropped.
   */
  void seek(Revision rev) {
    while (past_.back_revision() && *past_.back_revision() > rev) {
      future_.push_front(std::move(*past_.take_back()));
    }
    while (future_.front_revision() && *future_.front_revision() <= rev) {
      past_.push_back(std::move(*future_.take_front()));
    }
  }

  /**
   * Slot in effect at rev. std::nullopt means the attribute was unset at or
   * before rev; NotFound means nothing was recorded at or before rev.
   */
  arrow::Result<Slot<V>> get(Revision rev) {
    seek(rev);
    if (past_.empty()) {
      return not_found("no value recorded at or before revision ", rev);
    }
    return past_.back_value();
  }

  // Like get(), but an unset slot is also NotFound
  arrow::Result<V> value_at(Revision rev) {
    ARROW_ASSIGN_OR_RAISE(Slot<V> slot, get(rev));
    if (!slot.has_value()) {
      return not_found("value was unset at or before revision ", rev);
    }
    return std::move(*slot);
  }

  bool contains(Revision rev) {
    seek(rev);
    return !past_.empty() && past_.back_value().has_value();
  }

  /**
   * Record value at rev: overwrite when rev is the window tail, otherwise
   * append a new entry right after it.
   */
  arrow::Status set(Revision rev, V value) {
    return assign(rev, Slot<V>(std::move(value)));
  }

  // Apply (revision, value) assignments in the order given
  arrow::Status update(const std::vector<std::pair<Revision, V>>& batch) {
    for (const auto& [rev, value] : batch) {
      ARROW_RETURN_NOT_OK(set(rev, value));
    }
    return arrow::Status::OK();
  }

  /**
   * Discard every entry at or after rev and record a single unset marker
   * at exactly rev. This rewrites history forward from rev; there is no
   * point-deletion counterpart.
   */
  arrow::Status truncate_from(Revision rev) {
    while (std::optional<Entry> entry = past_.take_back()) {
      future_.push_front(std::move(*entry));
    }
    size_t discarded = 0;
    while (std::optional<Entry> entry = future_.take_front()) {
      if (entry->rev < rev) {
        past_.push_back(std::move(*entry));
        continue;
      }
      ++discarded;
      break;
    }
    discarded += future_.size();
    future_.clear();
    past_.push_back(rev, std::nullopt);
    logger().debug("truncated from revision {}, {} entries discarded", rev,
                   discarded);
    return verify();
  }

  // Revision of the last change strictly before rev
  arrow::Result<Revision> rev_before(Revision rev) {
    if (rev == std::numeric_limits<Revision>::min()) {
      return not_found("no change recorded before revision ", rev);
    }
    seek(rev - 1);
    if (past_.empty()) {
      return not_found("no change recorded before revision ", rev);
    }
    return *past_.back_revision();
  }

  // Revision of the next change after rev; nullopt if none is recorded
  std::optional<Revision> rev_after(Revision rev) {
    seek(rev);
    return future_.front_revision();
  }

  std::optional<Revision> earliest_revision() const {
    if (!past_.empty()) return past_.front_revision();
    return future_.front_revision();
  }

  KeysView keys() const { return KeysView(this); }
  ValuesView values() const { return ValuesView(this); }
  ItemsView items() const { return ItemsView(this); }

  const_iterator begin() const {
    return const_iterator(&past_, &future_, false);
  }
  const_iterator end() const { return const_iterator(&past_, &future_, true); }

  size_t size() const { return past_.size() + future_.size(); }
  bool empty() const { return past_.empty() && future_.empty(); }

  const Queue& past() const { return past_; }
  const Queue& future() const { return future_; }
  const HistoryConfig& config() const { return config_; }

  // Same history, regardless of where each window currently sits
  bool operator==(const RevisionWindowedMap& other) const {
    if (size() != other.size()) {
      return false;
    }
    auto it = other.begin();
    for (const EntryView<Slot<V>> entry : *this) {
      const EntryView<Slot<V>> theirs = *it;
      if (entry.rev != theirs.rev || !(entry.value == theirs.value)) {
        return false;
      }
      ++it;
    }
    return true;
  }

  /**
   * Verify both queues and that past_ ++ future_ is strictly ascending.
   */
  arrow::Status check_invariants() const {
    ARROW_RETURN_NOT_OK(past_.check_invariants());
    ARROW_RETURN_NOT_OK(future_.check_invariants());
    std::optional<Revision> previous;
    for (const EntryView<Slot<V>> entry : *this) {
      if (previous && *previous >= entry.rev) {
        return invariant_violation("revision ", entry.rev, " follows ",
                                   *previous);
      }
      previous = entry.rev;
    }
    return arrow::Status::OK();
  }

  std::string to_string() const {
    std::string out = "RevisionWindowedMap{";
    bool first = true;
    for (const EntryView<Slot<V>> entry : *this) {
      if (!first) out += ", ";
      first = false;
      if (entry.value.has_value()) {
        out += spdlog::fmt_lib::format("{}: {}", entry.rev, *entry.value);
      } else {
        out += spdlog::fmt_lib::format("{}: <unset>", entry.rev);
      }
    }
    out += "}";
    return out;
  }

#ifdef TESTING_ENABLED
  Queue& get_past_for_testing() { return past_; }
  Queue& get_future_for_testing() { return future_; }
#endif

 private:
  static const ContextLogger& logger() {
    static const ContextLogger instance("RevisionWindowedMap");
    return instance;
  }

  arrow::Status assign(Revision rev, Slot<V> slot) {
    if (empty()) {
      past_.push_back(rev, std::move(slot));
      return verify();
    }
    seek(rev);
    if (past_.empty()) {
      past_.push_back(rev, std::move(slot));
      return verify();
    }

    const Revision tail = *past_.back_revision();
    if (rev == tail) {
      past_.back_value() = std::move(slot);
    } else if (rev > tail) {
      past_.push_back(rev, std::move(slot));
    } else {
      logger().warn("rejected assignment at {} below window tail {}", rev,
                    tail);
      return ordering_violation("revision ", rev, " is below window tail ",
                                tail);
    }
    return verify();
  }

  /**
   * Slot in effect at rev without moving the window; nullptr when nothing
   * is recorded at or before rev.
   */
  const Slot<V>* effective_slot(Revision rev) const {
    const std::optional<Revision> past_tail = past_.back_revision();
    const std::optional<Revision> future_head = future_.front_revision();
    if (past_tail && *past_tail <= rev && (!future_head || *future_head > rev)) {
      return &past_.back_value();
    }

    const Slot<V>* found = nullptr;
    for (const EntryView<Slot<V>> entry : *this) {
      if (entry.rev > rev) break;
      found = &entry.value;
    }
    return found;
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
  Queue past_;
  Queue future_;
};

}  // namespace revhist

#endif  // REVHIST_WINDOWED_MAP_HPP
