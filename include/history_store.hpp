#ifndef REVHIST_HISTORY_STORE_HPP
#define REVHIST_HISTORY_STORE_HPP

#include <arrow/result.h>
#include <arrow/status.h>
#include <tbb/concurrent_hash_map.h>

#include <optional>
#include <string>
#include <utility>

#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "windowed_map.hpp"

namespace revhist {

/**
 * @brief Thread-safe collection of attribute histories keyed by slot name
 *
 * Each slot owns one RevisionWindowedMap. Every operation holds the slot's
 * accessor for its whole duration:
 * - writes (set, truncate_from) take the exclusive accessor
 * - reads take the exclusive accessor too, because lookups move the window
 * - snapshot() takes a shared accessor and copies the map out
 *
 * Different slots never contend; the same slot is serialized.
 */
template <typename V>
class HistoryStore {
 public:
  using Map = RevisionWindowedMap<V>;

  explicit HistoryStore(HistoryConfig config = {}) : config_(config) {}

  HistoryStore(const HistoryStore&) = delete;
  HistoryStore& operator=(const HistoryStore&) = delete;

  /**
   * @brief Record value at rev in slot, creating the slot on first write
   */
  arrow::Status set(const std::string& slot, Revision rev, V value) {
    accessor acc;
    if (slots_.insert(acc, slot)) {
      acc->second = Map(config_);
      logger().debug("created slot '{}'", slot);
    }
    return acc->second.set(rev, std::move(value));
  }

  arrow::Result<Slot<V>> get(const std::string& slot, Revision rev) {
    accessor acc;
    if (!slots_.find(acc, slot)) {
      return not_found("unknown slot '", slot, "'");
    }
    return acc->second.get(rev);
  }

  arrow::Status truncate_from(const std::string& slot, Revision rev) {
    accessor acc;
    if (!slots_.find(acc, slot)) {
      return not_found("unknown slot '", slot, "'");
    }
    return acc->second.truncate_from(rev);
  }

  arrow::Result<Revision> rev_before(const std::string& slot, Revision rev) {
    accessor acc;
    if (!slots_.find(acc, slot)) {
      return not_found("unknown slot '", slot, "'");
    }
    return acc->second.rev_before(rev);
  }

  arrow::Result<std::optional<Revision>> rev_after(const std::string& slot,
                                                   Revision rev) {
    accessor acc;
    if (!slots_.find(acc, slot)) {
      return not_found("unknown slot '", slot, "'");
    }
    return acc->second.rev_after(rev);
  }

  /**
   * @brief Copy of a slot's history, safe to read without further locking
   */
  arrow::Result<Map> snapshot(const std::string& slot) const {
    const_accessor acc;
    if (!slots_.find(acc, slot)) {
      return not_found("unknown slot '", slot, "'");
    }
    return Map(acc->second);
  }

  bool erase(const std::string& slot) { return slots_.erase(slot); }

  bool contains(const std::string& slot) const {
    const_accessor acc;
    return slots_.find(acc, slot);
  }

  size_t size() const { return slots_.size(); }

  const HistoryConfig& config() const { return config_; }

 private:
  static const ContextLogger& logger() {
    static const ContextLogger instance("HistoryStore");
    return instance;
  }

  using Table = tbb::concurrent_hash_map<std::string, Map>;
  using accessor = typename Table::accessor;
  using const_accessor = typename Table::const_accessor;

  HistoryConfig config_;
  Table slots_;
};

}  // namespace revhist

#endif  // REVHIST_HISTORY_STORE_HPP
