#ifndef REVHIST_CONFIG_HPP
#define REVHIST_CONFIG_HPP

#include <arrow/status.h>

#include <cstddef>

#include "logger.hpp"

namespace revhist {

// Default configuration constants
namespace defaults {
constexpr size_t INITIAL_CAPACITY = 64;
constexpr bool ALLOW_APPEND_AT_SIZE = true;
constexpr bool VERIFY_INVARIANTS = false;
constexpr LogLevel LOG_LEVEL = LogLevel::INFO;
}  // namespace defaults

// Configuration shared by the history containers
class HistoryConfig {
 private:
  // Node slots reserved up front by every slab
  size_t initial_capacity = defaults::INITIAL_CAPACITY;

  // CursorSequence::set(size(), v) appends instead of failing
  bool allow_append_at_size = defaults::ALLOW_APPEND_AT_SIZE;

  // Run the full structural check after every mutating call
  bool verify_invariants = defaults::VERIFY_INVARIANTS;

  LogLevel log_level = defaults::LOG_LEVEL;

  friend class HistoryConfigBuilder;

 public:
  size_t get_initial_capacity() const { return initial_capacity; }
  bool is_append_at_size_allowed() const { return allow_append_at_size; }
  bool is_invariant_verification_enabled() const { return verify_invariants; }
  LogLevel get_log_level() const { return log_level; }

  arrow::Status validate() const;
};

// Builder class for HistoryConfig
class HistoryConfigBuilder {
 private:
  HistoryConfig config;

 public:
  HistoryConfigBuilder() = default;

  HistoryConfigBuilder &with_initial_capacity(size_t capacity) {
    config.initial_capacity = capacity;
    return *this;
  }

  HistoryConfigBuilder &with_append_at_size(bool allowed) {
    config.allow_append_at_size = allowed;
    return *this;
  }

  HistoryConfigBuilder &with_invariant_verification(bool enabled) {
    config.verify_invariants = enabled;
    return *this;
  }

  HistoryConfigBuilder &with_log_level(LogLevel level) {
    config.log_level = level;
    return *this;
  }

  [[nodiscard]] HistoryConfig build() const { return config; }
};

// Helper function to create a config builder
inline HistoryConfigBuilder make_config() { return {}; }

// Push the configured level into the process-wide logger
void apply_logging(const HistoryConfig &config);

}  // namespace revhist

#endif  // REVHIST_CONFIG_HPP
