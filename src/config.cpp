#include "config.hpp"

namespace revhist {

arrow::Status HistoryConfig::validate() const {
  if (initial_capacity == 0) {
    log_warn("rejected HistoryConfig: initial_capacity is 0");
    return arrow::Status::Invalid("initial_capacity must be positive");
  }
  return arrow::Status::OK();
}

void apply_logging(const HistoryConfig &config) {
  Logger::get_instance().set_level(config.get_log_level());
  log_info("log level set from HistoryConfig");
}

}  // namespace revhist
