#ifndef BRIGHTCHAIN_CONFIG_HPP
#define BRIGHTCHAIN_CONFIG_HPP

#include <optional>
#include <ostream>
#include <string>
#include "common/error.hpp"
#include "crypto/constants.hpp"
#include "logger/logger.hpp"
#include "store/block_store.hpp"

namespace brightchain::config {

enum class ConfigErrorType {
  UnknownArgument,
  MissingValue,
  InvalidNumber,
  InvalidLogLevel,
  InvalidTupleSize,
  InvalidWorkerCount,
  EmptyPoolName
};

const char* to_string(ConfigErrorType type);

class ConfigError : public BrightChainError {
public:
  explicit ConfigError(ConfigErrorType type, Context context = {})
    : BrightChainError("Config error", to_string(type), std::move(context)), type_(type) {}

  ConfigErrorType type() const { return type_; }

private:
  ConfigErrorType type_;
};

struct Config {
  std::size_t tuple_size = crypto::constants::TUPLE_SIZE;
  // Empty means console logging
  std::string log_file;
  logging::severity log_level = logging::severity::info;
  std::size_t worker_threads = 2;
  std::string pool = store::DEFAULT_POOL;
  // File ingested by the demo; a generated sample when unset
  std::optional<std::string> input_file;
};

// Flags take one value each: -t/--tuple-size, -l/--log-file, -v/--log-level,
// -w/--workers, -p/--pool, -i/--input. The result is validated.
Config parse_command_line(int argc, const char* const argv[]);
// Throws ConfigError for a tuple size outside 2..15, no workers or no pool
void validate(const Config& config);
void print_usage(std::ostream& os, const std::string& program_name);

} // namespace brightchain::config

#endif // BRIGHTCHAIN_CONFIG_HPP
