#include "config/config.hpp"
#include <stdexcept>
#include <unordered_map>

namespace brightchain::config {

const char* to_string(ConfigErrorType type) {
  switch (type) {
    case ConfigErrorType::UnknownArgument:    return "UnknownArgument";
    case ConfigErrorType::MissingValue:       return "MissingValue";
    case ConfigErrorType::InvalidNumber:      return "InvalidNumber";
    case ConfigErrorType::InvalidLogLevel:    return "InvalidLogLevel";
    case ConfigErrorType::InvalidTupleSize:   return "InvalidTupleSize";
    case ConfigErrorType::InvalidWorkerCount: return "InvalidWorkerCount";
    case ConfigErrorType::EmptyPoolName:      return "EmptyPoolName";
    default:                                  return "Unknown";
  }
}

namespace {

enum class Flag { TupleSize, LogFile, LogLevel, Workers, Pool, Input };

std::size_t parse_number(const std::string& flag, const std::string& value) {
  try {
    std::size_t consumed = 0;
    unsigned long number = std::stoul(value, &consumed);
    if (consumed != value.size() || value.front() == '-') {
      throw std::invalid_argument(value);
    }
    return static_cast<std::size_t>(number);
  } catch (const std::logic_error&) {
    throw ConfigError(ConfigErrorType::InvalidNumber, {{"flag", flag}, {"value", value}});
  }
}

} // namespace

Config parse_command_line(int argc, const char* const argv[]) {
  static const std::unordered_map<std::string, Flag> flag_map = {
    {"-t", Flag::TupleSize}, {"--tuple-size", Flag::TupleSize},
    {"-l", Flag::LogFile},   {"--log-file", Flag::LogFile},
    {"-v", Flag::LogLevel},  {"--log-level", Flag::LogLevel},
    {"-w", Flag::Workers},   {"--workers", Flag::Workers},
    {"-p", Flag::Pool},      {"--pool", Flag::Pool},
    {"-i", Flag::Input},     {"--input", Flag::Input}
  };

  Config config;
  for (int i = 1; i < argc; i += 2) {
    const std::string flag(argv[i]);
    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      throw ConfigError(ConfigErrorType::UnknownArgument, {{"flag", flag}});
    }
    if (i + 1 >= argc) {
      throw ConfigError(ConfigErrorType::MissingValue, {{"flag", flag}});
    }
    const std::string value(argv[i + 1]);

    switch (it->second) {
      case Flag::TupleSize:
        config.tuple_size = parse_number(flag, value);
        break;
      case Flag::LogFile:
        config.log_file = value;
        break;
      case Flag::LogLevel:
        try {
          config.log_level = logging::parse_severity(value);
        } catch (const std::invalid_argument&) {
          throw ConfigError(ConfigErrorType::InvalidLogLevel, {{"value", value}});
        }
        break;
      case Flag::Workers:
        config.worker_threads = parse_number(flag, value);
        break;
      case Flag::Pool:
        config.pool = value;
        break;
      case Flag::Input:
        config.input_file = value;
        break;
    }
  }

  validate(config);
  return config;
}

void validate(const Config& config) {
  if (config.tuple_size < crypto::constants::MIN_TUPLE_SIZE
      || config.tuple_size > crypto::constants::MAX_TUPLE_SIZE) {
    throw ConfigError(ConfigErrorType::InvalidTupleSize, {{"tuple_size", std::to_string(config.tuple_size)}});
  }
  if (config.worker_threads == 0) {
    throw ConfigError(ConfigErrorType::InvalidWorkerCount);
  }
  if (config.pool.empty()) {
    throw ConfigError(ConfigErrorType::EmptyPoolName);
  }
}

void print_usage(std::ostream& os, const std::string& program_name) {
  os << "Usage: " << program_name << " [options]\n"
     << "Options:\n"
     << "  -t, --tuple-size  Blocks per tuple, 2 to 15 (default 3)\n"
     << "  -l, --log-file    Log file (default: console)\n"
     << "  -v, --log-level   trace, debug, info, warning, error or fatal (default info)\n"
     << "  -w, --workers     Worker threads for hashing and encryption (default 2)\n"
     << "  -p, --pool        Storage pool name (default \"default\")\n"
     << "  -i, --input       File to ingest (default: generated sample)\n"
     << "Example: " << program_name << " -t 3 -v debug -i notes.txt\n";
}

} // namespace brightchain::config
