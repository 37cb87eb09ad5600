#include "config/config.hpp"
#include "logger/logger.hpp"
#include "service/service_provider.hpp"
#include "store/block_store.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

using namespace brightchain;

Bytes load_input(const config::Config& config) {
  if (!config.input_file) {
    std::string sample;
    for (int i = 0; i < 200; ++i) {
      sample += "BrightChain sample line " + std::to_string(i) + "\n";
    }
    return Bytes(sample.begin(), sample.end());
  }
  std::ifstream file(*config.input_file, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Cannot open input file: " + *config.input_file);
  }
  return Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

bool run_demo(const config::Config& config) {
  try {
    service::ServiceProvider services(config);
    store::MemoryBlockStore block_store;
    auto creator = crypto::Member::generate("demo");

    Bytes input = load_input(config);
    std::cout << "Ingesting " << input.size() << " bytes with tuple size " << config.tuple_size << '\n';

    auto result = services.tuple_service().data_to_tuples_and_cbl(input, creator, block_store, config.pool);
    const auto& cbl = *result.cbl;
    std::cout << "CBL " << cbl.id_checksum().to_hex().substr(0, 16) << "... lists "
              << cbl.cbl_address_count() << " blocks in " << result.data_tuple_count << " tuples of "
              << cbl.block_size() << '\n';
    std::cout << "Pool " << config.pool << " holds " << block_store.size(config.pool) << " blocks\n";

    auto retrieved = services.tuple_service().retrieve_cbl(result.cbl_tuple_ids, cbl.block_size(), block_store,
                                                          creator, config.pool);
    if (!retrieved->validate_signature(services.ecies(), services.checksums())) {
      std::cerr << "Error: CBL signature did not verify\n";
      return false;
    }

    Bytes output = services.tuple_service().reconstruct_data(*retrieved, block_store, config.pool);
    if (output != input) {
      std::cerr << "Error: Reconstructed data differs from input\n";
      return false;
    }
    std::cout << "Reconstructed " << output.size() << " bytes, checksum "
              << retrieved->original_data_checksum().to_hex().substr(0, 16) << "... verified\n";
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  config::Config config;
  try {
    config = config::parse_command_line(argc, argv);
  } catch (const config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    config::print_usage(std::cerr, argv[0]);
    return 1;
  }

  if (config.log_file.empty()) {
    logging::init_console_logging(config.log_level);
  } else {
    logging::init_logging(config.log_file, config.log_level);
  }
  return run_demo(config) ? 0 : 1;
}
