#include "service/service_provider.hpp"
#include <boost/log/trivial.hpp>

namespace brightchain::service {

ServiceProvider::ServiceProvider(const config::Config& config)
  : checksums_(config.worker_threads)
  , factory_(checksums_, calculator_)
  , cbl_service_(checksums_, ecies_, config.tuple_size)
  , tuple_service_(checksums_, cbl_service_)
  , block_service_(checksums_, ecies_, factory_, cbl_service_, config.worker_threads) {
  blocks::register_default_block_types(factory_);
  BOOST_LOG_TRIVIAL(debug) << "Service provider: Ready with tuple size " << config.tuple_size << " and "
                           << config.worker_threads << " workers";
}

} // namespace brightchain::service
