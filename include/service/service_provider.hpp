#ifndef BRIGHTCHAIN_SERVICE_PROVIDER_HPP
#define BRIGHTCHAIN_SERVICE_PROVIDER_HPP

#include "blocks/block_capacity.hpp"
#include "blocks/block_factory.hpp"
#include "config/config.hpp"
#include "crypto/checksum.hpp"
#include "crypto/ecies.hpp"
#include "service/block_service.hpp"
#include "service/cbl_service.hpp"
#include "service/tuple_service.hpp"

namespace brightchain::service {

// Owns one instance of every service, wired together from a Config.
// Built once at the program entry point and passed down by reference.
class ServiceProvider {
public:
  explicit ServiceProvider(const config::Config& config);

  ServiceProvider(const ServiceProvider&) = delete;
  ServiceProvider& operator=(const ServiceProvider&) = delete;

  const crypto::ChecksumService& checksums() const { return checksums_; }
  const crypto::EciesService& ecies() const { return ecies_; }
  const blocks::BlockCapacityCalculator& calculator() const { return calculator_; }
  const blocks::BlockFactory& factory() const { return factory_; }
  const CblService& cbl_service() const { return cbl_service_; }
  const TupleService& tuple_service() const { return tuple_service_; }
  const BlockService& block_service() const { return block_service_; }

private:
  crypto::ChecksumService checksums_;
  crypto::EciesService ecies_;
  blocks::BlockCapacityCalculator calculator_;
  blocks::BlockFactory factory_;
  CblService cbl_service_;
  TupleService tuple_service_;
  BlockService block_service_;
};

} // namespace brightchain::service

#endif // BRIGHTCHAIN_SERVICE_PROVIDER_HPP
