#ifndef BRIGHTCHAIN_TUPLE_SERVICE_HPP
#define BRIGHTCHAIN_TUPLE_SERVICE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "blocks/block_tuple.hpp"
#include "blocks/whitened_block.hpp"
#include "service/cbl_service.hpp"
#include "store/block_store.hpp"

namespace brightchain::service {

// Outcome of ingesting a file: the signed CBL and the stored tuple that
// whitens it. The CBL itself is never stored in the clear.
struct TupleIngestResult {
  std::shared_ptr<blocks::ConstituentBlockListBlock> cbl;
  std::vector<crypto::Checksum> cbl_tuple_ids;
  std::size_t data_tuple_count = 0;
};

// Owner-free whitening: every stored block is a source XORed with random
// blocks, and each tuple lists the prime block followed by its whiteners.
class TupleService {
public:
  TupleService(const crypto::ChecksumService& checksums, const CblService& cbl_service);

  std::size_t tuple_size() const { return cbl_service_.tuple_size(); }


  // ---- TUPLE CONSTRUCTION ----
  // 1 + whiteners + randoms must equal the tuple size
  std::shared_ptr<blocks::WhitenedBlock> xor_source_to_prime_whitened(
    const blocks::BaseBlock& source, const std::vector<std::shared_ptr<const blocks::BaseBlock>>& whiteners,
    const std::vector<std::shared_ptr<const blocks::BaseBlock>>& randoms) const;
  // Tuple ordered as prime, whiteners, randoms
  blocks::InMemoryBlockTuple make_tuple_from_source_xor(
    const blocks::BaseBlock& source, const std::vector<std::shared_ptr<const blocks::BaseBlock>>& whiteners,
    const std::vector<std::shared_ptr<const blocks::BaseBlock>>& randoms) const;
  std::shared_ptr<blocks::ConstituentBlockListBlock> xor_prime_whitened_to_cbl(
    const blocks::BaseBlock& prime, const std::vector<std::shared_ptr<const blocks::BaseBlock>>& whiteners,
    std::shared_ptr<const crypto::Member> creator) const;


  // ---- FILES ----
  // Chunks data, whitens every chunk into a stored tuple, then signs a CBL
  // over all tuples and stores it whitened. Without block_size the smallest
  // size whose CBL indexes the whole file is used.
  TupleIngestResult data_to_tuples_and_cbl(const Bytes& data, std::shared_ptr<const crypto::Member> creator,
                                           store::BlockStore& store,
                                           const std::string& pool = store::DEFAULT_POOL,
                                           std::optional<blocks::BlockSize> block_size = std::nullopt,
                                           const std::optional<blocks::ExtendedCblDetails>& extended = std::nullopt) const;
  // Rebuilds the CBL from its stored whitening tuple
  std::shared_ptr<blocks::ConstituentBlockListBlock> retrieve_cbl(
    const std::vector<crypto::Checksum>& cbl_tuple_ids, blocks::BlockSize block_size,
    const store::BlockStore& store, std::shared_ptr<const crypto::Member> creator,
    const std::string& pool = store::DEFAULT_POOL) const;
  // XORs every tuple the CBL lists and checks the original data checksum
  Bytes reconstruct_data(const blocks::ConstituentBlockListBlock& cbl, const store::BlockStore& store,
                         const std::optional<std::string>& pool = std::nullopt) const;

private:
  void store_block(store::BlockStore& store, const blocks::BaseBlock& block, const std::string& pool) const;

  const crypto::ChecksumService& checksums_;
  const CblService& cbl_service_;
};

} // namespace brightchain::service

#endif // BRIGHTCHAIN_TUPLE_SERVICE_HPP
