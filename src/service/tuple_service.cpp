#include "service/tuple_service.hpp"
#include "blocks/block_error.hpp"
#include "blocks/raw_data_block.hpp"
#include "crypto/openssl_util.hpp"
#include <boost/log/trivial.hpp>

namespace brightchain::service {

using namespace blocks;

namespace {

using BlockList = std::vector<std::shared_ptr<const BaseBlock>>;

void check_sizes(BlockSize expected, const BlockList& blocks) {
  for (const auto& block : blocks) {
    if (!block) {
      throw TupleError(TupleErrorType::MissingParameters, {{"reason", "null block"}});
    }
    if (block->block_size() != expected) {
      throw TupleError(TupleErrorType::BlockSizeMismatch,
                       {{"expected", to_string(expected)}, {"actual", to_string(block->block_size())}});
    }
  }
}

Bytes xor_with_all(Bytes data, const BlockList& blocks) {
  for (const auto& block : blocks) {
    xor_into(data, block->full_data());
  }
  return data;
}

} // namespace

TupleService::TupleService(const crypto::ChecksumService& checksums, const CblService& cbl_service)
  : checksums_(checksums)
  , cbl_service_(cbl_service) {}

//==============================================
// TUPLE CONSTRUCTION
//==============================================

std::shared_ptr<WhitenedBlock> TupleService::xor_source_to_prime_whitened(const BaseBlock& source,
                                                                          const BlockList& whiteners,
                                                                          const BlockList& randoms) const {
  if (1 + whiteners.size() + randoms.size() != tuple_size()) {
    throw TupleError(TupleErrorType::InvalidBlockCount,
                     {{"whiteners", std::to_string(whiteners.size())},
                      {"randoms", std::to_string(randoms.size())},
                      {"tuple_size", std::to_string(tuple_size())}});
  }
  check_sizes(source.block_size(), whiteners);
  check_sizes(source.block_size(), randoms);

  Bytes prime = xor_with_all(xor_with_all(source.full_data(), whiteners), randoms);
  return WhitenedBlock::from(checksums_, source.block_size(), prime);
}

InMemoryBlockTuple TupleService::make_tuple_from_source_xor(const BaseBlock& source, const BlockList& whiteners,
                                                            const BlockList& randoms) const {
  BlockList members;
  members.push_back(xor_source_to_prime_whitened(source, whiteners, randoms));
  members.insert(members.end(), whiteners.begin(), whiteners.end());
  members.insert(members.end(), randoms.begin(), randoms.end());
  return InMemoryBlockTuple(std::move(members), tuple_size());
}

std::shared_ptr<ConstituentBlockListBlock> TupleService::xor_prime_whitened_to_cbl(
    const BaseBlock& prime, const BlockList& whiteners, std::shared_ptr<const crypto::Member> creator) const {
  if (whiteners.empty()) {
    throw TupleError(TupleErrorType::MissingParameters, {{"reason", "no whiteners"}});
  }
  check_sizes(prime.block_size(), whiteners);
  Bytes data = xor_with_all(prime.full_data(), whiteners);
  return ConstituentBlockListBlock::from_bytes(checksums_, data, std::move(creator), prime.block_size());
}

//==============================================
// FILES
//==============================================

void TupleService::store_block(store::BlockStore& store, const BaseBlock& block, const std::string& pool) const {
  store.store(block.id_checksum(), block.full_data(), pool);
}

TupleIngestResult TupleService::data_to_tuples_and_cbl(const Bytes& data,
                                                       std::shared_ptr<const crypto::Member> creator,
                                                       store::BlockStore& store, const std::string& pool,
                                                       std::optional<BlockSize> block_size,
                                                       const std::optional<ExtendedCblDetails>& extended) const {
  if (data.empty()) {
    throw TupleError(TupleErrorType::InvalidSourceLength, {{"length", "0"}});
  }
  BlockSize size = block_size.value_or(cbl_service_.file_size_to_cbl_block_size(data.size(), extended));
  if (size == BlockSize::Unknown) {
    throw CblError(CblErrorType::FileSizeTooLarge, {{"length", std::to_string(data.size())}});
  }
  std::size_t chunk_length = to_length(size);
  std::size_t needed_tuples = (data.size() + chunk_length - 1) / chunk_length;
  if (needed_tuples > cbl_service_.max_tuple_count(size, extended)) {
    throw CblError(CblErrorType::AddressCountExceedsCapacity,
                   {{"address_count", std::to_string(needed_tuples * tuple_size())},
                    {"block_size", to_string(size)}});
  }

  std::vector<crypto::Checksum> addresses;
  std::shared_ptr<const BaseBlock> carried_random;
  std::size_t tuple_count = 0;
  for (std::size_t offset = 0; offset < data.size(); offset += chunk_length) {
    std::size_t end = std::min(offset + chunk_length, data.size());
    Bytes chunk(data.begin() + static_cast<std::ptrdiff_t>(offset), data.begin() + static_cast<std::ptrdiff_t>(end));
    if (chunk.size() < chunk_length) {
      Bytes padding = crypto::random_bytes(chunk_length - chunk.size());
      chunk.insert(chunk.end(), padding.begin(), padding.end());
    }
    auto source = RawDataBlock::from(checksums_, size, chunk);

    // A random block of the previous tuple whitens this one
    BlockList whiteners;
    if (carried_random) {
      whiteners.push_back(carried_random);
    }
    BlockList randoms;
    while (1 + whiteners.size() + randoms.size() < tuple_size()) {
      randoms.push_back(RandomBlock::generate(checksums_, size));
    }

    InMemoryBlockTuple tuple = make_tuple_from_source_xor(*source, whiteners, randoms);
    for (const auto& member : tuple.blocks()) {
      store_block(store, *member, pool);
      addresses.push_back(member->id_checksum());
    }
    if (!randoms.empty()) {
      carried_random = randoms.back();
    }
    ++tuple_count;
  }

  crypto::Checksum original = checksums_.calculate_checksum(data);
  auto cbl = cbl_service_.make_cbl(creator, size, addresses, data.size(), original, extended);

  BlockList cbl_randoms;
  while (cbl_randoms.size() + 1 < tuple_size()) {
    cbl_randoms.push_back(RandomBlock::generate(checksums_, size));
  }
  InMemoryBlockTuple cbl_tuple = make_tuple_from_source_xor(*cbl, {}, cbl_randoms);
  for (const auto& member : cbl_tuple.blocks()) {
    store_block(store, *member, pool);
  }

  BOOST_LOG_TRIVIAL(info) << "Tuple service: Stored " << data.size() << " bytes as " << tuple_count
                          << " tuples of " << size << " in pool " << pool;
  return TupleIngestResult{cbl, cbl_tuple.block_ids(), tuple_count};
}

std::shared_ptr<ConstituentBlockListBlock> TupleService::retrieve_cbl(
    const std::vector<crypto::Checksum>& cbl_tuple_ids, BlockSize block_size, const store::BlockStore& store,
    std::shared_ptr<const crypto::Member> creator, const std::string& pool) const {
  std::vector<BlockHandle> handles;
  for (const auto& id : cbl_tuple_ids) {
    handles.emplace_back(id, block_size, store, pool);
  }
  BlockHandleTuple tuple(std::move(handles), tuple_size());
  return tuple.xor_to_cbl(checksums_, std::move(creator));
}

Bytes TupleService::reconstruct_data(const ConstituentBlockListBlock& cbl, const store::BlockStore& store,
                                     const std::optional<std::string>& pool) const {
  Bytes result;
  for (const auto& tuple : cbl.get_handle_tuples(store, pool)) {
    Bytes chunk = tuple.xor_data(checksums_);
    result.insert(result.end(), chunk.begin(), chunk.end());
  }
  if (result.size() < cbl.original_data_length()) {
    throw CblError(CblErrorType::InvalidStructure,
                   {{"reconstructed", std::to_string(result.size())},
                    {"original_data_length", std::to_string(cbl.original_data_length())}});
  }
  result.resize(static_cast<std::size_t>(cbl.original_data_length()));

  crypto::Checksum computed = checksums_.calculate_checksum(result);
  if (computed != cbl.original_data_checksum()) {
    BOOST_LOG_TRIVIAL(error) << "Tuple service: Reconstructed data does not match " << cbl.original_data_checksum();
    throw CblError(CblErrorType::OriginalDataChecksumMismatch,
                   {{"expected", cbl.original_data_checksum().to_hex()}, {"computed", computed.to_hex()}});
  }
  return result;
}

} // namespace brightchain::service
