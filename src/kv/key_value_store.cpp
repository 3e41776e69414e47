#include "ethstorage/kv/key_value_store.hpp"
#include "ethstorage/blob/blob_codec.hpp"
#include "ethstorage/crypto/hash.hpp"
#include "ethstorage/errors.hpp"
#include <boost/log/trivial.hpp>

namespace ethstorage::kv {

//==============================================
// CONSTRUCTION
//==============================================

std::unique_ptr<KeyValueStore> KeyValueStore::create(const config::SdkConfig& config,
                                                     chain::ChainBinding& binding,
                                                     kzg::BackendFactory backend) {
  config.validate();

  std::shared_ptr<chain::ChainClient> writer_client;
  if (!config.rpc.empty()) {
    writer_client = binding.connect(config.rpc, config.private_key);
  }

  std::optional<Address> address = config.address;
  if (!address && writer_client) {
    address = config::resolve_storage_address(writer_client->chain_id());
  }
  if (!address) {
    throw CapabilityError("network not supported yet");
  }

  Components parts;
  if (config.private_key && writer_client) {
    parts.writer = binding.key_value(*address, writer_client);
    parts.engine = std::make_shared<kzg::CommitmentEngine>(std::move(backend), config.commitment_workers);
    parts.builder = std::make_shared<tx::TransactionBuilder>(writer_client, parts.engine);
    parts.uploader = std::make_shared<tx::Uploader>(writer_client);
  }
  if (config.ethstorage_rpc) {
    parts.reader = binding.key_value(*address, binding.connect(*config.ethstorage_rpc, std::nullopt));
  }

  BOOST_LOG_TRIVIAL(info) << "KeyValueStore: Bound to " << *address
                          << (parts.writer ? "" : " (read-only)");
  return std::make_unique<KeyValueStore>(std::move(parts));
}

KeyValueStore::KeyValueStore(Components components, chain::RetryPolicy retry)
  : parts_(std::move(components))
  , retry_(std::move(retry)) {
  if (parts_.writer && (!parts_.builder || !parts_.uploader || !parts_.engine)) {
    throw std::invalid_argument("KeyValueStore: writer requires builder, uploader and commitment engine");
  }
}

KeyValueStore::~KeyValueStore() {
  close();
}

void KeyValueStore::close() {
  if (parts_.engine) {
    parts_.engine->close();
  }
}

Hash32 KeyValueStore::content_key(const std::string& key) {
  return crypto::keccak256(key);
}

void KeyValueStore::check_data(const Bytes& data) {
  if (data.empty() || data.size() > blob::COMPACT_BLOB_DATA_SIZE) {
    throw ValidationError("data length should be > 0 && <= " + std::to_string(blob::COMPACT_BLOB_DATA_SIZE));
  }
}

void KeyValueStore::require_writer() const {
  if (!parts_.writer) {
    throw ValidationError("private key is required for this operation");
  }
}

//==============================================
// OPERATIONS
//==============================================

CostEstimate KeyValueStore::estimate_cost(const std::string& key, const Bytes& data) {
  check_data(data);
  require_writer();

  const Hash32 hashed = content_key(key);
  const Wei storage_cost = retry_.run([this]() { return parts_.writer->upfront_payment(); }, "upfront_payment");
  const Wei blob_gas_price = parts_.builder->blob_gas_price();
  const chain::FeeData fees = parts_.builder->fee_data();

  chain::TransactionRequest tx = parts_.writer->put_blob(hashed, 0, data.size(), storage_cost);
  tx.type = chain::BLOB_TX_TYPE;
  tx.blob_versioned_hashes.push_back(crypto::hash_from_hex(DUMMY_VERSIONED_COMMITMENT_HASH));
  const uint64_t gas_limit = parts_.builder->estimate_gas(tx);

  CostEstimate estimate;
  estimate.storage_cost = storage_cost;
  estimate.gas_cost = (fees.max_fee_per_gas + fees.max_priority_fee_per_gas) * gas_limit +
                      blob_gas_price * blob::BLOB_SIZE;
  return estimate;
}

WriteResult KeyValueStore::write(const std::string& key, const Bytes& data) {
  check_data(data);
  require_writer();

  WriteResult result;
  try {
    const Hash32 hashed = content_key(key);
    const Wei storage_cost = retry_.run([this]() { return parts_.writer->upfront_payment(); }, "upfront_payment");
    chain::TransactionRequest tx = parts_.writer->put_blob(hashed, 0, data.size(), storage_cost);
    tx = parts_.builder->build_blob_tx(std::move(tx), blob::CompactBlobCodec().encode(data));

    result.hash = parts_.uploader->send_tx(tx);
    BOOST_LOG_TRIVIAL(info) << "KeyValueStore: Tx hash is " << result.hash;
    result.success = parts_.uploader->get_transaction_result(result.hash).success;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "KeyValueStore: Write blob failed: " << e.what();
    result.success = false;
  }
  return result;
}

WriteResult KeyValueStore::write_blobs(const std::vector<std::string>& keys, const std::vector<Bytes>& values) {
  if (keys.size() != values.size()) {
    throw ValidationError("the number of keys and data does not match");
  }
  if (keys.empty()) {
    throw ValidationError("at least one key is required");
  }
  if (keys.size() > blob::BLOB_COUNT_LIMIT) {
    throw ValidationError("the count exceeds the maximum blob limit of " + std::to_string(blob::BLOB_COUNT_LIMIT));
  }
  for (const auto& value : values) {
    check_data(value);
  }
  require_writer();

  std::vector<blob::Blob> blobs;
  std::vector<Hash32> hashed_keys;
  std::vector<uint64_t> indexes;
  std::vector<uint64_t> lengths;
  blob::CompactBlobCodec codec;
  for (std::size_t i = 0; i < keys.size(); ++i) {
    blobs.push_back(codec.encode_blob(values[i].data(), values[i].size()));
    hashed_keys.push_back(content_key(keys[i]));
    indexes.push_back(i);
    lengths.push_back(values[i].size());
  }

  WriteResult result;
  try {
    const Wei storage_cost = retry_.run([this]() { return parts_.writer->upfront_payment(); }, "upfront_payment");
    chain::TransactionRequest tx =
      parts_.writer->put_blobs(hashed_keys, indexes, lengths, storage_cost * keys.size());
    tx = parts_.builder->build_blob_tx(std::move(tx), std::move(blobs));

    result.hash = parts_.uploader->send_tx(tx);
    BOOST_LOG_TRIVIAL(info) << "KeyValueStore: Tx hash is " << result.hash;
    result.success = parts_.uploader->get_transaction_result(result.hash).success;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "KeyValueStore: Put blobs failed: " << e.what();
    result.success = false;
  }
  return result;
}

Bytes KeyValueStore::read(const std::string& key, blob::DecodeType decode_type,
                          const std::optional<Address>& from) {
  if (key.empty()) {
    throw ValidationError("invalid key");
  }

  std::optional<Address> reader_address = parts_.uploader ? std::optional<Address>(parts_.uploader->signer()) : from;
  if (!reader_address) {
    throw ValidationError("read requires an address when no private key is configured");
  }
  if (!parts_.reader) {
    throw ValidationError("ethstorage_rpc is required for read");
  }

  const Hash32 hashed = content_key(key);
  const Address& caller = *reader_address;
  const uint64_t size = retry_.run([this, &hashed, &caller]() { return parts_.reader->size(hashed, caller); }, "size");
  if (size == 0) {
    throw EthStorageError("there is no data corresponding to key " + key + " under address " + caller);
  }

  Bytes data = retry_.run([this, &hashed, decode_type, size, &caller]() {
    return parts_.reader->get(hashed, decode_type, 0, size, caller);
  }, "get");
  BOOST_LOG_TRIVIAL(debug) << "KeyValueStore: Read " << data.size() << " byte(s) for " << key;
  return data;
}

} // namespace ethstorage::kv
