#include "ethstorage/upload/diff_engine.hpp"
#include "ethstorage/utils/task_pool.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <stdexcept>

namespace ethstorage::upload {

DiffEngine::DiffEngine(std::shared_ptr<chain::StorageContract> contract,
                       chain::RetryPolicy retry, std::size_t concurrency)
  : contract_(std::move(contract))
  , retry_(std::move(retry))
  , concurrency_(std::max<std::size_t>(concurrency, 1)) {
  if (!contract_) {
    throw std::invalid_argument("DiffEngine: storage contract is required");
  }
}

//==============================================
// REMOTE STATE
//==============================================

std::map<std::string, std::vector<Hash32>> DiffEngine::fetch_hashes(
    const std::vector<std::pair<std::string, uint64_t>>& files) {
  std::map<std::string, std::vector<Hash32>> all;

  // Pack chunk ids of every file into pages of at most MAX_CHUNKS_PER_CALL
  std::vector<std::vector<chain::FileChunks>> pages;
  std::vector<chain::FileChunks> page;
  std::size_t in_page = 0;
  for (const auto& [name, count] : files) {
    all[name] = std::vector<Hash32>(count);
    for (uint64_t id = 0; id < count; ++id) {
      if (page.empty() || page.back().name != name) {
        page.push_back(chain::FileChunks{name, {}});
      }
      page.back().chunk_ids.push_back(id);
      if (++in_page == MAX_CHUNKS_PER_CALL) {
        pages.push_back(std::move(page));
        page.clear();
        in_page = 0;
      }
    }
  }
  if (!page.empty()) {
    pages.push_back(std::move(page));
  }
  if (pages.empty()) {
    return all;
  }

  BOOST_LOG_TRIVIAL(debug) << "DiffEngine: Fetching hashes in " << pages.size() << " page(s)";

  std::vector<std::vector<Hash32>> results(pages.size());
  {
    utils::TaskPool pool(std::min(concurrency_, pages.size()));
    for (std::size_t i = 0; i < pages.size(); ++i) {
      pool.submit([this, &pages, &results, i]() {
        results[i] = retry_.run([this, &pages, i]() { return contract_->get_chunk_hashes_batch(pages[i]); },
                                "get_chunk_hashes_batch");
      });
    }
    pool.wait();
  }

  for (std::size_t i = 0; i < pages.size(); ++i) {
    std::size_t k = 0;
    for (const auto& file : pages[i]) {
      for (uint64_t id : file.chunk_ids) {
        if (k >= results[i].size()) {
          throw std::runtime_error("DiffEngine: hash page " + std::to_string(i) + " came back short");
        }
        all[file.name][id] = results[i][k++];
      }
    }
  }
  return all;
}

std::map<std::string, std::vector<Hash32>> DiffEngine::fetch_hashes(const std::vector<std::string>& names) {
  std::vector<uint64_t> counts =
    retry_.run([this, &names]() { return contract_->count_chunks_batch(names); }, "count_chunks_batch");
  if (counts.size() != names.size()) {
    throw std::runtime_error("DiffEngine: chunk count lookup returned " + std::to_string(counts.size()) +
                             " entries for " + std::to_string(names.size()) + " names");
  }

  std::vector<std::pair<std::string, uint64_t>> files;
  files.reserve(names.size());
  for (std::size_t i = 0; i < names.size(); ++i) {
    files.emplace_back(names[i], counts[i]);
  }
  return fetch_hashes(files);
}

RemoteChunkState DiffEngine::fetch_remote_state(const std::string& name, uint64_t chunk_count) {
  RemoteChunkState state;
  state.chunk_count = chunk_count;
  std::vector<std::pair<std::string, uint64_t>> files{{name, chunk_count}};
  state.hashes = std::move(fetch_hashes(files)[name]);
  return state;
}

//==============================================
// COMPARISON
//==============================================

bool DiffEngine::chunk_unchanged(const std::vector<Hash32>& remote, uint64_t index, const Hash32& local) {
  return index < remote.size() && remote[index] == local;
}

bool DiffEngine::batch_unchanged(const std::vector<Hash32>& remote, uint64_t first_index,
                                 const std::vector<Hash32>& local) {
  if (local.empty() || first_index + local.size() > remote.size()) {
    return false;
  }
  return std::equal(local.begin(), local.end(), remote.begin() + first_index);
}

std::vector<bool> DiffEngine::changed_chunks(const std::vector<Hash32>& remote,
                                             const std::vector<Hash32>& local) {
  std::vector<bool> changed(local.size());
  for (std::size_t i = 0; i < local.size(); ++i) {
    changed[i] = !chunk_unchanged(remote, i, local[i]);
  }
  return changed;
}

//==============================================
// SHRINKING
//==============================================

bool DiffEngine::truncate_if_shrinking(const std::string& name, uint64_t new_count, uint64_t old_count,
                                       tx::Uploader& uploader, bool confirm_nonce) {
  if (old_count <= new_count) {
    return true;
  }

  BOOST_LOG_TRIVIAL(info) << "DiffEngine: Truncating " << name << " from " << old_count
                          << " to " << new_count << " chunks";
  chain::TransactionRequest request = contract_->truncate(name, new_count);
  tx::TransactionResult result = uploader.submit_and_wait(std::move(request), confirm_nonce);
  BOOST_LOG_TRIVIAL(info) << "DiffEngine: Truncate tx hash is " << result.hash;
  return result.success;
}

} // namespace ethstorage::upload
