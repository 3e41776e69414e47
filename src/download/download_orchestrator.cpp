#include "ethstorage/download/download_orchestrator.hpp"
#include "ethstorage/errors.hpp"
#include "ethstorage/utils/ordered_buffer.hpp"
#include "ethstorage/utils/task_pool.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>

namespace ethstorage::download {

DownloadOrchestrator::DownloadOrchestrator(std::shared_ptr<chain::StorageContract> reader,
                                           chain::RetryPolicy retry, std::size_t concurrency)
  : reader_(std::move(reader))
  , retry_(std::move(retry))
  , concurrency_(concurrency > 0
                   ? concurrency
                   : utils::TaskPool::default_concurrency(MIN_DOWNLOAD_CONCURRENCY, MAX_DOWNLOAD_CONCURRENCY)) {
  if (!reader_) {
    throw std::invalid_argument("DownloadOrchestrator: storage contract is required");
  }
}

bool DownloadOrchestrator::download(const std::string& key, const DownloadCallback& callback) {
  auto fail = [&callback, &key](const std::string& message) {
    BOOST_LOG_TRIVIAL(error) << "DownloadOrchestrator: Download of " << key << " failed: " << message;
    if (callback.on_fail) {
      callback.on_fail(message);
    }
    return false;
  };

  if (key.empty()) {
    return fail(ValidationError("invalid key").what());
  }

  uint64_t total = 0;
  try {
    total = retry_.run([this, &key]() { return reader_->count_chunks(key); }, "count_chunks");
  } catch (const std::exception& e) {
    return fail(e.what());
  }
  BOOST_LOG_TRIVIAL(info) << "DownloadOrchestrator: Fetching " << total << " chunk(s) of " << key
                          << " with " << concurrency_ << " worker(s)";

  if (total > 0) {
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::string first_error;

    utils::OrderedBuffer<Bytes> buffer(0, [&callback, total](std::size_t index, Bytes&& data) {
      if (callback.on_progress) {
        callback.on_progress(index, total, data);
      }
    });

    utils::TaskPool pool(std::min<uint64_t>(concurrency_, total));
    for (uint64_t index = 0; index < total; ++index) {
      pool.submit([this, &key, index, &failed, &error_mutex, &first_error, &buffer]() {
        if (failed.load()) {
          return;
        }
        try {
          Bytes data = retry_.run([this, &key, index]() { return reader_->read_chunk(key, index); },
                                  "read_chunk");
          if (!failed.load()) {
            buffer.push(index, std::move(data));
          }
        } catch (const std::exception& e) {
          std::lock_guard<std::mutex> lock(error_mutex);
          if (!failed.exchange(true)) {
            first_error = "chunk " + std::to_string(index) + ": " + e.what();
          }
        }
      });
    }
    pool.wait();

    if (failed.load()) {
      return fail(first_error);
    }
  }

  BOOST_LOG_TRIVIAL(info) << "DownloadOrchestrator: Download of " << key << " complete";
  if (callback.on_finish) {
    callback.on_finish();
  }
  return true;
}

Bytes DownloadOrchestrator::download_all(const std::string& key) {
  Bytes content;
  std::string error;
  DownloadCallback callback;
  callback.on_progress = [&content](uint64_t, uint64_t, const Bytes& data) {
    content.insert(content.end(), data.begin(), data.end());
  };
  callback.on_fail = [&error](const std::string& message) { error = message; };

  if (!download(key, callback)) {
    throw EthStorageError("download failed: " + error);
  }
  return content;
}

} // namespace ethstorage::download
