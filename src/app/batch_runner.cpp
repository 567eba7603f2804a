#include <deductly/app/batch_runner.hpp>
#include <algorithm>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace deductly::app {

void scan_batch(ReceiptScanner& scanner,
                const std::vector<std::filesystem::path>& paths,
                const ScanResultCallback& callback) {
  for (std::size_t i = 0; i < paths.size(); ++i) {
    auto result = scanner.scan(paths[i]);
    if (callback) callback(i, result);
  }
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void scan_batch_parallel(const ScannerFactory& factory,
                         const std::vector<std::filesystem::path>& paths,
                         const ScanResultCallback& callback,
                         std::size_t num_workers) {
  const std::size_t n = paths.size();
  if (n == 0 || !factory) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  std::vector<std::unique_ptr<ReceiptScanner>> scanners;
  scanners.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    auto scanner = factory();
    if (!scanner) {
      throw std::runtime_error("scan_batch_parallel: scanner factory returned null");
    }
    scanners.push_back(std::move(scanner));
  }

  if (workers <= 1) {
    scan_batch(*scanners.front(), paths, callback);
    return;
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;

  auto worker = [&](ReceiptScanner& scanner) {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }
      auto result = scanner.scan(paths[idx]);
      if (callback) callback(idx, result);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (auto& scanner : scanners) {
    threads.emplace_back(worker, std::ref(*scanner));
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace deductly::app
