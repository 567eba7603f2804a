#pragma once

#include <deductly/app/receipt_scanner.hpp>
#include <deductly/core/receipt.hpp>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

namespace deductly::app {

/// Receives (input index, result). Parallel runners call it from worker
/// threads, so it must be thread-safe there.
using ScanResultCallback =
    std::function<void(std::size_t index, const deductly::core::ScanResult&)>;

/// Creates an independent scanner (and recognizer) for one worker.
using ScannerFactory = std::function<std::unique_ptr<ReceiptScanner>()>;

/// Scans each path in order with one scanner; failed scans are reported too.
void scan_batch(ReceiptScanner& scanner,
                const std::vector<std::filesystem::path>& paths,
                const ScanResultCallback& callback);

/// Scans paths on a pool of std::threads, one scanner per worker (recognizers
/// are not assumed reentrant). Scanners are created on the calling thread
/// before any work starts, so factory exceptions reach the caller.
/// num_workers 0 = hardware concurrency. No ordering between callbacks.
/// \throws std::runtime_error if factory returns null.
void scan_batch_parallel(const ScannerFactory& factory,
                         const std::vector<std::filesystem::path>& paths,
                         const ScanResultCallback& callback,
                         std::size_t num_workers = 0);

}  // namespace deductly::app
