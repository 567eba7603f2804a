#pragma once

#include <deductly/app/batch_runner.hpp>
#include <filesystem>
#include <vector>

#ifdef DEDUCTLY_HAS_TBB

namespace deductly::app {

/// Scans paths with tbb::parallel_for. Each TBB worker thread lazily gets its
/// own scanner from factory (tbb::enumerable_thread_specific), so a scanner is
/// never shared between threads. callback must be thread-safe.
void scan_batch_tbb(const ScannerFactory& factory,
                    const std::vector<std::filesystem::path>& paths,
                    const ScanResultCallback& callback);

}  // namespace deductly::app

#endif  // DEDUCTLY_HAS_TBB
