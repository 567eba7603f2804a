#include <deductly/app/batch_runner_tbb.hpp>

#ifdef DEDUCTLY_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/enumerable_thread_specific.h>
#include <tbb/parallel_for.h>
#include <cstddef>
#include <memory>
#include <stdexcept>

namespace deductly::app {

void scan_batch_tbb(const ScannerFactory& factory,
                    const std::vector<std::filesystem::path>& paths,
                    const ScanResultCallback& callback) {
  if (paths.empty() || !factory) return;

  tbb::enumerable_thread_specific<std::unique_ptr<ReceiptScanner>> scanners;
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, paths.size()),
      [&](const tbb::blocked_range<std::size_t>& range) {
        auto& scanner = scanners.local();
        if (!scanner) scanner = factory();
        if (!scanner) {
          throw std::runtime_error("scan_batch_tbb: scanner factory returned null");
        }
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          auto result = scanner->scan(paths[i]);
          if (callback) callback(i, result);
        }
      });
}

}  // namespace deductly::app

#endif  // DEDUCTLY_HAS_TBB
