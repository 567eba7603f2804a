#include <deductly/core/receipt.hpp>

namespace deductly::core {

std::string ReceiptImage::describe() const {
  if (const auto* p = path()) return p->string();
  return encoded()->name;
}

}  // namespace deductly::core
