#pragma once

#include <algorithm>
#include <exception>
#include <future>
#include <type_traits>
#include <vector>

#include "core/ThreadPool.hpp"

namespace dnspub::core {

/// Applies fnTransform to every item and returns the results in input order.
///
/// A pool of min(iNumThreads, items) workers is used only when both are at
/// least 2; otherwise the items are processed sequentially on the calling
/// thread. Both paths produce the same result. If any call throws, the first
/// exception (in input order) is rethrown once every task has finished.
template <typename T, typename F>
auto concurrentTransform(const std::vector<T>& vItems, int iNumThreads, F&& fnTransform)
    -> std::vector<std::invoke_result_t<F&, const T&>> {
  using Result = std::invoke_result_t<F&, const T&>;

  std::vector<Result> vResults;
  vResults.reserve(vItems.size());

  if (iNumThreads < 2 || vItems.size() < 2) {
    for (const auto& item : vItems) {
      vResults.push_back(fnTransform(item));
    }
    return vResults;
  }

  const int iPoolSize = std::min(iNumThreads, static_cast<int>(vItems.size()));
  ThreadPool tpPool(iPoolSize);

  std::vector<std::future<Result>> vFutures;
  vFutures.reserve(vItems.size());
  for (const auto& item : vItems) {
    vFutures.push_back(tpPool.submit([&fnTransform, &item]() { return fnTransform(item); }));
  }

  std::exception_ptr epFirst;
  for (auto& fut : vFutures) {
    try {
      vResults.push_back(fut.get());
    } catch (const std::exception&) {
      if (!epFirst) epFirst = std::current_exception();
    }
  }
  if (epFirst) {
    std::rethrow_exception(epFirst);
  }
  return vResults;
}

}  // namespace dnspub::core
