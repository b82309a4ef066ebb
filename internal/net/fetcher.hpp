#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>

#include "internal/util/cancellation.hpp"

namespace skycache::net {

enum class FetchOutcome {
  kOk,
  kHttpError,    // server answered with a non-2xx status
  kNetworkError, // no answer (DNS, connect, timeout, TLS)
  kCancelled,
};

struct FetchResult {
  FetchOutcome                   outcome     = FetchOutcome::kNetworkError;
  long                           http_status = 0;
  std::shared_ptr<arrow::Buffer> body;
  std::string                    content_type;
  std::string                    error;

  bool ok() const {
    return outcome == FetchOutcome::kOk;
  }
};

const char* ToString(FetchOutcome outcome);

/*
  HTTP GET primitive consumed by the download engine.

  Fetch never throws for transport problems; they come back as
  kHttpError / kNetworkError. A cancelled token yields kCancelled,
  whether it was set before the request or while it was in flight.

  Implementations must be safe to call from several threads at once
  (HiPS batches fetch concurrently).
*/
class Fetcher {
 public:
  virtual ~Fetcher() = default;

  virtual FetchResult Fetch(const std::string& url, const util::CancellationToken& token) = 0;

  /*
    Host connectivity signal. Advisory: used to skip network fallbacks
    while offline, never to abort running downloads.
  */
  virtual bool IsOnline() const = 0;
};

using FetcherPtr = std::shared_ptr<Fetcher>;

} // namespace skycache::net
