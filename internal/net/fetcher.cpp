#include "fetcher.hpp"

namespace skycache::net {

const char* ToString(FetchOutcome outcome) {
  switch (outcome) {
    case FetchOutcome::kOk:
      return "ok";
    case FetchOutcome::kHttpError:
      return "http_error";
    case FetchOutcome::kNetworkError:
      return "network_error";
    case FetchOutcome::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

} // namespace skycache::net
