#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/net/fetcher.hpp"
#include "internal/storage/common/arrow_utils.hpp"

namespace skycache::testing {

/*
  Fetcher answering from a URL -> body table.

  Unknown URLs answer 404. URLs in `unreachable` fail with a network
  error. `on_fetch` runs before each answer and `on_answered` after it
  is decided, both on the fetching thread.
*/
class ScriptedFetcher final : public net::Fetcher {
 public:
  void Serve(const std::string& url, const std::string& body, const std::string& content_type = "application/octet-stream") {
    std::lock_guard<std::mutex> lock(mutex_);
    bodies_[url] = {body, content_type};
  }

  void MakeUnreachable(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    unreachable_[url] = true;
  }

  void MakeReachable(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    unreachable_.erase(url);
  }

  // every URL fails with a network error
  void SetOffline(bool offline) {
    offline_ = offline;
  }

  void SetOnFetch(std::function<void(const std::string&)> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_fetch_ = std::move(hook);
  }

  void SetOnAnswered(std::function<void(const std::string&)> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_answered_ = std::move(hook);
  }

  net::FetchResult Fetch(const std::string& url, const util::CancellationToken& token) override {
    std::function<void(const std::string&)> hook;
    std::function<void(const std::string&)> after;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(url);
      hook  = on_fetch_;
      after = on_answered_;
    }
    if (hook) hook(url);

    auto result = Answer(url, token);
    if (after) after(url);
    return result;
  }

  bool IsOnline() const override {
    return !offline_;
  }

  std::vector<std::string> Requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  std::size_t RequestCount(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto& r : requests_) {
      if (r == url) ++n;
    }
    return n;
  }

  void ClearRequests() {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.clear();
  }

 private:
  net::FetchResult Answer(const std::string& url, const util::CancellationToken& token) {
    net::FetchResult result;
    if (token.IsCancelled()) {
      result.outcome = net::FetchOutcome::kCancelled;
      result.error   = "cancelled";
      return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (offline_ || unreachable_.count(url) > 0) {
      result.outcome = net::FetchOutcome::kNetworkError;
      result.error   = "unreachable";
      return result;
    }

    auto it = bodies_.find(url);
    if (it == bodies_.end()) {
      result.outcome     = net::FetchOutcome::kHttpError;
      result.http_status = 404;
      result.error       = "HTTP 404";
      return result;
    }

    result.outcome      = net::FetchOutcome::kOk;
    result.http_status  = 200;
    result.body         = storage::common::CopyToBuffer(it->second.first);
    result.content_type = it->second.second;
    return result;
  }

  mutable std::mutex                                         mutex_;
  std::map<std::string, std::pair<std::string, std::string>> bodies_;
  std::map<std::string, bool>                                unreachable_;
  std::vector<std::string>                                   requests_;
  std::function<void(const std::string&)>                    on_fetch_;
  std::function<void(const std::string&)>                    on_answered_;
  std::atomic<bool>                                          offline_{false};
};

} // namespace skycache::testing
