#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/model/download_task.hpp"

namespace skycache::model {

/*
  In-flight downloads keyed by target id (or storage name).

  Each manager owns one. A task enters on Begin() and leaves when its
  TaskHandle is destroyed, so an id is "downloading" exactly while the
  download call is on the stack.

  Progress is mutated through Update() so ActiveDownloads() snapshots
  never observe a torn record.
*/
class ActiveTaskRegistry {
 public:
  class TaskHandle {
   public:
    TaskHandle() = default;
    TaskHandle(ActiveTaskRegistry* registry, std::shared_ptr<DownloadTask> task) : registry_(registry), task_(std::move(task)) {
    }
    ~TaskHandle();

    TaskHandle(TaskHandle&& other) noexcept;
    TaskHandle& operator=(TaskHandle&& other) noexcept;

    TaskHandle(const TaskHandle&)            = delete;
    TaskHandle& operator=(const TaskHandle&) = delete;

    explicit operator bool() const {
      return task_ != nullptr;
    }

    util::CancellationToken Token() const {
      return task_->cancellation.Token();
    }

    /*
      Apply `mutate` under the registry lock and return the new snapshot.
    */
    DownloadProgress Update(const std::function<void(DownloadProgress&)>& mutate);

   private:
    void Release();

    ActiveTaskRegistry*           registry_ = nullptr;
    std::shared_ptr<DownloadTask> task_;
  };

  /*
    Empty handle when `key` is already in flight. Progress reports
    `target_id`, which defaults to `key`; managers whose targets can
    share storage key on the storage name instead.
  */
  TaskHandle Begin(const std::string& key, std::uint64_t total_units, std::uint64_t total_bytes, const std::string& target_id = {});

  bool Cancel(const std::string& key);

  void CancelAll();

  bool Contains(const std::string& key) const;

  std::vector<DownloadProgress> Snapshot() const;

 private:
  mutable std::mutex                                   mutex_;
  std::map<std::string, std::shared_ptr<DownloadTask>> tasks_;
};

} // namespace skycache::model
