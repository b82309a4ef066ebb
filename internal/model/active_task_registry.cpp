#include "active_task_registry.hpp"

namespace skycache::model {

// ------------------------------------------------------------------
// TaskHandle
// ------------------------------------------------------------------

ActiveTaskRegistry::TaskHandle::~TaskHandle() {
  Release();
}

ActiveTaskRegistry::TaskHandle::TaskHandle(TaskHandle&& other) noexcept : registry_(other.registry_), task_(std::move(other.task_)) {
  other.registry_ = nullptr;
}

ActiveTaskRegistry::TaskHandle& ActiveTaskRegistry::TaskHandle::operator=(TaskHandle&& other) noexcept {
  if (this != &other) {
    Release();
    registry_       = other.registry_;
    task_           = std::move(other.task_);
    other.registry_ = nullptr;
  }
  return *this;
}

void ActiveTaskRegistry::TaskHandle::Release() {
  if (!registry_ || !task_) return;

  std::lock_guard lock(registry_->mutex_);
  auto            it = registry_->tasks_.find(task_->key);
  if (it != registry_->tasks_.end() && it->second == task_) {
    registry_->tasks_.erase(it);
  }
  registry_ = nullptr;
  task_.reset();
}

DownloadProgress ActiveTaskRegistry::TaskHandle::Update(const std::function<void(DownloadProgress&)>& mutate) {
  std::lock_guard lock(registry_->mutex_);
  mutate(task_->progress);
  return task_->progress;
}

// ------------------------------------------------------------------
// Registry
// ------------------------------------------------------------------

ActiveTaskRegistry::TaskHandle ActiveTaskRegistry::Begin(const std::string& key, std::uint64_t total_units, std::uint64_t total_bytes,
                                                         const std::string& target_id) {
  std::lock_guard lock(mutex_);

  if (tasks_.count(key) > 0) {
    return TaskHandle{};
  }

  auto task                           = std::make_shared<DownloadTask>();
  task->key                           = key;
  task->progress.target_id            = target_id.empty() ? key : target_id;
  task->progress.total_units          = total_units;
  task->progress.total_bytes_estimate = total_bytes;
  task->progress.status               = DownloadStatus::kPending;
  tasks_.emplace(key, task);
  return TaskHandle(this, std::move(task));
}

bool ActiveTaskRegistry::Cancel(const std::string& key) {
  std::lock_guard lock(mutex_);

  auto it = tasks_.find(key);
  if (it == tasks_.end()) return false;

  it->second->cancellation.Cancel();
  return true;
}

void ActiveTaskRegistry::CancelAll() {
  std::lock_guard lock(mutex_);
  for (auto& [_, task] : tasks_) {
    task->cancellation.Cancel();
  }
}

bool ActiveTaskRegistry::Contains(const std::string& key) const {
  std::lock_guard lock(mutex_);
  return tasks_.count(key) > 0;
}

std::vector<DownloadProgress> ActiveTaskRegistry::Snapshot() const {
  std::lock_guard lock(mutex_);

  std::vector<DownloadProgress> snapshot;
  snapshot.reserve(tasks_.size());
  for (const auto& [_, task] : tasks_) {
    snapshot.push_back(task->progress);
  }
  return snapshot;
}

} // namespace skycache::model
