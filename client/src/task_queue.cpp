#include "task_queue.h"

#include <exception>
#include <utility>

#include "platform_log.h"

namespace sft::transfer {

namespace plog = sft::platform::log;

bool Lifeline::Handle::Run(const std::function<void()>& fn) const {
  if (!state_) {
    return false;
  }
  std::lock_guard<std::recursive_mutex> lock(state_->mutex);
  if (!state_->alive) {
    return false;
  }
  fn();
  return true;
}

void Lifeline::Revoke() {
  std::lock_guard<std::recursive_mutex> lock(state_->mutex);
  state_->alive = false;
}

TaskQueue::TaskQueue(std::string name, std::uint32_t threads,
                     std::size_t max_pending)
    : name_(std::move(name)),
      thread_count_(threads == 0 ? 1u : threads),
      max_pending_(max_pending) {}

TaskQueue::~TaskQueue() { Stop(); }

bool TaskQueue::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_.load()) {
    return true;
  }
  running_.store(true);
  threads_.reserve(thread_count_);
  for (std::uint32_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&TaskQueue::WorkerLoop, this);
  }
  return true;
}

void TaskQueue::Stop() {
  std::vector<std::thread> threads;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_.store(false);
    threads.swap(threads_);
  }
  cv_.notify_all();
  for (auto& t : threads) {
    if (t.joinable()) {
      t.join();
    }
  }
}

bool TaskQueue::Post(std::function<void()> task) {
  if (!task) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.load()) {
      return false;
    }
    if (max_pending_ != 0 && queue_.size() >= max_pending_) {
      plog::Log(plog::Level::kWarn, "task_queue", "queue full",
                {{"queue", name_}});
      return false;
    }
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
  return true;
}

bool TaskQueue::IsCurrentThread() const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto self = std::this_thread::get_id();
  for (const auto& t : threads_) {
    if (t.get_id() == self) {
      return true;
    }
  }
  return false;
}

void TaskQueue::WorkerLoop() {
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return !running_.load() || !queue_.empty(); });
      if (!running_.load() && queue_.empty()) {
        return;
      }
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    try {
      task();
    } catch (const std::exception& ex) {
      plog::Log(plog::Level::kError, "task_queue", "task threw",
                {{"queue", name_}, {"what", ex.what()}});
    }
  }
}

}  // namespace sft::transfer
