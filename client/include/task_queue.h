#ifndef SFT_CLIENT_TASK_QUEUE_H
#define SFT_CLIENT_TASK_QUEUE_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace sft::transfer {

class Executor {
 public:
  virtual ~Executor() = default;

  // Returns false when the task was not accepted (stopped or full).
  virtual bool Post(std::function<void()> task) = 0;
};

// Revocable handle for callbacks given to transports that may outlive the
// object that issued them. The owner revokes before its executors go away;
// a hand-off run through a Handle never overlaps the revoke.
class Lifeline {
 private:
  struct State {
    // Recursive: a hand-off run inline may hand off again.
    std::recursive_mutex mutex;
    bool alive{true};
  };

 public:
  class Handle {
   public:
    // Runs |fn| under the lifeline lock. Returns false, without running it,
    // once the owner has revoked.
    bool Run(const std::function<void()>& fn) const;

   private:
    friend class Lifeline;
    explicit Handle(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
  };

  Lifeline() : state_(std::make_shared<State>()) {}
  ~Lifeline() { Revoke(); }

  Lifeline(const Lifeline&) = delete;
  Lifeline& operator=(const Lifeline&) = delete;

  // Waits for a running hand-off to finish.
  void Revoke();
  Handle handle() const { return Handle(state_); }

 private:
  std::shared_ptr<State> state_;
};

// FIFO task queue served by a fixed set of threads. With one thread the
// tasks run strictly in submission order.
class TaskQueue : public Executor {
 public:
  // |max_pending| of 0 means unbounded.
  explicit TaskQueue(std::string name,
                     std::uint32_t threads = 1,
                     std::size_t max_pending = 4096);
  ~TaskQueue() override;

  TaskQueue(const TaskQueue&) = delete;
  TaskQueue& operator=(const TaskQueue&) = delete;

  bool Start();
  // Runs every task already queued, then joins the threads.
  void Stop();

  bool Post(std::function<void()> task) override;

  bool running() const { return running_.load(); }
  const std::string& name() const { return name_; }
  bool IsCurrentThread() const;

 private:
  void WorkerLoop();

  std::string name_;
  std::uint32_t thread_count_{1};
  std::size_t max_pending_{0};
  std::atomic<bool> running_{false};
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> queue_;
  std::vector<std::thread> threads_;
};

}  // namespace sft::transfer

#endif  // SFT_CLIENT_TASK_QUEUE_H
