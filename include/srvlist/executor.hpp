#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace srvlist {

using Task = std::function<void()>;

// Execution context for event deliveries.
class Executor {
  public:
    virtual ~Executor() = default;

    virtual void execute(Task task) = 0;
};

// Runs tasks on the caller's stack.
class InlineExecutor final : public Executor {
  public:
    void execute(Task task) override;
};

// Runs every task on its own detached thread. Tasks may run concurrently.
class ThreadExecutor final : public Executor {
  public:
    void execute(Task task) override;
};

// Runs tasks one at a time, in submission order, on a single worker thread.
// Pending tasks are drained before destruction returns.
class SerialExecutor final : public Executor {
  private:
    std::mutex m_mtx;
    std::condition_variable m_cv;
    std::deque<Task> m_tasks;
    bool m_stopping = false;
    std::thread m_worker;

    void run();

  public:
    SerialExecutor();
    SerialExecutor(SerialExecutor const&) = delete;
    SerialExecutor& operator=(SerialExecutor const&) = delete;
    ~SerialExecutor() override;

    void execute(Task task) override;
};

} // namespace srvlist
