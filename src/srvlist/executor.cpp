#include "srvlist/executor.hpp"

#include "srvlist/log.hpp"

#include <exception>
#include <fmt/format.h>
#include <utility>

namespace srvlist {

static void run_task(Task const& task) noexcept;

void InlineExecutor::execute(Task task) {
    run_task(task);
}

void ThreadExecutor::execute(Task task) {
    std::thread([task = std::move(task)] { run_task(task); }).detach();
}

SerialExecutor::SerialExecutor() : m_worker([this] { run(); }) {}

SerialExecutor::~SerialExecutor() {
    {
        auto _guard = std::lock_guard(m_mtx);
        m_stopping = true;
    }
    m_cv.notify_one();
    m_worker.join();
}

void SerialExecutor::execute(Task task) {
    {
        auto _guard = std::lock_guard(m_mtx);
        m_tasks.push_back(std::move(task));
    }
    m_cv.notify_one();
}

void SerialExecutor::run() {
    for (;;) {
        Task task;
        {
            auto lock = std::unique_lock(m_mtx);
            m_cv.wait(lock, [this] { return m_stopping or not m_tasks.empty(); });
            if (m_tasks.empty()) {
                return;
            }
            task = std::move(m_tasks.front());
            m_tasks.pop_front();
        }
        run_task(task);
    }
}

static void run_task(Task const& task) noexcept {
    try {
        task();
    } catch (std::exception const& err) {
        Log::error(fmt::format("event delivery failed: {}", err.what()));
    }
}

} // namespace srvlist
