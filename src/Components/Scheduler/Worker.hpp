//----------------------------------------------------------------------------------------------------------------------
// File: Worker.hpp
// Description: An asio io_context driven by a dedicated thread. Components post work to the worker to move it off of
// the caller's context and use its executor for timers.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
//----------------------------------------------------------------------------------------------------------------------
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
//----------------------------------------------------------------------------------------------------------------------

namespace spdlog { class logger; }

//----------------------------------------------------------------------------------------------------------------------
namespace Scheduler {
//----------------------------------------------------------------------------------------------------------------------

class Worker;

//----------------------------------------------------------------------------------------------------------------------
} // Scheduler namespace
//----------------------------------------------------------------------------------------------------------------------

class Scheduler::Worker
{
public:
    using Task = std::function<void()>;

    explicit Worker(std::string_view name);
    ~Worker();

    Worker(Worker const&) = delete;
    Worker& operator=(Worker const&) = delete;

    [[nodiscard]] std::string_view GetName() const;
    [[nodiscard]] boost::asio::io_context& GetContext();
    [[nodiscard]] bool IsActive() const;
    [[nodiscard]] bool IsWorkerThread() const;

    // Returns false when the worker has been stopped and the task will not be run.
    [[nodiscard]] bool Post(Task&& task);

    // Note: Tasks posted before Stop() is called are run before the worker thread exits. Calling Stop() from a posted
    // task is not permitted.
    void Stop();

private:
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    void ProcessEvents();

    std::string m_name;
    mutable std::mutex m_mutex;
    boost::asio::io_context m_context;
    std::optional<WorkGuard> m_optWorkGuard;
    std::atomic_bool m_active;
    std::jthread m_worker;
    std::shared_ptr<spdlog::logger> m_logger;
};

//----------------------------------------------------------------------------------------------------------------------
