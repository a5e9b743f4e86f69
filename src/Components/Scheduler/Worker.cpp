//----------------------------------------------------------------------------------------------------------------------
// File: Worker.cpp
// Description:
//----------------------------------------------------------------------------------------------------------------------
#include "Worker.hpp"
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <spdlog/spdlog.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cassert>
#include <exception>
#include <utility>
//----------------------------------------------------------------------------------------------------------------------

Scheduler::Worker::Worker(std::string_view name)
    : m_name(name)
    , m_mutex()
    , m_context()
    , m_optWorkGuard(boost::asio::make_work_guard(m_context))
    , m_active(true)
    , m_worker()
    , m_logger(spdlog::get(Logger::Name::Core.data()))
{
    assert(m_logger);
    m_worker = std::jthread([this] () { ProcessEvents(); });
    assert(m_worker.joinable()); // A thread must be spawned for the worker to be usable.
}

//----------------------------------------------------------------------------------------------------------------------

Scheduler::Worker::~Worker()
{
    Stop();
}

//----------------------------------------------------------------------------------------------------------------------

std::string_view Scheduler::Worker::GetName() const { return m_name; }

//----------------------------------------------------------------------------------------------------------------------

boost::asio::io_context& Scheduler::Worker::GetContext() { return m_context; }

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::Worker::IsActive() const { return m_active; }

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::Worker::IsWorkerThread() const { return std::this_thread::get_id() == m_worker.get_id(); }

//----------------------------------------------------------------------------------------------------------------------

bool Scheduler::Worker::Post(Task&& task)
{
    std::scoped_lock lock{ m_mutex };
    if (!m_active) { return false; }
    boost::asio::post(m_context, std::move(task));
    return true;
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Worker::Stop()
{
    {
        std::scoped_lock lock{ m_mutex };
        if (!m_active) { return; }
        m_active = false;
        m_optWorkGuard.reset(); // Allow io_context.run() to return once the queued work has been drained.
    }

    assert(!IsWorkerThread());
    if (m_worker.joinable()) { m_worker.join(); }
    m_logger->debug("The {} worker has been stopped.", m_name);
}

//----------------------------------------------------------------------------------------------------------------------

void Scheduler::Worker::ProcessEvents()
{
    // The work guard keeps io_context.run() blocking while idle. Once the guard has been released, run() returns after
    // every queued task has completed. A task that raised an error unwinds run(), which is resumed for the remainder.
    while (true) {
        try {
            m_context.run();
            return;
        } catch (std::exception const& exception) {
            m_logger->error("A task on the {} worker raised an error: {}", m_name, exception.what());
        }
    }
}

//----------------------------------------------------------------------------------------------------------------------
