#include "ScanTaskRegistry.hpp"
#include "../common/Errors.hpp"
#include "../scanner/ResultAggregator.hpp"
#include <openssl/rand.h>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace net_map::service
{
    namespace
    {
        bool IsTerminal(TaskState state)
        {
            return state == TaskState::Done || state == TaskState::Error || state == TaskState::Cancelled;
        }

        const char *CANCELLED_MESSAGE = "Scan cancelled by user";
    }

    const char *ToString(TaskState state)
    {
        switch (state)
        {
        case TaskState::Pending:
            return "pending";
        case TaskState::Running:
            return "running";
        case TaskState::Done:
            return "done";
        case TaskState::Error:
            return "error";
        case TaskState::Cancelled:
            return "cancelled";
        }
        return "unknown";
    }

    ScanTaskRegistry::ScanTaskRegistry(ScanRunner runner) : m_runner(std::move(runner))
    {
    }

    ScanTaskRegistry::~ScanTaskRegistry()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (auto &pair : m_tasks)
            {
                pair.second->cancel.Cancel();
            }
        }

        for (auto &pair : m_tasks)
        {
            if (pair.second->thread.joinable())
                pair.second->thread.join();
        }
    }

    std::string ScanTaskRegistry::GenerateTaskId()
    {
        unsigned char bytes[16];
        if (RAND_bytes(bytes, sizeof(bytes)) != 1)
            throw common::ScanError("OpenSSL RNG failed while generating a task id");

        // RFC 4122 version 4, variant 1.
        bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

        std::stringstream ss;
        ss << std::hex << std::setfill('0');
        for (int i = 0; i < 16; ++i)
        {
            if (i == 4 || i == 6 || i == 8 || i == 10)
                ss << '-';
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    std::string ScanTaskRegistry::Submit(const scanner::ScanConfig &config)
    {
        config.Validate();

        std::string id = GenerateTaskId();
        auto task = std::make_unique<Task>();
        Task *raw = task.get();

        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks.emplace(id, std::move(task));
        raw->thread = std::thread(&ScanTaskRegistry::RunTask, this, raw, config);

        std::cout << "[TaskRegistry] Submitted scan " << id << (config.deep ? " (deep)" : "") << "\n";
        return id;
    }

    void ScanTaskRegistry::RunTask(Task *task, scanner::ScanConfig config)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (task->status.state == TaskState::Cancelled)
            {
                task->completed = true;
                m_cv.notify_all();
                return;
            }
            task->status.state = TaskState::Running;
            task->status.started_at = scanner::ResultAggregator::NowEpochSeconds();
        }

        TaskState outcome = TaskState::Done;
        std::string message;
        std::optional<scanner::ScanSnapshot> result;
        try
        {
            result = m_runner(config, task->cancel);
            message = std::to_string(result->devices.size()) + " device(s) found";
        }
        catch (const common::ScanCancelled &)
        {
            outcome = TaskState::Cancelled;
            message = CANCELLED_MESSAGE;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[TaskRegistry] Scan failed: " << e.what() << "\n";
            outcome = TaskState::Error;
            message = e.what();
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (task->status.state == TaskState::Cancelled)
            {
                task->status.message = CANCELLED_MESSAGE;
            }
            else
            {
                task->status.state = outcome;
                task->status.message = message;
                if (outcome == TaskState::Done)
                    task->result = std::move(result);
            }
            if (!task->status.finished_at)
                task->status.finished_at = scanner::ResultAggregator::NowEpochSeconds();
            task->completed = true;
        }
        m_cv.notify_all();
    }

    CancelOutcome ScanTaskRegistry::Cancel(const std::string &id)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_tasks.find(id);
        if (it == m_tasks.end())
            return CancelOutcome::NotFound;

        Task &task = *it->second;
        if (IsTerminal(task.status.state))
            return CancelOutcome::AlreadyFinished;

        task.cancel.Cancel();
        task.status.state = TaskState::Cancelled;
        task.status.message = CANCELLED_MESSAGE;
        task.status.finished_at = scanner::ResultAggregator::NowEpochSeconds();

        std::cout << "[TaskRegistry] Cancelled scan " << id << "\n";
        return CancelOutcome::Cancelled;
    }

    std::optional<TaskStatus> ScanTaskRegistry::Status(const std::string &id) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_tasks.find(id);
        if (it == m_tasks.end())
            return std::nullopt;
        return it->second->status;
    }

    std::optional<scanner::ScanSnapshot> ScanTaskRegistry::Result(const std::string &id) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_tasks.find(id);
        if (it == m_tasks.end())
            return std::nullopt;
        return it->second->result;
    }

    bool ScanTaskRegistry::Wait(const std::string &id, std::chrono::milliseconds timeout) const
    {
        std::unique_lock<std::mutex> lock(m_mutex);

        auto it = m_tasks.find(id);
        if (it == m_tasks.end())
            return false;

        const Task *task = it->second.get();
        return m_cv.wait_for(lock, timeout, [task]
                             { return task->completed; });
    }
}
