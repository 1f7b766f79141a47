#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include "../common/CancelToken.hpp"
#include "../scanner/ScanPipeline.hpp"

namespace net_map::service
{
    enum class TaskState
    {
        Pending,
        Running,
        Done,
        Error,
        Cancelled
    };

    const char *ToString(TaskState state);

    struct TaskStatus
    {
        TaskState state = TaskState::Pending;
        std::optional<double> started_at;
        std::optional<double> finished_at;
        std::string message;
    };

    enum class CancelOutcome
    {
        Cancelled,
        AlreadyFinished,
        NotFound
    };

    // Runs one scan; the returned snapshot is kept as the task result.
    using ScanRunner = std::function<scanner::ScanSnapshot(const scanner::ScanConfig &, const common::CancelToken &)>;

    class ScanTaskRegistry
    {
    private:
        struct Task
        {
            TaskStatus status;
            common::CancelToken cancel;
            std::thread thread;
            std::optional<scanner::ScanSnapshot> result;
            bool completed = false;
        };

        ScanRunner m_runner;
        mutable std::mutex m_mutex;
        mutable std::condition_variable m_cv;
        std::unordered_map<std::string, std::unique_ptr<Task>> m_tasks;

        void RunTask(Task *task, scanner::ScanConfig config);

    public:
        explicit ScanTaskRegistry(ScanRunner runner);
        ~ScanTaskRegistry();

        ScanTaskRegistry(const ScanTaskRegistry &) = delete;
        ScanTaskRegistry &operator=(const ScanTaskRegistry &) = delete;

        // Validates the config (common::ConfigurationError) and starts the
        // scan on its own thread.
        std::string Submit(const scanner::ScanConfig &config);
        CancelOutcome Cancel(const std::string &id);
        std::optional<TaskStatus> Status(const std::string &id) const;

        // Snapshot of a task that ended Done; nullopt otherwise.
        std::optional<scanner::ScanSnapshot> Result(const std::string &id) const;

        // True once the task's thread has finished; false on timeout or
        // unknown id.
        bool Wait(const std::string &id, std::chrono::milliseconds timeout) const;

        static std::string GenerateTaskId();
    };
}
