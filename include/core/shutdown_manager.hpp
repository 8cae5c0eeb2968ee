#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

/**
 * @brief Process-wide shutdown coordination
 *
 * installSignalHandlers() blocks SIGINT/SIGTERM/SIGQUIT for the calling thread and
 * every thread started after it, then receives them synchronously on a dedicated
 * thread, so no code runs in signal context. It must be called before other threads
 * are started. Shutdown hooks run in reverse registration order, once.
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    void installSignalHandlers();

    // Safe from any thread; only the first request is recorded. Copies the reason and
    // logs, so allocation failures propagate to the caller.
    void requestShutdown(const std::string &reason, int signal_number = 0);

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    void waitForShutdown();

    // Register cleanup to run from runShutdownHooks()
    void addShutdownHook(const std::string &name, std::function<void()> hook);

    // Runs each hook once, newest first; hook exceptions are logged
    void runShutdownHooks();

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Clears state and hooks (tests)
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    void signalLoop();
    void stopSignalThread() noexcept;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::vector<std::pair<std::string, std::function<void()>>> hooks_;
    std::mutex hooks_mutex_;

    std::thread signal_thread_;
    std::atomic<bool> signal_thread_running_{false};
};
