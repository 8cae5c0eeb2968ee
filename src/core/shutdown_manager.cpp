#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <pthread.h>
#include <time.h>

namespace
{
    sigset_t shutdownSignals()
    {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGQUIT);
        return set;
    }
}

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopSignalThread();
}

void ShutdownManager::installSignalHandlers()
{
    if (signal_thread_running_.exchange(true))
    {
        return;
    }

    sigset_t set = shutdownSignals();
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0)
    {
        signal_thread_running_.store(false);
        Logger::error("ShutdownManager: pthread_sigmask failed: " + std::string(std::strerror(rc)));
        return;
    }

    signal_thread_ = std::thread(&ShutdownManager::signalLoop, this);
    Logger::info("ShutdownManager: listening for SIGINT, SIGTERM and SIGQUIT");
}

void ShutdownManager::signalLoop()
{
    sigset_t set = shutdownSignals();
    const timespec poll_interval{0, 100 * 1000 * 1000};

    while (signal_thread_running_.load())
    {
        int sig = sigtimedwait(&set, nullptr, &poll_interval);
        if (sig > 0)
        {
            try
            {
                requestShutdown(std::string("signal ") + strsignal(sig), sig);
            }
            catch (const std::exception &e)
            {
                // Still unblock waiters; the reason is best effort
                std::fprintf(stderr, "ShutdownManager: failed to record signal %d: %s\n", sig, e.what());
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    last_signal_.store(sig);
                    shutdown_requested_.store(true);
                }
                cv_.notify_all();
            }
            continue;
        }
        if (errno != EAGAIN && errno != EINTR)
        {
            Logger::error("ShutdownManager: sigtimedwait failed: " + std::string(std::strerror(errno)));
            break;
        }
    }
}

void ShutdownManager::stopSignalThread() noexcept
{
    signal_thread_running_.store(false);
    if (signal_thread_.joinable())
    {
        signal_thread_.join();
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_requested_.load())
        {
            return;
        }
        reason_ = reason;
        last_signal_.store(signal_number);
        shutdown_requested_.store(true);
    }
    cv_.notify_all();

    if (signal_number != 0)
    {
        Logger::info("ShutdownManager: " + reason + ", shutting down");
    }
    else
    {
        Logger::info("ShutdownManager: shutdown requested (" + reason + ")");
    }
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]
             { return shutdown_requested_.load(); });
}

void ShutdownManager::addShutdownHook(const std::string &name, std::function<void()> hook)
{
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    hooks_.emplace_back(name, std::move(hook));
}

void ShutdownManager::runShutdownHooks()
{
    std::vector<std::pair<std::string, std::function<void()>>> hooks;
    {
        std::lock_guard<std::mutex> lock(hooks_mutex_);
        hooks.swap(hooks_);
    }

    for (auto it = hooks.rbegin(); it != hooks.rend(); ++it)
    {
        Logger::debug("ShutdownManager: running hook " + it->first);
        try
        {
            it->second();
        }
        catch (const std::exception &e)
        {
            Logger::error("ShutdownManager: hook " + it->first + " failed: " + e.what());
        }
    }
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    stopSignalThread();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_requested_.store(false);
        last_signal_.store(0);
        reason_.clear();
    }
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    hooks_.clear();
}
