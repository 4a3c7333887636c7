#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace hs::concurrency {

class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    virtual void restart();

    [[nodiscard]] bool isRunning() const { return running_.load(std::memory_order_acquire); }

    [[nodiscard]] const std::string& name() const { return serviceName_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    [[nodiscard]] bool shouldStop() const { return interruptFlag_.load(std::memory_order_acquire); }

    // Sleeps for up to `d`, returning early as soon as stop() is requested.
    template <typename Rep, typename Period>
    void lazySleep(const std::chrono::duration<Rep, Period>& d) {
        std::unique_lock lock(sleepMutex_);
        sleepCv_.wait_for(lock, d, [this] { return shouldStop(); });
    }

private:
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
};

}
