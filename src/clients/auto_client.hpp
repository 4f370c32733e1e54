#pragma once
#include "../client.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace troupe {

// Background ticker that runs the agent autonomously once per interval.
// Runs on its own thread until stopped; the destructor stops and joins.
class AutoClientHandle : public ClientHandle {
public:
    AutoClientHandle(std::string agent_name, std::chrono::milliseconds interval);
    ~AutoClientHandle() override;

    AutoClientHandle(const AutoClientHandle&) = delete;
    AutoClientHandle& operator=(const AutoClientHandle&) = delete;

    std::string client_name() const override { return "auto"; }
    void stop() override;

    bool running() const { return running_.load(); }
    uint64_t tick_count() const { return ticks_.load(); }

private:
    void run();

    std::string agent_name_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running_{true};
    std::atomic<uint64_t> ticks_{0};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
};

class AutoClient : public ClientInterface {
public:
    explicit AutoClient(std::chrono::milliseconds interval = std::chrono::hours(1))
        : interval_(interval) {}

    std::string name() const override { return "auto"; }
    std::unique_ptr<ClientHandle> start(AgentRuntime& runtime) override;

private:
    std::chrono::milliseconds interval_;
};

} // namespace troupe
