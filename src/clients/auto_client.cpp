#include "auto_client.hpp"
#include "../plugin.hpp"
#include "../runtime.hpp"
#include <iostream>

static troupe::ClientRegistrar reg_auto("auto", []() {
    return std::make_shared<troupe::AutoClient>();
});

namespace troupe {

AutoClientHandle::AutoClientHandle(std::string agent_name, std::chrono::milliseconds interval)
    : agent_name_(std::move(agent_name)), interval_(interval) {
    thread_ = std::thread(&AutoClientHandle::run, this);
}

AutoClientHandle::~AutoClientHandle() {
    stop();
}

void AutoClientHandle::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void AutoClientHandle::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load()) {
        if (cv_.wait_for(lock, interval_, [this] { return !running_.load(); })) {
            break;
        }
        ticks_.fetch_add(1);
        std::cerr << "[auto] Running auto client for " << agent_name_ << "\n";
    }
}

std::unique_ptr<ClientHandle> AutoClient::start(AgentRuntime& runtime) {
    return std::make_unique<AutoClientHandle>(runtime.character().name, interval_);
}

} // namespace troupe
