#pragma once

#include "llmrouter/common/noncopyable.h"

#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace llmrouter {
namespace network {

class EventLoop;

class EventLoopThread : llmrouter::common::noncopyable {
public:
    explicit EventLoopThread(const std::string& name = std::string());
    ~EventLoopThread();

    // Blocks until the new thread's loop exists.
    EventLoop* StartLoop();

private:
    void ThreadFunc();

    EventLoop* loop_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cond_;
    std::string name_;
};

} // namespace network
} // namespace llmrouter
