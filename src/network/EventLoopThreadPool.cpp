#include "llmrouter/network/EventLoopThreadPool.h"
#include "llmrouter/network/EventLoop.h"
#include "llmrouter/network/EventLoopThread.h"

namespace llmrouter {
namespace network {

EventLoopThreadPool::EventLoopThreadPool(EventLoop* baseLoop, const std::string& nameArg)
    : baseLoop_(baseLoop),
      name_(nameArg),
      started_(false),
      numThreads_(0),
      next_(0) {
}

EventLoopThreadPool::~EventLoopThreadPool() = default;

void EventLoopThreadPool::Start() {
    started_ = true;
    for (int i = 0; i < numThreads_; ++i) {
        threads_.push_back(std::make_unique<EventLoopThread>(name_ + std::to_string(i)));
        loops_.push_back(threads_.back()->StartLoop());
    }
}

EventLoop* EventLoopThreadPool::GetNextLoop() {
    EventLoop* loop = baseLoop_;
    if (!loops_.empty()) {
        loop = loops_[next_];
        next_ = (next_ + 1) % loops_.size();
    }
    return loop;
}

} // namespace network
} // namespace llmrouter
