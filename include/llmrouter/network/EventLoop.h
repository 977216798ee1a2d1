#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "llmrouter/common/noncopyable.h"
#include "llmrouter/network/Channel.h"
#include "llmrouter/network/Poller.h"

namespace llmrouter {
namespace network {

// One loop per thread. Everything touching a loop's channels, timers and
// connections runs on that loop's thread; other threads hand work over
// with RunInLoop/QueueInLoop.
class EventLoop : llmrouter::common::noncopyable {
public:
    using Functor = std::function<void()>;
    using TimerId = uint64_t;

    EventLoop();
    ~EventLoop();

    void Loop();
    // Safe to call before Loop(); the loop then returns after one iteration.
    void Quit();

    void RunInLoop(Functor cb);
    void QueueInLoop(Functor cb);

    // One-shot timer on this loop. Must be called from the loop thread.
    TimerId RunAfter(double delaySec, Functor cb);
    void Cancel(TimerId id);

    void WakeUp();
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel);

    bool IsInLoopThread() const { return thread_id_ == std::this_thread::get_id(); }

    static EventLoop* GetEventLoopOfCurrentThread();

private:
    using Clock = std::chrono::steady_clock;
    using TimerKey = std::pair<Clock::time_point, TimerId>;

    void HandleRead(); // wakeup fd
    void HandleTimer();
    void ResetTimerfd();
    void DoPendingFunctors();

    using ChannelList = std::vector<Channel*>;

    std::atomic_bool looping_;
    std::atomic_bool quit_;
    std::atomic_bool calling_pending_functors_;

    const std::thread::id thread_id_;
    std::unique_ptr<Poller> poller_;

    int wakeup_fd_;
    std::unique_ptr<Channel> wakeup_channel_;

    int timer_fd_;
    std::unique_ptr<Channel> timer_channel_;
    TimerId next_timer_id_;
    std::map<TimerKey, Functor> timers_;
    std::unordered_map<TimerId, Clock::time_point> timer_deadlines_;

    ChannelList active_channels_;

    std::mutex mutex_;
    std::vector<Functor> pending_functors_;
};

} // namespace network
} // namespace llmrouter
