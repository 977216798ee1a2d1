#include "llmrouter/network/EventLoop.h"
#include "llmrouter/network/Channel.h"
#include "llmrouter/network/Poller.h"
#include "llmrouter/common/Logger.h"

#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace llmrouter {
namespace network {

namespace {

__thread EventLoop* t_loopInThisThread = nullptr;

const int kPollTimeMs = 10000;

int CreateEventfd() {
    int evtfd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (evtfd < 0) {
        LOG_FATAL << "Failed in eventfd: " << std::strerror(errno);
        throw std::runtime_error("eventfd failed");
    }
    return evtfd;
}

int CreateTimerfd() {
    int tfd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (tfd < 0) {
        LOG_FATAL << "Failed in timerfd_create: " << std::strerror(errno);
        throw std::runtime_error("timerfd_create failed");
    }
    return tfd;
}

} // namespace

EventLoop* EventLoop::GetEventLoopOfCurrentThread() {
    return t_loopInThisThread;
}

EventLoop::EventLoop()
    : looping_(false),
      quit_(false),
      calling_pending_functors_(false),
      thread_id_(std::this_thread::get_id()),
      poller_(Poller::NewDefaultPoller(this)),
      wakeup_fd_(CreateEventfd()),
      wakeup_channel_(new Channel(this, wakeup_fd_)),
      timer_fd_(CreateTimerfd()),
      timer_channel_(new Channel(this, timer_fd_)),
      next_timer_id_(1) {
    LOG_DEBUG << "EventLoop created " << this << " in thread " << thread_id_;

    if (t_loopInThisThread) {
        LOG_FATAL << "Another EventLoop " << t_loopInThisThread << " exists in this thread " << thread_id_;
        throw std::logic_error("one EventLoop per thread");
    }
    t_loopInThisThread = this;

    wakeup_channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
    wakeup_channel_->EnableReading();
    timer_channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { HandleTimer(); });
    timer_channel_->EnableReading();
}

EventLoop::~EventLoop() {
    timer_channel_->DisableAll();
    timer_channel_->Remove();
    ::close(timer_fd_);
    wakeup_channel_->DisableAll();
    wakeup_channel_->Remove();
    ::close(wakeup_fd_);
    t_loopInThisThread = nullptr;
}

void EventLoop::Loop() {
    looping_ = true;
    LOG_DEBUG << "EventLoop " << this << " start looping";

    do {
        active_channels_.clear();
        poller_->Poll(kPollTimeMs, &active_channels_);
        for (Channel* channel : active_channels_) {
            channel->HandleEvent(std::chrono::system_clock::now());
        }
        DoPendingFunctors();
    } while (!quit_);

    LOG_DEBUG << "EventLoop " << this << " stop looping";
    looping_ = false;
}

void EventLoop::Quit() {
    quit_ = true;
    if (!IsInLoopThread()) {
        WakeUp();
    }
}

void EventLoop::RunInLoop(Functor cb) {
    if (IsInLoopThread()) {
        cb();
    } else {
        QueueInLoop(std::move(cb));
    }
}

void EventLoop::QueueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_functors_.emplace_back(std::move(cb));
    }

    if (!IsInLoopThread() || calling_pending_functors_ || !looping_) {
        WakeUp();
    }
}

EventLoop::TimerId EventLoop::RunAfter(double delaySec, Functor cb) {
    if (delaySec < 0.0) delaySec = 0.0;
    const auto deadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(delaySec));
    const TimerId id = next_timer_id_++;

    const bool earliest = timers_.empty() || deadline < timers_.begin()->first.first;
    timers_.emplace(TimerKey(deadline, id), std::move(cb));
    timer_deadlines_[id] = deadline;
    if (earliest) {
        ResetTimerfd();
    }
    return id;
}

void EventLoop::Cancel(TimerId id) {
    auto it = timer_deadlines_.find(id);
    if (it == timer_deadlines_.end()) return;
    timers_.erase(TimerKey(it->second, id));
    timer_deadlines_.erase(it);
}

void EventLoop::ResetTimerfd() {
    struct itimerspec spec;
    std::memset(&spec, 0, sizeof spec);
    if (!timers_.empty()) {
        auto delta = std::chrono::duration_cast<std::chrono::nanoseconds>(
            timers_.begin()->first.first - Clock::now()).count();
        if (delta < 1000) delta = 1000; // zero would disarm the timer
        spec.it_value.tv_sec = static_cast<time_t>(delta / 1000000000);
        spec.it_value.tv_nsec = static_cast<long>(delta % 1000000000);
    }
    if (::timerfd_settime(timer_fd_, 0, &spec, nullptr) != 0) {
        LOG_ERROR << "timerfd_settime: " << std::strerror(errno);
    }
}

void EventLoop::HandleTimer() {
    uint64_t howmany = 0;
    if (::read(timer_fd_, &howmany, sizeof howmany) != sizeof howmany) {
        LOG_DEBUG << "EventLoop timerfd spurious wakeup";
    }

    const auto now = Clock::now();
    std::vector<Functor> expired;
    while (!timers_.empty() && timers_.begin()->first.first <= now) {
        auto it = timers_.begin();
        timer_deadlines_.erase(it->first.second);
        expired.push_back(std::move(it->second));
        timers_.erase(it);
    }
    for (auto& cb : expired) {
        cb();
    }
    ResetTimerfd();
}

void EventLoop::WakeUp() {
    uint64_t one = 1;
    ssize_t n = ::write(wakeup_fd_, &one, sizeof one);
    if (n != sizeof one) {
        LOG_ERROR << "EventLoop::WakeUp() writes " << n << " bytes instead of 8";
    }
}

void EventLoop::HandleRead() {
    uint64_t one = 1;
    ssize_t n = ::read(wakeup_fd_, &one, sizeof one);
    if (n != sizeof one) {
        LOG_ERROR << "EventLoop::HandleRead() reads " << n << " bytes instead of 8";
    }
}

void EventLoop::UpdateChannel(Channel* channel) {
    poller_->UpdateChannel(channel);
}

void EventLoop::RemoveChannel(Channel* channel) {
    poller_->RemoveChannel(channel);
}

bool EventLoop::HasChannel(Channel* channel) {
    return poller_->HasChannel(channel);
}

void EventLoop::DoPendingFunctors() {
    std::vector<Functor> functors;
    calling_pending_functors_ = true;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        functors.swap(pending_functors_);
    }

    for (const auto& functor : functors) {
        functor();
    }
    calling_pending_functors_ = false;
}

} // namespace network
} // namespace llmrouter
