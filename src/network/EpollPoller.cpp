#include "llmrouter/network/EpollPoller.h"
#include "llmrouter/network/Channel.h"
#include "llmrouter/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unistd.h>

namespace llmrouter {
namespace network {

namespace {
const int kNew = -1;
const int kAdded = 1;
const int kDeleted = 2;
}

EpollPoller::EpollPoller(EventLoop* loop)
    : Poller(loop),
      epollfd_(::epoll_create1(EPOLL_CLOEXEC)),
      events_(kInitEventListSize) {
    if (epollfd_ < 0) {
        LOG_FATAL << "epoll_create1 failed: " << std::strerror(errno);
        throw std::runtime_error("epoll_create1 failed");
    }
}

EpollPoller::~EpollPoller() {
    ::close(epollfd_);
}

std::chrono::system_clock::time_point EpollPoller::Poll(int timeout_ms, ChannelList* active_channels) {
    const int num_events = ::epoll_wait(epollfd_, events_.data(), static_cast<int>(events_.size()), timeout_ms);
    const int saved_errno = errno;
    const auto now = std::chrono::system_clock::now();

    if (num_events > 0) {
        FillActiveChannels(num_events, active_channels);
        if (static_cast<size_t>(num_events) == events_.size()) {
            events_.resize(events_.size() * 2);
        }
    } else if (num_events < 0 && saved_errno != EINTR) {
        LOG_ERROR << "epoll_wait: " << std::strerror(saved_errno);
    }
    return now;
}

void EpollPoller::FillActiveChannels(int num_events, ChannelList* active_channels) const {
    for (int i = 0; i < num_events; ++i) {
        Channel* channel = static_cast<Channel*>(events_[i].data.ptr);
        channel->set_revents(events_[i].events);
        active_channels->push_back(channel);
    }
}

void EpollPoller::UpdateChannel(Channel* channel) {
    const int index = channel->index();
    if (index == kNew || index == kDeleted) {
        if (index == kNew) {
            channels_[channel->fd()] = channel;
        }
        channel->set_index(kAdded);
        Update(EPOLL_CTL_ADD, channel);
    } else if (channel->IsNoneEvent()) {
        Update(EPOLL_CTL_DEL, channel);
        channel->set_index(kDeleted);
    } else {
        Update(EPOLL_CTL_MOD, channel);
    }
}

void EpollPoller::RemoveChannel(Channel* channel) {
    const int index = channel->index();
    if (index == kNew) return;
    channels_.erase(channel->fd());
    if (index == kAdded) {
        Update(EPOLL_CTL_DEL, channel);
    }
    channel->set_index(kNew);
}

void EpollPoller::Update(int operation, Channel* channel) {
    struct epoll_event event;
    std::memset(&event, 0, sizeof(event));
    event.events = channel->events();
    event.data.ptr = channel;
    const int fd = channel->fd();
    if (::epoll_ctl(epollfd_, operation, fd, &event) < 0) {
        LOG_ERROR << "epoll_ctl op=" << operation << " fd=" << fd << ": " << std::strerror(errno);
    }
}

} // namespace network
} // namespace llmrouter
