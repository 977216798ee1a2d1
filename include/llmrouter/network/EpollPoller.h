#pragma once

#include "llmrouter/network/Poller.h"

#include <sys/epoll.h>
#include <vector>

namespace llmrouter {
namespace network {

class EpollPoller : public Poller {
public:
    explicit EpollPoller(EventLoop* loop);
    ~EpollPoller() override;

    std::chrono::system_clock::time_point Poll(int timeout_ms, ChannelList* active_channels) override;
    void UpdateChannel(Channel* channel) override;
    void RemoveChannel(Channel* channel) override;

private:
    static const int kInitEventListSize = 16;

    void FillActiveChannels(int num_events, ChannelList* active_channels) const;
    void Update(int operation, Channel* channel);

    int epollfd_;
    using EventList = std::vector<struct epoll_event>;
    EventList events_;
};

} // namespace network
} // namespace llmrouter
