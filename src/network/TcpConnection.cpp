#include "llmrouter/network/TcpConnection.h"
#include "llmrouter/network/Channel.h"
#include "llmrouter/network/EventLoop.h"
#include "llmrouter/network/Socket.h"
#include "llmrouter/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace llmrouter {
namespace network {

static std::int64_t ToSteadyNs(std::chrono::steady_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& nameArg,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr)
    : loop_(loop),
      name_(nameArg),
      state_(kConnecting),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      lastActiveNs_(ToSteadyNs(std::chrono::steady_clock::now())) {
    channel_->SetReadCallback([this](std::chrono::system_clock::time_point t) { HandleRead(t); });
    channel_->SetWriteCallback([this]() { HandleWrite(); });
    channel_->SetCloseCallback([this]() { HandleClose(); });
    channel_->SetErrorCallback([this]() { HandleError(); });

    LOG_DEBUG << "TcpConnection::ctor[" << name_ << "] fd=" << sockfd;
    socket_->SetKeepAlive(true);
    socket_->SetTcpNoDelay(true);
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection::dtor[" << name_ << "] fd=" << channel_->fd() << " state=" << state_;
}

void TcpConnection::ConnectEstablished() {
    SetState(kConnected);
    Touch();
    channel_->Tie(shared_from_this());
    channel_->EnableReading();

    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }
}

void TcpConnection::ConnectDestroyed() {
    if (state_ == kConnected) {
        SetState(kDisconnected);
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

void TcpConnection::HandleRead(std::chrono::system_clock::time_point receiveTime) {
    int savedErrno = 0;
    const ssize_t n = inputBuffer_.ReadFd(channel_->fd(), &savedErrno);
    if (n > 0) {
        Touch();
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
    } else if (n == 0) {
        HandleClose();
    } else if (savedErrno != EAGAIN && savedErrno != EINTR) {
        LOG_DEBUG << "TcpConnection::HandleRead [" << name_ << "]: " << std::strerror(savedErrno);
        HandleError();
        HandleClose();
    }
}

void TcpConnection::HandleWrite() {
    if (!channel_->IsWriting()) {
        LOG_DEBUG << "Connection fd = " << channel_->fd() << " is down, no more writing";
        return;
    }
    const ssize_t n = ::write(channel_->fd(), outputBuffer_.Peek(), outputBuffer_.ReadableBytes());
    if (n > 0) {
        Touch();
        outputBuffer_.Retrieve(static_cast<size_t>(n));
        if (outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
            if (state_ == kDisconnecting) {
                ShutdownInLoop();
            }
        }
    } else if (errno != EAGAIN && errno != EINTR) {
        LOG_ERROR << "TcpConnection::HandleWrite [" << name_ << "]: " << std::strerror(errno);
    }
}

void TcpConnection::HandleClose() {
    if (state_ == kDisconnected) return;
    LOG_DEBUG << "TcpConnection::HandleClose fd = " << channel_->fd() << " state = " << state_;
    SetState(kDisconnected);
    channel_->DisableAll();

    TcpConnectionPtr guardThis(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(guardThis);
    }
    if (closeCallback_) {
        closeCallback_(guardThis);
    }
}

void TcpConnection::HandleError() {
    int optval = 0;
    socklen_t optlen = static_cast<socklen_t>(sizeof optval);
    int err = 0;
    if (::getsockopt(channel_->fd(), SOL_SOCKET, SO_ERROR, &optval, &optlen) < 0) {
        err = errno;
    } else {
        err = optval;
    }
    LOG_DEBUG << "TcpConnection::HandleError [" << name_ << "] SO_ERROR=" << err;
}

void TcpConnection::Send(const std::string& message) {
    Send(message.data(), message.size());
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ != kConnected) return;
    if (loop_->IsInLoopThread()) {
        SendInLoop(data, len);
    } else {
        std::string msg(static_cast<const char*>(data), len);
        loop_->RunInLoop([self = shared_from_this(), msg = std::move(msg)]() {
            self->SendInLoop(msg.data(), msg.size());
        });
    }
}

void TcpConnection::SendInLoop(const void* data, size_t len) {
    ssize_t nwrote = 0;
    size_t remaining = len;
    bool faultError = false;

    if (state_ == kDisconnected) {
        LOG_DEBUG << "disconnected, give up writing";
        return;
    }

    if (!channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
        nwrote = ::write(channel_->fd(), data, len);
        if (nwrote >= 0) {
            Touch();
            remaining = len - static_cast<size_t>(nwrote);
        } else {
            nwrote = 0;
            if (errno != EWOULDBLOCK) {
                LOG_DEBUG << "TcpConnection::SendInLoop [" << name_ << "]: " << std::strerror(errno);
                if (errno == EPIPE || errno == ECONNRESET) {
                    faultError = true;
                }
            }
        }
    }

    if (!faultError && remaining > 0) {
        outputBuffer_.Append(static_cast<const char*>(data) + nwrote, remaining);
        if (!channel_->IsWriting()) {
            channel_->EnableWriting();
        }
    }
}

void TcpConnection::Shutdown() {
    if (state_ == kConnected) {
        SetState(kDisconnecting);
        loop_->RunInLoop([self = shared_from_this()]() { self->ShutdownInLoop(); });
    }
}

void TcpConnection::ShutdownInLoop() {
    if (!channel_->IsWriting()) {
        socket_->ShutdownWrite();
    }
}

void TcpConnection::ForceClose() {
    if (state_ == kConnected || state_ == kDisconnecting) {
        loop_->QueueInLoop([self = shared_from_this()]() { self->ForceCloseInLoop(); });
    }
}

void TcpConnection::ForceCloseInLoop() {
    if (state_ == kConnected || state_ == kDisconnecting) {
        HandleClose();
    }
}

void TcpConnection::Touch() {
    lastActiveNs_.store(ToSteadyNs(std::chrono::steady_clock::now()), std::memory_order_relaxed);
}

std::chrono::steady_clock::time_point TcpConnection::LastActiveTime() const {
    return std::chrono::steady_clock::time_point(
        std::chrono::nanoseconds(lastActiveNs_.load(std::memory_order_relaxed)));
}

} // namespace network
} // namespace llmrouter
