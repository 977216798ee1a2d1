#include "llmrouter/GatewayServer.h"
#include "llmrouter/balancer/PolicyRegistry.h"
#include "llmrouter/common/Config.h"
#include "llmrouter/common/Logger.h"
#include "llmrouter/common/Settings.h"
#include "llmrouter/network/Channel.h"
#include "llmrouter/network/EventLoop.h"

#include <getopt.h>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace llmrouter;

    std::string configFile = "../config/llmrouter.conf";
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-C]\n", argv[0]);
                printf("  -C  validate config, print it with secrets redacted and exit\n");
                return 0;
        }
    }

    auto& conf = common::Config::Instance();
    if (!conf.Load(configFile)) {
        LOG_ERROR << "Failed to load config " << configFile;
        return 1;
    }
    const int overrides = conf.ApplyEnvOverrides();

    const common::GatewaySettings settings = common::GatewaySettings::FromConfig(conf);
    common::Logger::Instance().SetLevel(common::Logger::Instance().ParseLevel(settings.logLevel));
    common::Logger::Instance().SetJsonFormat(settings.jsonLogging);
    if (overrides > 0) LOG_INFO << "Applied " << overrides << " environment override(s)";

    std::vector<std::string> errors;
    settings.Validate(&errors);
    auto policies = balancer::PolicyRegistry::FromConfig(conf, settings.defaultPolicy, !checkOnly, &errors);

    if (checkOnly) {
        printf("%s", settings.Sanitized().c_str());
        for (const auto& e : errors) fprintf(stderr, "config error: %s\n", e.c_str());
        printf("%s\n", errors.empty() ? "OK" : "INVALID");
        return errors.empty() ? 0 : 1;
    }
    if (!errors.empty()) {
        for (const auto& e : errors) LOG_ERROR << "config error: " << e;
        return 1;
    }

    ::signal(SIGPIPE, SIG_IGN);
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    // Block before any worker thread starts so they inherit the mask.
    if (::pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
        LOG_ERROR << "pthread_sigmask failed";
        return 1;
    }
    const int sfd = ::signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (sfd < 0) {
        LOG_ERROR << "signalfd failed: " << strerror(errno);
        return 1;
    }

    network::EventLoop loop;
    GatewayServer server(&loop, settings, std::move(policies));

    network::Channel signalChannel(&loop, sfd);
    signalChannel.SetReadCallback([&loop, sfd](std::chrono::system_clock::time_point) {
        struct signalfd_siginfo info;
        const ssize_t n = ::read(sfd, &info, sizeof(info));
        if (n != static_cast<ssize_t>(sizeof(info))) return;
        LOG_INFO << "Received signal " << info.ssi_signo << ", shutting down";
        loop.Quit();
    });
    signalChannel.EnableReading();

    server.Start();
    loop.Loop();

    signalChannel.DisableAll();
    signalChannel.Remove();
    ::close(sfd);
    LOG_INFO << "llm-router stopped";
    return 0;
}
