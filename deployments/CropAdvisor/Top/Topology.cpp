#include "Topology.hpp"

#include <deployments/CropAdvisor/Components/Advisor/AdvisorComponentImpl.hpp>
#include <AppTopologyAc.hpp>

#include <Drv/Ip/IpSocket.hpp>
#include <Drv/TcpServer/TcpServerComponentImpl.hpp>
#include <Fw/Logger/Logger.hpp>
#include <Fw/Types/String.hpp>
#include <Svc/ActiveRateGroup/ActiveRateGroup.hpp>
#include <Svc/RateGroupDriver/RateGroupDriver.hpp>

#include <Os/Task.hpp>

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace CropAdvisorApp;

namespace CropAdvisorApp {
namespace ConfigObjects {
namespace CdhCore_health {
Svc::HealthImpl::PingEntry pingEntries[3] = {
    {PingEntries::CdhCore_cmdDisp::WARN, PingEntries::CdhCore_cmdDisp::FATAL, Fw::String("cmdDisp")},
    {PingEntries::CdhCore_events::WARN, PingEntries::CdhCore_events::FATAL, Fw::String("events")},
    {PingEntries::CdhCore_tlmSend::WARN, PingEntries::CdhCore_tlmSend::FATAL, Fw::String("tlmSend")},
};
}  // namespace CdhCore_health
}  // namespace ConfigObjects
}  // namespace CropAdvisorApp

namespace {

// ----------------------------------------------------------------------
// Scheduler configuration
// ----------------------------------------------------------------------

constexpr FwTaskPriorityType kComDriverPriority = 100;
constexpr Os::Task::ParamType kComDriverStack = Os::Task::TASK_DEFAULT;
constexpr Os::Task::ParamType kComDriverCpu = Os::Task::TASK_DEFAULT;

Svc::RateGroupDriver::DividerSet g_rateDivisors{{{1, 0}}};
U32 g_rateGroupContext[Svc::ActiveRateGroup::CONNECTION_COUNT_MAX] = {};

// ----------------------------------------------------------------------
// Request ingress worker state
// ----------------------------------------------------------------------

constexpr int kPollMillis = 250;
constexpr int kListenBacklog = 4;

struct IngressConfig {
    std::string socketPath{"/tmp/crop_advisor.sock"};
    std::string replayPath{};
};

struct WorkerState {
    AdvisorComponentImpl* advisor{nullptr};
    IngressConfig config{};
};

std::atomic<bool> g_workerRunning{false};
std::thread g_workerThread;
WorkerState g_workerState;

// ----------------------------------------------------------------------
// Utility helpers
// ----------------------------------------------------------------------

[[nodiscard]] bool sendAll(int fd, const std::string& text) {
    std::size_t sent = 0;
    while (sent < text.size()) {
        const ssize_t n = ::send(fd, text.data() + sent, text.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

[[nodiscard]] std::string processRecord(const std::string& record) {
    std::string line(record);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.find_first_not_of(" \t") == std::string::npos) {
        return std::string();  // keep-alive
    }
    return g_workerState.advisor->serveRequestForBringup(line);
}

void runSocketLoop(int fd) {
    std::string carry;
    std::vector<char> buffer(4096, 0);
    while (g_workerRunning.load()) {
        struct pollfd pfd{fd, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, kPollMillis);
        if (ready == 0 || (ready < 0 && errno == EINTR)) {
            continue;
        }
        if (ready < 0) {
            return;
        }
        const ssize_t count = ::recv(fd, buffer.data(), buffer.size(), 0);
        if (count == 0) {
            return;  // proxy closed the connection
        }
        if (count < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            Fw::Logger::log("[WARN] request socket read failed: %s\n", std::strerror(errno));
            return;
        }
        carry.append(buffer.data(), static_cast<std::size_t>(count));
        std::size_t searchStart = 0;
        for (;;) {
            const auto newline = carry.find('\n', searchStart);
            if (newline == std::string::npos) {
                carry.erase(0, searchStart);
                break;
            }
            const std::string response = processRecord(carry.substr(searchStart, newline - searchStart));
            searchStart = newline + 1;
            if (!response.empty() && !sendAll(fd, response + "\n")) {
                Fw::Logger::log("[WARN] request socket write failed: %s\n", std::strerror(errno));
                return;
            }
        }
    }
}

int listenSocket(const std::string& path) {
    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        Fw::Logger::log("[WARN] request socket path %s is too long\n", path.c_str());
        return -1;
    }
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path.c_str());

    const int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }
    ::unlink(path.c_str());  // stale socket from a previous run
    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(fd, kListenBacklog) != 0) {
        Fw::Logger::log("[WARN] cannot listen on %s: %s\n", path.c_str(), std::strerror(errno));
        ::close(fd);
        return -1;
    }
    return fd;
}

void socketIngress(const std::string& path) {
    const int fd = listenSocket(path);
    if (fd < 0) {
        return;
    }
    Fw::Logger::log("[INFO] accepting requests on %s\n", path.c_str());
    while (g_workerRunning.load()) {
        struct pollfd pfd{fd, POLLIN, 0};
        if (::poll(&pfd, 1, kPollMillis) <= 0) {
            continue;
        }
        const int client = ::accept(fd, nullptr, nullptr);
        if (client < 0) {
            continue;
        }
        runSocketLoop(client);
        ::close(client);
    }
    ::close(fd);
    ::unlink(path.c_str());
}

void replayIngress(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        Fw::Logger::log("[WARN] cannot open replay file %s\n", path.c_str());
        return;
    }
    std::string line;
    while (g_workerRunning.load() && std::getline(in, line)) {
        const std::string response = processRecord(line);
        if (!response.empty()) {
            std::cout << response << std::endl;
        }
    }
}

void ingressWorker() {
    if (!g_workerState.config.replayPath.empty()) {
        replayIngress(g_workerState.config.replayPath);
    }
    if (!g_workerState.config.socketPath.empty()) {
        socketIngress(g_workerState.config.socketPath);
    }
}

void configureIngress(const TopologyState& state) {
    g_workerState.advisor = &advisor;
    g_workerState.config.socketPath = state.requestSocket ? state.requestSocket : "";
    g_workerState.config.replayPath = state.replayPath ? state.replayPath : "";
}

void configureComponents(const TopologyState& state) {
    rateGroupDriverComp.configure(g_rateDivisors);
    rateGroup1Comp.configure(g_rateGroupContext, FW_NUM_ARRAY_ELEMENTS(g_rateGroupContext));

    const char* host = state.gdsHostname ? state.gdsHostname : "0.0.0.0";
    const U16 port = state.gdsPort != 0 ? state.gdsPort : static_cast<U16>(50000);
    const Drv::SocketIpStatus status = comDriver.configure(host, port);
    if (status != Drv::SOCK_SUCCESS) {
        Fw::Logger::log("[WARN] TcpServer configure(%s:%hu) failed with status %d\n", host, port, status);
    }
    comDriver.setAutomaticOpen(true);
}

}  // namespace

namespace CropAdvisorApp {

bool setupTopology(const TopologyState& state) {
    if (state.advisorConfig == nullptr || !advisor.loadModel(*state.advisorConfig)) {
        return false;
    }
    configureIngress(state);

    initComponents(state);
    setBaseIds();
    connectComponents();
    regCommands();
    configComponents(state);
    configureComponents(state);
    loadParameters();
    startTasks(state);

    // Start the TCP server read task
    Os::TaskString recvTask("TcpServer");
    comDriver.start(recvTask, kComDriverPriority, kComDriverStack, kComDriverCpu);

    // Launch request worker
    g_workerRunning.store(true);
    g_workerThread = std::thread(ingressWorker);
    return true;
}

void startRateGroups(const Fw::TimeInterval& interval) {
    linuxTimer.startTimer(interval);
}

void stopRateGroups() {
    linuxTimer.quit();
}

void teardownTopology(const TopologyState& state) {
    // Stop the request worker first so nothing reaches the component after teardown begins
    g_workerRunning.store(false);
    if (g_workerThread.joinable()) {
        g_workerThread.join();
    }

    // Stop server tasks
    comDriver.stopReconnect();
    comDriver.stop();
    (void)comDriver.joinReconnect();
    (void)comDriver.join();

    stopTasks(state);
    freeThreads(state);
    tearDownComponents(state);
}

}  // namespace CropAdvisorApp
