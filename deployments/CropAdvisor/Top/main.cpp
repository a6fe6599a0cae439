#include "Topology.hpp"

#include <Os/Os.hpp>
#include <Os/Task.hpp>

#include <Fw/Time/TimeInterval.hpp>

#include <cstdlib>
#include <csignal>
#include <getopt.h>
#include <iostream>
#include <string>

namespace {

using namespace CropAdvisorApp;

volatile std::sig_atomic_t g_shouldStop = 0;

void handleSignal(int) {
    g_shouldStop = 1;
}

void printUsage(const char* app) {
    std::cout << "Usage: " << app << " [options]\n"
              << "  -c <file>   Service configuration (default: config/advisor.cfg or ADVISOR_CONFIG)\n"
              << "  -m <dir>    Model artifact directory (default: model_dir from the configuration or ADVISOR_MODEL_DIR)\n"
              << "  -s <path>   Unix-domain socket for proxy requests (default: socket_path from the configuration or ADVISOR_SOCK)\n"
              << "  -r <file>   Replay a JSON-lines request file once before serving\n"
              << "  -a <addr>   Bind address for the GDS TCP server (default: 0.0.0.0 or ADVISOR_GDS_HOST)\n"
              << "  -p <port>   Port for the GDS TCP server (default: 50000 or ADVISOR_GDS_PORT)\n"
              << "  -h          Show this help message\n";
}

U16 parsePort(const char* text, U16 fallback) {
    if (text == nullptr) {
        return fallback;
    }
    const long value = std::strtol(text, nullptr, 10);
    if (value <= 0 || value > 65535) {
        return fallback;
    }
    return static_cast<U16>(value);
}

}  // namespace

int main(int argc, char* argv[]) {
    Os::init();

    const char* envConfig = std::getenv("ADVISOR_CONFIG");
    const char* envModelDir = std::getenv("ADVISOR_MODEL_DIR");
    const char* envSock = std::getenv("ADVISOR_SOCK");
    const char* envHost = std::getenv("ADVISOR_GDS_HOST");
    const char* envPort = std::getenv("ADVISOR_GDS_PORT");

    std::string configPath = envConfig ? envConfig : "config/advisor.cfg";
    std::string modelDir = envModelDir ? envModelDir : "";
    std::string socketPath = envSock ? envSock : "";
    std::string replayPath;
    std::string host = envHost ? envHost : "0.0.0.0";
    U16 port = parsePort(envPort, static_cast<U16>(50000));

    int opt = 0;
    while ((opt = ::getopt(argc, argv, "hc:m:s:r:a:p:")) != -1) {
        switch (opt) {
            case 'c':
                configPath = optarg;
                break;
            case 'm':
                modelDir = optarg;
                break;
            case 's':
                socketPath = optarg;
                break;
            case 'r':
                replayPath = optarg;
                break;
            case 'a':
                host = optarg;
                break;
            case 'p':
                port = parsePort(optarg, port);
                break;
            case 'h':
            default:
                printUsage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    CropAdvisor::AdvisorConfig config;
    if (!CropAdvisor::loadConfig(configPath, config)) {
        std::cerr << "Malformed configuration " << configPath << std::endl;
        return 1;
    }
    if (!modelDir.empty()) {
        config.modelDir = modelDir;
    }
    if (!socketPath.empty()) {
        config.socketPath = socketPath;
    }

    CropAdvisorApp::TopologyState state{};
    state.gdsHostname = host.c_str();
    state.gdsPort = port;
    state.requestSocket = config.socketPath.empty() ? nullptr : config.socketPath.c_str();
    state.replayPath = replayPath.empty() ? nullptr : replayPath.c_str();
    state.advisorConfig = &config;

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    if (!setupTopology(state)) {
        return 2;
    }
    startRateGroups(Fw::TimeInterval(1, 0));

    while (!g_shouldStop) {
        Os::Task::delay(Fw::TimeInterval(0, 250000000));  // 250ms sleep
    }

    stopRateGroups();
    teardownTopology(state);
    return 0;
}
