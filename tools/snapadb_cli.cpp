// snapadb_cli.cpp - command-line front end for the SnapADB client
//
//   snapadb [--config file.json] [-v] <command> [args...]
//
//   devices                               one-shot device listing
//   track                                 follow the enriched device list
//   shell <serial> <cmd...>
//   getprop <serial> [prefix]
//   pull <serial> <remote> <local>
//   screencap <serial> <out.png>
//   record <serial> <out.mp4> <seconds>
//   stream <serial> <out.h264> <seconds>
//   forward <serial> <socket>             forward until Enter is pressed
//   sockets <serial> <prefix>             abstract sockets with a prefix
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <csignal>
#include <atomic>
#include <chrono>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "adb_client.hpp"
#include "config_loader.hpp"
#include "device_tracker.hpp"
#include "snapadb_log.hpp"

using namespace snapadb;

namespace {

std::atomic<bool> g_interrupted{false};

void onSignal(int) { g_interrupted = true; }

void usage() {
    fprintf(stderr,
            "usage: snapadb [--config file] [-v] <command> [args]\n"
            "  devices\n"
            "  track\n"
            "  shell <serial> <cmd...>\n"
            "  getprop <serial> [prefix]\n"
            "  pull <serial> <remote> <local>\n"
            "  screencap <serial> <out.png>\n"
            "  record <serial> <out.mp4> <seconds>\n"
            "  stream <serial> <out.h264> <seconds>\n"
            "  forward <serial> <socket>\n"
            "  sockets <serial> <prefix>\n");
}

int fail(const AdbError& e) {
    SLOG_ERROR("cli", "[%s] %s", kindName(e.kind), e.message.c_str());
    if (!e.stderr_text.empty()) fprintf(stderr, "%s\n", e.stderr_text.c_str());
    return 1;
}

void printDevices(const DeviceList& devices) {
    if (devices.empty()) {
        printf("(no devices)\n");
        return;
    }
    for (const auto& d : devices) {
        printf("%-24s %-10s %-28s Android %s  %s\n", d.id.c_str(), d.state.c_str(),
               d.displayTitle().c_str(),
               d.info.android_version ? d.info.android_version->c_str() : "?",
               d.info.manufacturer ? d.info.manufacturer->c_str() : "");
    }
}

// Sleeps up to `seconds`, returning early on Ctrl-C.
void waitSeconds(int seconds) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (!g_interrupted && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

int cmdDevices(AdbClient& client) {
    auto listing = client.devicesList();
    if (listing.is_err()) return fail(listing.error());
    for (const auto& row : parse::parseDeviceList(listing.value())) {
        printf("%s\t%s\n", row.serial.c_str(), row.state.c_str());
    }
    return 0;
}

int cmdTrack(AdbClient& client) {
    DeviceTracker tracker(DeviceTracker::Backend::fromClient(client),
                          std::chrono::milliseconds(client.config().tracker.reconnect_delay_ms));
    auto sub = tracker.subscribe();
    while (!g_interrupted) {
        auto devices = sub.nextFor(std::chrono::milliseconds(200));
        if (!devices) continue;
        printf("--- %zu device(s)\n", devices->size());
        printDevices(*devices);
        fflush(stdout);
    }
    return 0;
}

int cmdShell(AdbClient& client, const std::string& serial, const std::string& command) {
    auto out = client.shell(serial, command);
    if (out.is_err()) return fail(out.error());
    fwrite(out.value().data(), 1, out.value().size(), stdout);
    return 0;
}

int cmdGetprop(AdbClient& client, const std::string& serial, const std::string& prefix) {
    auto props = client.getProperties(serial, prefix);
    if (props.is_err()) return fail(props.error());
    for (const auto& kv : props.value()) {
        printf("%s=%s\n", kv.first.c_str(), kv.second.c_str());
    }
    return 0;
}

int cmdScreencap(AdbClient& client, const std::string& serial, const std::string& out_path) {
    auto png = client.screencapPNG(serial);
    if (png.is_err()) return fail(png.error());
    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(png.value().data()), (std::streamsize)png.value().size());
    if (!out) return fail(AdbError::localIo("cannot write " + out_path));
    printf("%s (%zu bytes)\n", out_path.c_str(), png.value().size());
    return 0;
}

int cmdRecord(AdbClient& client, const std::string& serial, const std::string& out_path, int seconds) {
    RecordingOptions options;
    auto session = client.startScreenRecord(serial, options);
    if (session.is_err()) return fail(session.error());
    printf("recording %s for %d s (Ctrl-C to stop early)\n", serial.c_str(), seconds);
    waitSeconds(seconds);
    auto stopped = client.stopScreenRecord(*session.value(), out_path);
    if (stopped.is_err()) return fail(stopped.error());
    printf("%s\n", out_path.c_str());
    return 0;
}

int cmdStream(AdbClient& client, const std::string& serial, const std::string& out_path, int seconds) {
    auto opened = client.startScreenStream(serial);
    if (opened.is_err()) return fail(opened.error());
    std::unique_ptr<ScreenStreamSession> session = std::move(opened).value();

    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) return fail(AdbError::localIo("cannot open " + out_path));

    std::thread timer([&session, seconds]() {
        waitSeconds(seconds);
        session->close();
    });

    int rc = 0;
    while (true) {
        auto chunk = session->readChunk();
        if (chunk.is_err()) {
            if (!session->isClosed()) rc = fail(chunk.error());
            break;
        }
        if (!chunk.value()) break;
        out.write(reinterpret_cast<const char*>(chunk.value()->data()), (std::streamsize)chunk.value()->size());
    }
    g_interrupted = true;
    timer.join();
    printf("%s (%llu bytes)\n", out_path.c_str(), (unsigned long long)session->bytesReceived());
    return rc;
}

int cmdForward(AdbClient& client, const std::string& serial, const std::string& socket) {
    auto handle = client.forward(serial, socket);
    if (handle.is_err()) return fail(handle.error());
    printf("tcp:%u -> %s (press Enter to remove)\n", (unsigned)handle.value().local_port,
           handle.value().remote.c_str());
    fflush(stdout);
    getchar();
    auto removed = client.removeForward(handle.value());
    if (removed.is_err()) return fail(removed.error());
    return 0;
}

int cmdSockets(AdbClient& client, const std::string& serial, const std::string& prefix) {
    auto names = client.findAbstractSockets(serial, prefix);
    if (names.is_err()) return fail(names.error());
    for (const auto& n : names.value()) printf("%s\n", n.c_str());
    return 0;
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string config_path = "snapadb.json";
    bool verbose = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (a == "-v") {
            verbose = true;
        } else if (a == "-h" || a == "--help") {
            usage();
            return 0;
        } else {
            args.push_back(a);
        }
    }
    if (args.empty()) {
        usage();
        return 1;
    }

    config::AdbConfig cfg = config::loadConfig(config_path);
    config::applyEnvironment(cfg);

    log::Level level = log::Level::Info;
    if (!log::parseLevel(cfg.log.level, level)) {
        SLOG_WARN("cli", "unknown log level '%s'", cfg.log.level.c_str());
    }
    log::setLogLevel(verbose ? log::Level::Debug : level);
    if (!cfg.log.log_path.empty() && !log::openLogFile(cfg.log.log_path.c_str())) {
        SLOG_WARN("cli", "cannot open log file %s", cfg.log.log_path.c_str());
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGPIPE, SIG_IGN);

    ServerRestartCoordinator::instance().setGracePeriod(std::chrono::milliseconds(cfg.server.start_grace_ms));
    AdbClient client(cfg);

    const std::string& cmd = args[0];
    auto need = [&](size_t n) {
        if (args.size() < n + 1) {
            usage();
            return false;
        }
        return true;
    };

    int rc = 1;
    if (cmd == "devices") {
        rc = cmdDevices(client);
    } else if (cmd == "track") {
        rc = cmdTrack(client);
    } else if (cmd == "shell" && need(2)) {
        std::string joined;
        for (size_t i = 2; i < args.size(); ++i) {
            if (!joined.empty()) joined += ' ';
            joined += args[i];
        }
        rc = cmdShell(client, args[1], joined);
    } else if (cmd == "getprop" && need(1)) {
        rc = cmdGetprop(client, args[1], args.size() > 2 ? args[2] : std::string());
    } else if (cmd == "pull" && need(3)) {
        auto pulled = client.pull(args[1], args[2], args[3]);
        rc = pulled.is_ok() ? 0 : fail(pulled.error());
    } else if (cmd == "screencap" && need(2)) {
        rc = cmdScreencap(client, args[1], args[2]);
    } else if (cmd == "record" && need(3)) {
        rc = cmdRecord(client, args[1], args[2], std::atoi(args[3].c_str()));
    } else if (cmd == "stream" && need(3)) {
        rc = cmdStream(client, args[1], args[2], std::atoi(args[3].c_str()));
    } else if (cmd == "forward" && need(2)) {
        rc = cmdForward(client, args[1], args[2]);
    } else if (cmd == "sockets" && need(2)) {
        rc = cmdSockets(client, args[1], args[2]);
    } else if (cmd != "shell" && cmd != "getprop" && cmd != "pull" && cmd != "screencap" &&
               cmd != "record" && cmd != "stream" && cmd != "forward" && cmd != "sockets") {
        SLOG_ERROR("cli", "unknown command '%s'", cmd.c_str());
        usage();
    }

    log::closeLogFile();
    return rc;
}
