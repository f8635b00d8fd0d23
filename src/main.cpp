#include <prometheus/exposer.h>
#include <prometheus/text_serializer.h>
#include <diskstats/diskstat_exposer.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include <args.hxx>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/systemd_sink.h>
#include <spdlog/spdlog.h>

class DiskstatsExporter {
public:
    DiskstatsExporter(int port, diskstats::Config const& config)
        : exposer("[::]:" + std::to_string(port) + "," + std::to_string(port)),
          diskstat(diskstats::DiskstatExposer::create(config)) {
        exposer.RegisterCollectable(diskstat);
        spdlog::debug("Collectables registered");
    }
    DiskstatsExporter(DiskstatsExporter const&)            = delete;
    DiskstatsExporter& operator=(DiskstatsExporter const&) = delete;

    std::vector<std::string> listening_ports() const {
        std::vector<std::string> ports;
        for (int p : exposer.GetListeningPorts()) ports.push_back(std::to_string(p));
        return ports;
    }

private:
    prometheus::Exposer exposer;
    std::shared_ptr<diskstats::DiskstatExposer> diskstat;
};

namespace {
std::atomic_flag stop_all = ATOMIC_FLAG_INIT;

// Single cycle written to stdout, exit code reflects the cycle result
int collect_once(diskstats::Config const& config) {
    auto diskstat = diskstats::DiskstatExposer::create(config);
    auto families = diskstat->Collect();

    bool ok = false;
    for (auto const& f : families) {
        if (f.name == "diskstats_scrape_success" && !f.metric.empty())
            ok = f.metric.front().gauge.value == 1.0;
    }

    std::cout << prometheus::TextSerializer().Serialize(families);
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
}  // namespace

extern "C" void stop_handler(int) {
    //
    stop_all.clear();
}

void config_logger(bool systemd, bool to_stderr, bool debug, bool trace) {
    spdlog::flush_on(spdlog::level::err);
    spdlog::set_level(spdlog::level::info);
    if (systemd) {
        static auto logger = spdlog::systemd_logger_mt("diskstats-exposer");
        spdlog::set_default_logger(logger);
    } else if (to_stderr) {
        // stdout carries the metrics
        static auto logger = spdlog::stderr_color_mt("diskstats-exposer");
        spdlog::set_default_logger(logger);
    }
    if (trace)
        spdlog::set_level(spdlog::level::trace);
    else if (debug)
        spdlog::set_level(spdlog::level::debug);
}

int main(int argc, char** argv) {
    args::ArgumentParser p("Linux block device statistics exposer for prometheus");
    args::HelpFlag help(p, "help", "Display this help menu", {'h', "help"});
    args::CompletionFlag complete(p, {"complete"});
    args::Flag systemd(p, "log-to-systemd", "Send log output to systemd-journald", {"systemd"});
    args::ValueFlag<uint16_t> port(
        p, "port", "Port on which the exposer is started (default 9100)", {'p', "port"}, 9100
    );
    args::Flag debug(p, "debug", "Enable debug logs", {"debug"});
    args::Flag trace(p, "trace", "Enable trace logs", {"trace"});
    args::ValueFlag<std::string> procfs(
        p, "path", "procfs mountpoint (default /proc)", {"path.procfs"}, "/proc"
    );
    args::ValueFlag<std::string> ignored(
        p, "regex", "Regexp of devices to ignore for diskstats",
        {"collector.diskstats.ignored-devices"}, diskstats::default_ignored_devices
    );
    args::Flag once(p, "once", "Collect once, print metrics to stdout and exit", {"once"});

    try {
        p.ParseCLI(argc, argv);
    } catch (args::Help const&) {
        std::cout << p;
        return EXIT_SUCCESS;
    } catch (args::Completion const& e) {
        std::cout << e.what();
        return EXIT_SUCCESS;
    } catch (args::Error const& e) {
        std::cout << e.what() << "\n" << p;
        return EXIT_FAILURE;
    }

    bool stopped_with_error = false;
    try {
        config_logger(systemd, once, debug, trace);

        diskstats::Config config;
        config.procfs_root     = procfs.Get();
        config.ignored_devices = ignored.Get();

        if (once) return collect_once(config);

        DiskstatsExporter exporter(port.Get(), config);
        for (auto const& lp : exporter.listening_ports()) {
            spdlog::info("Listening on port {}", lp);
        }

        stop_all.test_and_set();
        std::signal(SIGTERM, stop_handler);
        std::signal(SIGINT, stop_handler);

        while (stop_all.test_and_set()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
        spdlog::info("Stopping...");
    } catch (std::exception const& e) {
        spdlog::error("Uncaught exception: {}", e.what());
        stopped_with_error = true;
    }
    return stopped_with_error ? EXIT_FAILURE : EXIT_SUCCESS;
}
