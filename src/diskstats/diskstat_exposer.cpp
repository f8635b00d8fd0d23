#include <diskstats/diskstat_exposer.hpp>

#include <atomic>
#include <chrono>
#include <mutex>

#include <prometheus/client_metric.h>
#include <prometheus/metric_type.h>
#include <spdlog/spdlog.h>

#include <diskstats/diskstat.hpp>
#include <diskstats/errors.hpp>
#include <diskstats/metric_mapper.hpp>

namespace diskstats {

namespace pr = prometheus;

namespace {

pr::MetricType to_metric_type(MetricKind kind) {
    switch (kind) {
    case MetricKind::counter: return pr::MetricType::Counter;
    case MetricKind::gauge: return pr::MetricType::Gauge;
    }
    return pr::MetricType::Untyped;
}

std::vector<pr::MetricFamily>
create_metric_families(std::vector<FieldMapping> const& table) {
    std::vector<pr::MetricFamily> fms;
    fms.reserve(table.size() + 3);
    for (auto const& m : table) {
        fms.push_back({m.descriptor.name, m.descriptor.help,
                       to_metric_type(m.descriptor.kind), {}});
    }
    return fms;
}

pr::MetricFamily single_value(std::string const& name, std::string const& help,
                              pr::MetricType type, double value) {
    pr::MetricFamily fm{name, help, type, {}};
    pr::ClientMetric& cm = fm.metric.emplace_back();
    if (type == pr::MetricType::Counter)
        cm.counter.value = value;
    else
        cm.gauge.value = value;
    return fm;
}

}  // namespace

class DiskstatExposer::Impl {
public:
    explicit Impl(Config const& config)
        : path(diskstats_path(config.procfs_root)),
          filter(config.ignored_devices) {}

    void update(std::function<sample_sink> const& sink) const {
        std::string const source = path.string();
        ParsedDeviceStats const stats = read_diskstats(path);

        for (auto const& [device, fields] : stats) {
            if (filter.excluded(device)) {
                spdlog::debug("Ignoring device: {}", device);
                continue;
            }
            mapper.map(device, fields, source, sink);
        }
    }

    std::vector<pr::MetricFamily> collect() {
        std::lock_guard grd(mtx);

        auto fms   = create_metric_families(mapper.table());
        auto start = std::chrono::steady_clock::now();

        bool success = true;
        try {
            update([&fms](Sample const& s) {
                pr::ClientMetric& cm = fms[s.index].metric.emplace_back();
                cm.label             = {
                    {device_label, s.device}
                };
                if (s.descriptor->kind == MetricKind::counter)
                    cm.counter.value = s.value;
                else
                    cm.gauge.value = s.value;
            });
        } catch (std::exception const& e) {
            success = false;
            errors_count += 1;
            spdlog::error("Couldn't get diskstats: {}", e.what());
        }

        std::chrono::duration<double> const elapsed =
            std::chrono::steady_clock::now() - start;

        fms.push_back(single_value("diskstats_scrape_success",
                                   "Whether the last diskstats collection succeeded",
                                   pr::MetricType::Gauge, success ? 1.0 : 0.0));
        fms.push_back(single_value("diskstats_scrape_duration_seconds",
                                   "Duration of the last diskstats collection",
                                   pr::MetricType::Gauge, elapsed.count()));
        fms.push_back(single_value("diskstats_scrape_errors_total",
                                   "Number of failed diskstats collections",
                                   pr::MetricType::Counter,
                                   static_cast<double>(errors_count.load())));
        return fms;
    }

    std::filesystem::path const path;

private:
    DeviceFilter const filter;
    MetricMapper const mapper;
    std::atomic_llong errors_count = 0;
    std::mutex mtx;
};

std::shared_ptr<DiskstatExposer> DiskstatExposer::create(Config const& config) {
    return std::make_shared<DiskstatExposer>(config, init());
}

DiskstatExposer::DiskstatExposer(Config const& config, init)
    : impl(std::make_unique<Impl>(config)) {
    spdlog::debug("diskstats source {}, ignoring devices matching '{}'",
                  impl->path.string(), config.ignored_devices);
}

DiskstatExposer::~DiskstatExposer() = default;

void DiskstatExposer::update(std::function<sample_sink> const& sink) const {
    impl->update(sink);
}

std::vector<pr::MetricFamily> DiskstatExposer::Collect() const {
    return impl->collect();
}

std::filesystem::path const& DiskstatExposer::source() const {
    return impl->path;
}

}  // namespace diskstats
