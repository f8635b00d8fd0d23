#pragma once

#include <prometheus/collectable.h>
#include <prometheus/metric_family.h>

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "device_filter.hpp"
#include "metric.hpp"

namespace diskstats {

struct Config {
    std::filesystem::path procfs_root = "/proc";
    std::string ignored_devices       = default_ignored_devices;
};

class DiskstatExposer: public prometheus::Collectable {
    struct init {};

public:
    static std::shared_ptr<DiskstatExposer> create(Config const& config = {});

    /**
     * @brief update Runs one collection cycle, pushing samples to sink as they are produced
     * Samples pushed before a failure are kept by the sink.
     * @throws IOError, FormatError on the first error of the cycle
     */
    void update(std::function<sample_sink> const& sink) const;

    /// Runs a cycle, failures are logged and reported through diskstats_scrape_* metrics
    std::vector<prometheus::MetricFamily> Collect() const override;

    std::filesystem::path const& source() const;

    DiskstatExposer(Config const& config, init);
    ~DiskstatExposer();

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

}  // namespace diskstats
