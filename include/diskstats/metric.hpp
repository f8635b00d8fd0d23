#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace diskstats {

enum class MetricKind { counter, gauge };

inline constexpr char const* device_label = "device";

struct MetricDescriptor {
    std::string name;
    std::string help;
    MetricKind kind;
};

struct Sample {
    std::size_t index;  // position in the descriptor table
    MetricDescriptor const* descriptor;
    std::string device;
    double value;
};

/**
 * @brief sample_sink receives samples as soon as they are produced.
 * Samples handed to the sink are never taken back, even if the cycle fails
 * afterwards.
 */
using sample_sink = void(Sample const&);

}  // namespace diskstats
