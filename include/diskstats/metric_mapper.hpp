#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "diskstat.hpp"
#include "metric.hpp"

namespace diskstats {

inline constexpr char const* metric_namespace = "node";
inline constexpr char const* disk_subsystem   = "disk";

struct FieldMapping {
    std::size_t raw_index;
    MetricDescriptor descriptor;
    std::function<double(double)> convert;
};

/**
 * @brief The MetricMapper class turns one device's fields into samples.
 * The table is positional: entry i describes field i of a device after the
 * derived byte fields were appended.
 */
class MetricMapper {
public:
    MetricMapper();

    /// Shared by every mapper, built on first use and never modified
    static std::vector<FieldMapping> const& default_table();

    std::vector<FieldMapping> const& table() const { return table_; }

    /**
     * @brief map Pushes one sample per table entry for device
     * @throws FormatError if the field count differs from the table size or a field is not numeric
     */
    void map(std::string const& device, DeviceFields const& fields,
             std::string const& source,
             std::function<sample_sink> const& sink) const;

private:
    std::vector<FieldMapping> const& table_;
};

double milliseconds_to_seconds(double ms);
double parse_value(std::string const& text, std::string const& source);

}  // namespace diskstats
