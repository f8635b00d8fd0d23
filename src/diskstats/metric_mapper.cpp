#include <diskstats/metric_mapper.hpp>

#include <diskstats/errors.hpp>

#include <charconv>

namespace diskstats {

namespace {

std::string fq_name(std::string const& name) {
    return std::string(metric_namespace) + "_" + disk_subsystem + "_" + name;
}

double identity(double v) { return v; }

// Docs from https://www.kernel.org/doc/Documentation/iostats.txt
std::vector<FieldMapping> create_table() {
    std::vector<FieldMapping> table;

    auto add = [&table](std::string const& name, std::string const& help,
                        MetricKind kind, auto convert) {
        table.push_back({table.size(), {fq_name(name), help, kind}, convert});
    };

    add("reads_completed_total",
        "The total number of reads completed successfully.",
        MetricKind::counter, identity);
    add("reads_merged_total",
        "The total number of reads merged. See "
        "https://www.kernel.org/doc/Documentation/iostats.txt.",
        MetricKind::counter, identity);
    add("read_sectors_total", "The total number of sectors read successfully.",
        MetricKind::counter, identity);
    add("read_time_seconds_total",
        "The total number of seconds spent by all reads.",
        MetricKind::counter, milliseconds_to_seconds);

    add("writes_completed_total",
        "The total number of writes completed successfully.",
        MetricKind::counter, identity);
    add("writes_merged_total",
        "The number of writes merged. See "
        "https://www.kernel.org/doc/Documentation/iostats.txt.",
        MetricKind::counter, identity);
    add("written_sectors_total",
        "The total number of sectors written successfully.",
        MetricKind::counter, identity);
    add("write_time_seconds_total",
        "This is the total number of seconds spent by all writes.",
        MetricKind::counter, milliseconds_to_seconds);

    add("io_now", "The number of I/Os currently in progress.",
        MetricKind::gauge, identity);
    add("io_time_seconds_total", "Total seconds spent doing I/Os.",
        MetricKind::counter, milliseconds_to_seconds);
    add("io_time_weighted_seconds_total",
        "The weighted # of seconds spent doing I/Os. See "
        "https://www.kernel.org/doc/Documentation/iostats.txt.",
        MetricKind::counter, milliseconds_to_seconds);

    // Derived from the sector counts when parsing
    add("read_bytes_total", "The total number of bytes read successfully.",
        MetricKind::counter, identity);
    add("written_bytes_total",
        "The total number of bytes written successfully.",
        MetricKind::counter, identity);

    return table;
}

}  // namespace

double milliseconds_to_seconds(double ms) { return ms / 1000.0; }

double parse_value(std::string const& text, std::string const& source) {
    char const* first = text.data();
    char const* last  = first + text.size();
    // from_chars takes no sign prefix, a single '+' is still a valid number
    if (first != last && *first == '+' && last - first > 1 && first[1] != '-')
        ++first;

    double v       = 0;
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (text.empty() || ec != std::errc() || ptr != last) {
        throw FormatError("invalid value " + text + " in " + source);
    }
    return v;
}

std::vector<FieldMapping> const& MetricMapper::default_table() {
    static std::vector<FieldMapping> const table = create_table();
    return table;
}

MetricMapper::MetricMapper(): table_(default_table()) {}

void MetricMapper::map(std::string const& device, DeviceFields const& fields,
                       std::string const& source,
                       std::function<sample_sink> const& sink) const {
    if (fields.size() != table_.size()) {
        throw FormatError("invalid line for " + source + " for " + device +
                          ": expected " + std::to_string(table_.size()) +
                          " fields, got " + std::to_string(fields.size()));
    }

    for (std::size_t i = 0; i < table_.size(); ++i) {
        FieldMapping const& m = table_[i];

        auto it = fields.find(m.raw_index);
        if (it == fields.end()) {
            throw FormatError("missing field " + std::to_string(m.raw_index) +
                              " for " + device + " in " + source);
        }

        double value = 0;
        try {
            value = m.convert(parse_value(it->second, source));
        } catch (FormatError const& e) {
            throw FormatError(std::string(e.what()) + " for " + device +
                              " field " + std::to_string(m.raw_index));
        }
        sink(Sample{i, &m.descriptor, device, value});
    }
}

}  // namespace diskstats
