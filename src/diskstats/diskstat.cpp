#include <diskstats/diskstat.hpp>

#include <diskstats/errors.hpp>

#include <cerrno>
#include <charconv>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>
#include <vector>

#include <spdlog/spdlog.h>

namespace diskstats {

namespace {

constexpr std::size_t min_tokens = 4;  // major, minor, device and one field

std::vector<std::string> split_fields(std::string const& line) {
    std::vector<std::string> tokens;
    std::istringstream ss(line);
    std::string token;
    while (ss >> token) tokens.push_back(std::move(token));
    return tokens;
}

std::ifstream open_diskstats(std::filesystem::path const& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw IOError("Failed to open " + path.string() + ": " +
                      std::strerror(errno));
    }
    return ifs;
}

}  // namespace

std::filesystem::path diskstats_path(std::filesystem::path const& procfs_root) {
    return procfs_root / "diskstats";
}

ParsedDeviceStats read_diskstats(std::filesystem::path const& path) {
    std::ifstream ifs = open_diskstats(path);
    spdlog::trace("Reading {}", path.string());

    auto stats = parse_diskstats(ifs, path.string());
    if (ifs.bad()) {
        throw IOError("Error while reading " + path.string() + ": " +
                      std::strerror(errno));
    }
    return stats;
}

ParsedDeviceStats parse_diskstats(std::istream& is, std::string const& source) {
    ParsedDeviceStats stats;

    std::string line;
    while (std::getline(is, line)) {
        auto tokens = split_fields(line);
        if (tokens.size() < min_tokens) {
            throw FormatError("invalid line in " + source + ": " + line);
        }

        DeviceFields fields;
        for (std::size_t i = 3; i < tokens.size(); ++i) {
            fields[i - 3] = std::move(tokens[i]);
        }
        append_derived_fields(fields, source, line);

        stats.insert_or_assign(tokens[2], std::move(fields));
    }

    return stats;
}

std::uint64_t sectors_to_bytes(std::string const& sectors) {
    std::uint64_t value = 0;

    char const* first = sectors.data();
    char const* last  = first + sectors.size();
    auto [ptr, ec]    = std::from_chars(first, last, value);
    if (sectors.empty() || ec != std::errc() || ptr != last) {
        throw FormatError("invalid sector count '" + sectors + "'");
    }
    if (value > std::numeric_limits<std::uint64_t>::max() / sector_size) {
        throw FormatError("sector count '" + sectors +
                          "' overflows 64 bit byte count");
    }
    return value * sector_size;
}

void append_derived_fields(DeviceFields& fields, std::string const& source,
                           std::string const& line) {
    // operator[] yields an empty string for a missing field, which fails to parse
    std::uint64_t bytes_read    = 0;
    std::uint64_t bytes_written = 0;
    try {
        bytes_read = sectors_to_bytes(fields[sectors_read_field]);
    } catch (FormatError const& e) {
        throw FormatError("invalid value for sectors read in " + source +
                          ": " + line + " (" + e.what() + ")");
    }
    try {
        bytes_written = sectors_to_bytes(fields[sectors_written_field]);
    } catch (FormatError const& e) {
        throw FormatError("invalid value for sectors written in " + source +
                          ": " + line + " (" + e.what() + ")");
    }

    fields[bytes_read_field]    = std::to_string(bytes_read);
    fields[bytes_written_field] = std::to_string(bytes_written);
}

}  // namespace diskstats
