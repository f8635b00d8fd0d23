#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <map>
#include <string>

namespace diskstats {

/// Raw fields of one device, keyed by their position after the device name
using DeviceFields = std::map<std::size_t, std::string>;

/// Device name -> fields. Rebuilt every cycle, a repeated device replaces the earlier one
using ParsedDeviceStats = std::map<std::string, DeviceFields>;

inline constexpr std::uint64_t sector_size = 512;

inline constexpr std::size_t sectors_read_field    = 2;
inline constexpr std::size_t sectors_written_field = 6;
inline constexpr std::size_t bytes_read_field      = 11;
inline constexpr std::size_t bytes_written_field   = 12;

std::filesystem::path diskstats_path(std::filesystem::path const& procfs_root);

/**
 * @brief read_diskstats Reads and parses the whole stats file
 * @throws IOError when the file cannot be opened or read
 * @throws FormatError on the first malformed line
 */
ParsedDeviceStats read_diskstats(std::filesystem::path const& path);

/**
 * @brief parse_diskstats Parses diskstats content and appends the derived byte fields
 * @param source Used in error messages only
 */
ParsedDeviceStats parse_diskstats(std::istream& is, std::string const& source);

/// Sector count in decimal text to bytes, throws FormatError instead of overflowing
std::uint64_t sectors_to_bytes(std::string const& sectors);

void append_derived_fields(DeviceFields& fields, std::string const& source,
                           std::string const& line);

}  // namespace diskstats
