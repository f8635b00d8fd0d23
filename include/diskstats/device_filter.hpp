#pragma once

#include <regex>
#include <string>

namespace diskstats {

inline constexpr char const* default_ignored_devices =
    R"(^(ram|loop|fd|(h|s|v|xv)d[a-z]|nvme\d+n\d+p)\d+$)";

class DeviceFilter {
public:
    /// @throws std::invalid_argument if pattern is not a valid regular expression
    explicit DeviceFilter(std::string const& pattern = default_ignored_devices);

    bool excluded(std::string const& device) const;
    std::string const& pattern() const { return pattern_; }

private:
    std::string pattern_;
    std::regex regex_;
};

}  // namespace diskstats
