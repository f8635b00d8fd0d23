#include <diskstats/device_filter.hpp>

#include <stdexcept>

namespace diskstats {

namespace {
std::regex compile(std::string const& pattern) {
    try {
        return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
    } catch (std::regex_error const& e) {
        throw std::invalid_argument("Invalid ignored devices pattern '" +
                                    pattern + "': " + e.what());
    }
}
}  // namespace

DeviceFilter::DeviceFilter(std::string const& pattern)
    : pattern_(pattern), regex_(compile(pattern)) {}

bool DeviceFilter::excluded(std::string const& device) const {
    return std::regex_search(device, regex_);
}

}  // namespace diskstats
