#pragma once

#include <stdexcept>
#include <string>

namespace diskstats {

/// The stats source could not be opened or read
class IOError: public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The stats source was read, but its content does not follow the expected layout
class FormatError: public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace diskstats
