#pragma once

#include <stdexcept>
#include <string>

namespace pm {

// Raised when a metadata file cannot be read or written. Format problems in
// the text itself never raise; the parser drops the offending line instead.
class FormatError : public std::runtime_error {
public:
    FormatError(const std::string& path, const std::string& what)
        : std::runtime_error("metadata I/O error: " + what + " '" + path + "'"), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

}  // namespace pm
