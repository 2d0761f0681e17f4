#include "buckle/error.hpp"

namespace buckle {

std::string Error::toString() const {
    std::string out = std::string(kind_name()) + ": " + message_;

    std::string location;
    if (!package_id_.empty()) {
        location = "package '" + package_id_ + "'";
    }
    if (!path_.empty()) {
        if (!location.empty()) location += ", ";
        location += path_;
        if (line_ > 0) location += ":" + std::to_string(line_);
    } else if (line_ > 0) {
        if (!location.empty()) location += ", ";
        location += "line " + std::to_string(line_);
    }

    if (!location.empty()) {
        out += " (" + location + ")";
    }
    return out;
}

} // namespace buckle
