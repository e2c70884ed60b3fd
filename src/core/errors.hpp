#pragma once

#include <stdexcept>
#include <string>

namespace trade_analytics {

/**
 * Malformed or insufficient input: empty trade set, non-positive capital,
 * non-positive simulation parameters. Aborts the requested computation.
 */
class InvalidInput : public std::runtime_error {
public:
    explicit InvalidInput(const std::string& what) : std::runtime_error(what) {}
};

/**
 * A trade table could not be listed, opened or read.
 */
class SourceError : public std::runtime_error {
public:
    explicit SourceError(const std::string& what, bool not_found = false)
        : std::runtime_error(what), not_found_(not_found) {}

    bool not_found() const { return not_found_; }

private:
    bool not_found_;
};

} // namespace trade_analytics
