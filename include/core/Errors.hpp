#pragma once

#include <stdexcept>
#include <string>

namespace core {

/**
 * Per-stream failures. Each one aborts the run before (or instead of)
 * processing frames; per-frame conditions such as "no pose" are not errors.
 */

// Video file missing/corrupt or camera device inaccessible.
class SourceUnavailable : public std::runtime_error {
public:
    explicit SourceUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// Offset, radius, thickness or pipeline settings outside their bounds.
class InvalidConfiguration : public std::runtime_error {
public:
    explicit InvalidConfiguration(const std::string& what) : std::runtime_error(what) {}
};

// Video writer or preview server could not be opened.
class OutputUnavailable : public std::runtime_error {
public:
    explicit OutputUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// Landmark model could not be loaded or executed.
class InferenceError : public std::runtime_error {
public:
    explicit InferenceError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace core
