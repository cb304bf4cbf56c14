//
// Created by Giuseppe Francione on 21/10/25.
//

/**
 * @file errors.hpp
 * @brief Exception types raised by audiopress.
 *
 * ConfigError and AggregationError end the run. Everything derived from
 * PerFileError is caught at the worker boundary and turned into a failed
 * FileResult.
 */

#ifndef AUDIOPRESS_ERRORS_HPP
#define AUDIOPRESS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace audiopress {

/// Invalid or inconsistent job configuration. Fatal, raised before any work starts.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Base class for errors that only affect a single file.
class PerFileError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Source and destination resolve to the same file.
class SameFileError final : public PerFileError {
public:
    using PerFileError::PerFileError;
};

/// Intermediate output directories could not be created.
class DirectoryCreateError final : public PerFileError {
public:
    using PerFileError::PerFileError;
};

/// The encoder was launched but did not produce a usable output.
class EncodeFailure final : public PerFileError {
public:
    using PerFileError::PerFileError;
};

/// An encoder option (e.g. silence mode) could not be translated.
class InvalidOptionError final : public PerFileError {
public:
    using PerFileError::PerFileError;
};

/// A discovered file does not live under the input root.
class PathMirrorError final : public PerFileError {
public:
    using PerFileError::PerFileError;
};

/// No file was encoded successfully. Fatal, suppresses the summary.
class AggregationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace audiopress

#endif // AUDIOPRESS_ERRORS_HPP
