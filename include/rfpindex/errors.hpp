/**
 * @file errors.hpp
 * @brief Exception types raised by the rfpindex core.
 *
 * Lookups of unknown ids are not errors: they return false or an empty
 * optional. Caller mistakes (bad arguments, calls on a store that is not
 * ready) use std::invalid_argument and std::logic_error.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace rfpindex {

/**
 * Base class for runtime failures of the store and its collaborators.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Configuration is invalid or a backend cannot be brought up. The store
 * reacts by falling back to the default embedding provider.
 */
class InitializationError : public Error {
public:
    explicit InitializationError(const std::string& what) : Error(what) {}
};

/**
 * An embedding backend failed while producing vectors. Adds that hit this
 * leave the index untouched.
 */
class EmbeddingError : public Error {
public:
    explicit EmbeddingError(const std::string& what) : Error(what) {}
};

/**
 * Reading or writing the index file or the metadata sidecar failed.
 */
class PersistenceError : public Error {
public:
    PersistenceError(const std::string& what, const std::string& path)
        : Error(what + " (" + path + ")"), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace rfpindex
