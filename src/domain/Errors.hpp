/**
 * @file Errors.hpp
 * @brief Exception types raised by the revision engine.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace redliner::domain {

/** @brief A pattern target failed to compile or is outside the bounded dialect. */
class PatternRejectedError : public std::invalid_argument {
public:
    explicit PatternRejectedError(const std::string& msg) : std::invalid_argument(msg) {}
};

/** @brief An operation record is malformed (empty replacement, unknown action...). */
class InvalidOperationError : public std::invalid_argument {
public:
    explicit InvalidOperationError(const std::string& msg) : std::invalid_argument(msg) {}
};

/** @brief Image bytes are not a decodable PNG or JPEG. */
class ImageDecodeError : public std::runtime_error {
public:
    explicit ImageDecodeError(const std::string& msg) : std::runtime_error(msg) {}
};

/** @brief The document could not be loaded or written back. */
class SerializationError : public std::runtime_error {
public:
    explicit SerializationError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace redliner::domain
