/**
 * @file Base64.hpp
 * @brief Base64 codec for binary package parts.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace redliner::infrastructure {

class Base64 {
public:
    /** @brief Standard alphabet with '=' padding, one unbroken line. */
    static std::string Encode(const std::vector<unsigned char>& bytes);

    /** @brief Decodes, skipping whitespace. nullopt on any other invalid character. */
    static std::optional<std::vector<unsigned char>> Decode(const std::string& text);
};

} // namespace redliner::infrastructure
