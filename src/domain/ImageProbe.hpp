/**
 * @file ImageProbe.hpp
 * @brief Interface for validating raster images before they enter a document.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace redliner::domain {

/**
 * @struct RasterInfo
 * @brief Decoded properties of an image.
 */
struct RasterInfo {
    std::string format;      ///< "png" or "jpeg".
    std::string contentType; ///< "image/png" or "image/jpeg".
    int widthPx = 0;
    int heightPx = 0;
};

/**
 * @class ImageProbe
 * @brief Fully decodes image bytes and reports their geometry.
 */
class ImageProbe {
public:
    virtual ~ImageProbe() = default;

    /** @return nullopt if the bytes are not a decodable raster image. */
    virtual std::optional<RasterInfo> probe(const std::vector<unsigned char>& bytes) const = 0;
};

} // namespace redliner::domain
