/**
 * @file RasterImageProbe.hpp
 * @brief ImageProbe backed by libpng and libjpeg-turbo.
 */

#pragma once

#include <cstdint>
#include "domain/ImageProbe.hpp"

namespace redliner::infrastructure {

/**
 * @class RasterImageProbe
 * @brief Decodes every pixel, not only the header, so truncated files are caught.
 */
class RasterImageProbe : public domain::ImageProbe {
public:
    explicit RasterImageProbe(std::uint32_t maxDimension = 16384);

    std::optional<domain::RasterInfo> probe(const std::vector<unsigned char>& bytes) const override;

private:
    std::optional<domain::RasterInfo> probePng(const std::vector<unsigned char>& bytes) const;
    std::optional<domain::RasterInfo> probeJpeg(const std::vector<unsigned char>& bytes) const;

    std::uint32_t m_maxDimension;
};

} // namespace redliner::infrastructure
