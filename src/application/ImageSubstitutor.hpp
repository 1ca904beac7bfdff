/**
 * @file ImageSubstitutor.hpp
 * @brief Replaces placeholder text with an embedded picture, as a tracked change.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "domain/ImageProbe.hpp"
#include "domain/Operation.hpp"
#include "domain/document/Document.hpp"
#include "domain/matching/Matcher.hpp"
#include "domain/revision/RevisionWriter.hpp"

namespace redliner::application {

/**
 * @struct PreparedImage
 * @brief An image that passed decoding, with its final extent.
 */
struct PreparedImage {
    std::vector<unsigned char> bytes;
    domain::RasterInfo info;
    std::string name;
    std::int64_t widthEmu = 0;
    std::int64_t heightEmu = 0;
};

/**
 * @class ImageSubstitutor
 * @brief Decodes, sizes and inserts pictures through the RevisionWriter.
 *
 * The placeholder is deleted and the picture inserted with the same tracking as
 * a text replace, so reviewers can reject it like any other change.
 */
class ImageSubstitutor {
public:
    static constexpr double kEmuPerMm = 36000.0;

    ImageSubstitutor(std::shared_ptr<domain::ImageProbe> probe,
                     domain::revision::RevisionWriter& writer,
                     double defaultHeightMm = 6.0);

    /**
     * @brief Decodes and sizes the image of an operation. Does not touch any document.
     * @throws domain::ImageDecodeError if the bytes cannot be decoded.
     * @throws domain::InvalidOperationError on a negative size.
     */
    PreparedImage prepare(const domain::ReplaceWithImageAction& action) const;

    /** @brief Substitutes the span. The span is validated before the resource is registered. */
    domain::revision::RevisionResult substitute(domain::Document& document,
                                                const domain::matching::MatchSpan& span,
                                                const PreparedImage& image,
                                                const std::string& author);

    /**
     * @brief Picture extent in EMU.
     *
     * Height 0 follows the width's aspect ratio, width 0 follows the height's,
     * both 0 use `defaultHeightMm`.
     */
    static std::pair<std::int64_t, std::int64_t> ComputeExtentEmu(const domain::RasterInfo& info,
                                                                  const domain::SizeConstraint& size,
                                                                  double defaultHeightMm);

private:
    std::shared_ptr<domain::ImageProbe> m_probe;
    domain::revision::RevisionWriter& m_writer;
    double m_defaultHeightMm;
};

} // namespace redliner::application
