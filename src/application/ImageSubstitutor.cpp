/**
 * @file ImageSubstitutor.cpp
 * @brief Implementation of ImageSubstitutor.
 */

#include "application/ImageSubstitutor.hpp"
#include <cmath>
#include <iostream>
#include "domain/Errors.hpp"

namespace redliner::application {

ImageSubstitutor::ImageSubstitutor(std::shared_ptr<domain::ImageProbe> probe,
                                   domain::revision::RevisionWriter& writer,
                                   double defaultHeightMm)
    : m_probe(std::move(probe)), m_writer(writer), m_defaultHeightMm(defaultHeightMm) {
    if (!m_probe) {
        throw std::invalid_argument("ImageSubstitutor requires an image probe.");
    }
}

std::pair<std::int64_t, std::int64_t> ImageSubstitutor::ComputeExtentEmu(const domain::RasterInfo& info,
                                                                         const domain::SizeConstraint& size,
                                                                         double defaultHeightMm) {
    if (size.widthMm < 0.0 || size.heightMm < 0.0) {
        throw domain::InvalidOperationError("Image size must not be negative.");
    }
    if (info.widthPx <= 0 || info.heightPx <= 0) {
        throw domain::ImageDecodeError("Image has no pixels.");
    }

    double aspect = static_cast<double>(info.widthPx) / static_cast<double>(info.heightPx);
    double widthMm = size.widthMm;
    double heightMm = size.heightMm;

    if (widthMm > 0.0 && heightMm == 0.0) {
        heightMm = widthMm / aspect;
    } else if (widthMm == 0.0 && heightMm > 0.0) {
        widthMm = heightMm * aspect;
    } else if (widthMm == 0.0 && heightMm == 0.0) {
        heightMm = defaultHeightMm;
        widthMm = heightMm * aspect;
    }

    return {static_cast<std::int64_t>(std::llround(widthMm * kEmuPerMm)),
            static_cast<std::int64_t>(std::llround(heightMm * kEmuPerMm))};
}

PreparedImage ImageSubstitutor::prepare(const domain::ReplaceWithImageAction& action) const {
    if (action.imageBytes.empty()) {
        throw domain::ImageDecodeError("No image data supplied.");
    }
    auto info = m_probe->probe(action.imageBytes);
    if (!info) {
        throw domain::ImageDecodeError("Image data is not a decodable PNG or JPEG.");
    }

    PreparedImage prepared;
    prepared.bytes = action.imageBytes;
    prepared.info = *info;
    prepared.name = action.imageName.empty() ? "Logo" : action.imageName;
    auto extent = ComputeExtentEmu(*info, action.size, m_defaultHeightMm);
    prepared.widthEmu = extent.first;
    prepared.heightEmu = extent.second;
    return prepared;
}

domain::revision::RevisionResult ImageSubstitutor::substitute(domain::Document& document,
                                                              const domain::matching::MatchSpan& span,
                                                              const PreparedImage& image,
                                                              const std::string& author) {
    m_writer.validate(document, span);

    // The same picture placed twice shares one package part.
    const domain::ImageResource* resource = nullptr;
    for (const auto& existing : document.images()) {
        if (existing.bytes == image.bytes) {
            resource = &existing;
            break;
        }
    }
    if (!resource) {
        resource = &document.addImageResource(image.bytes, image.info.format, image.info.contentType);
        std::cout << "[ImageSubstitutor] Embedded " << resource->id << " (" << image.info.widthPx << "x"
                  << image.info.heightPx << " " << image.info.format << ")" << std::endl;
    }

    domain::ImageRef ref;
    ref.resourceId = resource->id;
    ref.widthEmu = image.widthEmu;
    ref.heightEmu = image.heightEmu;
    ref.name = image.name;
    return m_writer.applyImageReplace(document, span, ref, author);
}

} // namespace redliner::application
