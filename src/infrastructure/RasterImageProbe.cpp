/**
 * @file RasterImageProbe.cpp
 * @brief Implementation of RasterImageProbe.
 */

#include "infrastructure/RasterImageProbe.hpp"
#include <png.h>
#include <turbojpeg.h>
#include <cstring>
#include <iostream>
#include <memory>

namespace redliner::infrastructure {

namespace {

struct PngDecodeState {
    const unsigned char* data = nullptr;
    size_t size = 0;
    size_t offset = 0;
    std::vector<unsigned char> pixels;
    std::vector<png_bytep> rows;
};

void PngReadFromMemory(png_structp png, png_bytep out, png_size_t length) {
    auto* state = static_cast<PngDecodeState*>(png_get_io_ptr(png));
    if (state->offset + length > state->size) {
        png_error(png, "unexpected end of data");
    }
    std::memcpy(out, state->data + state->offset, length);
    state->offset += length;
}

void PngError(png_structp png, png_const_charp message) {
    std::cerr << "[RasterImageProbe] PNG decode error: " << message << std::endl;
    png_longjmp(png, 1);
}

void PngWarning(png_structp, png_const_charp) {}

bool LooksLikeJpeg(const std::vector<unsigned char>& bytes) {
    return bytes.size() > 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF;
}

} // namespace

RasterImageProbe::RasterImageProbe(std::uint32_t maxDimension) : m_maxDimension(maxDimension) {}

std::optional<domain::RasterInfo> RasterImageProbe::probe(const std::vector<unsigned char>& bytes) const {
    if (bytes.size() >= 8 && png_sig_cmp(bytes.data(), 0, 8) == 0) {
        return probePng(bytes);
    }
    if (LooksLikeJpeg(bytes)) {
        return probeJpeg(bytes);
    }
    std::cerr << "[RasterImageProbe] Unrecognised image signature." << std::endl;
    return std::nullopt;
}

std::optional<domain::RasterInfo> RasterImageProbe::probePng(const std::vector<unsigned char>& bytes) const {
    // Decoder state lives on the heap: png_error unwinds with longjmp.
    auto state = std::make_unique<PngDecodeState>();
    state->data = bytes.data();
    state->size = bytes.size();

    png_structp png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, PngError, PngWarning);
    if (!png) return std::nullopt;
    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_read_struct(&png, nullptr, nullptr);
        return std::nullopt;
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_read_struct(&png, &info, nullptr);
        return std::nullopt;
    }

    png_set_read_fn(png, state.get(), PngReadFromMemory);
    png_read_info(png, info);

    png_uint_32 width = png_get_image_width(png, info);
    png_uint_32 height = png_get_image_height(png, info);
    if (width == 0 || height == 0 || width > m_maxDimension || height > m_maxDimension) {
        std::cerr << "[RasterImageProbe] PNG dimensions out of range: " << width << "x" << height << std::endl;
        png_destroy_read_struct(&png, &info, nullptr);
        return std::nullopt;
    }

    png_set_expand(png);
    png_set_strip_16(png);
    png_set_packing(png);
    if (png_get_interlace_type(png, info) != PNG_INTERLACE_NONE) {
        png_set_interlace_handling(png);
    }
    png_read_update_info(png, info);

    size_t rowBytes = png_get_rowbytes(png, info);
    state->pixels.resize(rowBytes * height);
    state->rows.resize(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        state->rows[y] = state->pixels.data() + y * rowBytes;
    }
    png_read_image(png, state->rows.data());
    png_read_end(png, nullptr);
    png_destroy_read_struct(&png, &info, nullptr);

    domain::RasterInfo result;
    result.format = "png";
    result.contentType = "image/png";
    result.widthPx = static_cast<int>(width);
    result.heightPx = static_cast<int>(height);
    return result;
}

std::optional<domain::RasterInfo> RasterImageProbe::probeJpeg(const std::vector<unsigned char>& bytes) const {
    tjhandle handle = tjInitDecompress();
    if (!handle) {
        std::cerr << "[RasterImageProbe] Failed to initialize TurboJPEG decompressor: " << tjGetErrorStr() << std::endl;
        return std::nullopt;
    }

    unsigned char* data = const_cast<unsigned char*>(bytes.data());
    unsigned long size = static_cast<unsigned long>(bytes.size());
    int width = 0;
    int height = 0;
    int subsampling = 0;
    int colorspace = 0;

    if (tjDecompressHeader3(handle, data, size, &width, &height, &subsampling, &colorspace) != 0) {
        std::cerr << "[RasterImageProbe] JPEG header error: " << tjGetErrorStr() << std::endl;
        tjDestroy(handle);
        return std::nullopt;
    }
    if (width <= 0 || height <= 0 ||
        static_cast<std::uint32_t>(width) > m_maxDimension || static_cast<std::uint32_t>(height) > m_maxDimension) {
        std::cerr << "[RasterImageProbe] JPEG dimensions out of range: " << width << "x" << height << std::endl;
        tjDestroy(handle);
        return std::nullopt;
    }

    std::vector<unsigned char> pixels(static_cast<size_t>(width) * static_cast<size_t>(height) * 3);
    if (tjDecompress2(handle, data, size, pixels.data(), width, 0, height, TJPF_RGB, 0) != 0) {
        std::cerr << "[RasterImageProbe] JPEG decode error: " << tjGetErrorStr() << std::endl;
        tjDestroy(handle);
        return std::nullopt;
    }
    tjDestroy(handle);

    domain::RasterInfo result;
    result.format = "jpeg";
    result.contentType = "image/jpeg";
    result.widthPx = width;
    result.heightPx = height;
    return result;
}

} // namespace redliner::infrastructure
