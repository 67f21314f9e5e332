//===----------------------------------------------------------------------===//
//                         runnerd
//
// artifacts/image_resizer.cpp
//
// Image thumbnailing. Decoding and encoding use stb_image/stb_image_write
// (implementations compiled in artifacts/stb_impl.cpp).
//===----------------------------------------------------------------------===//

#include "artifacts/image_resizer.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

#ifdef RUNNERD_WITH_IMAGE_CODEC
// Suppress warnings in third-party STB headers
#if defined(__clang__)
    #pragma clang diagnostic push
    #pragma clang diagnostic ignored "-Wmissing-field-initializers"
    #pragma clang diagnostic ignored "-Wunused-function"
#elif defined(__GNUC__)
    #pragma GCC diagnostic push
    #pragma GCC diagnostic ignored "-Wmissing-field-initializers"
    #pragma GCC diagnostic ignored "-Wunused-function"
#endif

#include "stb_image.h"
#include "stb_image_write.h"

#if defined(__clang__)
    #pragma clang diagnostic pop
#elif defined(__GNUC__)
    #pragma GCC diagnostic pop
#endif
#endif

namespace runnerd {

ImageSize FitWithin(int width, int height, int max_dimension) {
    ImageSize size{width, height};
    if (width <= 0 || height <= 0 || max_dimension <= 0) {
        return size;
    }
    if (width <= max_dimension && height <= max_dimension) {
        return size;
    }

    if (width >= height) {
        size.width = max_dimension;
        size.height = std::max(1, static_cast<int>(std::lround(
            static_cast<double>(height) * max_dimension / width)));
    } else {
        size.height = max_dimension;
        size.width = std::max(1, static_cast<int>(std::lround(
            static_cast<double>(width) * max_dimension / height)));
    }
    return size;
}

RasterImage Downscale(const RasterImage& image, int width, int height) {
    if (width <= 0 || height <= 0 || image.channels <= 0 ||
        image.pixels.size() < static_cast<size_t>(image.width) * image.height * image.channels) {
        throw std::invalid_argument("invalid image dimensions");
    }

    RasterImage out;
    out.width = width;
    out.height = height;
    out.channels = image.channels;
    out.pixels.resize(static_cast<size_t>(width) * height * image.channels);

    const int channels = image.channels;
    for (int dy = 0; dy < height; ++dy) {
        int sy0 = static_cast<int>(static_cast<int64_t>(dy) * image.height / height);
        int sy1 = static_cast<int>(static_cast<int64_t>(dy + 1) * image.height / height);
        sy1 = std::min(image.height, std::max(sy1, sy0 + 1));

        for (int dx = 0; dx < width; ++dx) {
            int sx0 = static_cast<int>(static_cast<int64_t>(dx) * image.width / width);
            int sx1 = static_cast<int>(static_cast<int64_t>(dx + 1) * image.width / width);
            sx1 = std::min(image.width, std::max(sx1, sx0 + 1));

            const int count = (sy1 - sy0) * (sx1 - sx0);
            for (int c = 0; c < channels; ++c) {
                uint32_t sum = 0;
                for (int sy = sy0; sy < sy1; ++sy) {
                    const uint8_t* row = &image.pixels[(static_cast<size_t>(sy) * image.width) * channels];
                    for (int sx = sx0; sx < sx1; ++sx) {
                        sum += row[static_cast<size_t>(sx) * channels + c];
                    }
                }
                out.pixels[(static_cast<size_t>(dy) * width + dx) * channels + c] =
                    static_cast<uint8_t>((sum + count / 2) / count);
            }
        }
    }

    return out;
}

#ifdef RUNNERD_WITH_IMAGE_CODEC

bool ImageCodecAvailable() {
    return true;
}

RasterImage DecodeImage(const std::string& encoded) {
    int width = 0;
    int height = 0;
    int channels = 0;
    unsigned char* data = stbi_load_from_memory(
        reinterpret_cast<const unsigned char*>(encoded.data()),
        static_cast<int>(encoded.size()),
        &width, &height, &channels, 0);
    if (!data) {
        const char* reason = stbi_failure_reason();
        throw std::runtime_error(reason ? reason : "cannot decode image");
    }

    RasterImage image;
    image.width = width;
    image.height = height;
    image.channels = channels;
    image.pixels.assign(data, data + static_cast<size_t>(width) * height * channels);
    stbi_image_free(data);
    return image;
}

namespace {

void AppendToString(void* context, void* data, int size) {
    auto* out = static_cast<std::string*>(context);
    out->append(static_cast<const char*>(data), static_cast<size_t>(size));
}

} // anonymous namespace

std::string EncodePng(const RasterImage& image) {
    std::string out;
    int ok = stbi_write_png_to_func(AppendToString, &out,
                                    image.width, image.height, image.channels,
                                    image.pixels.data(), image.width * image.channels);
    if (!ok) {
        throw std::runtime_error("cannot encode PNG");
    }
    return out;
}

std::string ShrinkToPng(const std::string& encoded, int max_dimension) {
    RasterImage image = DecodeImage(encoded);
    ImageSize target = FitWithin(image.width, image.height, max_dimension);
    if (target.width != image.width || target.height != image.height) {
        image = Downscale(image, target.width, target.height);
    }
    return EncodePng(image);
}

#else

bool ImageCodecAvailable() {
    return false;
}

std::string ShrinkToPng(const std::string& encoded, int /*max_dimension*/) {
    return encoded;
}

#endif

} // namespace runnerd
