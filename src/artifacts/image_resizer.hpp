//===----------------------------------------------------------------------===//
//                         runnerd
//
// artifacts/image_resizer.hpp
//
// Thumbnailing of plot images
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace runnerd {

struct ImageSize {
    int width = 0;
    int height = 0;
};

// Interleaved 8-bit pixels, `channels` per pixel
struct RasterImage {
    int width = 0;
    int height = 0;
    int channels = 0;
    std::vector<uint8_t> pixels;
};

// Size that fits within max_dimension x max_dimension with the aspect ratio
// preserved. Images already within bounds keep their size.
ImageSize FitWithin(int width, int height, int max_dimension);

// Box-filter downscale to the given size
RasterImage Downscale(const RasterImage& image, int width, int height);

// True when decoding and re-encoding is compiled in
bool ImageCodecAvailable();

// Decodes a PNG/JPEG, shrinks it to fit max_dimension and re-encodes it as
// PNG. Without codec support the input is returned unchanged.
// Throws std::runtime_error if the image cannot be decoded or encoded.
std::string ShrinkToPng(const std::string& encoded, int max_dimension);

#ifdef RUNNERD_WITH_IMAGE_CODEC
RasterImage DecodeImage(const std::string& encoded);
std::string EncodePng(const RasterImage& image);
#endif

} // namespace runnerd
