//===----------------------------------------------------------------------===//
//                         runnerd - Unit Tests
//
// tests/unit/artifacts/test_image_resizer.cpp
//
// Unit tests for image bounding and downscaling
//===----------------------------------------------------------------------===//

#include "artifacts/image_resizer.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace runnerd;

namespace {

RasterImage Solid(int width, int height, int channels, uint8_t value) {
    RasterImage image;
    image.width = width;
    image.height = height;
    image.channels = channels;
    image.pixels.assign(static_cast<size_t>(width) * height * channels, value);
    return image;
}

} // anonymous namespace

//===----------------------------------------------------------------------===//
// Bounding Tests
//===----------------------------------------------------------------------===//

void TestFitWithinTall() {
    std::cout << "  Testing FitWithin for tall images..." << std::endl;

    ImageSize size = FitWithin(1000, 1200, 800);
    assert(size.width == 667);
    assert(size.height == 800);

    std::cout << "    PASSED" << std::endl;
}

void TestFitWithinWide() {
    std::cout << "  Testing FitWithin for wide images..." << std::endl;

    ImageSize size = FitWithin(1200, 1000, 800);
    assert(size.width == 800);
    assert(size.height == 667);

    size = FitWithin(1600, 10, 800);
    assert(size.width == 800);
    assert(size.height == 5);

    // Never collapses to zero
    size = FitWithin(5000, 1, 800);
    assert(size.width == 800);
    assert(size.height == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestFitWithinUnchanged() {
    std::cout << "  Testing FitWithin leaves small images alone..." << std::endl;

    ImageSize size = FitWithin(200, 150, 800);
    assert(size.width == 200);
    assert(size.height == 150);

    size = FitWithin(800, 800, 800);
    assert(size.width == 800);
    assert(size.height == 800);

    // Degenerate input passes through
    size = FitWithin(0, 100, 800);
    assert(size.width == 0);
    assert(size.height == 100);

    size = FitWithin(1000, 1000, 0);
    assert(size.width == 1000);
    assert(size.height == 1000);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Downscale Tests
//===----------------------------------------------------------------------===//

void TestDownscaleAverages() {
    std::cout << "  Testing Downscale box filter..." << std::endl;

    // 4x2 gray: left half black, right half white
    RasterImage image;
    image.width = 4;
    image.height = 2;
    image.channels = 1;
    image.pixels = {0, 0, 200, 200,
                    0, 0, 200, 200};

    RasterImage out = Downscale(image, 2, 1);
    assert(out.width == 2);
    assert(out.height == 1);
    assert(out.channels == 1);
    assert(out.pixels.size() == 2);
    assert(out.pixels[0] == 0);
    assert(out.pixels[1] == 200);

    // 2x1 RGB averaged into one pixel, rounded
    RasterImage rgb;
    rgb.width = 2;
    rgb.height = 1;
    rgb.channels = 3;
    rgb.pixels = {10, 1, 255,
                  20, 2, 0};

    RasterImage one = Downscale(rgb, 1, 1);
    assert(one.pixels.size() == 3);
    assert(one.pixels[0] == 15);
    assert(one.pixels[1] == 2);
    assert(one.pixels[2] == 128);

    std::cout << "    PASSED" << std::endl;
}

void TestDownscaleLargeImage() {
    std::cout << "  Testing Downscale of a large image..." << std::endl;

    RasterImage image = Solid(1000, 1200, 4, 77);
    ImageSize target = FitWithin(image.width, image.height, 800);
    RasterImage out = Downscale(image, target.width, target.height);

    assert(out.width == 667);
    assert(out.height == 800);
    assert(out.channels == 4);
    assert(out.pixels.size() == static_cast<size_t>(667) * 800 * 4);
    assert(out.pixels.front() == 77);
    assert(out.pixels.back() == 77);

    std::cout << "    PASSED" << std::endl;
}

void TestDownscaleRejectsBadInput() {
    std::cout << "  Testing Downscale rejects bad input..." << std::endl;

    RasterImage image = Solid(4, 4, 3, 0);

    bool threw = false;
    try {
        Downscale(image, 0, 2);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    image.pixels.resize(10);
    threw = false;
    try {
        Downscale(image, 2, 2);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Codec Tests
//===----------------------------------------------------------------------===//

void TestShrinkToPng() {
    std::cout << "  Testing ShrinkToPng..." << std::endl;

#ifdef RUNNERD_WITH_IMAGE_CODEC
    assert(ImageCodecAvailable());

    std::string big = EncodePng(Solid(1000, 1200, 3, 120));
    assert(big.compare(0, 4, "\x89PNG") == 0);

    RasterImage shrunk = DecodeImage(ShrinkToPng(big, 800));
    assert(shrunk.width == 667);
    assert(shrunk.height == 800);
    assert(shrunk.pixels[0] == 120);

    RasterImage kept = DecodeImage(ShrinkToPng(EncodePng(Solid(200, 150, 3, 9)), 800));
    assert(kept.width == 200);
    assert(kept.height == 150);

    bool threw = false;
    try {
        ShrinkToPng("definitely not an image", 800);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
#else
    assert(!ImageCodecAvailable());
    std::string bytes = "\x89PNG\r\n\x1a\n-opaque-";
    assert(ShrinkToPng(bytes, 800) == bytes);
#endif

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Image Resizer Unit Tests ===" << std::endl;

    std::cout << "\n1. Bounding:" << std::endl;
    TestFitWithinTall();
    TestFitWithinWide();
    TestFitWithinUnchanged();

    std::cout << "\n2. Downscale:" << std::endl;
    TestDownscaleAverages();
    TestDownscaleLargeImage();
    TestDownscaleRejectsBadInput();

    std::cout << "\n3. Codec:" << std::endl;
    TestShrinkToPng();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
