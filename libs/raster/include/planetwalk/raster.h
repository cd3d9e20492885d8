#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <vector>

namespace planetwalk::raster {

struct Image {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> pixels; // RGBA, row-major, top-to-bottom, 4 bytes per pixel

    Image() = default;
    Image(int w, int h);

    [[nodiscard]] bool empty() const;
    [[nodiscard]] uint8_t* at(int x, int y);
    [[nodiscard]] const uint8_t* at(int x, int y) const;
};

// LoadError is raised whenever a raster cannot be opened or decoded.
class LoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// decode_png reads any PNG colour type and expands it to 8-bit RGBA.
Image decode_png(std::istream& r);

// encode_png writes an 8-bit RGBA PNG.
void encode_png(std::ostream& w, const Image& img);

// decode_tga reads true-color (24/32 bpp) and 8-bit grayscale TGA rasters,
// raw or run-length encoded, in any origin corner.
Image decode_tga(std::istream& r);

// decode picks the PNG decoder when the stream carries the PNG signature and
// falls back to TGA otherwise.
Image decode(std::istream& r);

Image load(const std::filesystem::path& path);
void save_png(const std::filesystem::path& path, const Image& img);

// luma returns Rec. 709 luminance of an RGBA pixel in [0, 255].
[[nodiscard]] double luma(const uint8_t* rgba);

} // namespace planetwalk::raster
