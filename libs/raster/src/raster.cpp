#include "planetwalk/raster.h"

#include <array>
#include <format>
#include <fstream>

namespace planetwalk::raster {

namespace {

constexpr std::array<uint8_t, 8> png_signature = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

bool has_png_signature(std::istream& r) {
    std::array<uint8_t, 8> head{};
    const auto start = r.tellg();
    r.read(reinterpret_cast<char*>(head.data()), static_cast<std::streamsize>(head.size()));
    const bool complete = r.gcount() == static_cast<std::streamsize>(head.size());
    r.clear();
    r.seekg(start);
    return complete && head == png_signature;
}

} // namespace

Image::Image(int w, int h) : width(w), height(h) {
    if (w <= 0 || h <= 0) throw std::invalid_argument(std::format("raster: invalid dimensions {}x{}", w, h));
    pixels.assign(static_cast<size_t>(w) * static_cast<size_t>(h) * 4, 0);
}

bool Image::empty() const {
    return width <= 0 || height <= 0 || pixels.empty();
}

uint8_t* Image::at(int x, int y) {
    return pixels.data() + (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 4;
}

const uint8_t* Image::at(int x, int y) const {
    return pixels.data() + (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 4;
}

Image decode(std::istream& r) {
    if (has_png_signature(r)) return decode_png(r);
    return decode_tga(r);
}

Image load(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw LoadError("raster: cannot open " + path.string());
    try {
        return decode(in);
    } catch (const LoadError& e) {
        throw LoadError(std::format("{} ({})", e.what(), path.string()));
    }
}

void save_png(const std::filesystem::path& path, const Image& img) {
    if (!path.parent_path().empty()) std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    if (!out) throw std::runtime_error("raster: cannot write " + path.string());
    encode_png(out, img);
    if (!out) throw std::runtime_error("raster: failed while writing " + path.string());
}

double luma(const uint8_t* rgba) {
    return 0.2126 * rgba[0] + 0.7152 * rgba[1] + 0.0722 * rgba[2];
}

} // namespace planetwalk::raster
