#include "planetwalk/raster.h"

#include <algorithm>
#include <array>
#include <format>

namespace planetwalk::raster {

namespace {

enum class TgaKind : uint8_t {
    TrueColor = 2,
    Gray = 3,
    TrueColorRle = 10,
    GrayRle = 11,
};

struct TgaHeader {
    int id_length = 0;
    TgaKind kind = TgaKind::TrueColor;
    int width = 0;
    int height = 0;
    int bytes_per_pixel = 0;
    bool top_origin = false;
    bool right_origin = false;

    [[nodiscard]] bool rle() const { return kind == TgaKind::TrueColorRle || kind == TgaKind::GrayRle; }
    [[nodiscard]] bool gray() const { return kind == TgaKind::Gray || kind == TgaKind::GrayRle; }
};

uint16_t le16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

TgaHeader read_header(std::istream& r) {
    std::array<uint8_t, 18> raw{};
    if (!r.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size())))
        throw LoadError("raster: not a PNG and too short for a TGA header");

    if (raw[1] != 0) throw LoadError("raster: palette TGA rasters are not supported");

    TgaHeader h;
    h.id_length = raw[0];
    switch (raw[2]) {
        case 2: h.kind = TgaKind::TrueColor; break;
        case 3: h.kind = TgaKind::Gray; break;
        case 10: h.kind = TgaKind::TrueColorRle; break;
        case 11: h.kind = TgaKind::GrayRle; break;
        default: throw LoadError(std::format("raster: unsupported TGA image type {}", raw[2]));
    }
    h.width = le16(&raw[12]);
    h.height = le16(&raw[14]);
    h.bytes_per_pixel = raw[16] / 8;
    h.top_origin = (raw[17] & 0x20) != 0;
    h.right_origin = (raw[17] & 0x10) != 0;

    if (h.width == 0 || h.height == 0)
        throw LoadError(std::format("raster: TGA has no pixels ({}x{})", h.width, h.height));
    const bool depth_ok = h.gray() ? raw[16] == 8 : (raw[16] == 24 || raw[16] == 32);
    if (!depth_ok)
        throw LoadError(std::format("raster: TGA depth {} does not match image type {}", raw[16], raw[2]));
    return h;
}

// PixelStream yields source pixels in file order, expanding RLE packets.
class PixelStream {
public:
    PixelStream(std::istream& r, const TgaHeader& h) : r_(r), h_(h) {}

    void next(uint8_t* rgba) {
        if (!h_.rle()) {
            read_one(rgba);
            return;
        }
        if (left_ == 0) {
            const int packet = r_.get();
            if (packet == std::char_traits<char>::eof()) throw LoadError("raster: TGA pixel data ends early");
            left_ = (packet & 0x7F) + 1;
            repeat_ = (packet & 0x80) != 0;
            if (repeat_) read_one(held_.data());
        }
        --left_;
        if (repeat_) std::copy(held_.begin(), held_.end(), rgba);
        else read_one(rgba);
    }

private:
    void read_one(uint8_t* rgba) {
        std::array<uint8_t, 4> src{};
        if (!r_.read(reinterpret_cast<char*>(src.data()), h_.bytes_per_pixel))
            throw LoadError("raster: TGA pixel data ends early");
        if (h_.gray()) {
            rgba[0] = rgba[1] = rgba[2] = src[0];
            rgba[3] = 255;
            return;
        }
        // Stored as BGR(A).
        rgba[0] = src[2];
        rgba[1] = src[1];
        rgba[2] = src[0];
        rgba[3] = h_.bytes_per_pixel == 4 ? src[3] : uint8_t(255);
    }

    std::istream& r_;
    const TgaHeader& h_;
    int left_ = 0;
    bool repeat_ = false;
    std::array<uint8_t, 4> held_{};
};

} // namespace

Image decode_tga(std::istream& r) {
    const TgaHeader h = read_header(r);
    if (h.id_length > 0 && r.ignore(h.id_length).gcount() != h.id_length)
        throw LoadError("raster: TGA image id is truncated");

    Image img(h.width, h.height);
    PixelStream pixels(r, h);
    for (int row = 0; row < h.height; ++row) {
        const int y = h.top_origin ? row : h.height - 1 - row;
        for (int col = 0; col < h.width; ++col) {
            const int x = h.right_origin ? h.width - 1 - col : col;
            pixels.next(img.at(x, y));
        }
    }
    return img;
}

} // namespace planetwalk::raster
