#include "planetwalk/raster.h"

#include <png.h>

#include <cstring>
#include <format>
#include <iterator>
#include <string>

namespace planetwalk::raster {

namespace {

void write_to_stream(png_structp png_ptr, png_bytep data, png_size_t length) {
    auto* out = static_cast<std::ostream*>(png_get_io_ptr(png_ptr));
    if (!out->write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length))) {
        png_error(png_ptr, "stream write failed");
    }
}

void flush_stream(png_structp png_ptr) {
    static_cast<std::ostream*>(png_get_io_ptr(png_ptr))->flush();
}

} // namespace

Image decode_png(std::istream& r) {
    const std::vector<uint8_t> data{std::istreambuf_iterator<char>(r), std::istreambuf_iterator<char>()};
    if (data.empty()) throw LoadError("png: empty input");

    png_image image;
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;

    if (!png_image_begin_read_from_memory(&image, data.data(), data.size())) {
        throw LoadError(std::format("png: {}", image.message));
    }

    image.format = PNG_FORMAT_RGBA;
    if (image.width == 0 || image.height == 0 || image.width > 65535 || image.height > 65535) {
        png_image_free(&image);
        throw LoadError(std::format("png: unsupported dimensions {}x{}", image.width, image.height));
    }

    Image img(static_cast<int>(image.width), static_cast<int>(image.height));
    if (!png_image_finish_read(&image, nullptr, img.pixels.data(), 0, nullptr)) {
        const std::string message = image.message;
        png_image_free(&image);
        throw LoadError(std::format("png: {}", message));
    }
    return img;
}

void encode_png(std::ostream& w, const Image& img) {
    if (img.empty()) {
        throw std::invalid_argument("png: cannot encode an empty image");
    }

    png_structp png_ptr = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png_ptr) {
        throw std::runtime_error("png: png_create_write_struct failed");
    }

    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        png_destroy_write_struct(&png_ptr, nullptr);
        throw std::runtime_error("png: png_create_info_struct failed");
    }

    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_write_struct(&png_ptr, &info_ptr);
        throw std::runtime_error("png: write failed");
    }

    png_set_write_fn(png_ptr, &w, write_to_stream, flush_stream);
    png_set_IHDR(png_ptr, info_ptr, static_cast<png_uint_32>(img.width), static_cast<png_uint_32>(img.height), 8,
                 PNG_COLOR_TYPE_RGBA, PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png_ptr, info_ptr);

    for (int y = 0; y < img.height; ++y) {
        png_write_row(png_ptr, const_cast<png_bytep>(img.at(0, y)));
    }

    png_write_end(png_ptr, info_ptr);
    png_destroy_write_struct(&png_ptr, &info_ptr);
}

} // namespace planetwalk::raster
