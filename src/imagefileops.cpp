// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#include <imagefileops.hpp>
#include <logging.hpp>
#include <utils.hpp>

#include <png.h>
#include <jpeglib.h>

#include <csetjmp>
#include <cstdio>
#include <memory>
#include <string_view>

namespace pagewright::internal {

namespace {

const std::string_view PNG_SIG("\x89PNG\r\n\x1a\n", 8);
const std::string_view JPG_SIG("\xff\xd8\xff", 3);

const int PNG_LOAD_TRANSFORMS = PNG_TRANSFORM_PACKING | PNG_TRANSFORM_STRIP_16 |
                                PNG_TRANSFORM_STRIP_ALPHA | PNG_TRANSFORM_EXPAND |
                                PNG_TRANSFORM_GRAY_TO_RGB;

bool starts_with(std::span<const std::byte> buf, std::string_view sig) {
    return span2sv(buf).starts_with(sig);
}

std::vector<std::byte> to_bytes(std::string_view s) {
    auto sp = str2span(s);
    return std::vector<std::byte>(sp.begin(), sp.end());
}

rvoe<LoadedImage> do_png_load(png_struct *png_ptr, png_info *info_ptr) {
    LoadedImage image;
    const uint32_t w = png_get_image_width(png_ptr, info_ptr);
    const uint32_t h = png_get_image_height(png_ptr, info_ptr);
    if(w == 0 || h == 0) {
        RETERR(InvalidImageSize);
    }
    // The load transforms reduce every supported PNG to 8 bit RGB.
    if(png_get_channels(png_ptr, info_ptr) != 3 || png_get_bit_depth(png_ptr, info_ptr) != 8) {
        get_logger()->error("PNG could not be converted to 8 bit RGB.");
        RETERR(UnsupportedFormat);
    }
    unsigned char **rows = png_get_rows(png_ptr, info_ptr);
    std::string pixels;
    pixels.reserve(size_t{w} * h * 3);
    for(uint32_t row_number = 0; row_number < h; ++row_number) {
        pixels.append((const char *)rows[row_number], size_t{w} * 3);
    }
    ERC(compressed, flate_compress(pixels));
    image.format = "PNG";
    image.payload = to_bytes(compressed);
    image.size = ImageSize{(int32_t)w, (int32_t)h};
    return image;
}

rvoe<LoadedImage> load_png_file(FILE *f) {
    struct PngCloser {
        png_struct *p = nullptr;
        png_info *i = nullptr;

        ~PngCloser() {
            if(p) {
                png_destroy_read_struct(&p, &i, nullptr);
            }
        }
    };
    PngCloser pclose;
    pclose.p = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if(!pclose.p) {
        RETERR(UnsupportedFormat);
    }
    pclose.i = png_create_info_struct(pclose.p);
    if(!pclose.i) {
        RETERR(UnsupportedFormat);
    }

    if(setjmp(png_jmpbuf(pclose.p))) {
        get_logger()->error("Could not decode PNG data.");
        RETERR(UnsupportedFormat);
    }
    png_init_io(pclose.p, f);
    png_read_png(pclose.p, pclose.i, PNG_LOAD_TRANSFORMS, nullptr);
    return do_png_load(pclose.p, pclose.i);
}

rvoe<LoadedImage> load_png_from_memory(std::span<const std::byte> buf) {
    // libpng's read callbacks have no context argument, so memory input
    // goes through a temporary file.
    FILE *f = tmpfile();
    if(!f) {
        RETERR(CouldNotOpenFile);
    }
    std::unique_ptr<FILE, FileCloser> fcloser(f);
    if(fwrite(buf.data(), 1, buf.size(), f) != buf.size()) {
        RETERR(FileWriteError);
    }
    if(fseek(f, 0, SEEK_SET) != 0) {
        RETERR(FileReadError);
    }
    return load_png_file(f);
}

struct JpegError {
    struct jpeg_error_mgr jmgr;
    jmp_buf buf;
};

void jpegErrorExit(j_common_ptr cinfo) {
    JpegError *e = (JpegError *)cinfo->err;
    longjmp(e->buf, 1);
}

struct JpegCloser {
    void operator()(jpeg_decompress_struct *j) const { jpeg_destroy_decompress(j); }
};

// JPEG data is embedded as is, only the header is read.
rvoe<LoadedImage> load_jpg_metadata(std::span<const std::byte> buf) {
    LoadedImage im;
    // Libjpeg kills the process on invalid input unless
    // error_exit is redirected to a longjmp.
    struct jpeg_decompress_struct cinfo{};
    JpegError jerr;

    cinfo.err = jpeg_std_error(&jerr.jmgr);
    jerr.jmgr.error_exit = jpegErrorExit;
    std::unique_ptr<jpeg_decompress_struct, JpegCloser> jpgcloser(&cinfo);
    if(setjmp(jerr.buf)) {
        get_logger()->error("Could not read JPEG header.");
        RETERR(UnsupportedFormat);
    }
    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, (const unsigned char *)buf.data(), (unsigned long)buf.size());
    if(jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
        RETERR(UnsupportedFormat);
    }
    if(cinfo.image_width == 0 || cinfo.image_height == 0) {
        RETERR(InvalidImageSize);
    }

    switch(cinfo.jpeg_color_space) {
    case JCS_GRAYSCALE:
        im.grayscale = true;
        break;
    case JCS_RGB:
    case JCS_YCbCr:
        break;
    default:
        get_logger()->error("Unsupported JPEG color space {}.", (int)cinfo.jpeg_color_space);
        RETERR(UnsupportedFormat);
    }
    if(cinfo.data_precision != 8) {
        get_logger()->error("JPEG bit depth {} is not supported.", cinfo.data_precision);
        RETERR(UnsupportedFormat);
    }
    im.format = "JPEG";
    im.size = ImageSize{(int32_t)cinfo.image_width, (int32_t)cinfo.image_height};
    return im;
}

} // namespace

rvoe<LoadedImage> load_image_from_memory(std::span<const std::byte> buf) {
    if(buf.empty()) {
        RETERR(EmptyImage);
    }
    if(starts_with(buf, PNG_SIG)) {
        return load_png_from_memory(buf);
    }
    if(starts_with(buf, JPG_SIG)) {
        ERC(im, load_jpg_metadata(buf));
        im.payload.assign(buf.begin(), buf.end());
        return std::move(im);
    }
    get_logger()->error("Image data is neither PNG nor JPEG.");
    RETERR(UnsupportedFormat);
}

rvoe<LoadedImage> load_image_file(const std::filesystem::path &fname) {
    ERC(contents, load_file_as_bytes(fname));
    if(starts_with(contents, PNG_SIG)) {
        FILE *f = fopen(fname.c_str(), "rb");
        if(!f) {
            RETERR(CouldNotOpenFile);
        }
        std::unique_ptr<FILE, FileCloser> fcloser(f);
        return load_png_file(f);
    }
    return load_image_from_memory(contents);
}

} // namespace pagewright::internal
