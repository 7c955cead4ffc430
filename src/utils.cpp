// SPDX-License-Identifier: Apache-2.0
// Copyright 2022-2025 Jussi Pakkanen

#include <utils.hpp>
#include <logging.hpp>

#include <fmt/core.h>
#include <zlib.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <cstdint>
#include <memory>
#include <optional>
#include <time.h>

namespace pagewright::internal {

namespace {

struct UtfDecodeStep {
    uint32_t byte1_data_mask;
    uint32_t num_subsequent_bytes;
};

const uint32_t subsequent_header_mask = 0b011000000;
const uint32_t subsequent_header_value = 0b10000000;
const uint32_t subsequent_data_mask = 0b111111;
const uint32_t subsequent_num_data_bits = 6;

bool decode_step_for(unsigned char byte1, UtfDecodeStep &par) {
    if(byte1 < 0x80) {
        par = UtfDecodeStep{0x7F, 0};
    } else if((byte1 & 0b11100000) == 0b11000000) {
        par = UtfDecodeStep{0b11111, 1};
    } else if((byte1 & 0b11110000) == 0b11100000) {
        par = UtfDecodeStep{0b1111, 2};
    } else if((byte1 & 0b11111000) == 0b11110000) {
        par = UtfDecodeStep{0b111, 3};
    } else {
        return false;
    }
    return true;
}

bool decode_one_codepoint(std::string_view input,
                          size_t cur,
                          const UtfDecodeStep &par,
                          uint32_t &codepoint) {
    if(cur + par.num_subsequent_bytes >= input.size()) {
        return false;
    }
    uint32_t unpacked = uint32_t((unsigned char)input[cur]) & par.byte1_data_mask;
    for(uint32_t i = 0; i < par.num_subsequent_bytes; ++i) {
        unpacked <<= subsequent_num_data_bits;
        const uint32_t subsequent = uint32_t((unsigned char)input[cur + 1 + i]);
        if((subsequent & subsequent_header_mask) != subsequent_header_value) {
            return false;
        }
        unpacked |= subsequent & subsequent_data_mask;
    }
    codepoint = unpacked;
    return true;
}

bool needs_quoting(const unsigned char c) {
    if(c < '!' || c > '~') {
        return true;
    }
    if(c == '#' || c == '(' || c == ')' || c == ' ' || c == '/' || c == '<' || c == '>' ||
       c == '[' || c == ']' || c == '{' || c == '}' || c == '%') {
        return true;
    }
    return false;
}

struct DeflateCloser {
    void operator()(z_stream *zs) const {
        if(zs) {
            auto rc = deflateEnd(zs);
            if(rc != Z_OK && rc != Z_DATA_ERROR) {
                get_logger()->warn("Zlib error when closing: {}", zs->msg ? zs->msg : "unknown");
            }
        }
    }
};

struct WinAnsiExtra {
    uint32_t codepoint;
    char code;
};

// WinAnsi characters in 0x80-0x9F that are not at their Unicode position.
const std::array<WinAnsiExtra, 27> winansi_extras{{
    {0x20AC, '\x80'}, {0x201A, '\x82'}, {0x0192, '\x83'}, {0x201E, '\x84'}, {0x2026, '\x85'},
    {0x2020, '\x86'}, {0x2021, '\x87'}, {0x02C6, '\x88'}, {0x2030, '\x89'}, {0x0160, '\x8A'},
    {0x2039, '\x8B'}, {0x0152, '\x8C'}, {0x017D, '\x8E'}, {0x2018, '\x91'}, {0x2019, '\x92'},
    {0x201C, '\x93'}, {0x201D, '\x94'}, {0x2022, '\x95'}, {0x2013, '\x96'}, {0x2014, '\x97'},
    {0x02DC, '\x98'}, {0x2122, '\x99'}, {0x0161, '\x9A'}, {0x203A, '\x9B'}, {0x0153, '\x9C'},
    {0x017E, '\x9E'}, {0x0178, '\x9F'},
}};

std::optional<char> winansi_code(uint32_t codepoint) {
    if(codepoint < 0x80 || (codepoint >= 0xA0 && codepoint <= 0xFF)) {
        return (char)codepoint;
    }
    for(const auto &e : winansi_extras) {
        if(e.codepoint == codepoint) {
            return e.code;
        }
    }
    return {};
}

} // namespace

rvoe<std::string> flate_compress(std::string_view data) {
    std::string compressed;
    const int CHUNK = 1024 * 1024;
    std::string buf;
    z_stream strm;
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;

    auto ret = deflateInit(&strm, Z_BEST_COMPRESSION);
    if(ret != Z_OK) {
        RETERR(CompressionFailure);
    }
    std::unique_ptr<z_stream, DeflateCloser> zcloser(&strm);
    strm.avail_in = (uInt)data.size();
    strm.next_in = (Bytef *)(data.data());

    do {
        buf.resize(CHUNK);
        strm.avail_out = CHUNK;
        strm.next_out = (Bytef *)buf.data();
        ret = deflate(&strm, Z_FINISH);
        if(ret == Z_STREAM_ERROR) {
            RETERR(CompressionFailure);
        }
        const int write_size = CHUNK - strm.avail_out;
        buf.resize(write_size);
        compressed += buf;
    } while(strm.avail_out == 0);
    if(strm.avail_in != 0) {
        RETERR(CompressionFailure);
    }
    if(ret != Z_STREAM_END) {
        RETERR(CompressionFailure);
    }
    return compressed;
}

rvoe<std::vector<std::byte>> load_file_as_bytes(FILE *f) {
    if(fseek(f, 0, SEEK_END) != 0) {
        get_logger()->error("Seek failed: {}", strerror(errno));
        RETERR(FileReadError);
    }
    auto fsize = ftell(f);
    if(fsize < 0) {
        get_logger()->error("Could not determine file size: {}", strerror(errno));
        RETERR(FileReadError);
    }
    std::vector<std::byte> contents(fsize);
    if(fseek(f, 0, SEEK_SET) != 0) {
        get_logger()->error("Seek failed: {}", strerror(errno));
        RETERR(FileReadError);
    }
    const size_t rc = fread(contents.data(), 1, fsize, f);
    if(rc != (size_t)fsize) {
        get_logger()->error("Short read: got {} bytes of {}.", rc, fsize);
        RETERR(FileReadError);
    }
    return contents;
}

rvoe<std::vector<std::byte>> load_file_as_bytes(const std::filesystem::path &fname) {
    if(!std::filesystem::is_regular_file(fname)) {
        RETERR(FileDoesNotExist);
    }
    FILE *f = fopen(fname.string().c_str(), "rb");
    if(!f) {
        get_logger()->error("Could not open {}: {}", fname.string(), strerror(errno));
        RETERR(CouldNotOpenFile);
    }
    std::unique_ptr<FILE, FileCloser> fcloser(f);
    return load_file_as_bytes(f);
}

rvoe<std::string> load_file_as_string(const std::filesystem::path &fname) {
    ERC(bytes, load_file_as_bytes(fname));
    return std::string(span2sv(bytes));
}

bool is_valid_utf8(std::string_view input) {
    size_t cur = 0;
    while(cur < input.size()) {
        UtfDecodeStep par;
        uint32_t codepoint;
        if(!decode_step_for((unsigned char)input[cur], par)) {
            return false;
        }
        if(par.num_subsequent_bytes > 0 && !decode_one_codepoint(input, cur, par, codepoint)) {
            return false;
        }
        cur += 1 + par.num_subsequent_bytes;
    }
    return true;
}

std::string utf8_to_winansi(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    size_t cur = 0;
    size_t num_replaced = 0;
    while(cur < input.size()) {
        UtfDecodeStep par;
        uint32_t codepoint = '?';
        if(!decode_step_for((unsigned char)input[cur], par)) {
            result += '?';
            ++num_replaced;
            ++cur;
            continue;
        }
        if(par.num_subsequent_bytes == 0) {
            result += input[cur];
            ++cur;
            continue;
        }
        std::optional<char> code;
        if(decode_one_codepoint(input, cur, par, codepoint)) {
            code = winansi_code(codepoint);
        }
        if(code) {
            result += *code;
        } else {
            result += '?';
            ++num_replaced;
        }
        cur += 1 + par.num_subsequent_bytes;
    }
    if(num_replaced > 0) {
        get_logger()->debug("Replaced {} characters not representable in WinAnsi.", num_replaced);
    }
    return result;
}

std::string pdfstring_quote(std::string_view raw_string) {
    std::string result;
    result.reserve(raw_string.size() + 2);
    for(const char c : raw_string) {
        const unsigned char uc = (unsigned char)c;
        if(c == '(' || c == ')' || c == '\\') {
            result += '\\';
            result += c;
        } else if(c == '\n') {
            result += "\\n";
        } else if(c == '\r') {
            result += "\\r";
        } else if(uc > 127 || uc < 32) {
            result += fmt::format("\\{:03o}", uc);
        } else {
            result += c;
        }
    }
    return result;
}

std::string pdfname_quote(std::string_view raw_string) {
    std::string result;
    result.reserve(raw_string.size() + 1);
    result += '/';
    for(const char c : raw_string) {
        const unsigned char uc = (unsigned char)c;
        if(needs_quoting(uc)) {
            result += fmt::format("#{:02X}", uc);
        } else {
            result += c;
        }
    }
    return result;
}

std::string hex_encode(std::span<const std::byte> data) {
    static const char hexdigits[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(data.size() * 2);
    for(const auto b : data) {
        const auto v = (unsigned char)b;
        result += hexdigits[v >> 4];
        result += hexdigits[v & 0xF];
    }
    return result;
}

std::string current_date_string() {
    const int bufsize = 128;
    char buf[bufsize];
    time_t timepoint = time(nullptr);
    struct tm utctime;
#ifdef _WIN32
    if(gmtime_s(&utctime, &timepoint) != 0) {
#else
    if(gmtime_r(&timepoint, &utctime) == nullptr) {
#endif
        return "D:19700101000000Z";
    }
    strftime(buf, bufsize, "D:%Y%m%d%H%M%SZ", &utctime);
    return buf;
}

std::string_view span2sv(std::span<const std::byte> s) {
    return std::string_view((const char *)s.data(), s.size());
}

std::span<const std::byte> str2span(std::string_view s) {
    return std::span<const std::byte>((const std::byte *)s.data(), s.size());
}

} // namespace pagewright::internal
