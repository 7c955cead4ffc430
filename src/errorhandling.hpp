// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2025 Jussi Pakkanen

#pragma once

#include <cstdint>
#include <expected>
#include <utility>

namespace pagewright::internal {

enum class ErrorCode : int32_t {
    NoError,
    NoColumns,
    NoOutputTarget,
    WritingTwice,
    DocumentFinalized,
    NoPages,
    BadId,

    CouldNotOpenFile,
    FileReadError,
    FileWriteError,
    FileDoesNotExist,
    CompressionFailure,
    UnsupportedFormat,
    InvalidImageSize,
    EmptyImage,
    DrawStateEndMismatch,
    BadUtf8,

    InvalidHeadingLevel,
    // When you add an error code here, also add the string representation in the .cpp file.
    NumErrors,
};

const char *error_text(ErrorCode ec) noexcept;

#if defined(PAGEWRIGHT_USE_EXCEPTIONS)
// All errors throw exceptions

template<typename T> struct rvoe {
    T v;

    rvoe(const T &in) : v{in} {}
    rvoe(T &&in) : v{std::move(in)} {}

    T &&value() { return std::move(v); }
    operator bool() const { return true; }
    T *operator->() { return &v; }
    const T *operator->() const { return &v; }
    T &operator*() { return v; }
    const T &operator*() const { return v; }

    ErrorCode error() const { return ErrorCode::NoError; }
};

#define RETERR(code) throw(ErrorCode::code)

#define RETOK                                                                                      \
    return NoReturnValue {}

#define ERC(varname, func)                                                                         \
    auto varname##_shell = func;                                                                   \
    auto &varname = varname##_shell.v;

// For void.

#define ERCV(func) func

#else
// All errors are returned as std::unexpecteds and propagated manually.

// This error exists solely so you can put a breakpoint in it.
inline std::unexpected<ErrorCode> create_error(ErrorCode code) { return std::unexpected(code); }

#define RETERR(code) return create_error(ErrorCode::code)

#define RETOK                                                                                      \
    return NoReturnValue {}

// Return value or error.
template<typename T> using rvoe = std::expected<T, ErrorCode>;

#define ERC(varname, func)                                                                         \
    auto varname##_variant = func;                                                                 \
    if(!(varname##_variant)) {                                                                     \
        return std::unexpected(varname##_variant.error());                                         \
    }                                                                                              \
    auto &varname = varname##_variant.value();

// For void.

#define ERCV(func)                                                                                 \
    {                                                                                              \
        auto placeholder_name_variant = func;                                                      \
        if(!(placeholder_name_variant)) {                                                          \
            return std::unexpected(placeholder_name_variant.error());                              \
        }                                                                                          \
    }

#endif

struct NoReturnValue {};

} // namespace pagewright::internal
