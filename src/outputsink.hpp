// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pagewright::internal {

// Durable destination for a finished document. Returns an identifier
// for the stored bytes.
class OutputSink {
public:
    virtual ~OutputSink() = default;

    virtual rvoe<std::string> store(std::string_view bytes) = 0;
};

// Writes to a temporary file next to the target, syncs it and renames it
// into place so a partially written file is never visible.
class FileSink : public OutputSink {
public:
    explicit FileSink(std::filesystem::path fname) : fname{std::move(fname)} {}

    rvoe<std::string> store(std::string_view bytes) override;

private:
    std::filesystem::path fname;
};

class MemorySink : public OutputSink {
public:
    rvoe<std::string> store(std::string_view bytes) override;

    const std::vector<std::string> &documents() const { return stored; }

private:
    std::vector<std::string> stored;
};

} // namespace pagewright::internal
