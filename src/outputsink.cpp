// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Jussi Pakkanen

#include <outputsink.hpp>
#include <logging.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace pagewright::internal {

rvoe<std::string> FileSink::store(std::string_view bytes) {
    std::filesystem::path tempfname(fname);
    tempfname.replace_extension(".pdf~");
    FILE *out_file = fopen(tempfname.string().c_str(), "wb");
    if(!out_file) {
        get_logger()->error("Could not open {}: {}", tempfname.string(), strerror(errno));
        RETERR(CouldNotOpenFile);
    }
    std::unique_ptr<FILE, FileCloser> fcloser(out_file);

    if(fwrite(bytes.data(), 1, bytes.size(), out_file) != bytes.size()) {
        get_logger()->error("Write to {} failed: {}", tempfname.string(), strerror(errno));
        RETERR(FileWriteError);
    }
    if(fflush(out_file) != 0) {
        get_logger()->error("Flush failed: {}", strerror(errno));
        RETERR(FileWriteError);
    }
    if(
#ifdef _WIN32
        _commit(fileno(out_file))
#else
        fsync(fileno(out_file))
#endif
        != 0) {

        get_logger()->error("Sync failed: {}", strerror(errno));
        RETERR(FileWriteError);
    }
    // Close the file manually to verify it worked.
    fcloser.release();
    if(fclose(out_file) != 0) {
        get_logger()->error("Close failed: {}", strerror(errno));
        RETERR(FileWriteError);
    }

    // The file has been fully written and synced to disk. Now replace.
    std::error_code ec;
    std::filesystem::rename(tempfname, fname, ec);
    if(ec) {
        get_logger()->error("Rename to {} failed: {}", fname.string(), ec.message());
        RETERR(FileWriteError);
    }
    get_logger()->info("Wrote {} bytes to {}.", bytes.size(), fname.string());
    return fname.string();
}

rvoe<std::string> MemorySink::store(std::string_view bytes) {
    stored.emplace_back(bytes);
    return fmt::format("memory:{}", stored.size() - 1);
}

} // namespace pagewright::internal
