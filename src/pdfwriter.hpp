// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>
#include <imagepipeline.hpp>
#include <pdfcommon.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pagewright::internal {

struct DocumentMetadata {
    std::optional<std::string> title;
    std::optional<std::string> author;
    std::optional<std::string> subject;
    std::optional<std::string> creator;
    std::optional<std::string> producer;
    // In PDF date format. Filled in with the current time when other
    // metadata is present but this is not.
    std::optional<std::string> creation_date;

    bool empty() const {
        return !title && !author && !subject && !creator && !producer && !creation_date;
    }
};

struct GraphicsStateResource {
    std::string name;
    double opacity;
};

struct XObjectResource {
    std::string name;
    int32_t object_number;
};

// Resources shared by every page through the page tree.
struct SharedResources {
    std::vector<XObjectResource> xobjects;
    std::vector<GraphicsStateResource> graphics_states;
};

// Serializes objects into a growing in-memory buffer and tracks the byte
// offset of each one. Objects must be written in object number order.
class PdfWriter {
public:
    PdfWriter();

    PdfWriter(const PdfWriter &) = delete;
    PdfWriter &operator=(const PdfWriter &) = delete;

    // Appends a complete indirect object and returns its byte offset.
    size_t append_object(std::string_view content);

    rvoe<NoReturnValue> write_finished_object(int32_t object_number,
                                              std::string_view dict_data,
                                              std::string_view stream_data = {});

    rvoe<NoReturnValue> write_catalog();
    rvoe<NoReturnValue> write_pages_root(const std::vector<int32_t> &page_objects,
                                         const FontTable &fonts,
                                         const SharedResources &resources);
    rvoe<NoReturnValue> write_page(int32_t object_number, int32_t contents_object);
    rvoe<NoReturnValue>
    write_content_stream(int32_t object_number, std::string_view ops, bool compress);
    rvoe<NoReturnValue> write_image(int32_t object_number,
                                    const EmbeddedImage &image,
                                    const ImageSize &size);
    rvoe<NoReturnValue> write_info(int32_t object_number, const DocumentMetadata &meta);

    // Writes the cross reference table and the trailer and hands out the
    // finished file. The writer can not be used after this.
    rvoe<std::string> finish(std::optional<int32_t> info_object);

    int32_t num_objects() const { return (int32_t)object_offsets.size(); }
    const std::vector<size_t> &offsets() const { return object_offsets; }
    size_t size() const { return buf.size(); }

private:
    rvoe<NoReturnValue> check_next(int32_t object_number) const;
    std::string cross_reference_table() const;

    std::string buf;
    std::vector<size_t> object_offsets;
    bool finished = false;
};

} // namespace pagewright::internal
