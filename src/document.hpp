// SPDX-License-Identifier: Apache-2.0
// Copyright 2023-2025 Jussi Pakkanen

#pragma once

#include <errorhandling.hpp>
#include <imagepipeline.hpp>
#include <outputsink.hpp>
#include <pdfcommon.hpp>
#include <pdfwriter.hpp>
#include <tablerenderer.hpp>
#include <textlayout.hpp>

#include <spdlog/common.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pagewright::internal {

struct DocumentOptions {
    DocumentMetadata metadata;
    bool compress_streams = false;
    // Text that runs over the bottom margin continues on a new page.
    bool auto_page_break = true;
    FontFamily default_family = FontFamily::Helvetica;
    double default_font_size = 12;
    std::optional<double> default_max_width;
    std::optional<spdlog::level::level_enum> log_level;
};

struct TextOptions {
    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> max_width;
    std::optional<double> font_size;
    FontStyle style = FontStyle::Normal;
    // Unknown names fall back to Helvetica.
    std::optional<std::string> font_family;
    std::optional<std::string> color;
    bool strikethrough = false;
    int32_t rotation = 0;
    double scale_x = 1.0;
    double scale_y = 1.0;
    double opacity = 1.0;
    std::optional<double> wrap_x;
};

struct ImageBox {
    double x;
    double y;
    double w;
    double h;
};

// Owns all pages and images of one PDF file and turns drawing requests
// into content streams. Single use: after finalize() nothing can be added.
class Document : public TableCanvas {
public:
    explicit Document(DocumentOptions opts = {});

    rvoe<NoReturnValue> add_text(std::string_view text, const TextOptions &opts);
    rvoe<NoReturnValue> add_heading(std::string_view text, int32_t level, const TextOptions &opts);
    // Returns the resource name of the image.
    rvoe<std::string>
    add_image(std::span<const std::byte> bytes, std::string_view format, const ImageBox &box);
    rvoe<std::string> add_image_file(const std::filesystem::path &fname,
                                     std::optional<ImageBox> box);
    rvoe<NoReturnValue> add_rect(const RectElement &rect);
    rvoe<double> draw_table(const std::vector<Column> &columns,
                            const std::vector<TableRow> &rows,
                            const TableOptions &opts);

    double cursor_y() const;
    void set_cursor_y(double y);

    rvoe<NoReturnValue> new_page();
    int32_t num_pages() const { return (int32_t)pages.size(); }
    int32_t num_images() const { return (int32_t)images.size(); }

    rvoe<std::string> serialize() const;
    rvoe<std::string> finalize(OutputSink &sink);

    bool is_finalized() const { return finalized; }

    // TableCanvas
    rvoe<NoReturnValue> draw_rect(const RectElement &rect) override;
    rvoe<NoReturnValue> draw_text(const TextElement &text) override;
    rvoe<NoReturnValue> start_new_page() override;
    double next_block_y() const override;

private:
    struct PageCreated {
        size_t page;
    };
    struct ImageCreated {
        size_t image;
    };
    using CreationEvent = std::variant<PageCreated, ImageCreated>;

    struct Page {
        std::string ops;
    };

    struct StoredImage {
        ImageElement element;
        EmbeddedImage embedded;
    };

    rvoe<NoReturnValue> check_mutable() const;
    rvoe<NoReturnValue> place_text(std::string_view text,
                                   const TextOptions &opts,
                                   const LayoutOptions &lopts,
                                   bool moves_cursor);
    rvoe<NoReturnValue> emit_text(const TextElement &e);
    rvoe<std::string> store_image(ImageElement element, EmbeddedImage embedded);
    std::string graphics_state_for(double opacity);
    Page &current_page() { return pages.back(); }

    DocumentOptions opts;
    TextLayoutEngine layout_engine;
    std::vector<Page> pages;
    std::vector<StoredImage> images;
    std::vector<GraphicsStateResource> gstates;
    std::vector<CreationEvent> creation_order;
    std::optional<Cursor> cursor;
    bool finalized = false;
};

} // namespace pagewright::internal
