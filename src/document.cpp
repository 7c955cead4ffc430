// SPDX-License-Identifier: Apache-2.0
// Copyright 2023-2025 Jussi Pakkanen

#include <document.hpp>
#include <drawprimitives.hpp>
#include <imagefileops.hpp>
#include <logging.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <cmath>
#include <utility>

namespace pagewright::internal {

Document::Document(DocumentOptions opts_)
    : opts{std::move(opts_)}, layout_engine{FontTable::standard()} {
    if(opts.log_level) {
        set_log_level(*opts.log_level);
    }
    pages.emplace_back();
    creation_order.emplace_back(PageCreated{0});
}

rvoe<NoReturnValue> Document::check_mutable() const {
    if(finalized) {
        get_logger()->error("Document has already been finalized.");
        RETERR(DocumentFinalized);
    }
    RETOK;
}

rvoe<NoReturnValue> Document::add_text(std::string_view text, const TextOptions &topts) {
    ERCV(check_mutable());
    if(!is_valid_utf8(text)) {
        get_logger()->error("Text is not valid UTF-8.");
        RETERR(BadUtf8);
    }
    LayoutOptions lopts;
    if(topts.font_size) {
        lopts.font_size = *topts.font_size;
    } else {
        lopts.font_size = opts.default_font_size;
    }
    lopts.style = topts.style;
    lopts.family =
        topts.font_family ? parse_font_family(*topts.font_family) : opts.default_family;
    lopts.max_width = topts.max_width ? topts.max_width : opts.default_max_width;
    lopts.wrap_x = topts.wrap_x;
    // Text pinned to an explicit Y is a label, not part of the flow.
    const bool moves_cursor = !topts.y || lopts.max_width;
    return place_text(text, topts, lopts, moves_cursor);
}

rvoe<NoReturnValue>
Document::add_heading(std::string_view text, int32_t level, const TextOptions &topts) {
    ERCV(check_mutable());
    if(level < 1 || level > 3) {
        get_logger()->error("Heading level {} is not in range 1-3.", level);
        RETERR(InvalidHeadingLevel);
    }
    if(!is_valid_utf8(text)) {
        get_logger()->error("Heading is not valid UTF-8.");
        RETERR(BadUtf8);
    }
    LayoutOptions lopts;
    lopts.heading = HeadingLevel(level);
    lopts.font_size = heading_size(*lopts.heading);
    lopts.style = topts.style == FontStyle::Normal ? FontStyle::Bold : topts.style;
    lopts.family =
        topts.font_family ? parse_font_family(*topts.font_family) : opts.default_family;
    return place_text(text, topts, lopts, true);
}

rvoe<NoReturnValue> Document::place_text(std::string_view text,
                                         const TextOptions &topts,
                                         const LayoutOptions &lopts,
                                         bool moves_cursor) {
    auto style_element = [&topts](TextElement e) {
        e.color = RgbColor::from_hex(topts.color);
        e.strikethrough = topts.strikethrough;
        e.set_rotation(topts.rotation);
        e.set_scale(topts.scale_x, topts.scale_y);
        e.set_opacity(topts.opacity);
        e.page_break_needed = false;
        return e;
    };
    std::string pending{text};
    std::optional<double> x = topts.x;
    std::optional<double> y = topts.y;
    bool fresh_page = false;
    while(true) {
        auto res = layout_engine.layout(pending, x, y, lopts, cursor);
        for(const auto &e : res.elements) {
            if(e.page_break_needed) {
                break;
            }
            ERCV(emit_text(style_element(e)));
            if(moves_cursor) {
                cursor = Cursor{e.x, e.y};
            }
        }
        if(!res.page_break_needed) {
            RETOK;
        }
        const auto &flagged = res.elements.back();
        if(fresh_page && res.elements.size() == 1) {
            // Not even one line fits on an empty page.
            get_logger()->warn("Line at font size {} is taller than the page.", lopts.font_size);
            ERCV(emit_text(style_element(flagged)));
            if(moves_cursor) {
                cursor = Cursor{flagged.x, flagged.y};
            }
            RETOK;
        }
        if(!opts.auto_page_break) {
            get_logger()->warn("Text runs past the bottom margin, {} bytes not drawn.",
                               res.remaining.size());
            RETOK;
        }
        ERCV(new_page());
        fresh_page = true;
        pending = std::move(res.remaining);
        y = PageGeometry::margin;
        if(lopts.wrap_x) {
            x = lopts.wrap_x;
        }
    }
}

rvoe<NoReturnValue> Document::emit_text(const TextElement &e) {
    std::optional<std::string> gs;
    if(e.opacity() < 1.0) {
        gs = graphics_state_for(e.opacity());
    }
    ERC(ops, text_operators(e, layout_engine.font_table(), gs));
    current_page().ops += ops;
    RETOK;
}

std::string Document::graphics_state_for(double opacity) {
    for(const auto &gs : gstates) {
        if(gs.opacity == opacity) {
            return gs.name;
        }
    }
    gstates.push_back(GraphicsStateResource{fmt::format("GS{}", gstates.size() + 1), opacity});
    return gstates.back().name;
}

rvoe<std::string>
Document::add_image(std::span<const std::byte> bytes, std::string_view format, const ImageBox &box) {
    ERCV(check_mutable());
    if(bytes.empty()) {
        get_logger()->error("Image has no data.");
        RETERR(EmptyImage);
    }
    if(!(box.w > 0) || !(box.h > 0)) {
        get_logger()->error("Image box {}x{} is not positive.", box.w, box.h);
        RETERR(InvalidImageSize);
    }
    auto embedded = embed_image(bytes, format);
    ImageElement el;
    el.format = embedded.normalized_format;
    el.data.assign(bytes.begin(), bytes.end());
    el.x = box.x;
    el.y = box.y;
    el.w = box.w;
    el.h = box.h;
    return store_image(std::move(el), std::move(embedded));
}

rvoe<std::string> Document::add_image_file(const std::filesystem::path &fname,
                                           std::optional<ImageBox> box) {
    ERCV(check_mutable());
    ERC(loaded, load_image_file(fname));
    ImageBox placement;
    if(box) {
        placement = *box;
    } else {
        // One pixel per point, shrunk to the printable width.
        double w = loaded.size.w;
        double h = loaded.size.h;
        if(w > PageGeometry::printable_width()) {
            h = h * PageGeometry::printable_width() / w;
            w = PageGeometry::printable_width();
        }
        placement = ImageBox{PageGeometry::margin, next_block_y(), w, h};
        if(opts.auto_page_break && cursor && placement.y + h > PageGeometry::bottom_limit()) {
            ERCV(new_page());
            placement.y = PageGeometry::margin;
        }
    }
    if(!(placement.w > 0) || !(placement.h > 0)) {
        get_logger()->error("Image box {}x{} is not positive.", placement.w, placement.h);
        RETERR(InvalidImageSize);
    }
    auto embedded = embed_image(loaded.payload, loaded.format);
    if(loaded.grayscale) {
        embedded.color_space = "DeviceGray";
    }
    ImageElement el;
    el.format = embedded.normalized_format;
    el.data = std::move(loaded.payload);
    el.x = placement.x;
    el.y = placement.y;
    el.w = placement.w;
    el.h = placement.h;
    el.pixel_size = loaded.size;
    el.grayscale = loaded.grayscale;
    ERC(name, store_image(std::move(el), std::move(embedded)));
    if(!box) {
        cursor = Cursor{placement.x, placement.y + placement.h};
    }
    get_logger()->debug("Loaded {} as {}.", fname.string(), name);
    return name;
}

rvoe<std::string> Document::store_image(ImageElement element, EmbeddedImage embedded) {
    element.identifier = fmt::format("Im{}", images.size() + 1);
    ERC(ops, image_placement_operators(element, element.identifier));
    current_page().ops += ops;
    creation_order.emplace_back(ImageCreated{images.size()});
    images.push_back(StoredImage{std::move(element), std::move(embedded)});
    return images.back().element.identifier;
}

rvoe<NoReturnValue> Document::add_rect(const RectElement &rect) { return draw_rect(rect); }

rvoe<NoReturnValue> Document::draw_rect(const RectElement &rect) {
    ERCV(check_mutable());
    ERC(ops, rect_operators(rect));
    current_page().ops += ops;
    RETOK;
}

rvoe<NoReturnValue> Document::draw_text(const TextElement &text) {
    ERCV(check_mutable());
    return emit_text(text);
}

rvoe<NoReturnValue> Document::start_new_page() { return new_page(); }

rvoe<double> Document::draw_table(const std::vector<Column> &columns,
                                  const std::vector<TableRow> &rows,
                                  const TableOptions &topts) {
    ERCV(check_mutable());
    TableRenderer renderer(this);
    ERC(end_y, renderer.draw(columns, rows, topts));
    cursor = Cursor{topts.margin.value_or(PageGeometry::margin), end_y};
    return end_y;
}

double Document::cursor_y() const { return cursor ? cursor->y : PageGeometry::margin; }

void Document::set_cursor_y(double y) {
    cursor = Cursor{cursor ? cursor->x : PageGeometry::margin, y};
}

double Document::next_block_y() const {
    if(!cursor) {
        return PageGeometry::margin;
    }
    return cursor->y + TextLayoutEngine::line_height(opts.default_font_size);
}

rvoe<NoReturnValue> Document::new_page() {
    ERCV(check_mutable());
    pages.emplace_back();
    creation_order.emplace_back(PageCreated{pages.size() - 1});
    cursor.reset();
    RETOK;
}

rvoe<std::string> Document::serialize() const {
    std::vector<int32_t> page_objs(pages.size());
    std::vector<int32_t> content_objs(pages.size());
    std::vector<int32_t> image_objs(images.size());
    // 1 is the catalog and 2 the page tree.
    int32_t next_obj = 3;
    for(const auto &ev : creation_order) {
        std::visit(overloaded{[&](const PageCreated &p) {
                                  page_objs[p.page] = next_obj++;
                                  content_objs[p.page] = next_obj++;
                              },
                              [&](const ImageCreated &i) { image_objs[i.image] = next_obj++; }},
                   ev);
    }
    std::optional<int32_t> info;
    if(!opts.metadata.empty()) {
        info = next_obj;
    }

    SharedResources resources;
    for(size_t i = 0; i < images.size(); ++i) {
        resources.xobjects.push_back(XObjectResource{images[i].element.identifier, image_objs[i]});
    }
    resources.graphics_states = gstates;

    PdfWriter writer;
    ERCV(writer.write_catalog());
    ERCV(writer.write_pages_root(page_objs, layout_engine.font_table(), resources));
    auto visitor = overloaded{
        [&](const PageCreated &p) -> rvoe<NoReturnValue> {
            ERCV(writer.write_page(page_objs[p.page], content_objs[p.page]));
            ERCV(writer.write_content_stream(
                content_objs[p.page], pages[p.page].ops, opts.compress_streams));
            RETOK;
        },
        [&](const ImageCreated &i) -> rvoe<NoReturnValue> {
            const auto &im = images[i.image];
            ERCV(writer.write_image(image_objs[i.image], im.embedded, xobject_size(im.element)));
            RETOK;
        }};
    for(const auto &ev : creation_order) {
        ERCV(std::visit(visitor, ev));
    }
    if(info) {
        ERCV(writer.write_info(*info, opts.metadata));
    }
    return writer.finish(info);
}

rvoe<std::string> Document::finalize(OutputSink &sink) {
    if(finalized) {
        get_logger()->error("Document finalized twice.");
        RETERR(WritingTwice);
    }
    ERC(bytes, serialize());
    finalized = true;
    ERC(id, sink.store(bytes));
    get_logger()->info("Finalized {} pages and {} images into {}.", pages.size(), images.size(), id);
    return id;
}

} // namespace pagewright::internal
