// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2025 Jussi Pakkanen

#include <pdfwriter.hpp>
#include <logging.hpp>
#include <pdfdict.hpp>
#include <utils.hpp>

#include <fmt/core.h>

#include <iterator>

namespace pagewright::internal {

namespace {

const char PDF_header_string[] = "%PDF-1.4\n%\xe5\xf6\xc4\xd6\n";

void add_info_string(PdfDict &dict, const char *key, const std::optional<std::string> &s) {
    if(s) {
        dict.add_string(key, pdfstring_quote(utf8_to_winansi(*s)));
    }
}

PdfDict font_dict(const FontResource &font) {
    PdfDict dict;
    dict.add("/Type", "/Font");
    dict.add("/Subtype", "/Type1");
    dict.add_name("/BaseFont", font.base_font);
    if(font.winansi) {
        dict.add("/Encoding", "/WinAnsiEncoding");
    }
    return dict;
}

} // namespace

PdfWriter::PdfWriter() : buf{PDF_header_string} {}

size_t PdfWriter::append_object(std::string_view content) {
    const size_t offset = buf.size();
    object_offsets.push_back(offset);
    buf += content;
    return offset;
}

rvoe<NoReturnValue> PdfWriter::check_next(int32_t object_number) const {
    if(finished) {
        RETERR(WritingTwice);
    }
    if(object_number != num_objects() + 1) {
        get_logger()->error(
            "Object {} written out of order, expected {}.", object_number, num_objects() + 1);
        RETERR(BadId);
    }
    RETOK;
}

rvoe<NoReturnValue> PdfWriter::write_finished_object(int32_t object_number,
                                                     std::string_view dict_data,
                                                     std::string_view stream_data) {
    ERCV(check_next(object_number));
    std::string obuf;
    auto appender = std::back_inserter(obuf);
    fmt::format_to(appender, "{} 0 obj\n", object_number);
    obuf += dict_data;
    if(!stream_data.empty()) {
        if(obuf.back() != '\n') {
            obuf += '\n';
        }
        obuf += "stream\n";
        obuf += stream_data;
        // There must always be a newline before "endstream".
        // It is not counted in the /Length key in the object dictionary.
        obuf += "\nendstream\n";
    }
    if(obuf.back() != '\n') {
        obuf += '\n';
    }
    obuf += "endobj\n";
    append_object(obuf);
    RETOK;
}

rvoe<NoReturnValue> PdfWriter::write_catalog() {
    PdfDict dict;
    dict.add("/Type", "/Catalog");
    dict.add_ref("/Pages", 2);
    return write_finished_object(1, dict.str());
}

rvoe<NoReturnValue> PdfWriter::write_pages_root(const std::vector<int32_t> &page_objects,
                                                const FontTable &fonts,
                                                const SharedResources &resources) {
    if(page_objects.empty()) {
        RETERR(NoPages);
    }
    std::vector<std::string> kids;
    for(const auto p : page_objects) {
        kids.push_back(object_ref(p));
    }
    PdfDict font_resources;
    for(const auto &font : fonts.resources()) {
        font_resources.add_dict(pdfname_quote(font.resource_name), font_dict(font));
    }

    PdfDict res;
    res.add_array("/ProcSet", {"/PDF", "/Text", "/ImageB", "/ImageC", "/ImageI"});
    res.add_dict("/Font", font_resources);
    if(!resources.xobjects.empty()) {
        PdfDict xobjects;
        for(const auto &x : resources.xobjects) {
            xobjects.add_ref(pdfname_quote(x.name), x.object_number);
        }
        res.add_dict("/XObject", xobjects);
    }
    if(!resources.graphics_states.empty()) {
        PdfDict states;
        for(const auto &gs : resources.graphics_states) {
            PdfDict state;
            state.add("/Type", "/ExtGState");
            state.add("/ca", gs.opacity);
            state.add("/CA", gs.opacity);
            states.add_dict(pdfname_quote(gs.name), state);
        }
        res.add_dict("/ExtGState", states);
    }

    PdfDict dict;
    dict.add("/Type", "/Pages");
    dict.add_array("/Kids", kids);
    dict.add("/Count", (int32_t)page_objects.size());
    dict.add_array("/MediaBox",
                   {"0",
                    "0",
                    fmt::format("{:f}", PageGeometry::width),
                    fmt::format("{:f}", PageGeometry::height)});
    dict.add_dict("/Resources", res);
    return write_finished_object(2, dict.str());
}

rvoe<NoReturnValue> PdfWriter::write_page(int32_t object_number, int32_t contents_object) {
    PdfDict dict;
    dict.add("/Type", "/Page");
    dict.add_ref("/Parent", 2);
    dict.add_ref("/Contents", contents_object);
    return write_finished_object(object_number, dict.str());
}

rvoe<NoReturnValue>
PdfWriter::write_content_stream(int32_t object_number, std::string_view ops, bool compress) {
    PdfDict dict;
    if(compress) {
        ERC(compressed, flate_compress(ops));
        dict.add("/Filter", "/FlateDecode");
        dict.add("/Length", compressed.size());
        return write_finished_object(object_number, dict.str(), compressed);
    }
    dict.add("/Length", ops.size());
    if(ops.empty()) {
        // An empty page still needs a stream keyword pair.
        ERCV(check_next(object_number));
        append_object(fmt::format("{} 0 obj\n{}stream\n\nendstream\nendobj\n",
                                  object_number,
                                  dict.str()));
        RETOK;
    }
    return write_finished_object(object_number, dict.str(), ops);
}

rvoe<NoReturnValue> PdfWriter::write_image(int32_t object_number,
                                           const EmbeddedImage &image,
                                           const ImageSize &size) {
    return write_finished_object(
        object_number, image_dictionary(image, size.w, size.h), image.hex_payload);
}

rvoe<NoReturnValue> PdfWriter::write_info(int32_t object_number, const DocumentMetadata &meta) {
    PdfDict dict;
    add_info_string(dict, "/Title", meta.title);
    add_info_string(dict, "/Author", meta.author);
    add_info_string(dict, "/Subject", meta.subject);
    add_info_string(dict, "/Creator", meta.creator);
    add_info_string(dict, "/Producer", meta.producer);
    dict.add_string("/CreationDate",
                    pdfstring_quote(meta.creation_date.value_or(current_date_string())));
    return write_finished_object(object_number, dict.str());
}

std::string PdfWriter::cross_reference_table() const {
    std::string xref;
    auto app = std::back_inserter(xref);
    fmt::format_to(app,
                   R"(xref
0 {}
)",
                   object_offsets.size() + 1);
    xref += "0000000000 65535 f \n"; // The end of line whitespace is significant.
    for(const auto offset : object_offsets) {
        fmt::format_to(app, "{:010} 00000 n \n", offset);
    }
    return xref;
}

rvoe<std::string> PdfWriter::finish(std::optional<int32_t> info_object) {
    if(finished) {
        RETERR(WritingTwice);
    }
    if(object_offsets.empty()) {
        RETERR(NoPages);
    }
    const size_t xref_offset = buf.size();
    buf += cross_reference_table();

    PdfDict dict;
    dict.add("/Size", object_offsets.size() + 1);
    dict.add_ref("/Root", 1);
    if(info_object) {
        dict.add_ref("/Info", *info_object);
    }
    buf += "trailer\n";
    buf += dict.str();
    fmt::format_to(std::back_inserter(buf),
                   R"(startxref
{}
%%EOF
)",
                   xref_offset);
    finished = true;
    std::string result = std::move(buf);
    buf.clear();
    return result;
}

} // namespace pagewright::internal
