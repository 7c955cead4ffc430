// SPDX-License-Identifier: Apache-2.0
// Copyright 2024-2025 Jussi Pakkanen

#include <pagewright.hpp>
#include <utils.hpp>

#include <cstdio>
#include <string>
#include <string_view>

namespace {

// Lines starting with one to three hashes are headings, blank lines
// end a paragraph.
int heading_level(std::string_view line) {
    int level = 0;
    while(level < (int)line.size() && line[level] == '#') {
        ++level;
    }
    if(level >= 1 && level <= 3 && (int)line.size() > level && line[level] == ' ') {
        return level;
    }
    return 0;
}

void flush_paragraph(pagewright::Document &doc, std::string &paragraph) {
    if(paragraph.empty()) {
        return;
    }
    pagewright::TextOptions opts;
    opts.max_width = pagewright::internal::PageGeometry::printable_width();
    doc.add_text(paragraph, opts);
    doc.set_cursor_y(doc.cursor_y() + 6);
    paragraph.clear();
}

} // namespace

int main(int argc, char **argv) {
    if(argc != 3) {
        printf("%s <input text file> <pdf output>\n", argv[0]);
        return 1;
    }
    auto contents = pagewright::internal::load_file_as_string(argv[1]);
    if(!contents) {
        fprintf(stderr,
                "Could not read %s: %s\n",
                argv[1],
                pagewright::internal::error_text(contents.error()));
        return 1;
    }
    pagewright::DocumentOptions dopts;
    dopts.metadata.title = argv[1];
    dopts.metadata.creator = "text2pdf";
    pagewright::Document doc(dopts);

    try {
        std::string_view text{*contents};
        std::string paragraph;
        while(!text.empty()) {
            const auto eol = text.find('\n');
            std::string_view line = text.substr(0, eol);
            text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);
            if(!line.empty() && line.back() == '\r') {
                line.remove_suffix(1);
            }
            if(line.find_first_not_of(" \t") == std::string_view::npos) {
                flush_paragraph(doc, paragraph);
                continue;
            }
            if(const int level = heading_level(line); level > 0) {
                flush_paragraph(doc, paragraph);
                doc.add_heading(line.substr(level + 1), level);
                continue;
            }
            if(!paragraph.empty()) {
                paragraph += ' ';
            }
            paragraph += line;
        }
        flush_paragraph(doc, paragraph);

        pagewright::FileSink sink(argv[2]);
        doc.finalize(sink);
    } catch(const pagewright::PdfException &e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }
    return 0;
}
