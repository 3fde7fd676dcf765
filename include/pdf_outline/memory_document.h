#pragma once

#include "pdf_outline/document.h"
#include <string>
#include <vector>

namespace pdf_outline {

// Document held entirely in memory. Used for synthetic inputs in tests and
// benchmarks, and as a snapshot format for pages extracted elsewhere.
class MemoryDocument : public Document {
public:
    MemoryDocument() = default;

    void set_metadata_title(std::string title);
    void set_native_outline(std::vector<NativeOutlineNode> outline);

    // Appends an empty page and returns its 1-based index
    int add_page();

    // Grows the document as needed. When no plain text was set for the page,
    // plain_text() joins the page's span texts with newlines.
    void add_span(int page, std::string text, float font_size, float y,
                  bool bold = false, bool italic = false);
    void set_plain_text(int page, std::string text);

    int page_count() const override;
    std::string metadata_title() const override;
    std::vector<NativeOutlineNode> native_outline() const override;
    std::vector<TextSpan> spans(int page) const override;
    std::string plain_text(int page) const override;

private:
    struct PageData {
        std::vector<TextSpan> spans;
        std::string text;
        bool has_text = false;
    };

    PageData& ensure_page(int page);

    std::string title_;
    std::vector<NativeOutlineNode> outline_;
    std::vector<PageData> pages_;
};

} // namespace pdf_outline
