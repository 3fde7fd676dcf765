#include "pdf_outline/memory_document.h"
#include <stdexcept>

namespace pdf_outline {

void MemoryDocument::set_metadata_title(std::string title) {
    title_ = std::move(title);
}

void MemoryDocument::set_native_outline(std::vector<NativeOutlineNode> outline) {
    outline_ = std::move(outline);
}

int MemoryDocument::add_page() {
    pages_.emplace_back();
    return static_cast<int>(pages_.size());
}

void MemoryDocument::add_span(int page, std::string text, float font_size, float y,
                              bool bold, bool italic) {
    TextSpan span;
    span.text = std::move(text);
    span.font_size = font_size;
    span.bold = bold;
    span.italic = italic;
    span.y = y;
    span.page = page;
    ensure_page(page).spans.push_back(std::move(span));
}

void MemoryDocument::set_plain_text(int page, std::string text) {
    auto& data = ensure_page(page);
    data.text = std::move(text);
    data.has_text = true;
}

int MemoryDocument::page_count() const {
    return static_cast<int>(pages_.size());
}

std::string MemoryDocument::metadata_title() const {
    return title_;
}

std::vector<NativeOutlineNode> MemoryDocument::native_outline() const {
    return outline_;
}

std::vector<TextSpan> MemoryDocument::spans(int page) const {
    if (page < 1 || page > page_count()) {
        return {};
    }
    return pages_[page - 1].spans;
}

std::string MemoryDocument::plain_text(int page) const {
    if (page < 1 || page > page_count()) {
        return {};
    }

    const auto& data = pages_[page - 1];
    if (data.has_text) {
        return data.text;
    }

    std::string text;
    for (const auto& span : data.spans) {
        text += span.text;
        text += '\n';
    }
    return text;
}

MemoryDocument::PageData& MemoryDocument::ensure_page(int page) {
    if (page < 1) {
        throw std::out_of_range("Page number out of range");
    }
    if (static_cast<size_t>(page) > pages_.size()) {
        pages_.resize(page);
    }
    return pages_[page - 1];
}

} // namespace pdf_outline
