#pragma once

#include <string>
#include <vector>
#include <optional>

namespace pdf_outline {

struct TextSpan {
    std::string text;
    float font_size = 0.0f;
    bool bold = false;
    bool italic = false;
    float y = 0.0f;     // baseline / top, grows downwards
    int page = 1;       // 1-based
};

struct NativeOutlineNode {
    std::string title;
    std::optional<int> page;   // 1-based, empty when the target did not resolve
    std::vector<NativeOutlineNode> children;
};

// Read-only view of an opened PDF. Pages are 1-based.
//
// Implementations must not throw once constructed: a page that cannot be
// extracted is reported as an empty page.
class Document {
public:
    virtual ~Document() = default;

    virtual int page_count() const = 0;
    virtual std::string metadata_title() const = 0;
    virtual std::vector<NativeOutlineNode> native_outline() const = 0;
    virtual std::vector<TextSpan> spans(int page) const = 0;
    virtual std::string plain_text(int page) const = 0;
};

} // namespace pdf_outline
