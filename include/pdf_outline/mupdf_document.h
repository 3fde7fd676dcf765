#pragma once

#include "pdf_outline/document.h"
#include <memory>
#include <string>

namespace pdf_outline {

// Document backed by MuPDF. Owns its own fz_context, so instances can be used
// from different threads as long as each instance stays on one thread.
class MupdfDocument : public Document {
public:
    // Throws UnreadablePdf when the file cannot be opened
    static std::unique_ptr<MupdfDocument> open(const std::string& pdf_path);

    ~MupdfDocument() override;

    MupdfDocument(const MupdfDocument&) = delete;
    MupdfDocument& operator=(const MupdfDocument&) = delete;

    int page_count() const override;
    std::string metadata_title() const override;
    std::vector<NativeOutlineNode> native_outline() const override;
    std::vector<TextSpan> spans(int page) const override;
    std::string plain_text(int page) const override;

private:
    class Impl;
    explicit MupdfDocument(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> pImpl;
};

} // namespace pdf_outline
