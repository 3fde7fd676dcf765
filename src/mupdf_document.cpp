#include "pdf_outline/mupdf_document.h"
#include "pdf_outline/errors.h"
#include <mupdf/fitz.h>
#include <cmath>
#include <cstring>
#include <iostream>
#include <map>
#include <utility>
#include <vector>

namespace pdf_outline {

namespace {

bool is_space_rune(int c) {
    return c == ' ' || c == '\t' || c == 0xA0;
}

bool name_looks_bold(const char* name) {
    if (!name) return false;
    return std::strstr(name, "Bold") || std::strstr(name, "Black") ||
           std::strstr(name, "Heavy") || std::strstr(name, "Semibold");
}

} // namespace

class MupdfDocument::Impl {
public:
    explicit Impl(const std::string& pdf_path) : path_(pdf_path) {
        ctx_ = fz_new_context(NULL, NULL, FZ_STORE_UNLIMITED);
        if (!ctx_) {
            throw UnreadablePdf(pdf_path, "Failed to create MuPDF context");
        }

        std::string error;
        fz_try(ctx_) {
            fz_register_document_handlers(ctx_);
            doc_ = fz_open_document(ctx_, path_.c_str());
            if (fz_needs_password(ctx_, doc_)) {
                fz_throw(ctx_, FZ_ERROR_GENERIC, "document is password protected");
            }
            page_count_ = fz_count_pages(ctx_, doc_);
        }
        fz_catch(ctx_) {
            error = fz_caught_message(ctx_);
        }

        if (!error.empty()) {
            release();
            throw UnreadablePdf(pdf_path, error);
        }
    }

    ~Impl() {
        release();
    }

    int page_count() const {
        return page_count_;
    }

    std::string metadata_title() const {
        // fz_lookup_metadata reports the full size needed, so a title longer
        // than the first buffer is read again into one that fits
        std::vector<char> buffer(1024, '\0');
        int length = lookup_title(buffer);
        if (length > static_cast<int>(buffer.size())) {
            buffer.assign(static_cast<size_t>(length), '\0');
            length = lookup_title(buffer);
        }

        if (length <= 0) {
            return {};
        }
        return std::string(buffer.data());
    }

    std::vector<NativeOutlineNode> native_outline() const {
        fz_outline* outline = nullptr;
        fz_var(outline);

        std::string error;
        fz_try(ctx_) {
            outline = fz_load_outline(ctx_, doc_);
        }
        fz_catch(ctx_) {
            error = fz_caught_message(ctx_);
        }

        if (!error.empty()) {
            std::cerr << "[MupdfDocument::native_outline] Failed to load outline of "
                      << path_ << ": " << error << std::endl;
            return {};
        }

        std::vector<NativeOutlineNode> roots;
        if (!outline) {
            return roots;
        }

        // Iterative conversion: sibling lists are filled completely before any
        // pointer into them is taken, so the pointers stay valid.
        std::vector<std::pair<fz_outline*, std::vector<NativeOutlineNode>*>> pending;
        pending.emplace_back(outline, &roots);

        while (!pending.empty()) {
            auto [head, target] = pending.back();
            pending.pop_back();

            size_t first = target->size();
            for (fz_outline* node = head; node; node = node->next) {
                NativeOutlineNode converted;
                converted.title = node->title ? node->title : "";
                converted.page = resolve_page(node);
                target->push_back(std::move(converted));
            }

            size_t index = first;
            for (fz_outline* node = head; node; node = node->next, ++index) {
                if (node->down) {
                    pending.emplace_back(node->down, &(*target)[index].children);
                }
            }
        }

        fz_drop_outline(ctx_, outline);
        return roots;
    }

    std::vector<TextSpan> spans(int page_number) const {
        return page(page_number).spans;
    }

    std::string plain_text(int page_number) const {
        return page(page_number).text;
    }

private:
    int lookup_title(std::vector<char>& buffer) const {
        int length = -1;
        fz_var(length);

        fz_try(ctx_) {
            length = fz_lookup_metadata(ctx_, doc_, FZ_META_INFO_TITLE,
                                        buffer.data(), static_cast<int>(buffer.size()));
        }
        fz_catch(ctx_) {
            length = -1;
        }
        return length;
    }

    struct PageData {
        std::vector<TextSpan> spans;
        std::string text;
    };

    const PageData& page(int page_number) const {
        auto it = cache_.find(page_number);
        if (it != cache_.end()) {
            return it->second;
        }
        return cache_.emplace(page_number, load_page(page_number)).first->second;
    }

    PageData load_page(int page_number) const {
        PageData data;
        if (page_number < 1 || page_number > page_count_) {
            return data;
        }

        fz_page* loaded = nullptr;
        fz_stext_page* stext = nullptr;
        fz_var(loaded);
        fz_var(stext);

        std::string error;
        fz_try(ctx_) {
            loaded = fz_load_page(ctx_, doc_, page_number - 1);

            fz_stext_options opts = { 0 };
            opts.flags = FZ_STEXT_PRESERVE_LIGATURES | FZ_STEXT_PRESERVE_WHITESPACE;
            stext = fz_new_stext_page_from_page(ctx_, loaded, &opts);
        }
        fz_catch(ctx_) {
            error = fz_caught_message(ctx_);
        }

        if (error.empty()) {
            collect(stext, page_number, data);
        } else {
            std::cerr << "[MupdfDocument::load_page] Skipping page " << page_number
                      << " of " << path_ << ": " << error << std::endl;
        }

        if (stext) fz_drop_stext_page(ctx_, stext);
        if (loaded) fz_drop_page(ctx_, loaded);

        return data;
    }

    // One span per run of characters sharing a rounded size and weight
    void collect(fz_stext_page* stext, int page_number, PageData& data) const {
        for (fz_stext_block* block = stext->first_block; block; block = block->next) {
            if (block->type != FZ_STEXT_BLOCK_TEXT) {
                continue;
            }

            for (fz_stext_line* line = block->u.t.first_line; line; line = line->next) {
                TextSpan current;
                bool open = false;
                long current_size = 0;

                for (fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
                    char utf8[8] = {0};
                    int len = fz_runetochar(utf8, ch->c);
                    utf8[len] = 0;
                    data.text += utf8;

                    if (is_space_rune(ch->c)) {
                        if (open) current.text += utf8;
                        continue;
                    }

                    bool bold = false;
                    bool italic = false;
                    if (ch->font) {
                        bold = fz_font_is_bold(ctx_, ch->font) ||
                               name_looks_bold(fz_font_name(ctx_, ch->font));
                        italic = fz_font_is_italic(ctx_, ch->font);
                    }
                    long size = std::lround(ch->size);

                    if (open && (size != current_size || bold != current.bold)) {
                        data.spans.push_back(std::move(current));
                        current = TextSpan();
                        open = false;
                    }

                    if (!open) {
                        current.font_size = ch->size;
                        current.bold = bold;
                        current.italic = italic;
                        current.y = line->bbox.y0;
                        current.page = page_number;
                        current_size = size;
                        open = true;
                    }
                    current.text += utf8;
                }

                if (open) {
                    data.spans.push_back(std::move(current));
                }
                data.text += '\n';
            }
            data.text += '\n';
        }
    }

    std::optional<int> resolve_page(fz_outline* node) const {
        if (!node->uri) {
            return std::nullopt;
        }

        int page_index = -1;
        fz_var(page_index);

        fz_try(ctx_) {
            if (!fz_is_external_link(ctx_, node->uri)) {
                fz_location loc = fz_resolve_link(ctx_, doc_, node->uri, NULL, NULL);
                page_index = fz_page_number_from_location(ctx_, doc_, loc);
            }
        }
        fz_catch(ctx_) {
            // broken destination: the entry is dropped by the caller
            page_index = -1;
        }

        if (page_index < 0 || page_index >= page_count_) {
            return std::nullopt;
        }
        return page_index + 1;
    }

    void release() {
        if (doc_) {
            fz_drop_document(ctx_, doc_);
            doc_ = nullptr;
        }
        if (ctx_) {
            fz_drop_context(ctx_);
            ctx_ = nullptr;
        }
    }

    std::string path_;
    fz_context* ctx_ = nullptr;
    fz_document* doc_ = nullptr;
    int page_count_ = 0;
    mutable std::map<int, PageData> cache_;
};

std::unique_ptr<MupdfDocument> MupdfDocument::open(const std::string& pdf_path) {
    auto impl = std::make_unique<Impl>(pdf_path);
    return std::unique_ptr<MupdfDocument>(new MupdfDocument(std::move(impl)));
}

MupdfDocument::MupdfDocument(std::unique_ptr<Impl> impl) : pImpl(std::move(impl)) {}

MupdfDocument::~MupdfDocument() = default;

int MupdfDocument::page_count() const {
    return pImpl->page_count();
}

std::string MupdfDocument::metadata_title() const {
    return pImpl->metadata_title();
}

std::vector<NativeOutlineNode> MupdfDocument::native_outline() const {
    return pImpl->native_outline();
}

std::vector<TextSpan> MupdfDocument::spans(int page) const {
    return pImpl->spans(page);
}

std::string MupdfDocument::plain_text(int page) const {
    return pImpl->plain_text(page);
}

} // namespace pdf_outline
