#pragma once

#include "pdf_outline/outline_types.h"
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <memory>
#include <string>

namespace pdf_outline {

using JsonDocument = rapidjson::Document;
using JsonValue = rapidjson::Value;
using JsonAllocator = rapidjson::MemoryPoolAllocator<>;

// Builds a JSON object whose members keep insertion order
class JsonBuilder {
public:
    JsonBuilder() : doc_(std::make_unique<JsonDocument>()) {
        doc_->SetObject();
    }

    JsonDocument* document() { return doc_.get(); }
    JsonAllocator& allocator() { return doc_->GetAllocator(); }

    JsonValue string_value(const std::string& text) {
        return JsonValue(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), allocator());
    }

    std::string serialize(bool pretty = true) const {
        rapidjson::StringBuffer buffer;

        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            writer.SetIndent(' ', 2);
            doc_->Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            doc_->Accept(writer);
        }

        return std::string(buffer.GetString(), buffer.GetSize());
    }

private:
    std::unique_ptr<JsonDocument> doc_;
};

// {"title": ..., "outline": [{"level", "text", "page"}, ...]} in that order
std::string outline_to_json(const OutlineResult& result, bool pretty = true);

// {"file": ..., "error": ...}
std::string error_to_json(const std::string& file, const std::string& error);

// Throws std::runtime_error when the file cannot be written
void write_text_file(const std::string& path, const std::string& content);

} // namespace pdf_outline
