#include "pdf_outline/json_writer.h"
#include <fstream>
#include <stdexcept>

namespace pdf_outline {

std::string outline_to_json(const OutlineResult& result, bool pretty) {
    JsonBuilder builder;
    auto& alloc = builder.allocator();
    auto* doc = builder.document();

    doc->AddMember("title", builder.string_value(result.title), alloc);

    JsonValue outline(rapidjson::kArrayType);
    outline.Reserve(static_cast<rapidjson::SizeType>(result.outline.size()), alloc);
    for (const auto& entry : result.outline) {
        JsonValue item(rapidjson::kObjectType);
        item.AddMember("level", rapidjson::StringRef(level_name(entry.level)), alloc);
        item.AddMember("text", builder.string_value(entry.text), alloc);
        item.AddMember("page", entry.page, alloc);
        outline.PushBack(item, alloc);
    }
    doc->AddMember("outline", outline, alloc);

    return builder.serialize(pretty);
}

std::string error_to_json(const std::string& file, const std::string& error) {
    JsonBuilder builder;
    auto& alloc = builder.allocator();
    builder.document()->AddMember("file", builder.string_value(file), alloc);
    builder.document()->AddMember("error", builder.string_value(error), alloc);
    return builder.serialize(true);
}

void write_text_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    out << content << '\n';
    out.close();
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + path);
    }
}

} // namespace pdf_outline
