#include <gtest/gtest.h>
#include <pdf_outline/json_writer.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace pdf_outline;

TEST(JsonWriterTest, FieldOrderIsStable) {
    OutlineResult result;
    result.title = "Annual Report";
    result.outline = {
        {HeadingLevel::H1, "Introduction", 1},
        {HeadingLevel::H3, "Scope", 2},
    };

    auto parsed = nlohmann::ordered_json::parse(outline_to_json(result));

    std::vector<std::string> keys;
    for (auto it = parsed.begin(); it != parsed.end(); ++it) {
        keys.push_back(it.key());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"title", "outline"}));

    ASSERT_EQ(parsed["outline"].size(), 2u);
    const auto& entry = parsed["outline"][1];
    std::vector<std::string> entry_keys;
    for (auto it = entry.begin(); it != entry.end(); ++it) {
        entry_keys.push_back(it.key());
    }
    EXPECT_EQ(entry_keys, (std::vector<std::string>{"level", "text", "page"}));
    EXPECT_EQ(entry["level"], "H3");
    EXPECT_EQ(entry["text"], "Scope");
    EXPECT_EQ(entry["page"], 2);
    EXPECT_TRUE(entry["page"].is_number_integer());
}

TEST(JsonWriterTest, EmptyOutline) {
    OutlineResult result;
    EXPECT_EQ(outline_to_json(result, false), "{\"title\":\"\",\"outline\":[]}");
}

TEST(JsonWriterTest, CompactOutput) {
    OutlineResult result;
    result.title = "T";
    result.outline = {{HeadingLevel::H2, "Background", 3}};

    EXPECT_EQ(outline_to_json(result, false),
              "{\"title\":\"T\",\"outline\":[{\"level\":\"H2\",\"text\":\"Background\",\"page\":3}]}");
}

TEST(JsonWriterTest, PrettyOutputUsesTwoSpaceIndent) {
    OutlineResult result;
    result.title = "T";
    result.outline = {{HeadingLevel::H1, "A", 1}};

    auto json = outline_to_json(result);
    EXPECT_NE(json.find("\n  \"title\": \"T\""), std::string::npos);
    EXPECT_NE(json.find("\n      \"level\": \"H1\""), std::string::npos);
}

TEST(JsonWriterTest, EscapesAndUtf8SurviveRoundTrip) {
    OutlineResult result;
    result.title = "Quotes \"and\" caf\xC3\xA9";
    result.outline = {{HeadingLevel::H1, "Back\\slash", 1}};

    auto parsed = nlohmann::json::parse(outline_to_json(result));
    EXPECT_EQ(parsed["title"], result.title);
    EXPECT_EQ(parsed["outline"][0]["text"], "Back\\slash");
}

TEST(JsonWriterTest, ErrorRecord) {
    auto parsed = nlohmann::ordered_json::parse(error_to_json("broken.pdf", "not a PDF"));
    EXPECT_EQ(parsed.begin().key(), "file");
    EXPECT_EQ(parsed["file"], "broken.pdf");
    EXPECT_EQ(parsed["error"], "not a PDF");
}

TEST(JsonWriterTest, WriteTextFile) {
    auto path = fs::temp_directory_path() / "pdf_outline_json_writer_test.json";
    write_text_file(path.string(), "{}");

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(content.str(), "{}\n");
    fs::remove(path);
}

TEST(JsonWriterTest, WriteTextFileFailsForMissingDirectory) {
    auto path = fs::temp_directory_path() / "pdf_outline_no_such_dir" / "out.json";
    EXPECT_THROW(write_text_file(path.string(), "{}"), std::runtime_error);
}
