#include <gtest/gtest.h>
#include "test_support.hpp"
#include <sys/stat.h>
#include <regex>

using namespace mcpfs;
using mcpfs::testing::ToolHarness;

class InfoToolsTest : public ::testing::Test {
protected:
    ToolHarness h;
};

TEST_F(InfoToolsTest, FileInfoForFile) {
    std::string path = h.tmp.write("root/f.txt", "12345");
    ASSERT_EQ(::chmod(path.c_str(), 0640), 0);
    std::string text = h.ok_text("get_file_info", {{"path", path}});

    EXPECT_NE(text.find("size: 5\n"), std::string::npos) << text;
    EXPECT_NE(text.find("isDirectory: false\n"), std::string::npos) << text;
    EXPECT_NE(text.find("isFile: true\n"), std::string::npos) << text;
    EXPECT_NE(text.find("permissions: 640"), std::string::npos) << text;

    const std::regex stamp(R"(modified: \d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}(Z|[+-]\d{2}:\d{2})\n)");
    EXPECT_TRUE(std::regex_search(text, stamp)) << text;
    EXPECT_NE(text.find("created: "), std::string::npos);
    EXPECT_NE(text.find("accessed: "), std::string::npos);
}

TEST_F(InfoToolsTest, FileInfoForDirectory) {
    std::string text = h.ok_text("get_file_info", {{"path", h.root}});
    EXPECT_NE(text.find("isDirectory: true\n"), std::string::npos) << text;
    EXPECT_NE(text.find("isFile: false\n"), std::string::npos) << text;
}

TEST_F(InfoToolsTest, FileInfoMissing) {
    std::string path = h.root + "/nope";
    std::string text = h.error_text("get_file_info", {{"path", path}});
    EXPECT_EQ(text.rfind("Error: get_file_info " + path + ": ", 0), 0u) << text;
}

TEST_F(InfoToolsTest, ListAllowedDirectories) {
    EXPECT_EQ(h.ok_text("list_allowed_directories", nlohmann::json::object()),
              "Allowed directories:\n" + h.root);
}

TEST(ToolCatalogue, ElevenToolsInFixedOrder) {
    ToolHarness h;
    auto tools = h.registry.list();
    const std::vector<std::string> expected = {
        "read_file", "read_multiple_files", "write_file", "edit_file",
        "create_directory", "list_directory", "directory_tree", "move_file",
        "search_files", "get_file_info", "list_allowed_directories",
    };
    ASSERT_EQ(tools.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(tools[i].name, expected[i]);
        EXPECT_FALSE(tools[i].description.empty()) << tools[i].name;
        EXPECT_EQ(tools[i].input_schema["type"], "object") << tools[i].name;
    }
}
