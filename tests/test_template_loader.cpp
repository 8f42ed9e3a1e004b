#include <gtest/gtest.h>
#include <platform/template_loader.hpp>
#include <platform/terminal.hpp>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <optional>
#include <vector>

namespace fs = std::filesystem;

class TemplateLoaderTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "bugrep_loader_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_file(const std::string& name, const std::string& content) {
        auto full = test_dir / name;
        std::ofstream(full, std::ios::binary) << content;
        return full;
    }
};

TEST_F(TemplateLoaderTest, LoadsAndKeepsLabels) {
    auto path = write_file("crash.md", "Crash: {error_type}\n\n## Context\n- Line: {line}\n");
    auto f = platform::load_template_file(path, {"bug", "crash"});
    ASSERT_TRUE(f.is_ok()) << f.error;
    EXPECT_EQ(f.value.labels.size(), 2u);

    auto t = f.value.parse();
    ASSERT_TRUE(t.is_ok());
    EXPECT_EQ(t.value.title, "Crash: {error_type}");
    EXPECT_EQ(t.value.body, "## Context\n- Line: {line}");
}

TEST_F(TemplateLoaderTest, MissingFile) {
    auto f = platform::load_template_file(test_dir / "nope.md");
    ASSERT_TRUE(f.is_err());
    EXPECT_EQ(f.kind, ErrorKind::FileReadFailed);
}

TEST_F(TemplateLoaderTest, BlankFileInvalid) {
    auto path = write_file("blank.md", "\n\n   \n");
    auto f = platform::load_template_file(path);
    ASSERT_TRUE(f.is_err());
    EXPECT_EQ(f.kind, ErrorKind::InvalidTemplateFile);
    EXPECT_NE(f.error.find("blank.md"), std::string::npos);
}

// ── terminal capability probe ───────────────────────────────

class TerminalProbeTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : {"TERM", "TERM_PROGRAM", "VSCODE_INJECTION"}) {
            auto v = platform::env_var(name);
            saved.emplace_back(name, v);
            unsetenv(name);
        }
    }

    void TearDown() override {
        for (auto& [name, v] : saved) {
            if (v) setenv(name.c_str(), v->c_str(), 1);
            else unsetenv(name.c_str());
        }
    }

    std::vector<std::pair<std::string, std::optional<std::string>>> saved;
};

TEST_F(TerminalProbeTest, UnknownTerminal) {
    setenv("TERM", "dumb", 1);
    EXPECT_FALSE(platform::terminal_supports_hyperlinks());
}

TEST_F(TerminalProbeTest, XtermFamily) {
    setenv("TERM", "xterm-256color", 1);
    EXPECT_TRUE(platform::terminal_supports_hyperlinks());
    setenv("TERM", "tmux-256color", 1);
    EXPECT_TRUE(platform::terminal_supports_hyperlinks());
}

TEST_F(TerminalProbeTest, TermProgram) {
    setenv("TERM_PROGRAM", "WezTerm", 1);
    EXPECT_TRUE(platform::terminal_supports_hyperlinks());
    setenv("TERM_PROGRAM", "Apple_Terminal", 1);
    EXPECT_FALSE(platform::terminal_supports_hyperlinks());
}

TEST_F(TerminalProbeTest, VsCode) {
    setenv("VSCODE_INJECTION", "1", 1);
    EXPECT_TRUE(platform::terminal_supports_hyperlinks());
}
