#include <gtest/gtest.h>
#include <ambient/config.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "bugrep_config_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_file(const std::string& rel_path, const std::string& content = "") {
        auto full = test_dir / rel_path;
        fs::create_directories(full.parent_path());
        std::ofstream(full) << content;
    }

    fs::path write_config(const std::string& content) {
        write_file("bugrep.yaml", content);
        return test_dir / "bugrep.yaml";
    }
};

TEST_F(ConfigTest, InlineTemplates) {
    auto path = write_config(
        "owner: u\n"
        "repo: r\n"
        "hyperlinks: never\n"
        "templates:\n"
        "  crash:\n"
        "    title: \"Crash: {err}\"\n"
        "    body: \"Err: {err}\"\n"
        "    labels: [bug, crash]\n");

    auto config = Config::load(path);
    ASSERT_TRUE(config.is_ok()) << config.error;
    EXPECT_EQ(config.value.owner(), "u");
    EXPECT_EQ(config.value.repo(), "r");
    EXPECT_EQ(config.value.hyperlinks(), HyperlinkMode::Never);
    ASSERT_EQ(config.value.templates().size(), 1u);
    EXPECT_EQ(config.value.templates()[0].labels.size(), 2u);

    auto handle = config.value.make_handle();
    ASSERT_TRUE(handle.is_ok()) << handle.error;
    auto url = handle.value.generate_url("crash", {{"err", "NPE"}});
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value,
              "https://github.com/u/r/issues/new?title=Crash%3A%20NPE&body=Err%3A%20NPE&labels=bug%2Ccrash");
}

TEST_F(ConfigTest, FileTemplatesRelativeToConfig) {
    write_file("templates/perf.md",
               "Slow: {operation}\n\nTook {actual}ms\n");
    auto path = write_config(
        "owner: u\n"
        "repo: r\n"
        "templates:\n"
        "  perf:\n"
        "    file: templates/perf.md\n"
        "    labels: performance\n"
        "  short: templates/perf.md\n");

    auto config = Config::load(path);
    ASSERT_TRUE(config.is_ok()) << config.error;
    EXPECT_EQ(config.value.hyperlinks(), HyperlinkMode::Auto);

    auto handle = config.value.make_handle();
    ASSERT_TRUE(handle.is_ok()) << handle.error;
    const auto* perf = handle.value.registry().find("perf");
    ASSERT_NE(perf, nullptr);
    EXPECT_EQ(perf->title, "Slow: {operation}");
    EXPECT_EQ(perf->body, "Took {actual}ms");
    ASSERT_EQ(perf->labels.size(), 1u);
    EXPECT_EQ(perf->labels[0], "performance");
    EXPECT_TRUE(handle.value.registry().contains("short"));
}

TEST_F(ConfigTest, MissingFile) {
    auto config = Config::load(test_dir / "absent.yaml");
    ASSERT_TRUE(config.is_err());
    EXPECT_EQ(config.kind, ErrorKind::FileReadFailed);
}

TEST_F(ConfigTest, MalformedYaml) {
    auto path = write_config("owner: [unterminated\n");
    auto config = Config::load(path);
    ASSERT_TRUE(config.is_err());
    EXPECT_EQ(config.kind, ErrorKind::InvalidConfig);
}

TEST_F(ConfigTest, UnknownHyperlinkMode) {
    auto path = write_config("owner: u\nrepo: r\nhyperlinks: sometimes\n");
    auto config = Config::load(path);
    ASSERT_TRUE(config.is_err());
    EXPECT_EQ(config.kind, ErrorKind::InvalidConfig);
}

TEST_F(ConfigTest, TemplateWithoutTitleOrFile) {
    auto path = write_config("owner: u\nrepo: r\ntemplates:\n  bad:\n    body: only a body\n");
    auto config = Config::load(path);
    ASSERT_TRUE(config.is_err());
    EXPECT_EQ(config.kind, ErrorKind::InvalidConfig);
    EXPECT_EQ(config.subject, "bad");
}

TEST_F(ConfigTest, NonScalarLabelRejected) {
    auto path = write_config(
        "owner: u\n"
        "repo: r\n"
        "templates:\n"
        "  crash:\n"
        "    title: T\n"
        "    labels: [bug, {nested: map}]\n");
    auto config = Config::load(path);
    ASSERT_TRUE(config.is_err());
    EXPECT_EQ(config.kind, ErrorKind::InvalidConfig);
    EXPECT_EQ(config.subject, "crash");

    path = write_config("owner: u\nrepo: r\ntemplates:\n  crash:\n    title: T\n    labels: {a: b}\n");
    config = Config::load(path);
    ASSERT_TRUE(config.is_err());
    EXPECT_EQ(config.kind, ErrorKind::InvalidConfig);
}

TEST_F(ConfigTest, MissingOwnerFailsAtBuild) {
    auto path = write_config("repo: r\ntemplates:\n  t:\n    title: T\n");
    auto config = Config::load(path);
    ASSERT_TRUE(config.is_ok()) << config.error;
    auto handle = config.value.make_handle();
    ASSERT_TRUE(handle.is_err());
    EXPECT_EQ(handle.kind, ErrorKind::EmptyOwnerOrRepo);
}

TEST_F(ConfigTest, MissingTemplateFileFailsAtBuild) {
    auto path = write_config("owner: u\nrepo: r\ntemplates:\n  gone:\n    file: nowhere.md\n");
    auto config = Config::load(path);
    ASSERT_TRUE(config.is_ok());
    auto handle = config.value.make_handle();
    ASSERT_TRUE(handle.is_err());
    EXPECT_EQ(handle.kind, ErrorKind::FileReadFailed);
}

TEST_F(ConfigTest, HyperlinkOverride) {
    auto path = write_config("owner: u\nrepo: r\nhyperlinks: never\n");
    auto config = Config::load(path);
    ASSERT_TRUE(config.is_ok());
    config.value.set_hyperlinks(HyperlinkMode::Always);
    auto handle = config.value.make_handle();
    ASSERT_TRUE(handle.is_ok());
    EXPECT_EQ(handle.value.hyperlink_mode(), HyperlinkMode::Always);
}
