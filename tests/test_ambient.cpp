#include <gtest/gtest.h>
#include <ambient/ambient.hpp>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

// The ambient slot can only be filled once per process. Every test that needs
// it installs the same configuration and tolerates AlreadyInitialized, so the
// suite passes whether tests share one process or each get their own.
static ReportBuilder canonical_builder() {
    ReportBuilder b("u", "r");
    b.add_template("crash", IssueTemplate("Crash: {err}", "Err: {err}"))
     .hyperlinks(HyperlinkMode::Never);
    return b;
}

static void ensure_installed() {
    auto r = ambient::install(canonical_builder());
    ASSERT_TRUE(r.is_ok() || r.kind == ErrorKind::AlreadyInitialized) << r.error;
}

TEST(Ambient, ReportBeforeInstallIsEmpty) {
    if (ambient::installed()) GTEST_SKIP() << "ambient already installed in this process";

    auto sink = std::make_shared<StringSink>();
    ambient::set_sink(sink);
    EXPECT_EQ(BUGREP_REPORT("crash", {"err", "NPE"}), "");
    EXPECT_EQ(sink->str(), "");

    auto url = ambient::generate_url("crash", {{"err", "NPE"}});
    ASSERT_TRUE(url.is_err());
    EXPECT_EQ(url.kind, ErrorKind::NotInitialized);
    ambient::set_sink(nullptr);
}

TEST(Ambient, InvalidBuilderLeavesSlotFree) {
    if (ambient::installed()) GTEST_SKIP() << "ambient already installed in this process";

    auto r = ambient::install(ReportBuilder("", "r"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::EmptyOwnerOrRepo);
    EXPECT_FALSE(ambient::installed());
}

TEST(Ambient, EmptyHandleLeavesSlotFree) {
    if (ambient::installed()) GTEST_SKIP() << "ambient already installed in this process";

    auto r = ambient::install(ReportHandle{});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::EmptyOwnerOrRepo);
    EXPECT_FALSE(ambient::installed());

    // A valid configuration can still claim the slot afterwards
    auto ok = ambient::install(canonical_builder());
    ASSERT_TRUE(ok.is_ok()) << ok.error;
    EXPECT_EQ(ambient::handle()->owner(), "u");
}

TEST(Ambient, SecondInstallFailsFirstKept) {
    ensure_installed();

    ReportBuilder other("someone", "else");
    other.add_template("crash", IssueTemplate("Other", "other"));
    auto r = ambient::install(other);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::AlreadyInitialized);

    ASSERT_NE(ambient::handle(), nullptr);
    EXPECT_EQ(ambient::handle()->owner(), "u");
    EXPECT_EQ(ambient::handle()->repo(), "r");
    EXPECT_EQ(ambient::handle()->registry().find("crash")->title, "Crash: {err}");
}

TEST(Ambient, ConcurrentInstallExactlyOneWins) {
    bool was_installed = ambient::installed();

    std::atomic<int> ok{0};
    std::atomic<int> already{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&] {
            auto r = ambient::install(canonical_builder());
            if (r.is_ok()) ok++;
            else if (r.kind == ErrorKind::AlreadyInitialized) already++;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(ok.load(), was_installed ? 0 : 1);
    EXPECT_EQ(ok.load() + already.load(), 8);
    ASSERT_NE(ambient::handle(), nullptr);
    EXPECT_EQ(ambient::handle()->owner(), "u");
}

TEST(Ambient, GenerateUrl) {
    ensure_installed();
    auto r = ambient::generate_url("crash", {{"err", "NPE"}});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "https://github.com/u/r/issues/new?title=Crash%3A%20NPE&body=Err%3A%20NPE");
}

TEST(Ambient, ReportWritesToInjectedSink) {
    ensure_installed();
    auto sink = std::make_shared<StringSink>();
    ambient::set_sink(sink);

    std::string url = BUGREP_REPORT("crash", {"err", "NPE"});
    EXPECT_EQ(url, "https://github.com/u/r/issues/new?title=Crash%3A%20NPE&body=Err%3A%20NPE");
    EXPECT_NE(sink->str().find("test_ambient.cpp:"), std::string::npos);
    EXPECT_NE(sink->str().find("   Template: crash\n"), std::string::npos);
    EXPECT_NE(sink->str().find("File a bug report: " + url), std::string::npos);

    ambient::set_sink(nullptr);
}

TEST(Ambient, FailuresDegradeToEmpty) {
    ensure_installed();
    auto sink = std::make_shared<StringSink>();
    ambient::set_sink(sink);

    EXPECT_EQ(BUGREP_REPORT("crash"), "");
    EXPECT_NE(sink->str().find("Error generating bug report: Missing required parameter 'err'"),
              std::string::npos);

    sink->clear();
    EXPECT_EQ(BUGREP_REPORT("no_such_template", {"err", "x"}), "");
    EXPECT_NE(sink->str().find("Template 'no_such_template' not found"), std::string::npos);

    ambient::set_sink(nullptr);
}
