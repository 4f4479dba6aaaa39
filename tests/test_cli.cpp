#include <gtest/gtest.h>
#include <cli/args.hpp>
#include <cli/prompt_merge_cli.hpp>
#include <cli/theme.hpp>
#include <core/constants.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <deque>
#include <unistd.h>

namespace fs = std::filesystem;

// ── parse_args ──────────────────────────────────────────────

TEST(ParseArgs, DefaultsToInteractive) {
    auto r = parse_args({});
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.interactive());
    EXPECT_FALSE(r.value.list);
    EXPECT_FALSE(r.value.output.has_value());
}

TEST(ParseArgs, GoIsAccepted) {
    auto r = parse_args({"go", "-o", "out.md"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.output.value(), "out.md");
}

TEST(ParseArgs, ListAndInlineValues) {
    auto r = parse_args({"--list", "--root=/tmp/t", "--output=x.md"});
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.list);
    EXPECT_EQ(r.value.root.value(), "/tmp/t");
    EXPECT_EQ(r.value.output.value(), "x.md");
}

TEST(ParseArgs, SelectIsRepeatableAndOrdered) {
    auto r = parse_args({"-s", "b.md", "--select", "a.md"});
    ASSERT_TRUE(r.is_ok());
    std::vector<std::string> expected = {"b.md", "a.md"};
    EXPECT_EQ(r.value.select, expected);
    EXPECT_FALSE(r.value.interactive());
}

TEST(ParseArgs, UnknownFlagIsUsageError) {
    auto r = parse_args({"--frobnicate"});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Usage);
}

TEST(ParseArgs, MissingValueIsUsageError) {
    auto r = parse_args({"-o"});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Usage);
}

TEST(ParseArgs, UnexpectedPositionalIsUsageError) {
    auto r = parse_args({"merge"});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Usage);
}

TEST(ParseArgs, ValueOnBooleanFlagIsUsageError) {
    auto r = parse_args({"--list=yes"});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Usage);
}

TEST(ExitCodes, DistinctPerFailureClass) {
    EXPECT_EQ(exit_code_for(ErrorKind::None), 0);
    EXPECT_EQ(exit_code_for(ErrorKind::Usage), 2);
    EXPECT_EQ(exit_code_for(ErrorKind::Configuration), PM_EXIT_CONFIG_ERROR);
    EXPECT_EQ(exit_code_for(ErrorKind::IO), PM_EXIT_IO_ERROR);
    EXPECT_EQ(exit_code_for(ErrorKind::Validation), PM_EXIT_VALIDATION);
    EXPECT_NE(PM_EXIT_CONFIG_ERROR, PM_EXIT_IO_ERROR);
    EXPECT_NE(PM_EXIT_IO_ERROR, PM_EXIT_VALIDATION);
}

// ── End-to-end through PromptMergeCLI ───────────────────────

namespace {

class ScriptedKeys : public KeySource {
public:
    explicit ScriptedKeys(std::deque<Key> keys) : keys_(std::move(keys)) {}

    Key next_key() override {
        if (keys_.empty()) return Key::Cancel;
        Key k = keys_.front();
        keys_.pop_front();
        return k;
    }

private:
    std::deque<Key> keys_;
};

} // namespace

class CliTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path root;
    std::ostringstream out;
    std::ostringstream err;

    void SetUp() override {
        theme::color_enabled() = false;
        theme::stderr_color_enabled() = false;
        test_dir = fs::temp_directory_path() /
                   ("prompt_merge_cli_test_" + std::to_string(getpid()));
        fs::remove_all(test_dir);
        root = test_dir / "templates";
        fs::create_directories(root);
        fs::create_directories(test_dir / "work");

        write_template("a/one.md", "# One\n");
        write_template("b/two.md", "# Two\n");
        write_template("base.md", "# Base\n");
        write_template("README.md", "# Not a template\n");
    }

    void TearDown() override {
        theme::color_enabled() = true;
        theme::stderr_color_enabled() = true;
        fs::remove_all(test_dir);
    }

    void write_template(const std::string& rel_path, const std::string& content) {
        auto full = root / rel_path;
        fs::create_directories(full.parent_path());
        std::ofstream(full) << content;
    }

    int run(std::vector<std::string> args, KeySource* keys = nullptr) {
        PromptMergeCLI cli(out, err);
        cli.set_project_dir(test_dir / "work");
        cli.set_global_config_path(test_dir / "no-global.yaml");
        cli.set_key_source(keys);
        return cli.run(args);
    }

    static std::string slurp(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    // Indented lines of --list output are the entries
    std::vector<std::string> listed_paths() {
        std::vector<std::string> paths;
        std::istringstream in(out.str());
        std::string line;
        while (std::getline(in, line)) {
            if (line.rfind("  ", 0) == 0 && line.size() > 2 && line[2] != ' ') {
                std::string rest = line.substr(2);
                paths.push_back(rest.substr(0, rest.find(' ')));
            }
        }
        return paths;
    }
};

TEST_F(CliTest, ListPrintsEveryTemplateOnceInPathOrder) {
    int code = run({"--list", "--root", root.string()});
    EXPECT_EQ(code, 0);

    std::vector<std::string> expected = {"a/one.md", "b/two.md", "base.md"};
    EXPECT_EQ(listed_paths(), expected);
    EXPECT_NE(out.str().find("[BASE]"), std::string::npos);
    EXPECT_NE(out.str().find("Total: 3 template(s)"), std::string::npos);
    EXPECT_TRUE(err.str().empty());
}

TEST_F(CliTest, ListGroupsByDirectory) {
    run({"--list", "--root", root.string()});
    const std::string s = out.str();

    auto group_a = s.find("\na\n");
    auto entry_a = s.find("  a/one.md");
    auto group_root = s.find("\n(root)\n");
    ASSERT_NE(group_a, std::string::npos);
    ASSERT_NE(group_root, std::string::npos);
    EXPECT_LT(group_a, entry_a);
    EXPECT_LT(entry_a, group_root);
}

TEST_F(CliTest, ListPrintsEachGroupOnce) {
    fs::path nested = test_dir / "nested";
    for (const char* rel : {"a/a.md", "a/b/y.md", "a/x.md", "a/z.md"}) {
        auto full = nested / rel;
        fs::create_directories(full.parent_path());
        std::ofstream(full) << "# T\n";
    }

    ASSERT_EQ(run({"--list", "--root", nested.string()}), 0) << err.str();
    const std::string s = out.str();

    size_t headers_a = 0;
    std::istringstream in(s);
    std::string line;
    while (std::getline(in, line)) {
        if (line == "a") headers_a++;
    }
    EXPECT_EQ(headers_a, 1u);

    std::vector<std::string> expected = {"a/a.md", "a/x.md", "a/z.md", "a/b/y.md"};
    EXPECT_EQ(listed_paths(), expected);
    EXPECT_LT(s.find("\na\n"), s.find("\na/b\n"));
}

TEST_F(CliTest, ListEmptyRootSucceeds) {
    fs::create_directories(test_dir / "empty");
    int code = run({"--list", "--root", (test_dir / "empty").string()});

    EXPECT_EQ(code, 0);
    EXPECT_NE(err.str().find("No templates available"), std::string::npos);
}

TEST_F(CliTest, MissingRootIsConfigurationErrorInBothModes) {
    fs::path missing = test_dir / "does-not-exist";

    EXPECT_EQ(run({"--list", "--root", missing.string()}), PM_EXIT_CONFIG_ERROR);
    EXPECT_NE(err.str().find(missing.string()), std::string::npos);

    err.str("");
    ScriptedKeys keys({Key::Toggle, Key::Confirm});
    EXPECT_EQ(run({"--root", missing.string()}, &keys), PM_EXIT_CONFIG_ERROR);
    EXPECT_NE(err.str().find(missing.string()), std::string::npos);
}

TEST_F(CliTest, UnknownFlagExitsTwoWithUsage) {
    EXPECT_EQ(run({"--bogus"}), 2);
    EXPECT_NE(err.str().find("Unknown option: --bogus"), std::string::npos);
    EXPECT_NE(err.str().find("Usage"), std::string::npos);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(CliTest, InteractiveMergeWritesSelectionOrder) {
    fs::path output = test_dir / "work" / "CLAUDE.md";
    // Catalog: a/one.md, b/two.md, base.md
    ScriptedKeys keys({Key::Toggle, Key::Down, Key::Toggle, Key::Confirm});

    int code = run({"--root", root.string(), "-o", output.string()}, &keys);
    ASSERT_EQ(code, 0) << err.str();

    std::string text = slurp(output);
    auto one = text.find("<!-- prompt-merge:source a/one.md -->\n# One\n");
    auto two = text.find("<!-- prompt-merge:source b/two.md -->\n# Two\n");
    ASSERT_NE(one, std::string::npos);
    ASSERT_NE(two, std::string::npos);
    EXPECT_LT(one, two);
    EXPECT_NE(out.str().find("Merged 2 template(s)"), std::string::npos);
}

TEST_F(CliTest, CancelExitsZeroAndWritesNothing) {
    fs::path output = test_dir / "work" / "CLAUDE.md";
    ScriptedKeys keys({Key::Toggle, Key::Down, Key::Cancel});

    int code = run({"--root", root.string(), "-o", output.string()}, &keys);

    EXPECT_EQ(code, 0);
    EXPECT_FALSE(fs::exists(output));
}

TEST_F(CliTest, ConfirmIgnoredUntilSomethingSelected) {
    fs::path output = test_dir / "work" / "CLAUDE.md";
    ScriptedKeys keys({Key::Confirm, Key::Confirm, Key::Down, Key::Toggle, Key::Confirm});

    int code = run({"--root", root.string(), "-o", output.string()}, &keys);
    ASSERT_EQ(code, 0) << err.str();

    std::string text = slurp(output);
    EXPECT_NE(text.find("<!-- prompt-merge:source b/two.md -->"), std::string::npos);
    EXPECT_EQ(text.find("<!-- prompt-merge:source a/one.md -->"), std::string::npos);
}

TEST_F(CliTest, NonInteractiveSelect) {
    fs::path output = test_dir / "work" / "out.md";

    int code = run({"--root", root.string(), "-o", output.string(),
                    "-s", "b/two.md", "-s", "./a/one.md"});
    ASSERT_EQ(code, 0) << err.str();

    std::string text = slurp(output);
    EXPECT_LT(text.find("source b/two.md"), text.find("source a/one.md"));
}

TEST_F(CliTest, DuplicateSelectIsValidationError) {
    fs::path output = test_dir / "work" / "out.md";

    int code = run({"--root", root.string(), "-o", output.string(),
                    "-s", "a/one.md", "-s", "a/one.md"});

    EXPECT_EQ(code, PM_EXIT_VALIDATION);
    EXPECT_FALSE(fs::exists(output));
}

TEST_F(CliTest, UnwritableOutputIsIOError) {
    fs::path output = test_dir / "no" / "such" / "dir" / "out.md";

    int code = run({"--root", root.string(), "-o", output.string(), "-s", "a/one.md"});

    EXPECT_EQ(code, PM_EXIT_IO_ERROR);
    EXPECT_FALSE(fs::exists(output));
    EXPECT_NE(err.str().find("does not exist"), std::string::npos);
}

TEST_F(CliTest, StdoutOutputKeepsSummaryOnStderr) {
    int code = run({"--root", root.string(), "-o", "-", "-s", "a/one.md", "--no-header"});
    ASSERT_EQ(code, 0) << err.str();

    EXPECT_EQ(out.str(), "<!-- prompt-merge:source a/one.md -->\n# One\n");
    EXPECT_NE(err.str().find("Merged 1 template(s) into stdout"), std::string::npos);
}

TEST_F(CliTest, EmptyCatalogMergeIsConfigurationError) {
    fs::create_directories(test_dir / "empty");
    ScriptedKeys keys({Key::Confirm});

    int code = run({"--root", (test_dir / "empty").string()}, &keys);
    EXPECT_EQ(code, PM_EXIT_CONFIG_ERROR);
    EXPECT_NE(err.str().find("No templates available"), std::string::npos);
}

TEST_F(CliTest, ProjectConfigSuppliesRoot) {
    std::ofstream(test_dir / "work" / "prompt-merge.yaml")
        << "templates_dir: ../templates\nheader: false\n";

    int code = run({"--list"});
    EXPECT_EQ(code, 0) << err.str();

    std::vector<std::string> expected = {"a/one.md", "b/two.md", "base.md"};
    EXPECT_EQ(listed_paths(), expected);
}

TEST_F(CliTest, HelpAndVersion) {
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_NE(out.str().find("--select"), std::string::npos);

    out.str("");
    EXPECT_EQ(run({"--version"}), 0);
    EXPECT_NE(out.str().find(PROMPT_MERGE_VERSION), std::string::npos);
}

TEST_F(CliTest, StderrColourFollowsItsOwnSwitch) {
    theme::color_enabled() = true;
    theme::stderr_color_enabled() = false;
    EXPECT_EQ(run({"--list", "--root", (test_dir / "missing").string()}), PM_EXIT_CONFIG_ERROR);
    EXPECT_EQ(err.str().find("\033["), std::string::npos);
    EXPECT_TRUE(theme::color_enabled());

    err.str("");
    theme::color_enabled() = false;
    theme::stderr_color_enabled() = true;
    EXPECT_EQ(run({"--list", "--root", (test_dir / "missing").string()}), PM_EXIT_CONFIG_ERROR);
    EXPECT_NE(err.str().find("\033["), std::string::npos);
    EXPECT_FALSE(theme::color_enabled());
}

TEST_F(CliTest, StdoutDocumentStaysPlainWithColouredSummary) {
    theme::stderr_color_enabled() = true;
    int code = run({"--root", root.string(), "-o", "-", "-s", "a/one.md", "--no-header"});
    ASSERT_EQ(code, 0) << err.str();

    EXPECT_EQ(out.str(), "<!-- prompt-merge:source a/one.md -->\n# One\n");
    EXPECT_NE(err.str().find(theme::color::GREEN), std::string::npos);
}
