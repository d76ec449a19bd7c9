// sail_tool command line tests

#include <catch2/catch_test_macros.hpp>
#include <sail_engine/tool/cli.hpp>

#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

using namespace sail_tool;

namespace {

const std::string k_main_layout = std::string(SAIL_ENGINE_SOURCE_DIR) + "/assets/ui/main.ron";

const char* k_label = R"(
Label(
    transform: (id: "title", width: 180., height: 30.),
    text: (
        text: "Port",
        font: File("font/square.ttf", ("TTF", ())),
        font_size: 25.,
        color: (1.0, 0.9, 0.6, 1.0),
        align: Middle,
    ),
)
)";

const char* k_label_extra_field = R"(
Label(
    transform: (id: "title", width: 180., height: 30.),
    text: (
        text: "Port",
        font: File("font/square.ttf", ("TTF", ())),
        font_size: 25.,
        color: (1.0, 0.9, 0.6, 1.0),
        align: Middle,
    ),
    shadow: true,
)
)";

struct RunResult {
    int code = -1;
    std::string out;
    std::string err;
};

RunResult run_tool(std::initializer_list<std::string> args) {
    std::vector<std::string> argv{"sail_layout", "--log-level", "off"};
    argv.insert(argv.end(), args.begin(), args.end());

    std::ostringstream out;
    std::ostringstream err;
    RunResult result;
    result.code = run(argv, out, err);
    result.out = out.str();
    result.err = err.str();
    return result;
}

std::size_t count_lines(const std::string& text) {
    std::size_t lines = 0;
    for (char c : text) {
        if (c == '\n') ++lines;
    }
    return lines;
}

class TempDir {
public:
    explicit TempDir(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    std::string write(const std::string& file, const std::string& text) const {
        auto full = m_path / file;
        std::ofstream out(full);
        out << text;
        return full.string();
    }

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

} // anonymous namespace

// =============================================================================
// Exit Codes
// =============================================================================

TEST_CASE("CLI check exit codes", "[tool][cli]") {
    TempDir dir("sail_cli_check");

    SECTION("shipped layout is valid") {
        RunResult r = run_tool({"check", k_main_layout});
        REQUIRE(r.code == k_exit_ok);
        REQUIRE(r.out.find(": OK (") != std::string::npos);
    }

    SECTION("malformed layout") {
        auto path = dir.write("broken.ron", "Label(transform: (width: 1., ");
        RunResult r = run_tool({"check", path});
        REQUIRE(r.code == k_exit_invalid);
        REQUIRE_FALSE(r.err.empty());
        REQUIRE(r.out.empty());
    }

    SECTION("missing layout file") {
        RunResult r = run_tool({"check", (dir.path() / "absent.ron").string()});
        REQUIRE(r.code == k_exit_invalid);
    }

    SECTION("unknown field is an error unless lenient") {
        auto path = dir.write("extra.ron", k_label_extra_field);
        REQUIRE(run_tool({"check", path}).code == k_exit_invalid);
        REQUIRE(run_tool({"--lenient", "check", path}).code == k_exit_ok);
    }

    SECTION("missing asset files with --check-files") {
        auto path = dir.write("label.ron", k_label);
        auto assets = dir.path() / "assets";
        std::filesystem::create_directories(assets);

        REQUIRE(run_tool({"--asset-root", assets.string(), "check", path}).code == k_exit_ok);

        RunResult r = run_tool({"--check-files", "--asset-root", assets.string(), "check", path});
        REQUIRE(r.code == k_exit_invalid);
        REQUIRE(r.err.find("font/square.ttf") != std::string::npos);

        std::filesystem::create_directories(assets / "font");
        dir.write("assets/font/square.ttf", "ttf");
        REQUIRE(run_tool({"--check-files", "--asset-root", assets.string(), "check", path}).code == k_exit_ok);
    }
}

TEST_CASE("CLI usage errors", "[tool][cli]") {
    SECTION("no command") {
        RunResult r = run_tool({});
        REQUIRE(r.code == k_exit_usage);
        REQUIRE(r.err.find("No command specified") != std::string::npos);
    }

    SECTION("unknown command") {
        REQUIRE(run_tool({"lint", k_main_layout}).code == k_exit_usage);
    }

    SECTION("unknown option") {
        REQUIRE(run_tool({"--fast", "check", k_main_layout}).code == k_exit_usage);
    }

    SECTION("option without value") {
        RunResult r = run_tool({"check", k_main_layout, "-o"});
        REQUIRE(r.code == k_exit_usage);
        REQUIRE(r.err.find("Missing value for -o") != std::string::npos);
    }

    SECTION("unknown log level") {
        REQUIRE(run_tool({"--log-level", "loud", "check", k_main_layout}).code == k_exit_usage);
    }

    SECTION("missing configuration file") {
        REQUIRE(run_tool({"--config", "/nonexistent/sail_layout.toml", "check", k_main_layout}).code
                == k_exit_usage);
    }

    SECTION("help and version") {
        RunResult help = run_tool({"--help"});
        REQUIRE(help.code == k_exit_ok);
        REQUIRE(help.out.find("Usage:") != std::string::npos);
        REQUIRE(run_tool({"--version"}).out.find("sail_layout") != std::string::npos);
    }
}

// =============================================================================
// Commands
// =============================================================================

TEST_CASE("CLI output commands", "[tool][cli]") {
    TempDir dir("sail_cli_output");

    SECTION("ids lists every id") {
        RunResult r = run_tool({"ids", k_main_layout});
        REQUIRE(r.code == k_exit_ok);
        REQUIRE(count_lines(r.out) == 19);
        REQUIRE(r.out.rfind("background\n", 0) == 0);
    }

    SECTION("tree starts at the root") {
        RunResult r = run_tool({"tree", k_main_layout});
        REQUIRE(r.code == k_exit_ok);
        REQUIRE(r.out.rfind("Container", 0) == 0);
    }

    SECTION("format output reads back") {
        RunResult r = run_tool({"format", k_main_layout});
        REQUIRE(r.code == k_exit_ok);
        auto path = dir.write("formatted.ron", r.out);
        REQUIRE(run_tool({"check", path}).code == k_exit_ok);
    }

    SECTION("json to stdout") {
        RunResult r = run_tool({"json", k_main_layout});
        REQUIRE(r.code == k_exit_ok);
        REQUIRE(r.out.find("\"root\"") != std::string::npos);
    }

    SECTION("-o writes the file instead of stdout") {
        auto target = dir.path() / "main.json";
        RunResult r = run_tool({"json", k_main_layout, "-o", target.string()});
        REQUIRE(r.code == k_exit_ok);
        REQUIRE(r.out.empty());
        REQUIRE(std::filesystem::is_regular_file(target));
        REQUIRE(std::filesystem::file_size(target) > 0);
    }

    SECTION("unwritable output path") {
        auto target = dir.path() / "no_such_dir" / "main.ron";
        REQUIRE(run_tool({"format", k_main_layout, "--output", target.string()}).code == k_exit_usage);
    }
}
