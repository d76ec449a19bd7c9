/// @file cli.cpp
/// @brief sail_layout command line implementation

#include <sail_engine/tool/cli.hpp>

#include <sail_engine/core/error.hpp>
#include <sail_engine/core/log.hpp>
#include <sail_engine/layout/config.hpp>
#include <sail_engine/layout/json.hpp>
#include <sail_engine/layout/reader.hpp>
#include <sail_engine/layout/validation.hpp>
#include <sail_engine/layout/writer.hpp>

#include <spdlog/fmt/fmt.h>

#include <filesystem>
#include <fstream>
#include <optional>
#include <ostream>

namespace fs = std::filesystem;

namespace sail_tool {

namespace {

// =============================================================================
// Command Line
// =============================================================================

struct CommandLine {
    std::string command;
    fs::path layout_path;
    fs::path config_path;
    fs::path output_path;
    std::optional<std::string> log_level;
    std::optional<fs::path> asset_root;
    bool check_files = false;
    bool lenient = false;
    bool implicit_some = false;
};

void print_usage(std::ostream& os, const std::string& program_name) {
    os << "Usage: " << program_name << " [OPTIONS] <COMMAND> [LAYOUT]\n"
       << "\n"
       << "Commands:\n"
       << "  check           Decode and validate the layout\n"
       << "  format          Print the layout in canonical RON form\n"
       << "  json            Print the layout as JSON\n"
       << "  ids             List node ids in document order\n"
       << "  tree            Print the node hierarchy\n"
       << "\n"
       << "Arguments:\n"
       << "  LAYOUT          Layout file (.ron), defaults to [layout] default_layout\n"
       << "\n"
       << "Options:\n"
       << "  --config <file>      Configuration file (default: " << k_default_config << ")\n"
       << "  --log-level <level>  trace, debug, info, warn, error, critical, off\n"
       << "  --asset-root <dir>   Directory asset paths are relative to\n"
       << "  --check-files        Require every referenced asset file to exist\n"
       << "  --lenient            Skip unknown fields instead of failing\n"
       << "  --implicit-some      Write optional values without Some(...) (format)\n"
       << "  --output, -o <file>  Write format/json output to a file\n"
       << "  --help, -h           Show this help message\n"
       << "  --version, -v        Show version information\n"
       << "\n"
       << "Examples:\n"
       << "  " << program_name << " check assets/ui/main.ron\n"
       << "  " << program_name << " --check-files --asset-root assets check assets/ui/main.ron\n"
       << "  " << program_name << " json assets/ui/main.ron -o main.json\n";
}

void print_version(std::ostream& os) {
    os << "sail_layout 0.1.0\n"
       << "sail_engine HUD layout tool\n";
}

bool is_command(const std::string& arg) {
    return arg == "check" || arg == "format" || arg == "json" || arg == "ids" || arg == "tree";
}

/// Returns an exit code when the program should stop right away
std::optional<int> parse_args(const std::vector<std::string>& args, CommandLine& cli,
                              std::ostream& out, std::ostream& err) {
    const std::string program_name = args.empty() ? "sail_layout" : args.front();

    auto next_value = [&](std::size_t& i, const std::string& option) -> std::optional<std::string> {
        if (i + 1 >= args.size()) {
            err << "Missing value for " << option << "\n";
            return std::nullopt;
        }
        return args[++i];
    };

    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(out, program_name);
            return k_exit_ok;
        } else if (arg == "--version" || arg == "-v") {
            print_version(out);
            return k_exit_ok;
        } else if (arg == "--config") {
            auto v = next_value(i, arg);
            if (!v) return k_exit_usage;
            cli.config_path = *v;
        } else if (arg == "--log-level") {
            auto v = next_value(i, arg);
            if (!v) return k_exit_usage;
            cli.log_level = *v;
        } else if (arg == "--asset-root") {
            auto v = next_value(i, arg);
            if (!v) return k_exit_usage;
            cli.asset_root = fs::path(*v);
        } else if (arg == "--output" || arg == "-o") {
            auto v = next_value(i, arg);
            if (!v) return k_exit_usage;
            cli.output_path = *v;
        } else if (arg == "--check-files") {
            cli.check_files = true;
        } else if (arg == "--lenient") {
            cli.lenient = true;
        } else if (arg == "--implicit-some") {
            cli.implicit_some = true;
        } else if (!arg.empty() && arg[0] != '-') {
            if (cli.command.empty()) {
                if (!is_command(arg)) {
                    err << "Unknown command: " << arg << "\n";
                    print_usage(err, program_name);
                    return k_exit_usage;
                }
                cli.command = arg;
            } else if (cli.layout_path.empty()) {
                cli.layout_path = arg;
            } else {
                err << "Unexpected argument: " << arg << "\n";
                return k_exit_usage;
            }
        } else {
            err << "Unknown option: " << arg << "\n";
            print_usage(err, program_name);
            return k_exit_usage;
        }
    }

    if (cli.command.empty()) {
        err << "Error: No command specified.\n\n";
        print_usage(err, program_name);
        return k_exit_usage;
    }
    return std::nullopt;
}

// =============================================================================
// Output
// =============================================================================

bool emit(const std::string& text, const fs::path& output_path, std::ostream& out) {
    if (output_path.empty()) {
        out << text;
        return true;
    }

    std::ofstream file(output_path);
    if (!file.is_open()) {
        sail_core::tool_logger()->error("Cannot write {}", output_path.string());
        return false;
    }
    file << text;
    sail_core::tool_logger()->info("Wrote {}", output_path.string());
    return true;
}

void print_tree(const sail_layout::LayoutDocument& doc, std::ostream& out) {
    if (doc.empty()) {
        return;
    }
    doc.root().visit([&out](const sail_layout::Node& node, std::size_t depth) {
        std::string line(depth * 2, ' ');
        line += sail_layout::node_kind_name(node.kind());
        if (!node.id().empty()) {
            line += " \"" + node.id() + "\"";
        }
        const auto& t = node.transform();
        line += fmt::format(" [{} {}x{} @ ({}, {}, {})]",
                            sail_layout::anchor_name(t.anchor), t.width, t.height, t.x, t.y, t.z);
        if (const auto* label = node.as_label()) {
            line += " text=\"" + label->text + "\"";
        } else if (const auto* button = node.as_button()) {
            line += " text=\"" + button->text + "\"";
        }
        out << line << "\n";
    });
}

int report_validation(const sail_layout::ValidationResult& result, const sail_layout::LayoutDocument& doc,
                      const fs::path& layout_path, std::ostream& out, std::ostream& err) {
    for (const auto& issue : result.issues) {
        err << layout_path.string() << ": " << issue.to_string() << "\n";
    }

    if (!result.valid) {
        err << layout_path.string() << ": " << result.error_count() << " error(s), "
            << result.warning_count() << " warning(s)\n";
        return k_exit_invalid;
    }

    out << layout_path.string() << ": OK (" << doc.node_count() << " nodes, "
        << doc.ids().size() << " ids, " << result.warning_count() << " warning(s))\n";
    return k_exit_ok;
}

} // namespace

// =============================================================================
// Run
// =============================================================================

int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    CommandLine cli;
    if (auto exit_code = parse_args(args, cli, out, err)) {
        return *exit_code;
    }

    // Load configuration
    sail_layout::LayoutConfig config;
    fs::path config_path = cli.config_path;
    if (config_path.empty() && fs::is_regular_file(k_default_config)) {
        config_path = k_default_config;
    }
    if (!config_path.empty()) {
        sail_layout::ConfigParser parser;
        auto loaded = parser.parse(config_path);
        if (!loaded) {
            err << sail_core::build_error_chain(loaded.error()) << "\n";
            return k_exit_usage;
        }
        config = std::move(*loaded);
    }

    // Command line overrides
    if (cli.log_level) {
        auto level = sail_core::parse_log_level(*cli.log_level);
        if (!level) {
            err << "Unknown log level: " << *cli.log_level << "\n";
            return k_exit_usage;
        }
        config.log_level = *level;
    }
    if (cli.asset_root) config.asset_root = *cli.asset_root;
    if (cli.check_files) config.check_asset_files = true;
    if (cli.lenient) config.strict_fields = false;

    sail_core::configure_logging(config.log_config());

    fs::path layout_path = cli.layout_path.empty() ? config.default_layout : cli.layout_path;
    if (layout_path.empty()) {
        err << "Error: No layout file specified.\n\n";
        print_usage(err, args.empty() ? "sail_layout" : args.front());
        return k_exit_usage;
    }

    // Load layout
    sail_core::tool_logger()->debug("{} {}", cli.command, layout_path.string());
    sail_layout::LayoutReader reader(config.reader_options());
    auto loaded = reader.read_file(layout_path);
    if (!loaded) {
        err << sail_core::build_error_chain(loaded.error()) << "\n";
        return k_exit_invalid;
    }
    const sail_layout::LayoutDocument& doc = *loaded;

    SAIL_LOG_SCOPE(cli.command);
    if (cli.command == "check") {
        sail_layout::LayoutValidator validator(config.validator_options());
        return report_validation(validator.validate(doc), doc, layout_path, out, err);
    }
    if (cli.command == "format") {
        sail_layout::LayoutWriterOptions options;
        if (cli.implicit_some) {
            options.implicit_some = true;
        }
        sail_layout::LayoutWriter writer(options);
        return emit(writer.write(doc), cli.output_path, out) ? k_exit_ok : k_exit_usage;
    }
    if (cli.command == "json") {
        try {
            return emit(sail_layout::to_json(doc).dump(2) + "\n", cli.output_path, out)
                ? k_exit_ok : k_exit_usage;
        } catch (const nlohmann::json::exception& e) {
            err << layout_path.string() << ": cannot export JSON: " << e.what() << "\n";
            return k_exit_invalid;
        }
    }
    if (cli.command == "ids") {
        for (const auto& id : doc.ids()) {
            out << id << "\n";
        }
        return k_exit_ok;
    }
    print_tree(doc, out);
    return k_exit_ok;
}

} // namespace sail_tool
