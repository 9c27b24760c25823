// diagram_forge: JSON diagram description in, draw.io XML out (C++20)

#include <diagram_loaders/json_loader.hpp>
#include <diagram_loaders/sample_diagram.hpp>
#include <diagram_model/errors.hpp>
#include <diagram_model/log.hpp>
#include <diagram_render/drawio_writer.hpp>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct Options {
    std::string input;      // empty = stdin
    std::string output;     // empty = stdout
    std::string config;     // empty = search default locations
    std::string log_file;
    std::optional<diagram_model::Theme> theme;
    bool sample = false;
    bool verbose = false;
    bool quiet = false;
};

void print_usage() {
    (void)fprintf(stderr,
        "usage: diagram_forge [input.json] [--output file.drawio] [--config style_config.json]\n"
        "                     [--theme light|dark] [--sample] [--log-file path] [--verbose|--quiet]\n"
        "Reads the diagram from stdin when no input file is given and writes the\n"
        "document to stdout when no output file is given.\n");
}

int exit_code(diagram_model::ErrorKind kind) {
    switch (kind) {
    case diagram_model::ErrorKind::Schema: return 2;
    case diagram_model::ErrorKind::Layout: return 3;
    case diagram_model::ErrorKind::Style: return 4;
    case diagram_model::ErrorKind::Config: return 5;
    }
    return 1;
}

// Returns false (after printing usage) on a malformed command line.
bool parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };
        if (arg == "--output" || arg == "-o") {
            if (!value(opts.output)) return false;
        } else if (arg == "--config") {
            if (!value(opts.config)) return false;
        } else if (arg == "--log-file") {
            if (!value(opts.log_file)) return false;
        } else if (arg == "--theme") {
            std::string tag;
            if (!value(tag)) return false;
            opts.theme = diagram_model::theme_from_string(tag);
            if (!opts.theme) {
                (void)fprintf(stderr, "unknown theme: %s\n", tag.c_str());
                return false;
            }
        } else if (arg == "--sample") {
            opts.sample = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--quiet" || arg == "-q") {
            opts.quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else if (!arg.empty() && arg[0] == '-') {
            (void)fprintf(stderr, "unknown option: %s\n", arg.c_str());
            return false;
        } else if (opts.input.empty()) {
            opts.input = arg;
        } else {
            (void)fprintf(stderr, "unexpected argument: %s\n", arg.c_str());
            return false;
        }
    }
    return true;
}

std::optional<diagram_model::StyleConfig> load_config(const std::string& explicit_path) {
    if (!explicit_path.empty())
        return diagram_loaders::load_style_config_from_json_file(explicit_path);
    const char* config_paths[] = { "data/style_config.json", "style_config.json" };
    for (const char* path : config_paths) {
        auto loaded = diagram_loaders::load_style_config_from_json_file(path);
        if (loaded) return loaded;
    }
    return std::nullopt;
}

} // namespace

int main(int argc, char* argv[])
{
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return 1;
    }

    auto log = diagram_model::engine_logger();
    if (opts.verbose) log->set_level(spdlog::level::debug);
    else if (opts.quiet) log->set_level(spdlog::level::warn);
    if (!opts.log_file.empty() && !diagram_model::attach_log_file(opts.log_file))
        return 1;

    try {
        auto config = load_config(opts.config);
        if (!config) {
            log->error("style configuration not found{}{}",
                opts.config.empty() ? "" : ": ", opts.config);
            return 1;
        }

        diagram_model::Diagram diagram;
        if (opts.sample) {
            diagram = diagram_loaders::generate_sample_diagram();
        } else if (!opts.input.empty()) {
            auto loaded = diagram_loaders::load_diagram_from_json_file(opts.input);
            if (!loaded) {
                log->error("cannot open input file: {}", opts.input);
                return 1;
            }
            diagram = std::move(*loaded);
        } else {
            diagram = diagram_loaders::load_diagram_from_json(std::cin);
        }
        if (opts.theme) diagram.theme = *opts.theme;

        const std::string xml = diagram_render::generate_drawio(diagram, *config);

        if (opts.output.empty()) {
            std::cout << xml;
            std::cout.flush();
        } else {
            std::ofstream out(opts.output, std::ios::binary | std::ios::trunc);
            if (!out) {
                log->error("cannot write output file: {}", opts.output);
                return 1;
            }
            out << xml;
            if (!out) {
                log->error("write failed: {}", opts.output);
                return 1;
            }
            log->info("Generated: {} ({} nodes, {} edges)", opts.output,
                diagram.nodes.size(), diagram.edges.size());
        }
    } catch (const diagram_model::DiagramError& ex) {
        log->error("{} (at {})", ex.what(), ex.subject());
        return exit_code(ex.kind());
    }
    return 0;
}
