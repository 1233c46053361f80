#include "cli.hpp"
#include <diagram_loaders/json_loader.hpp>
#include <diagram_loaders/sample_diagrams.hpp>
#include <diagram_model/logger.hpp>
#include <diagram_render/renderer.hpp>
#include <cstdio>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace {

enum class Source { None, ErdFile, RequirementFile, Sample };

struct Options {
    Source source = Source::None;
    std::string input;
    std::string output;
    std::string log_file;
    spdlog::level::level_enum log_level = spdlog::level::warn;
};

void print_usage(const std::string& program) {
    (void)fprintf(stderr,
        "usage: %s (--erd FILE | --requirements FILE | --sample erd|requirements)\n"
        "          [--output FILE] [--log-level LEVEL] [--log-file FILE]\n",
        program.c_str());
}

// Returns std::nullopt on a usage error (already reported).
std::optional<Options> parse_options(const std::vector<std::string>& args) {
    Options opts;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") return std::nullopt;
        if (i + 1 >= args.size()) {
            (void)fprintf(stderr, "missing value for %s\n", arg.c_str());
            return std::nullopt;
        }
        const std::string& value = args[++i];
        if (arg == "--erd" || arg == "--requirements" || arg == "--sample") {
            if (opts.source != Source::None) {
                (void)fprintf(stderr, "only one of --erd, --requirements, --sample may be given\n");
                return std::nullopt;
            }
            opts.source = arg == "--erd" ? Source::ErdFile
                : arg == "--requirements" ? Source::RequirementFile
                : Source::Sample;
            opts.input = value;
        } else if (arg == "--output") {
            opts.output = value;
        } else if (arg == "--log-file") {
            opts.log_file = value;
        } else if (arg == "--log-level") {
            opts.log_level = spdlog::level::from_str(value);
            // from_str maps unknown names to "off"
            if (opts.log_level == spdlog::level::off && value != "off") {
                (void)fprintf(stderr, "unknown log level %s\n", value.c_str());
                return std::nullopt;
            }
        } else {
            (void)fprintf(stderr, "unknown option %s\n", arg.c_str());
            return std::nullopt;
        }
    }
    if (opts.source == Source::None) {
        (void)fprintf(stderr, "no diagram given\n");
        return std::nullopt;
    }
    return opts;
}

std::optional<std::string> render_source(const Options& opts) {
    auto log = diagram_model::logger();
    switch (opts.source) {
    case Source::ErdFile:
        if (auto erd = diagram_loaders::load_erd_from_json_file(opts.input))
            return diagram_render::render(*erd);
        break;
    case Source::RequirementFile:
        if (auto diagram = diagram_loaders::load_requirement_diagram_from_json_file(opts.input))
            return diagram_render::render(*diagram);
        break;
    case Source::Sample:
        if (opts.input == "erd") return diagram_render::render(diagram_loaders::sample_erd());
        if (opts.input == "requirements")
            return diagram_render::render(diagram_loaders::sample_requirement_diagram());
        log->error("unknown sample {}", opts.input);
        return std::nullopt;
    case Source::None:
        break;
    }
    log->error("cannot load diagram from {}", opts.input);
    return std::nullopt;
}

} // namespace

namespace diagram_cli {

int run(const std::string& program, const std::vector<std::string>& args)
{
    const auto opts = parse_options(args);
    if (!opts) {
        print_usage(program);
        return exit_usage;
    }

    diagram_model::set_log_level(opts->log_level);
    if (!opts->log_file.empty() && !diagram_model::set_log_file(opts->log_file)) {
        // keep logging to stderr
        diagram_model::logger()->warn("falling back to stderr logging");
    }

    const auto text = render_source(*opts);
    if (!text) return exit_usage;

    if (opts->output.empty()) {
        (void)fprintf(stdout, "%s\n", text->c_str());
        return exit_ok;
    }

    std::ofstream out(opts->output);
    out << *text << '\n';
    // Buffered write errors (a full device) only surface on close.
    out.close();
    if (out.fail()) {
        diagram_model::logger()->error("cannot write {}", opts->output);
        return exit_write_failed;
    }
    diagram_model::logger()->info("wrote {} bytes to {}", text->size() + 1, opts->output);
    return exit_ok;
}

} // namespace diagram_cli
