#include "core/DocAnalyzer.hpp"
#include "core/Errors.hpp"
#include "core/IgnoreRules.hpp"
#include "core/LanguageRegistry.hpp"
#include "patch/PatchApplicator.hpp"
#include "synthesis/RuleBasedCommentProvider.hpp"
#include "workflow/Config.hpp"
#include "workflow/Orchestrator.hpp"
#include "workflow/Report.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <iostream>

namespace {

bool configure_logging(const std::string& log_level) {
    // stdout carries reports and JSON; keep log lines off it
    spdlog::set_default_logger(spdlog::stderr_color_mt("docpatch"));

    if (log_level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (log_level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (log_level == "critical") {
        spdlog::set_level(spdlog::level::critical);
    } else {
        std::cerr << "Invalid log level: " << log_level << std::endl;
        return false;
    }
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"docpatch - find undocumented functions and classes and insert comments"};
    app.require_subcommand(0, 1);

    std::string log_level = "warn";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("warn");

    std::string config_path;
    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    auto* analyze_cmd = app.add_subcommand("analyze", "List undocumented functions and classes");
    std::string analyze_dir = ".";
    bool analyze_json = false;
    analyze_cmd->add_option("directory", analyze_dir, "Directory or file to analyze")
        ->default_val(".");
    analyze_cmd->add_flag("--json", analyze_json, "Print the analysis as JSON");

    auto* generate_cmd = app.add_subcommand("generate", "Insert comments for undocumented symbols");
    std::string generate_dir = ".";
    bool dry_run = false;
    bool comments_json = false;
    generate_cmd->add_option("directory", generate_dir, "Directory or file to document")
        ->default_val(".");
    generate_cmd->add_flag("-n,--dry-run", dry_run, "Show what would change without writing");
    generate_cmd->add_flag("--comments-json", comments_json, "Print the generated comments as JSON");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "docpatch version 1.0.0" << std::endl;
        return 0;
    }

    if (!configure_logging(log_level)) {
        return 1;
    }

    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
        return 0;
    }

    docpatch::Config config;
    try {
        if (!config_path.empty()) {
            config = docpatch::Config::load(config_path);
        }
    } catch (const docpatch::ConfigError& e) {
        spdlog::critical("{}", e.what());
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    try {
        auto registry = docpatch::LanguageRegistry::build(config.registry_options());
        docpatch::DocAnalyzer analyzer(registry, docpatch::IgnoreRuleSet(config.ignore_patterns));

        if (analyze_cmd->parsed()) {
            auto results = analyzer.analyze_directory(analyze_dir);
            if (analyze_json) {
                std::cout << docpatch::to_json(results).dump(2) << std::endl;
            } else {
                std::cout << docpatch::Report::analysis_listing(results);
            }
            return 0;
        }

        docpatch::RuleBasedCommentProvider provider;
        docpatch::Orchestrator orchestrator(analyzer, provider,
                                            docpatch::PatchApplicator(config.patch),
                                            config.report);

        docpatch::RunOptions options;
        options.dry_run = dry_run;
        auto report = orchestrator.run(generate_dir, options);

        if (comments_json) {
            std::cout << docpatch::to_json(report.comments).dump(2) << std::endl;
        } else if (dry_run) {
            std::cout << report.summary << std::endl;
        } else if (report.analysis.empty()) {
            std::cout << "No undocumented functions or classes found." << std::endl;
        } else {
            std::cout << docpatch::Report::patch_summary(report.outcomes);
        }
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
