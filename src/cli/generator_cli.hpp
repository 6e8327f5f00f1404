// File: src/cli/generator_cli.hpp
//
// canforge command line front end
// Extracted from main for testability

#ifndef CANFORGE_GENERATOR_CLI_HPP
#define CANFORGE_GENERATOR_CLI_HPP

#include "config/generator_config.hpp"
#include "pipeline/anomaly_pipeline.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace canforge {

/// ANSI color codes for terminal output
namespace Color {
    inline const char* RESET = "\033[0m";
    inline const char* RED = "\033[31m";
    inline const char* GREEN = "\033[32m";
    inline const char* YELLOW = "\033[33m";
    inline const char* CYAN = "\033[36m";
    inline const char* BOLD = "\033[1m";
    inline const char* DIM = "\033[2m";
}

/// Command line interface for canforge
///
/// Usage: canforge [--config FILE] [--csv FILE] [--id ID] [--db FILE]
///                 [--out DIR] [--seed N] [--write-config FILE]
///                 [--verbose] [--no-color] [--help]
///
/// Options given on the command line override the values loaded from
/// --config, which in turn override the defaults.
class GeneratorCli {
public:
    GeneratorCli(std::ostream& out = std::cout, std::ostream& err = std::cerr);

    /// Parse arguments and run; returns the process exit code
    int Main(int argc, char** argv);

    /// Parse arguments (without the program name) into the configuration
    /// @return false on unknown options, missing or malformed values, or
    ///         an invalid resulting configuration
    bool ParseArguments(const std::vector<std::string>& args);

    /// Run the pipeline with the parsed configuration
    /// @return 0 on success, 1 on failure
    int Run();

    /// Print usage
    void ShowHelp() const;

    const GeneratorConfig& GetConfig() const { return config_; }
    bool IsHelpRequested() const { return help_requested_; }
    bool IsColorEnabled() const { return colors_enabled_; }

private:
    std::ostream& out_;
    std::ostream& err_;

    GeneratorConfig config_;
    std::string write_config_path_;
    bool help_requested_ = false;
    bool colors_enabled_ = true;

    void PrintSummary(const PipelineResult& result) const;
    void PrintError(const std::string& message) const;

    // Color helpers
    const char* C(const char* color) const { return colors_enabled_ ? color : ""; }
};

} // namespace canforge

#endif // CANFORGE_GENERATOR_CLI_HPP
