// File: src/cli/generator_cli.cpp
//
// Command line front end: builds a GeneratorConfig from a YAML file and
// option overrides, then drives the anomaly pipeline for one identifier.

#include "cli/generator_cli.hpp"
#include "storage/sqlite_field_repository.hpp"
#include <stdexcept>

namespace canforge {

GeneratorCli::GeneratorCli(std::ostream& out, std::ostream& err)
    : out_(out), err_(err), config_(GeneratorConfig::Default()) {}

int GeneratorCli::Main(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    if (!ParseArguments(args)) {
        err_ << "Try 'canforge --help' for usage.\n";
        return 1;
    }
    if (help_requested_) {
        ShowHelp();
        return 0;
    }
    return Run();
}

bool GeneratorCli::ParseArguments(const std::vector<std::string>& args) {
    // The config file is the base layer, whatever its position
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                PrintError("--config requires a file path");
                return false;
            }
            auto loaded = GeneratorConfig::LoadFromFile(args[i + 1]);
            if (!loaded) {
                PrintError("Could not load configuration from " + args[i + 1]);
                return false;
            }
            config_ = *loaded;
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            help_requested_ = true;
            continue;
        }
        if (arg == "--verbose" || arg == "-v") {
            config_.output.verbose = true;
            continue;
        }
        if (arg == "--no-color") {
            colors_enabled_ = false;
            continue;
        }

        const bool takes_value = arg == "--config" || arg == "--csv" || arg == "--id" ||
                                 arg == "--db" || arg == "--out" || arg == "--seed" ||
                                 arg == "--write-config";
        if (!takes_value) {
            PrintError("Unknown option: " + arg);
            return false;
        }
        if (i + 1 >= args.size()) {
            PrintError(arg + " requires a value");
            return false;
        }
        const std::string& value = args[++i];

        if (arg == "--csv") {
            config_.traffic.csv_path = value;
        } else if (arg == "--id") {
            config_.traffic.can_id = value;
        } else if (arg == "--db") {
            config_.fields.db_path = value;
        } else if (arg == "--out") {
            config_.output.directory = value;
        } else if (arg == "--write-config") {
            write_config_path_ = value;
        } else if (arg == "--seed") {
            try {
                if (value.find('-') != std::string::npos) {
                    throw std::invalid_argument("negative seed");
                }
                config_.anomaly.seed = static_cast<uint32_t>(std::stoul(value));
            } catch (const std::logic_error&) {
                PrintError("Invalid seed: " + value);
                return false;
            }
        }
    }

    if (!config_.Validate()) {
        for (const auto& error : config_.GetValidationErrors()) {
            PrintError(error);
        }
        return false;
    }

    return true;
}

int GeneratorCli::Run() {
    if (!write_config_path_.empty()) {
        if (!config_.SaveToFile(write_config_path_)) {
            PrintError("Could not write configuration to " + write_config_path_);
            return 1;
        }
        out_ << C(Color::DIM) << "Configuration written to " << write_config_path_
             << C(Color::RESET) << "\n";
    }

    out_ << C(Color::BOLD) << "canforge" << C(Color::RESET)
         << " generating anomalies for ID " << C(Color::CYAN) << config_.traffic.can_id
         << C(Color::RESET) << " from " << config_.traffic.csv_path << "\n";

    try {
        SqliteFieldRepository::Config storage_config;
        storage_config.db_path = config_.fields.db_path;
        SqliteFieldRepository repository(storage_config);

        AnomalyPipeline pipeline(config_, repository);
        PipelineResult result = pipeline.Run();
        PrintSummary(result);
    } catch (const std::exception& e) {
        PrintError(e.what());
        return 1;
    }

    return 0;
}

void GeneratorCli::ShowHelp() const {
    out_ << C(Color::BOLD) << "Usage:" << C(Color::RESET) << " canforge [options]\n\n"
         << "Generates anomalous CAN message sequences for one identifier.\n\n"
         << C(Color::BOLD) << "Options:\n" << C(Color::RESET)
         << "  --config FILE        Load settings from a YAML file\n"
         << "  --csv FILE           Traffic dump (,Timestamp,ID,DLC,Data[,DataBin])\n"
         << "  --id ID              CAN identifier to process\n"
         << "  --db FILE            SQLite field classification store\n"
         << "  --out DIR            Output directory for anomaly files\n"
         << "  --seed N             Random seed (0 = nondeterministic)\n"
         << "  --write-config FILE  Save the effective configuration as YAML\n"
         << "  --verbose, -v        Print progress of each stage\n"
         << "  --no-color           Disable colored output\n"
         << "  --help, -h           Show this help\n";
}

void GeneratorCli::PrintSummary(const PipelineResult& result) const {
    out_ << "\n" << C(Color::BOLD) << "Test sequences: " << C(Color::RESET)
         << result.sequences_shape.ToString();
    if (result.discarded_words > 0) {
        out_ << C(Color::DIM) << " (" << result.discarded_words
             << " trailing words discarded)" << C(Color::RESET);
    }
    out_ << "\n";

    if (result.target_field) {
        out_ << C(Color::BOLD) << "Target field:   " << C(Color::RESET)
             << result.target_field->ToString() << "\n";
    } else {
        out_ << C(Color::YELLOW) << "No field of variability "
             << ToString(config_.anomaly.target_category)
             << "; field anomalies skipped" << C(Color::RESET) << "\n";
    }

    out_ << "\n" << C(Color::BOLD) << "Anomalies:\n" << C(Color::RESET);
    for (const auto& anomaly : result.anomalies) {
        out_ << "  " << C(Color::GREEN) << "✓ " << C(Color::RESET) << anomaly.label
             << " " << anomaly.shape.ToString();
        if (!anomaly.output_path.empty()) {
            out_ << C(Color::DIM) << " -> " << anomaly.output_path << C(Color::RESET);
        }
        out_ << "\n";
    }
}

void GeneratorCli::PrintError(const std::string& message) const {
    err_ << C(Color::RED) << "Error: " << C(Color::RESET) << message << "\n";
}

} // namespace canforge
