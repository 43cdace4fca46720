#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

// Include implementation headers
#include "../internal/analysis/BatchProcessor.hpp"
#include "../internal/config/AuditConfiguration.hpp"
#include "../internal/io/PairListReader.hpp"
#include "../internal/io/ResultWriter.hpp"
#include "../interface/ContrastAuditAPI.hpp"
#include <shared/utils/Logger.hpp>

using namespace ContrastAudit;

struct AppSettings {
    std::string configFile;
    std::string pairsFile;
    std::string foreground;
    std::string background;
    bool verbose = false;

    // Command-line overrides, applied on top of the configuration file
    std::vector<std::pair<std::string, std::string>> overrides;
};

void printUsage(const char* programName) {
    std::cout << "Contrast Audit " << VERSION_STRING << "\n";
    std::cout << "Usage: " << programName << " [options] <foreground> <background>\n";
    std::cout << "       " << programName << " [options] --pairs <file>\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  foreground              Text/foreground color (hex, name, rgb(), hsl())\n";
    std::cout << "  background              Background color\n\n";
    std::cout << "Options:\n";
    std::cout << "  --pairs <file>          YAML/JSON file with a 'pairs' list\n";
    std::cout << "  --cvd                   Simulate color vision deficiencies\n";
    std::cout << "  --anomalous             Include protanomaly/deuteranomaly (with --cvd)\n";
    std::cout << "  --min-ratio <value>     Required contrast ratio (overrides role)\n";
    std::cout << "  --role <role>           text|large_text|graphic|stroke|border (default: text)\n";
    std::cout << "  --aaa                   Require AAA instead of AA\n";
    std::cout << "  -f, --format <format>   Output format: json|yaml|text (default: json)\n";
    std::cout << "  -c, --config <file>     Configuration file (YAML/JSON)\n";
    std::cout << "  -j, --threads <n>       Worker threads for --pairs (0 = auto)\n";
    std::cout << "  -v, --verbose           Enable verbose output\n";
    std::cout << "  -h, --help              Show this help message\n\n";
    std::cout << "Exit status: 0 all pairs pass, 1 error, 2 at least one pair fails\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " '#777' '#888'\n";
    std::cout << "  " << programName << " --cvd -f text '#e53e3e' '#38a169'\n";
    std::cout << "  " << programName << " --pairs colors.yml -j 4\n";
}

AppSettings parseArguments(int argc, char* argv[]) {
    AppSettings settings;
    std::vector<std::string> positionalArgs;

    auto requireValue = [&](int& i, const std::string& arg) -> std::string {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires a value\n";
            exit(1);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            exit(0);
        } else if (arg == "-v" || arg == "--verbose") {
            settings.verbose = true;
        } else if (arg == "--cvd") {
            settings.overrides.emplace_back("include_cvd", "true");
        } else if (arg == "--anomalous") {
            settings.overrides.emplace_back("include_anomalous_cvd", "true");
        } else if (arg == "--aaa") {
            settings.overrides.emplace_back("compliance_level", "AAA");
        } else if (arg == "--min-ratio") {
            settings.overrides.emplace_back("min_ratio", requireValue(i, arg));
        } else if (arg == "--role") {
            settings.overrides.emplace_back("role", requireValue(i, arg));
        } else if (arg == "-f" || arg == "--format") {
            settings.overrides.emplace_back("output_format", requireValue(i, arg));
        } else if (arg == "-j" || arg == "--threads") {
            settings.overrides.emplace_back("thread_count", requireValue(i, arg));
        } else if (arg == "-c" || arg == "--config") {
            settings.configFile = requireValue(i, arg);
        } else if (arg == "--pairs") {
            settings.pairsFile = requireValue(i, arg);
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << "\n";
            exit(1);
        } else {
            positionalArgs.push_back(arg);
        }
    }

    if (settings.pairsFile.empty()) {
        if (positionalArgs.size() != 2) {
            std::cerr << "Error: Expected 2 arguments (foreground, background) or --pairs <file>\n";
            printUsage(argv[0]);
            exit(1);
        }
        settings.foreground = positionalArgs[0];
        settings.background = positionalArgs[1];
    } else if (!positionalArgs.empty()) {
        std::cerr << "Error: Positional colors cannot be combined with --pairs\n";
        exit(1);
    }

    return settings;
}

bool configure(const AppSettings& settings, Internal::Config::AuditConfiguration& config) {
    if (!settings.configFile.empty() && !config.loadFromFile(settings.configFile)) {
        std::cerr << "Error: Failed to load configuration file " << settings.configFile << "\n";
        return false;
    }

    for (const auto& [key, value] : settings.overrides) {
        if (!config.setParameter(key, value)) {
            std::cerr << "Error: Invalid value '" << value << "' for " << key << "\n";
            return false;
        }
    }

    if (!config.isValid()) {
        std::cerr << "Error: Configuration values out of range\n";
        for (const auto& [key, value] : config.getAllParameters()) {
            std::cerr << "  " << key << " = " << value << "\n";
        }
        return false;
    }

    return true;
}

int main(int argc, char* argv[]) {
    try {
        AppSettings settings = parseArguments(argc, argv);

        Internal::Config::AuditConfiguration config;
        if (!configure(settings, config)) {
            return 1;
        }

        // Configure logging
        Shared::LogLevel level = Shared::LogLevel::INFO;
        Shared::Logger::parseLevel(config.getLogLevel(), level);
        Shared::Logger::getInstance().setLevel(settings.verbose ? Shared::LogLevel::DEBUG : level);

        std::vector<Internal::Analysis::PairRequest> requests;
        if (!settings.pairsFile.empty()) {
            Internal::IO::PairListReader reader(config.getPairRole());
            if (!reader.loadFromFile(settings.pairsFile, requests)) {
                std::cerr << "Error: Failed to read pair list " << settings.pairsFile << "\n";
                return 1;
            }
        } else {
            Internal::Analysis::PairRequest request;
            request.foreground = settings.foreground;
            request.background = settings.background;
            request.role = config.getPairRole();
            requests.push_back(request);
        }

        Internal::Analysis::BatchProcessor processor(config.toBatchSettings(),
                                                     config.toFixerSettings());
        auto batch = processor.processPairs(requests, config.toAnalysisOptions());

        Internal::IO::ResultWriter::Format format = Internal::IO::ResultWriter::Format::JSON;
        Internal::IO::ResultWriter::parseFormat(config.getOutputFormat(), format);
        Internal::IO::ResultWriter writer(format);

        if (settings.pairsFile.empty()) {
            const auto& outcome = batch.outcomes.front();
            if (!outcome.succeeded()) {
                std::cerr << "Error: " << outcome.errorMessage << "\n";
                return 1;
            }
            std::cout << writer.write(*outcome.result) << std::endl;
            return outcome.result->passesRequired ? 0 : 2;
        }

        std::cout << writer.write(batch) << std::endl;

        if (batch.hasErrors()) {
            return 1;
        }
        return batch.nonCompliantPairs > 0 ? 2 : 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
