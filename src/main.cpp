#include "scanner.hpp"
#include "batch.hpp"
#include "config.hpp"
#include "utils/printer.hpp"
#include "logger.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

struct Config {
    std::string configFile;
    std::string declaredType = "application/octet-stream";
    bool jsonOutput = false;
    std::string jsonFile;
    bool quiet = false;
    bool help = false;
    size_t parallelScans = default_parallel_scans();
    std::vector<std::string> inputFiles;
};


class ArgParser {
public:
    struct OptionInfo {
        bool takesValue;
        std::string canonicalName;
    };

    std::unordered_map<std::string, OptionInfo> optionDefs;
    std::unordered_map<std::string, std::string> parsedOptions;
    std::vector<std::string> positional;

    void addOption(const std::string& name, bool takesValue, const std::string& canonical) {
        optionDefs[name] = {takesValue, canonical};
    }

    void parse(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            auto it = optionDefs.find(arg);
            if (it != optionDefs.end()) {
                const auto& info = it->second;

                if (info.takesValue) {
                    if (i + 1 >= argc) {
                        throw std::runtime_error("Missing value for option: " + arg);
                    }
                    parsedOptions[info.canonicalName] = argv[++i];
                } else {
                    parsedOptions[info.canonicalName] = "true";
                }
            }
            else if (arg.size() > 1 && arg[0] == '-') {
                throw std::runtime_error("Unknown option: " + arg);
            }
            else {
                positional.push_back(arg);
            }
        }
    }

    bool has(const std::string& canonical) const {
        return parsedOptions.count(canonical);
    }

    std::string get(const std::string& canonical, const std::string& def = "") const {
        auto it = parsedOptions.find(canonical);
        return it != parsedOptions.end() ? it->second : def;
    }
};

static void printUsage() {
    std::cout << "Usage: uploadguard [options] <file>...\n"
              << "  -c FILE    JSON configuration (upload.security section)\n"
              << "  -t MIME    Declared MIME type of the inputs\n"
              << "  -O FILE    Write a JSON report\n"
              << "  -j N       Scan at most N files at once\n"
              << "  -d         Enable Debug mode\n"
              << "  -q         Only log errors\n"
              << "  -h         Show this help message\n"
              << "Exit status: 0 all passed, 1 rejected, 2 error\n";
}

// Returns false when usage was printed instead.
bool parseArgs(int argc, char* argv[], Config& config) {
    ArgParser args;
    args.addOption("-h", false, "help");
    args.addOption("--help", false, "help");

    args.addOption("-c", true, "config");
    args.addOption("--config", true, "config");

    args.addOption("-t", true, "type");
    args.addOption("--type", true, "type");

    args.addOption("-O", true, "jsonPath");
    args.addOption("--jsonPath", true, "jsonPath");

    args.addOption("-j", true, "jobs");
    args.addOption("--jobs", true, "jobs");

    args.addOption("-d", false, "debug");
    args.addOption("--debug", false, "debug");

    args.addOption("-q", false, "quiet");
    args.addOption("--quiet", false, "quiet");

    args.parse(argc, argv);

    if (args.has("help") || args.positional.empty()) {
        config.help = args.has("help");
        printUsage();
        return false;
    }

    if (args.has("debug")) {
        Logger::info("Enabling Debug Mode");
        Logger::setLevel(LogLevel::DEBUG);
    }
    if (args.has("quiet")) {
        config.quiet = true;
        Logger::setLevel(LogLevel::ERROR);
    }
    config.configFile = args.get("config");
    config.declaredType = args.get("type", config.declaredType);
    if (args.has("jsonPath")) {
        config.jsonFile = args.get("jsonPath");
        config.jsonOutput = true;
        Logger::debug("Setting json output path to " + config.jsonFile);
    }
    if (args.has("jobs")) {
        const std::string jobs = args.get("jobs");
        size_t used = 0;
        unsigned long value = 0;
        try {
            value = std::stoul(jobs, &used);
        } catch (const std::logic_error&) {
            used = 0;
        }
        if (used != jobs.size() || value == 0 || jobs[0] == '-') {
            throw std::runtime_error("Invalid value for -j: " + jobs);
        }
        config.parallelScans = value;
    }
    config.inputFiles = args.positional;
    return true;
}

int main(int argc, char* argv[]) {
    Logger::setLevel(LogLevel::INFO);

    Config config;
    SecurityConfig security;
    try {
        if (!parseArgs(argc, argv, config)) {
            return config.help ? 0 : 2;
        }
        if (!config.configFile.empty()) {
            security = loadSecurityConfig(config.configFile);
        }
        applyEnvironment(security);
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 2;
    }

    auto start = std::chrono::high_resolution_clock::now();

    std::vector<ScanReport> reports;
    try {
        Scanner scanner(security);

        reports = scanFiles(scanner, config.inputFiles, config.declaredType, config.parallelScans);

        if (config.jsonOutput) {
            dumpJson(reports, config.jsonFile);
        }
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 2;
    }

    if (!config.quiet) {
        for (const auto& report : reports) {
            printReport(report);
        }
        printSummary(reports);
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    Logger::debug("Total elapsed time: " + std::to_string(elapsed) + "ms");

    for (const auto& report : reports) {
        if (!report.passed) return 1;
    }
    return 0;
}
