#include "JsonReporter.hpp"
#include "ScenarioParser.hpp"
#include "Simulation.hpp"
#include "TextReporter.hpp"
#include "utils.hpp"
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Usage: " << program << " [-c config] [-f text|json] [-v] [input]" << std::endl;
        std::cout << "  -c <file>   simulation config (INI format)" << std::endl;
        std::cout << "  -f <format> report format, overrides the config" << std::endl;
        std::cout << "  -v          debug output on stderr" << std::endl;
        std::cout << "  -h          show this help message" << std::endl;
        std::cout << "Reads the topology description from input, or stdin when omitted." << std::endl;
    }

    struct Options
    {
        std::string configFile;
        std::string format;
        std::string inputFile;
        bool verbose = false;
        bool help = false;
    };

    Options parseOptions(int argc, char *argv[])
    {
        Options options;
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            if (arg == "-h" || arg == "--help")
            {
                options.help = true;
            }
            else if (arg == "-v" || arg == "--verbose")
            {
                options.verbose = true;
            }
            else if (arg == "-c" || arg == "-f")
            {
                if (i + 1 >= argc)
                {
                    throw std::runtime_error("Option " + arg + " requires a value");
                }
                if (arg == "-c")
                    options.configFile = argv[++i];
                else
                    options.format = argv[++i];
            }
            else if (!arg.empty() && arg[0] == '-' && arg != "-")
            {
                throw std::runtime_error("Unknown option: " + arg);
            }
            else if (options.inputFile.empty())
            {
                options.inputFile = arg;
            }
            else
            {
                throw std::runtime_error("More than one input file given");
            }
        }
        return options;
    }
}

int main(int argc, char *argv[])
{
    try
    {
        Options options = parseOptions(argc, argv);
        if (options.help)
        {
            printUsage(argv[0]);
            return 0;
        }

        SimulationConfig config;
        if (!options.configFile.empty())
        {
            config = loadSimulationConfig(options.configFile);
        }
        if (!options.format.empty())
        {
            config.report = parseReportFormat(options.format);
        }
        if (options.verbose)
        {
            config.verbose = true;
        }
        setVerbose(config.verbose);

        Scenario scenario;
        if (options.inputFile.empty() || options.inputFile == "-")
        {
            scenario = parseScenario(std::cin);
        }
        else
        {
            std::ifstream file(options.inputFile);
            if (!file)
            {
                throw std::runtime_error("Cannot open input file: " + options.inputFile);
            }
            scenario = parseScenario(file);
        }

        if (scenario.skippedLines > 0)
        {
            logDebug(std::to_string(scenario.skippedLines) + " malformed input lines skipped");
        }

        std::unique_ptr<SimulationObserver> reporter;
        if (config.report == ReportFormat::Json)
            reporter = std::make_unique<JsonReporter>(std::cout);
        else
            reporter = std::make_unique<TextReporter>(std::cout);

        Simulation simulation(scenario, config);
        SimulationSummary summary = simulation.run(*reporter);

        logDebug("channel: " + std::to_string(summary.traffic.framesSent) + " frames, " +
                 std::to_string(summary.traffic.totalBytesSent) + " bytes, " +
                 std::to_string(summary.traffic.compressedFrames) + " compressed, " +
                 std::to_string(summary.traffic.droppedFrames) + " dropped");
    }
    catch (const std::exception &e)
    {
        logError(e.what());
        return 1;
    }

    return 0;
}
