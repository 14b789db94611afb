#include "gyration/analysis.hpp"
#include "gyration/cli.hpp"
#include "gyration/errors.hpp"
#include "gyration/report.hpp"
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#ifndef GYRATION_VERSION_STR
#define GYRATION_VERSION_STR "unknown"
#endif

namespace fs = std::filesystem;

namespace {

struct Cli {
    fs::path input = "gyration.txt";
    fs::path output_dir = ".";
    std::string prefix = "rg_analysis";
    bool write_files = true;
    gyr::GyrationAnalysis::Parameters params;
};

void print_usage(const char* argv0) {
    std::cerr
        << "Usage: " << argv0 << " [--input <path>] [--policy half-tail|full-series]\n"
        << "       [--expected-g <value>] [--confidence <level>] [--bins <n>]\n"
        << "       [--delimiter <char>] [--output-dir <dir>] [--prefix <name>] [--no-files]\n"
        << "       " << argv0 << " --version\n";
}

Cli parse_cli(int argc, char** argv) {
    Cli cli;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next_value = [&]() -> std::string {
            if (i + 1 >= argc) throw gyr::ConfigurationError(a + " requires a value");
            return argv[++i];
        };

        if (a == "--help" || a == "-h") {
            print_usage(argv[0]);
            std::exit(gyr::EXIT_OK);
        } else if (a == "--version") {
            std::cout << GYRATION_VERSION_STR << "\n";
            std::exit(gyr::EXIT_OK);
        } else if (a == "--input") {
            cli.input = next_value();
        } else if (a == "--policy") {
            cli.params.policy = gyr::parsePolicy(next_value());
        } else if (a == "--expected-g") {
            cli.params.expected_g_factor = gyr::parseNumberArg(a, next_value());
        } else if (a == "--confidence") {
            cli.params.confidence_level = gyr::parseNumberArg(a, next_value());
        } else if (a == "--bins") {
            cli.params.histogram_bins = gyr::parseCountArg(a, next_value());
        } else if (a == "--delimiter") {
            std::string d = next_value();
            if (d.size() != 1) throw gyr::ConfigurationError("--delimiter expects a single character");
            cli.params.loader.delimiter = d[0];
        } else if (a == "--output-dir") {
            cli.output_dir = next_value();
        } else if (a == "--prefix") {
            cli.prefix = next_value();
        } else if (a == "--no-files") {
            cli.write_files = false;
        } else {
            throw gyr::ConfigurationError("unknown argument: " + a);
        }
    }
    return cli;
}

void print_results(const gyr::AnalysisResult& result) {
    const auto& stats = result.statistics;
    const auto& g = result.gFactor;
    const std::string rule(60, '-');

    std::cout << std::fixed << std::setprecision(4)
              << "Loaded " << result.series.size() << " data points from " << result.sourceName << "\n"
              << "Simulation timesteps: " << std::setprecision(0) << result.lastTimestep()
              << std::setprecision(4) << "\n"
              << "Equilibrated region (" << gyr::policyName(result.window.policy) << "): "
              << result.window.size() << " points from index " << result.window.begin << "\n"
              << rule << "\n"
              << "Mean Rg:                  " << stats.mean << " +/- " << stats.standardDeviation << "\n"
              << "Min Rg:                   " << stats.minimum << "\n"
              << "Max Rg:                   " << stats.maximum << "\n"
              << std::setprecision(0) << stats.confidenceLevel * 100 << std::setprecision(4)
              << "% CI:                   [" << stats.confidenceLow << ", " << stats.confidenceHigh << "]\n"
              << "Theoretical Rg (linear):  " << g.linearRg << "\n"
              << "Calculated g-factor:      " << g.gFactor << "\n"
              << "Expected g-factor:        " << g.expectedGFactor << "\n"
              << "Difference:               " << g.difference << "\n"
              << "Classification:           " << g.label() << "\n"
              << rule << "\n";
}

} // namespace

int main(int argc, char** argv) {
    Cli cli;
    try {
        cli = parse_cli(argc, argv);
    } catch (const gyr::ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return gyr::EXIT_CONFIGURATION;
    }

    gyr::AnalysisResult result;
    try {
        gyr::GyrationAnalysis analysis(cli.params);
        result = analysis.runFile(cli.input);
    } catch (const std::exception& e) {
        const gyr::ExitCode code = gyr::analysisExitCode(e);
        std::cerr << (code == gyr::EXIT_INTERNAL ? "Fatal: " : "Error: ") << e.what() << "\n";
        if (code == gyr::EXIT_SOURCE_NOT_FOUND) {
            std::cerr << "Make sure the simulation completed and wrote its gyration output.\n";
        }
        return code;
    }

    print_results(result);

    if (cli.write_files) {
        try {
            gyr::ReportWriter writer(cli.output_dir, cli.prefix, cli.params.histogram_bins);
            for (const auto& path : writer.write(result)) {
                std::cout << "Wrote " << path.string() << "\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return gyr::outputExitCode(e);
        }
    }

    return gyr::EXIT_OK;
}
