#include "dragfit/JsonUtils.hpp"
#include "dragfit/DragAnalysis.hpp"
#include "dragfit/Errors.hpp"
#include "dragfit/ReportUtils.hpp"
#include <cxxopts.hpp>
#include <chrono>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;
using namespace dragfit;

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("dragfit", "DRAG calibration: joint cosine fit of repeated-pulse series");
        opts.add_options()
            ("i,input", "Input JSON (series data + analysis settings)", cxxopts::value<std::string>())
            ("threads", "Number of threads (0 = all cores)", cxxopts::value<int>()->default_value("-1"))
            ("chi2-threshold", "Reduced chi2 limit of a good fit", cxxopts::value<double>())
            ("no-normalization", "Fit the raw signal instead of max|y| = 1")
            ("v,verbose", "Print progress of every stage")
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("input")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        const std::string input = cli["input"].as<std::string>();
        auto cfg_json = load_json(input);
        expand_env(cfg_json);

        /* command line overrides the file */
        AnalysisConfig config = analysis_config_from_json(cfg_json);
        if (cli["threads"].as<int>() >= 0)
            config.n_threads = static_cast<unsigned>(cli["threads"].as<int>());
        if (cli.count("chi2-threshold"))
            config.reduced_chi2_threshold = cli["chi2-threshold"].as<double>();
        if (cli.count("no-normalization"))
            config.normalization = false;
        if (cli.count("verbose"))
            config.verbose = true;

        auto series = series_from_json(cfg_json);
        std::cout << "Loaded: " << fs::path(input).filename()
                  << " (" << series.size() << " series)\n";

        DragAnalysis analysis(config);
        AnalysisResult result = analysis.run(series);
        print_fit_report(std::cout, result);

    } catch (const AnalysisError& e) {
        std::cerr << "Analysis failed during " << to_string(e.stage())
                  << ": " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    std::cout << "\nTook: " << ms << " ms\n";

    return 0;
}
