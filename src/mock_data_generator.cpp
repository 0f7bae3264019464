// src/mock_data_generator.cpp

#include "dragfit/DragModel.hpp"
#include "dragfit/Types.hpp"

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include <random>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace fs = std::filesystem;
using namespace dragfit;

/* "1,3,5" -> {1, 3, 5} */
static std::vector<int> parse_reps(const std::string& str)
{
    std::vector<int> out;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        out.push_back(std::stoi(item));
    }
    if (out.empty())
        throw std::invalid_argument("no repetition counts in '" + str + "'");
    return out;
}

int main(int argc, char** argv)
{
    try {
        cxxopts::Options options("dragfit_mock",
                                 "Generate synthetic DRAG calibration data");

        options.add_options()
            ("o,output", "Output JSON file", cxxopts::value<std::string>()->default_value("drag_mock.json"))
            ("beta", "True beta", cxxopts::value<double>()->default_value("0.02"))
            ("freq", "Frequency of one +/- pair", cxxopts::value<double>()->default_value("0.5"))
            ("amp", "Amplitude (negative for a minimum at beta)", cxxopts::value<double>()->default_value("-0.5"))
            ("base", "Base line", cxxopts::value<double>()->default_value("0.5"))
            ("noise", "Gaussian noise sigma (0 = clean)", cxxopts::value<double>()->default_value("0"))
            ("points", "Scan points per series", cxxopts::value<int>()->default_value("51"))
            ("xmin", "Smallest scanned beta", cxxopts::value<double>()->default_value("-2"))
            ("xmax", "Largest scanned beta", cxxopts::value<double>()->default_value("2"))
            ("reps", "Repetition counts, comma separated", cxxopts::value<std::string>()->default_value("1,3,5"))
            ("seed", "Random seed", cxxopts::value<unsigned>()->default_value("1234"))
            ("with-sigma", "Store the noise level as per-point sigma")
            ("h,help", "Print usage");

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        const int    n_points = result["points"].as<int>();
        const double xmin     = result["xmin"].as<double>();
        const double xmax     = result["xmax"].as<double>();
        const double noise    = result["noise"].as<double>();
        if (n_points < 2 || !(xmax > xmin))
            throw std::invalid_argument("need at least 2 points and xmax > xmin");

        std::vector<SeriesDef> defs;
        const auto reps = parse_reps(result["reps"].as<std::string>());
        for (std::size_t s = 0; s < reps.size(); ++s)
            defs.push_back({ "series-" + std::to_string(s), reps[s] });
        DragModel model(defs);

        Vector p(kNParams);
        p[AMP]  = result["amp"].as<double>();
        p[FREQ] = result["freq"].as<double>();
        p[BETA] = result["beta"].as<double>();
        p[BASE] = result["base"].as<double>();

        std::mt19937 rng(result["seed"].as<unsigned>());
        std::normal_distribution<> gauss(0.0, noise > 0.0 ? noise : 1.0);

        nlohmann::json out;
        out["series"] = nlohmann::json::array();
        for (int s = 0; s < model.n_series(); ++s) {
            std::vector<double> xs, ys;
            for (int i = 0; i < n_points; ++i) {
                const double x = xmin + (xmax - xmin) * i / (n_points - 1);
                double y = model.evaluate(s, x, p);
                if (noise > 0.0) y += gauss(rng);
                xs.push_back(x);
                ys.push_back(y);
            }

            nlohmann::json js;
            js["name"] = defs[s].name;
            js["reps"] = defs[s].reps;
            js["x"]    = xs;
            js["y"]    = ys;
            if (result.count("with-sigma") && noise > 0.0)
                js["sigma"] = std::vector<double>(n_points, noise);
            out["series"].push_back(js);
        }

        const fs::path path = result["output"].as<std::string>();
        std::ofstream f(path);
        if (!f.is_open())
            throw std::runtime_error("cannot write " + path.string());
        f << std::setw(2) << out << '\n';

        std::cout << "Wrote " << model.n_series() << " series x " << n_points
                  << " points to " << path << '\n';
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
