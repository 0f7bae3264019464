#include "dragfit/JsonUtils.hpp"
#include <fstream>
#include <regex>
#include <cstdlib>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace dragfit {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("cannot open " + path);
    nlohmann::json j;
    f >> j;
    return j;
}

static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out = input;
    std::smatch m;
    while (std::regex_search(out, m, re)) {
        std::string var = m[1];
        const char* env = std::getenv(var.c_str());
        out.replace(m.position(0), m.length(0), env ? env : "");
    }
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

/* "inf" / "-inf" are accepted for open bounds since JSON has no infinity */
static double bound_value(const nlohmann::json& v)
{
    if (v.is_string()) {
        const auto s = v.get<std::string>();
        if (s == "inf" || s == "+inf") return  std::numeric_limits<double>::infinity();
        if (s == "-inf")               return -std::numeric_limits<double>::infinity();
        throw std::invalid_argument("bad bound value '" + s + "'");
    }
    if (v.is_null()) return std::numeric_limits<double>::quiet_NaN();
    return v.get<double>();
}

AnalysisConfig analysis_config_from_json(const nlohmann::json& j)
{
    AnalysisConfig cfg;

    if (j.contains("series")) {
        cfg.series.clear();
        for (const auto& s : j["series"])
            cfg.series.push_back({ s["name"].get<std::string>(),
                                   s.value("reps", 1) });
    }

    if (j.contains("initialGuess"))
        for (const auto& [name, v] : j["initialGuess"].items())
            cfg.user_options.p0.set(name, v.get<double>());

    if (j.contains("bounds"))
        for (const auto& [name, v] : j["bounds"].items()) {
            if (!v.is_array() || v.size() != 2)
                throw std::invalid_argument("bounds of '" + name + "' must be [lower, upper]");
            Bounds b;
            const double lo = bound_value(v[0]);
            const double hi = bound_value(v[1]);
            if (!std::isnan(lo)) b.lower = lo;
            if (!std::isnan(hi)) b.upper = hi;
            cfg.user_options.bounds.set(name, b);
        }

    if (j.contains("fixed"))
        for (const auto& [name, v] : j["fixed"].items())
            cfg.user_options.fixed.set(name, v.get<double>());

    cfg.normalization          = j.value("normalization",     cfg.normalization);
    const int threads = j.value("threads", static_cast<int>(cfg.n_threads));
    if (threads < 0)
        throw std::invalid_argument("\"threads\" must be 0 (all cores) or positive");
    cfg.n_threads              = static_cast<unsigned>(threads);
    cfg.max_iterations         = j.value("maxIterations",     cfg.max_iterations);
    cfg.reduced_chi2_threshold = j.value("chi2Threshold",     cfg.reduced_chi2_threshold);
    cfg.beta_error_fraction    = j.value("betaErrorFraction", cfg.beta_error_fraction);
    cfg.signal_p_value         = j.value("signalPValue",      cfg.signal_p_value);
    cfg.verbose                = j.value("verbose",           cfg.verbose);
    return cfg;
}

std::vector<SeriesData> series_from_json(const nlohmann::json& j)
{
    std::vector<SeriesData> out;
    if (!j.contains("series"))
        throw std::invalid_argument("input has no \"series\" entry");

    for (const auto& s : j["series"]) {
        SeriesData d;
        d.name = s["name"].get<std::string>();
        d.x    = s["x"].get<std::vector<double>>();
        d.y    = s["y"].get<std::vector<double>>();
        if (s.contains("sigma"))
            d.sigma = s["sigma"].get<std::vector<double>>();
        out.push_back(std::move(d));
    }
    return out;
}

} // namespace dragfit
