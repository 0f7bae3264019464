#pragma once
#include "Types.hpp"
#include <unordered_map>
#include <optional>
#include <string>
#include <vector>
#include <limits>
#include <stdexcept>

namespace dragfit {

struct Bounds {
    double lower = -std::numeric_limits<double>::infinity();
    double upper =  std::numeric_limits<double>::infinity();

    bool operator==(const Bounds&) const = default;
};

/* throw std::invalid_argument for unknown names / unusable values */
void validate_entry(const std::string& name, double value);
void validate_entry(const std::string& name, const Bounds& value);

/*
 * Name -> value map over the shared fit parameters.  Every guess stage
 * seeds it with set_if_empty(), so a value written earlier (typically by
 * the user) survives all later stages.
 */
template <typename T>
class ParameterMap {
public:
    void set(const std::string& name, const T& val)
    {
        validate_entry(name, val);
        p_[name] = val;
    }

    /* returns true if the value was written */
    bool set_if_empty(const std::string& name, const T& val)
    {
        validate_entry(name, val);
        return p_.try_emplace(name, val).second;
    }

    bool contains(const std::string& name) const { return p_.count(name) > 0; }

    std::optional<T> get(const std::string& name) const
    {
        auto it = p_.find(name);
        if (it == p_.end()) return std::nullopt;
        return it->second;
    }

    const T& at(const std::string& name) const
    {
        auto it = p_.find(name);
        if (it == p_.end()) throw std::out_of_range(name);
        return it->second;
    }

    std::size_t size() const { return p_.size(); }
    bool        empty() const { return p_.empty(); }

    bool operator==(const ParameterMap&) const = default;

private:
    std::unordered_map<std::string, T> p_;
};

/* Solver-ready form of one candidate (full vectors in ParamIndex order). */
struct FinalizedOptions {
    Vector              x0;
    std::vector<double> lower;
    std::vector<double> upper;
    std::vector<bool>   free_mask;
};

/* One multi-start candidate: initial guesses, bounds and frozen values. */
struct FitOptions {
    ParameterMap<double> p0;
    ParameterMap<Bounds> bounds;
    ParameterMap<double> fixed;

    int n_free() const { return kNParams - static_cast<int>(fixed.size()); }

    FinalizedOptions finalize() const;

    bool operator==(const FitOptions&) const = default;
};

} // namespace dragfit
