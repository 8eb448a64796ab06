// easing.cpp - Easing catalog

#include "keymorph/easing.hpp"
#include "keymorph/types.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace keymorph {
namespace easing {

namespace {

constexpr double BACK_C1 = 1.70158;
constexpr double BACK_C2 = BACK_C1 * 1.525;
constexpr double BACK_C3 = BACK_C1 + 1.0;
constexpr double ELASTIC_C4 = TWO_PI / 3.0;
constexpr double ELASTIC_C5 = TWO_PI / 4.5;
constexpr double BOUNCE_N1 = 7.5625;
constexpr double BOUNCE_D1 = 2.75;

const std::map<std::string, double (*)(double)>& catalog() {
    static const std::map<std::string, double (*)(double)> table = {
        {"linear", &linear},
        {"step", &step},
        {"in_out", &in_out},
        {"in_quad", &in_quad},
        {"out_quad", &out_quad},
        {"in_out_quad", &in_out_quad},
        {"in_cubic", &in_cubic},
        {"out_cubic", &out_cubic},
        {"in_out_cubic", &in_out_cubic},
        {"in_quart", &in_quart},
        {"out_quart", &out_quart},
        {"in_out_quart", &in_out_quart},
        {"in_quint", &in_quint},
        {"out_quint", &out_quint},
        {"in_out_quint", &in_out_quint},
        {"in_sine", &in_sine},
        {"out_sine", &out_sine},
        {"in_out_sine", &in_out_sine},
        {"in_expo", &in_expo},
        {"out_expo", &out_expo},
        {"in_out_expo", &in_out_expo},
        {"in_circ", &in_circ},
        {"out_circ", &out_circ},
        {"in_out_circ", &in_out_circ},
        {"in_back", &in_back},
        {"out_back", &out_back},
        {"in_out_back", &in_out_back},
        {"in_elastic", &in_elastic},
        {"out_elastic", &out_elastic},
        {"in_out_elastic", &in_out_elastic},
        {"in_bounce", &in_bounce},
        {"out_bounce", &out_bounce},
        {"in_out_bounce", &in_out_bounce},
    };
    return table;
}

} // anonymous namespace

// =============================================================================
// Basic
// =============================================================================

double linear(double t) {
    return clamp_unit(t);
}

double step(double t) {
    return clamp_unit(t) < 0.5 ? 0.0 : 1.0;
}

double in_out(double t) {
    t = clamp_unit(t);
    return t * t * (3.0 - 2.0 * t);
}

// =============================================================================
// Polynomial
// =============================================================================

double in_quad(double t) {
    t = clamp_unit(t);
    return t * t;
}

double out_quad(double t) {
    t = clamp_unit(t);
    return 1.0 - (1.0 - t) * (1.0 - t);
}

double in_out_quad(double t) {
    t = clamp_unit(t);
    return t < 0.5 ? 2.0 * t * t : 1.0 - std::pow(-2.0 * t + 2.0, 2) / 2.0;
}

double in_cubic(double t) {
    t = clamp_unit(t);
    return t * t * t;
}

double out_cubic(double t) {
    t = clamp_unit(t);
    return 1.0 - std::pow(1.0 - t, 3);
}

double in_out_cubic(double t) {
    t = clamp_unit(t);
    return t < 0.5 ? 4.0 * t * t * t : 1.0 - std::pow(-2.0 * t + 2.0, 3) / 2.0;
}

double in_quart(double t) {
    t = clamp_unit(t);
    return t * t * t * t;
}

double out_quart(double t) {
    t = clamp_unit(t);
    return 1.0 - std::pow(1.0 - t, 4);
}

double in_out_quart(double t) {
    t = clamp_unit(t);
    return t < 0.5 ? 8.0 * std::pow(t, 4) : 1.0 - std::pow(-2.0 * t + 2.0, 4) / 2.0;
}

double in_quint(double t) {
    t = clamp_unit(t);
    return std::pow(t, 5);
}

double out_quint(double t) {
    t = clamp_unit(t);
    return 1.0 - std::pow(1.0 - t, 5);
}

double in_out_quint(double t) {
    t = clamp_unit(t);
    return t < 0.5 ? 16.0 * std::pow(t, 5) : 1.0 - std::pow(-2.0 * t + 2.0, 5) / 2.0;
}

// =============================================================================
// Sine / exponential / circular
// =============================================================================

double in_sine(double t) {
    t = clamp_unit(t);
    if (t == 1.0) return 1.0;
    return 1.0 - std::cos(t * PI / 2.0);
}

double out_sine(double t) {
    t = clamp_unit(t);
    return std::sin(t * PI / 2.0);
}

double in_out_sine(double t) {
    t = clamp_unit(t);
    if (t == 1.0) return 1.0;
    return -(std::cos(PI * t) - 1.0) / 2.0;
}

double in_expo(double t) {
    t = clamp_unit(t);
    if (t == 0.0) return 0.0;
    return std::pow(2.0, 10.0 * t - 10.0);
}

double out_expo(double t) {
    t = clamp_unit(t);
    if (t == 1.0) return 1.0;
    return 1.0 - std::pow(2.0, -10.0 * t);
}

double in_out_expo(double t) {
    t = clamp_unit(t);
    if (t == 0.0) return 0.0;
    if (t == 1.0) return 1.0;
    return t < 0.5 ? std::pow(2.0, 20.0 * t - 10.0) / 2.0
                   : (2.0 - std::pow(2.0, -20.0 * t + 10.0)) / 2.0;
}

double in_circ(double t) {
    t = clamp_unit(t);
    return 1.0 - std::sqrt(1.0 - t * t);
}

double out_circ(double t) {
    t = clamp_unit(t);
    return std::sqrt(1.0 - (t - 1.0) * (t - 1.0));
}

double in_out_circ(double t) {
    t = clamp_unit(t);
    return t < 0.5 ? (1.0 - std::sqrt(1.0 - std::pow(2.0 * t, 2))) / 2.0
                   : (std::sqrt(1.0 - std::pow(-2.0 * t + 2.0, 2)) + 1.0) / 2.0;
}

// =============================================================================
// Back / elastic / bounce
// =============================================================================

double in_back(double t) {
    t = clamp_unit(t);
    if (t == 1.0) return 1.0;
    return BACK_C3 * t * t * t - BACK_C1 * t * t;
}

double out_back(double t) {
    t = clamp_unit(t);
    if (t == 0.0) return 0.0;
    return 1.0 + BACK_C3 * std::pow(t - 1.0, 3) + BACK_C1 * std::pow(t - 1.0, 2);
}

double in_out_back(double t) {
    t = clamp_unit(t);
    if (t == 0.0) return 0.0;
    if (t == 1.0) return 1.0;
    return t < 0.5
        ? (std::pow(2.0 * t, 2) * ((BACK_C2 + 1.0) * 2.0 * t - BACK_C2)) / 2.0
        : (std::pow(2.0 * t - 2.0, 2) * ((BACK_C2 + 1.0) * (t * 2.0 - 2.0) + BACK_C2) + 2.0) / 2.0;
}

double in_elastic(double t) {
    t = clamp_unit(t);
    if (t == 0.0) return 0.0;
    if (t == 1.0) return 1.0;
    return -std::pow(2.0, 10.0 * t - 10.0) * std::sin((t * 10.0 - 10.75) * ELASTIC_C4);
}

double out_elastic(double t) {
    t = clamp_unit(t);
    if (t == 0.0) return 0.0;
    if (t == 1.0) return 1.0;
    return std::pow(2.0, -10.0 * t) * std::sin((t * 10.0 - 0.75) * ELASTIC_C4) + 1.0;
}

double in_out_elastic(double t) {
    t = clamp_unit(t);
    if (t == 0.0) return 0.0;
    if (t == 1.0) return 1.0;
    return t < 0.5
        ? -(std::pow(2.0, 20.0 * t - 10.0) * std::sin((20.0 * t - 11.125) * ELASTIC_C5)) / 2.0
        : (std::pow(2.0, -20.0 * t + 10.0) * std::sin((20.0 * t - 11.125) * ELASTIC_C5)) / 2.0 + 1.0;
}

double out_bounce(double t) {
    t = clamp_unit(t);
    if (t < 1.0 / BOUNCE_D1) {
        return BOUNCE_N1 * t * t;
    } else if (t < 2.0 / BOUNCE_D1) {
        t -= 1.5 / BOUNCE_D1;
        return BOUNCE_N1 * t * t + 0.75;
    } else if (t < 2.5 / BOUNCE_D1) {
        t -= 2.25 / BOUNCE_D1;
        return BOUNCE_N1 * t * t + 0.9375;
    }
    t -= 2.625 / BOUNCE_D1;
    return BOUNCE_N1 * t * t + 0.984375;
}

double in_bounce(double t) {
    return 1.0 - out_bounce(1.0 - clamp_unit(t));
}

double in_out_bounce(double t) {
    t = clamp_unit(t);
    return t < 0.5 ? (1.0 - out_bounce(1.0 - 2.0 * t)) / 2.0
                   : (1.0 + out_bounce(2.0 * t - 1.0)) / 2.0;
}

// =============================================================================
// Lookup and composition
// =============================================================================

std::optional<EasingFunction> find(const std::string& name) {
    const auto& table = catalog();
    auto it = table.find(name);
    if (it == table.end()) return std::nullopt;
    return EasingFunction(it->second);
}

std::vector<std::string> names() {
    std::vector<std::string> result;
    for (const auto& [name, fn] : catalog()) {
        result.push_back(name);
    }
    return result;
}

EasingFunction reversed(EasingFunction f) {
    return [f = std::move(f)](double t) {
        return 1.0 - f(1.0 - clamp_unit(t));
    };
}

EasingFunction mirrored(EasingFunction f) {
    return [f = std::move(f)](double t) {
        t = clamp_unit(t);
        return t < 0.5 ? f(2.0 * t) : f(2.0 - 2.0 * t);
    };
}

EasingFunction chained(EasingFunction inner, EasingFunction outer) {
    return [inner = std::move(inner), outer = std::move(outer)](double t) {
        return outer(inner(t));
    };
}

} // namespace easing
} // namespace keymorph
