#ifndef KEYMORPH_EASING_HPP
#define KEYMORPH_EASING_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace keymorph {

// Maps normalized progress in [0, 1] to eased progress
using EasingFunction = std::function<double(double)>;

namespace easing {

// All catalog functions clamp their input to [0, 1] and map 0 -> 0, 1 -> 1.
// back and elastic variants overshoot that range in between.

double linear(double t);
double step(double t);     // 0 below 0.5, 1 from 0.5 on
double in_out(double t);   // smoothstep 3t^2 - 2t^3

double in_quad(double t);
double out_quad(double t);
double in_out_quad(double t);

double in_cubic(double t);
double out_cubic(double t);
double in_out_cubic(double t);

double in_quart(double t);
double out_quart(double t);
double in_out_quart(double t);

double in_quint(double t);
double out_quint(double t);
double in_out_quint(double t);

double in_sine(double t);
double out_sine(double t);
double in_out_sine(double t);

double in_expo(double t);
double out_expo(double t);
double in_out_expo(double t);

double in_circ(double t);
double out_circ(double t);
double in_out_circ(double t);

double in_back(double t);
double out_back(double t);
double in_out_back(double t);

double in_elastic(double t);
double out_elastic(double t);
double in_out_elastic(double t);

double in_bounce(double t);
double out_bounce(double t);
double in_out_bounce(double t);

/**
 * Look up a catalog function by its snake_case name ("in_out_cubic").
 */
std::optional<EasingFunction> find(const std::string& name);

// Every registered name, sorted
std::vector<std::string> names();

// t -> 1 - f(1 - t)
EasingFunction reversed(EasingFunction f);

// Runs `f` forward over the first half and backward over the second, ending at 0
EasingFunction mirrored(EasingFunction f);

// t -> outer(inner(t))
EasingFunction chained(EasingFunction inner, EasingFunction outer);

} // namespace easing
} // namespace keymorph

#endif // KEYMORPH_EASING_HPP
