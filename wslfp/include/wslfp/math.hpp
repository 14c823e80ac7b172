#pragma once

#include <cmath>

namespace wslfp {
namespace math {

template <typename T>
T constexpr pi = 3.1415926535897932384626433832795l;

template <typename T>
T constexpr square(T a) {
    return a*a;
}

// Linear interpolation by u in interval [a,b]: (1-u)*a + u*b.
template <typename T, typename U>
T constexpr lerp(T a, T b, U u) {
    return std::fma(T(u), b, std::fma(T(-u), a, a));
}

// Time of peak of the difference of exponentials
//     exp(-t/tau_decay) - exp(-t/tau_rise)
// for 0 < tau_rise < tau_decay.
template <typename T>
T biexp_peak_time(T tau_rise, T tau_decay) {
    return tau_rise*tau_decay/(tau_decay-tau_rise)*std::log(tau_decay/tau_rise);
}

// Peak value of the difference of exponentials above, used to normalise
// the kernel to unit amplitude.
template <typename T>
T biexp_peak(T tau_rise, T tau_decay) {
    T tp = biexp_peak_time(tau_rise, tau_decay);
    return std::exp(-tp/tau_decay) - std::exp(-tp/tau_rise);
}

} // namespace math
} // namespace wslfp
