#pragma once

#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace nodal {

// ---------------------------------------------------------------------------
// EmaScalar: exponential moving average of a scalar series (training loss).
//
//   mu_t  = alpha * x_t + (1 - alpha) * mu_{t-1}
//   var_t = (1 - alpha) * (var_{t-1} + alpha * (x_t - mu_{t-1})^2)
//
// The first sample initialises mu directly so early readings are not
// biased towards zero.
// ---------------------------------------------------------------------------
class EmaScalar {
public:
    explicit EmaScalar(double alpha = 0.05) : alpha_(alpha) {
        if (!(alpha > 0.0 && alpha <= 1.0))
            throw std::invalid_argument("EmaScalar: alpha must be in (0, 1]");
    }

    void update(double x) {
        if (n_++ == 0) {
            mu_ = x;
            return;
        }
        const double old_mu = mu_;
        mu_  = alpha_ * x + (1.0 - alpha_) * mu_;
        var_ = (1.0 - alpha_) * (var_ + alpha_ * (x - old_mu) * (x - old_mu));
    }

    double mean()     const noexcept { return mu_; }
    double variance() const noexcept { return var_; }
    double stddev()   const noexcept { return std::sqrt(var_); }
    size_t count()    const noexcept { return n_; }

    void reset() { mu_ = 0.0; var_ = 0.0; n_ = 0; }

private:
    double alpha_ = 0.05;
    double mu_    = 0.0;
    double var_   = 0.0;
    size_t n_     = 0;
};

} // namespace nodal
