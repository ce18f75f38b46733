#include <stdexcept>

#include "fft.h"

#include "fft_impl/fft_impl_mkl.cpp"

namespace {
// Destroys the plan when a one shot transform leaves scope, even on error
struct ScopedPlan {
    fft_plan plan;

    explicit ScopedPlan(unsigned size) : plan(fft_make_plan(size)) { }
    ~ScopedPlan() { fft_destroy_plan(plan); }

    ScopedPlan(const ScopedPlan&) = delete;
    ScopedPlan& operator=(const ScopedPlan&) = delete;
};
}

void fft(const std::complex<double>* input, std::complex<double>* output, unsigned size) {
    ScopedPlan scoped(size);
    fft_cpx_forward(scoped.plan, input, output);
}
