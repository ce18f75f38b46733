// Included by fft.cpp, not compiled on its own

#include <string>

#include "mkl_dfti.h"

static void dftiCheck(MKL_LONG status, const char* what) {
    if (status != DFTI_NO_ERROR && !DftiErrorClass(status, DFTI_NO_ERROR))
        throw std::runtime_error(std::string(what) + ": " + DftiErrorMessage(status));
}

fft_plan fft_make_plan(unsigned size) {
    if (size == 0)
        throw std::invalid_argument("fft_make_plan: size must be positive");

    DFTI_DESCRIPTOR_HANDLE* hand = new DFTI_DESCRIPTOR_HANDLE(nullptr);

    try {
        dftiCheck(DftiCreateDescriptor(hand, DFTI_DOUBLE, DFTI_COMPLEX, 1, (MKL_LONG)size), "DftiCreateDescriptor");
        dftiCheck(DftiSetValue(*hand, DFTI_PLACEMENT, DFTI_NOT_INPLACE), "DftiSetValue");
        dftiCheck(DftiCommitDescriptor(*hand), "DftiCommitDescriptor");
    } catch (std::runtime_error&) {
        if (*hand != nullptr)
            DftiFreeDescriptor(hand);
        delete hand;
        throw;
    }

    return static_cast<fft_plan>(hand);
}
void fft_destroy_plan(fft_plan plan) {
    if (plan == nullptr)
        return;

    DFTI_DESCRIPTOR_HANDLE* hand = static_cast<DFTI_DESCRIPTOR_HANDLE*>(plan);
    DftiFreeDescriptor(hand);
    delete hand;
}

void fft_cpx_forward(fft_plan plan, const std::complex<double>* input, std::complex<double>* output) {
    // DFTI takes a non-const input even when not in place
    void* in = const_cast<std::complex<double>*>(input);
    dftiCheck(DftiComputeForward(*static_cast<DFTI_DESCRIPTOR_HANDLE*>(plan), in, output), "DftiComputeForward");
}
