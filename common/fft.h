#ifndef __FFT_H__
#define __FFT_H__

#include <complex>

typedef void* fft_plan;

// Plans are not shared between threads, make one per thread
fft_plan fft_make_plan(unsigned size);
void fft_destroy_plan(fft_plan plan);

// Out of place, unscaled
void fft_cpx_forward(fft_plan plan, const std::complex<double>* input, std::complex<double>* output);

// One shot transform
void fft(const std::complex<double>* input, std::complex<double>* output, unsigned size);

#endif
