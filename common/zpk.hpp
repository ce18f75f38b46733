#ifndef _ZPK_H_
#define _ZPK_H_

#include <complex>
#include <vector>

#include "include/filterSpec.h"

/*
* Analog prototype frequency transforms (s domain, unit cutoff prototype)
*
* wo - new cutoff or center frequency, rad/s
* bw - bandwidth, rad/s
*/
Rowan::ZPK LowpassToLowpass(const Rowan::ZPK& proto, double wo);
Rowan::ZPK LowpassToHighpass(const Rowan::ZPK& proto, double wo);
Rowan::ZPK LowpassToBandpass(const Rowan::ZPK& proto, double wo, double bw);
Rowan::ZPK LowpassToBandstop(const Rowan::ZPK& proto, double wo, double bw);

// s -> z with s = 2 fs (z - 1) / (z + 1). Zeros at infinity map to z = -1
Rowan::ZPK Bilinear(const Rowan::ZPK& analog, double fs);

// Coefficients of prod(x - roots[i]), highest power first
std::vector<std::complex<double>> PolyFromRoots(const std::vector<std::complex<double>>& roots);

void ZpkToTf(const Rowan::ZPK& zpk, std::vector<double>& b, std::vector<double>& a);
/*
* Splits a digital ZPK into second order sections
*
* Roots are grouped in conjugate pairs (or pairs of real roots). Sections are
* ordered with the poles furthest from the unit circle first, each pole pair
* takes the nearest remaining zero pair. The gain goes to the first section.
*
* Throws Rowan::NumericDivergenceError if the roots are not conjugate symmetric.
*/
std::vector<Rowan::Biquad> ZpkToSos(const Rowan::ZPK& zpk);

/*
* Magnitude response of a designed filter
*
* Args:
* res   - design result, evaluated in its own format
* freqs - frequencies as a fraction of the sampling frequency
*
* Returns the magnitude in dB
*/
std::vector<double> Response(const Rowan::FilterResult& res, const std::vector<double>& freqs);

#endif
