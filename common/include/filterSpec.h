#ifndef __ROWAN_FILTER_SPEC__
#define __ROWAN_FILTER_SPEC__

#include <complex>
#include <vector>

namespace Rowan {

enum class BandType {
    Lowpass,
    Highpass,
    Bandpass,
    Bandstop
};

// Coefficient representation produced by a designer
enum class CoefFormat {
    BA,  // numerator / denominator polynomials
    ZPK, // zeros, poles, gain
    SOS  // cascaded second order sections
};

// Which edges of the spec the resolved corner frequencies replace
enum class EdgeRole {
    None,
    Pass,
    Stop
};

inline unsigned EdgeCount(BandType band) {
    return (band == BandType::Lowpass || band == BandType::Highpass) ? 1 : 2;
}

inline const char* BandTypeName(BandType band) {
    switch (band) {
        case BandType::Lowpass:  return "lowpass";
        case BandType::Highpass: return "highpass";
        case BandType::Bandpass: return "bandpass";
        case BandType::Bandstop: return "bandstop";
    }

    return "unknown";
}

/*
* Inputs to a filter design call
*
* All edges are fractions of the sampling frequency, in (0, 0.5)
*/
struct FilterSpec {
    unsigned Order = 0;                 // 0 requests the minimum order
    BandType Band  = BandType::Lowpass;

    std::vector<double> PassEdges;      // 1 for LP / HP, 2 for BP / BS
    std::vector<double> StopEdges;

    double PassRipple = 1;              // dB
    double StopAtten  = 40;             // dB
};

/*
* H(z) = Gain * prod(1 - Zeros[i] z^-1) / prod(1 - Poles[i] z^-1)
*/
struct ZPK {
    std::vector<std::complex<double>> Zeros;
    std::vector<std::complex<double>> Poles;
    double Gain = 1;
};

// b0 + b1 z^-1 + b2 z^-2 / a0 + a1 z^-1 + a2 z^-2, with a0 == 1
struct Biquad {
    double B[3] = { 0, 0, 0 };
    double A[3] = { 1, 0, 0 };
};

struct FilterResult {
    unsigned   Order  = 0;
    CoefFormat Format = CoefFormat::BA;

    // Only the member matching Format is filled
    std::vector<double> B;
    std::vector<double> A;
    ZPK                 Zpk;
    std::vector<Biquad> Sections;

    // Corner frequencies actually used when the order was computed
    // (fraction of fs), to be written back into the spec
    bool                OrderComputed = false;
    EdgeRole            ResolvedRole  = EdgeRole::None;
    std::vector<double> ResolvedEdges;
};

}

#endif
