#include <algorithm>
#include <cmath>
#include <limits>

#include "zpk.hpp"
#include "defines.h"
#include "include/errors.h"

using namespace Rowan;

typedef std::complex<double> cpx;

static cpx prodNeg(const std::vector<cpx>& roots) {
    cpx prod = 1;

    for (const auto& r : roots)
        prod *= -r;

    return prod;
}

static int degree(const ZPK& zpk) {
    return (int)zpk.Poles.size() - (int)zpk.Zeros.size();
}

ZPK LowpassToLowpass(const ZPK& proto, double wo) {
    ZPK out;

    for (const auto& z : proto.Zeros)
        out.Zeros.push_back(wo * z);
    for (const auto& p : proto.Poles)
        out.Poles.push_back(wo * p);

    out.Gain = proto.Gain * pow(wo, degree(proto));

    return out;
}

ZPK LowpassToHighpass(const ZPK& proto, double wo) {
    ZPK out;

    for (const auto& z : proto.Zeros)
        out.Zeros.push_back(wo / z);
    for (const auto& p : proto.Poles)
        out.Poles.push_back(wo / p);

    // Zeros at infinity move to the origin
    out.Zeros.insert(out.Zeros.end(), std::max(degree(proto), 0), cpx(0, 0));

    out.Gain = proto.Gain * (prodNeg(proto.Zeros) / prodNeg(proto.Poles)).real();

    return out;
}

// Each root r of the prototype becomes r' +- sqrt(r'^2 - wo^2)
static std::vector<cpx> splitRoots(const std::vector<cpx>& roots, double wo) {
    std::vector<cpx> out(roots.size() * 2);

    for (size_t i = 0; i < roots.size(); i++) {
        cpx disc = std::sqrt(roots[i] * roots[i] - wo * wo);

        out[i]                = roots[i] + disc;
        out[i + roots.size()] = roots[i] - disc;
    }

    return out;
}

ZPK LowpassToBandpass(const ZPK& proto, double wo, double bw) {
    std::vector<cpx> zLp, pLp;

    for (const auto& z : proto.Zeros)
        zLp.push_back(z * bw / 2.0);
    for (const auto& p : proto.Poles)
        pLp.push_back(p * bw / 2.0);

    ZPK out;

    out.Zeros = splitRoots(zLp, wo);
    out.Poles = splitRoots(pLp, wo);

    // Zeros at infinity go to the origin and infinity
    out.Zeros.insert(out.Zeros.end(), std::max(degree(proto), 0), cpx(0, 0));

    out.Gain = proto.Gain * pow(bw, degree(proto));

    return out;
}

ZPK LowpassToBandstop(const ZPK& proto, double wo, double bw) {
    std::vector<cpx> zHp, pHp;

    for (const auto& z : proto.Zeros)
        zHp.push_back((bw / 2.0) / z);
    for (const auto& p : proto.Poles)
        pHp.push_back((bw / 2.0) / p);

    ZPK out;

    out.Zeros = splitRoots(zHp, wo);
    out.Poles = splitRoots(pHp, wo);

    // Zeros at infinity move to the center of the stop band
    const int deg = std::max(degree(proto), 0);
    out.Zeros.insert(out.Zeros.end(), deg, cpx(0, wo));
    out.Zeros.insert(out.Zeros.end(), deg, cpx(0, -wo));

    out.Gain = proto.Gain * (prodNeg(proto.Zeros) / prodNeg(proto.Poles)).real();

    return out;
}

ZPK Bilinear(const ZPK& analog, double fs) {
    const double fs2 = 2 * fs;

    ZPK out;
    cpx num = 1, den = 1;

    for (const auto& z : analog.Zeros) {
        out.Zeros.push_back((fs2 + z) / (fs2 - z));
        num *= fs2 - z;
    }
    for (const auto& p : analog.Poles) {
        out.Poles.push_back((fs2 + p) / (fs2 - p));
        den *= fs2 - p;
    }

    out.Zeros.insert(out.Zeros.end(), std::max(degree(analog), 0), cpx(-1, 0));

    out.Gain = analog.Gain * (num / den).real();

    return out;
}

std::vector<cpx> PolyFromRoots(const std::vector<cpx>& roots) {
    std::vector<cpx> poly(roots.size() + 1, cpx(0, 0));
    poly[0] = 1;

    for (size_t i = 0; i < roots.size(); i++) {
        for (size_t j = i + 1; j > 0; j--)
            poly[j] -= roots[i] * poly[j - 1];
    }

    return poly;
}

void ZpkToTf(const ZPK& zpk, std::vector<double>& b, std::vector<double>& a) {
    auto num = PolyFromRoots(zpk.Zeros);
    auto den = PolyFromRoots(zpk.Poles);

    b.resize(num.size());
    a.resize(den.size());

    for (size_t i = 0; i < num.size(); i++)
        b[i] = zpk.Gain * num[i].real();
    for (size_t i = 0; i < den.size(); i++)
        a[i] = den[i].real();
}

namespace {
// Conjugate pair, a pair of real roots, a single real root or nothing
struct RootPair {
    cpx first  = 0;
    cpx second = 0;
    int count  = 0;

    double Magnitude() const {
        return count == 0 ? 0 : std::max(std::abs(first), std::abs(second));
    }

    // 1, -(r1 + r2), r1 r2
    void Coefs(double* out) const {
        out[0] = 1;
        out[1] = -(first + second).real();
        out[2] = (first * second).real();
    }
};
}

static bool isReal(const cpx& r) {
    return fabs(r.imag()) <= 1e-10 * std::max(1.0, std::abs(r));
}

static std::vector<RootPair> pairRoots(const std::vector<cpx>& roots) {
    std::vector<cpx>    upper;
    std::vector<double> reals;
    size_t              lower = 0;

    for (const auto& r : roots) {
        if (isReal(r))
            reals.push_back(r.real());
        else if (r.imag() > 0)
            upper.push_back(r);
        else
            lower++;
    }

    if (upper.size() != lower)
        throw NumericDivergenceError("Complex roots are not in conjugate pairs");

    std::vector<RootPair> pairs;

    for (const auto& r : upper) {
        RootPair pair;
        pair.first  = r;
        pair.second = std::conj(r);
        pair.count  = 2;
        pairs.push_back(pair);
    }

    std::sort(reals.begin(), reals.end());

    for (size_t i = 0; i < reals.size(); i += 2) {
        RootPair pair;
        pair.first = reals[i];
        pair.count = 1;

        if (i + 1 < reals.size()) {
            pair.second = reals[i + 1];
            pair.count  = 2;
        }

        pairs.push_back(pair);
    }

    return pairs;
}

static double pairDistance(const RootPair& a, const RootPair& b) {
    if (a.count == 0 || b.count == 0)
        return a.count == b.count ? 0 : std::numeric_limits<double>::max();

    const cpx ra[2] = { a.first, a.second };
    const cpx rb[2] = { b.first, b.second };

    double dist = std::numeric_limits<double>::max();

    for (int i = 0; i < a.count; i++) {
        for (int j = 0; j < b.count; j++)
            dist = std::min(dist, std::abs(ra[i] - rb[j]));
    }

    return dist;
}

std::vector<Biquad> ZpkToSos(const ZPK& zpk) {
    auto poles = pairRoots(zpk.Poles);
    auto zeros = pairRoots(zpk.Zeros);

    const size_t sections = std::max<size_t>(std::max(poles.size(), zeros.size()), 1);

    // Empty pairs are roots at the origin
    poles.resize(sections);
    zeros.resize(sections);

    // Closest to the unit circle first, those pick their zeros first
    std::stable_sort(poles.begin(), poles.end(), [](const RootPair& a, const RootPair& b) {
        return a.Magnitude() > b.Magnitude();
    });

    std::vector<Biquad> sos(sections);
    std::vector<bool>   used(sections, false);

    for (size_t i = 0; i < sections; i++) {
        size_t best     = sections;
        double bestDist = std::numeric_limits<double>::max();

        for (size_t j = 0; j < sections; j++) {
            if (used[j])
                continue;

            double dist = pairDistance(poles[i], zeros[j]);

            if (best == sections || dist < bestDist) {
                best     = j;
                bestDist = dist;
            }
        }

        used[best] = true;

        // Filled from the back, the least resonant section ends up first
        Biquad& sec = sos[sections - 1 - i];
        poles[i].Coefs(sec.A);
        zeros[best].Coefs(sec.B);
    }

    for (auto& b : sos[0].B)
        b *= zpk.Gain;

    return sos;
}

static cpx evalPoly(const std::vector<double>& coefs, const cpx& zInv) {
    cpx sum = 0, zk = 1;

    for (double c : coefs) {
        sum += c * zk;
        zk  *= zInv;
    }

    return sum;
}

std::vector<double> Response(const FilterResult& res, const std::vector<double>& freqs) {
    std::vector<double> mag(freqs.size());

    for (size_t i = 0; i < freqs.size(); i++) {
        const cpx z    = std::polar(1.0, 2 * M_PI * freqs[i]);
        const cpx zInv = 1.0 / z;

        cpx h = 1;

        switch (res.Format) {
            case CoefFormat::BA:
                h = evalPoly(res.B, zInv) / evalPoly(res.A, zInv);
                break;
            case CoefFormat::ZPK:
                h = res.Zpk.Gain;

                for (const auto& zero : res.Zpk.Zeros)
                    h *= z - zero;
                for (const auto& pole : res.Zpk.Poles)
                    h /= z - pole;
                break;
            case CoefFormat::SOS:
                for (const auto& sec : res.Sections) {
                    h *= (sec.B[0] + sec.B[1] * zInv + sec.B[2] * zInv * zInv) /
                         (sec.A[0] + sec.A[1] * zInv + sec.A[2] * zInv * zInv);
                }
                break;
        }

        mag[i] = 20 * log10(std::max(std::abs(h), 1e-20));
    }

    return mag;
}
