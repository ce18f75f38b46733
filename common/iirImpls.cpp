#include <algorithm>
#include <cmath>
#include <complex>

#include "iirImpls.hpp"
#include "defines.h"
#include "include/errors.h"

using namespace Rowan;

typedef std::complex<double> cpx;

// Indices -N + 1, -N + 3, ..., N - 1
static std::vector<int> poleIndices(unsigned order) {
    std::vector<int> idx;

    for (int m = -(int)order + 1; m < (int)order; m += 2)
        idx.push_back(m);

    return idx;
}

static double chebyshevOrder(double nat, double gpass, double gstop) {
    return acosh(sqrt((gstop - 1) / (gpass - 1))) / acosh(nat);
}

double ChebyshevOrderAttenuation(unsigned order, double rippleDb, double ratio) {
    const double ch = cosh(order * acosh(ratio));

    return 10 * log10(1 + (pow(10, 0.1 * rippleDb) - 1) * ch * ch);
}

/*
* Butterworth
*/
Butterworth::Butterworth(CoefFormat format) : FilterDesigner("Butterworth", format) { }

ZPK Butterworth::Prototype(unsigned order, const FilterSpec&) const {
    ZPK proto;

    for (int m : poleIndices(order))
        proto.Poles.push_back(-std::polar(1.0, M_PI * m / (2.0 * order)));

    proto.Gain = 1;

    return proto;
}

const std::vector<double>& Butterworth::FixedEdges(const FilterSpec& spec) const {
    return spec.PassEdges;
}

EdgeRole Butterworth::ResolvedRole() const {
    return EdgeRole::Pass;
}

double Butterworth::OrderFor(double nat, double gpass, double gstop) const {
    return log10((gstop - 1) / (gpass - 1)) / (2 * log10(nat));
}

std::vector<double> Butterworth::NaturalEdges(unsigned order, BandType band, const std::vector<double>& passb,
                                              const std::vector<double>&, double gpass, double) const {
    // Frequency of the -3 dB point of the prototype
    const double w0 = pow(gpass - 1, -1.0 / (2.0 * order));

    switch (band) {
        case BandType::Lowpass:
            return { w0 * passb[0] };
        case BandType::Highpass:
            return { passb[0] / w0 };
        case BandType::Bandstop: {
            const double delta = passb[1] - passb[0];
            const double discr = sqrt(delta * delta + 4 * w0 * w0 * passb[0] * passb[1]);

            std::vector<double> wn = { fabs((delta + discr) / (2 * w0)), fabs((delta - discr) / (2 * w0)) };
            std::sort(wn.begin(), wn.end());

            return wn;
        }
        case BandType::Bandpass: {
            const double delta = passb[1] - passb[0];

            std::vector<double> wn;
            for (double w : { -w0, w0 })
                wn.push_back(fabs(-w * delta / 2 + sqrt(w * w / 4 * delta * delta + passb[0] * passb[1])));

            std::sort(wn.begin(), wn.end());

            return wn;
        }
    }

    return { };
}

/*
* Chebyshev type I
*/
Chebyshev1::Chebyshev1(CoefFormat format) : FilterDesigner("Chebyshev I", format) { }

ZPK Chebyshev1::Prototype(unsigned order, const FilterSpec& spec) const {
    const double eps = sqrt(pow(10, 0.1 * spec.PassRipple) - 1);
    const double mu  = asinh(1 / eps) / order;

    ZPK proto;
    cpx prod = 1;

    for (int m : poleIndices(order)) {
        cpx p = -std::sinh(cpx(mu, M_PI * m / (2.0 * order)));

        proto.Poles.push_back(p);
        prod *= -p;
    }

    proto.Gain = prod.real();

    // Even orders start at the bottom of the ripple
    if (order % 2 == 0)
        proto.Gain /= sqrt(1 + eps * eps);

    return proto;
}

const std::vector<double>& Chebyshev1::FixedEdges(const FilterSpec& spec) const {
    return spec.PassEdges;
}

void Chebyshev1::ValidateFixed(const FilterSpec& spec) const {
    if (!(spec.PassRipple > 0))
        throw SpecificationError("Pass band ripple must be positive");
}

EdgeRole Chebyshev1::ResolvedRole() const {
    return EdgeRole::Pass;
}

double Chebyshev1::OrderFor(double nat, double gpass, double gstop) const {
    return chebyshevOrder(nat, gpass, gstop);
}

std::vector<double> Chebyshev1::NaturalEdges(unsigned, BandType, const std::vector<double>& passb,
                                             const std::vector<double>&, double, double) const {
    // The ripple band ends exactly at the pass edges
    return passb;
}

/*
* Chebyshev type II
*/
Chebyshev2::Chebyshev2(CoefFormat format) : FilterDesigner("Chebyshev II", format) { }

ZPK Chebyshev2::Prototype(unsigned order, const FilterSpec& spec) const {
    const double de = 1 / sqrt(pow(10, 0.1 * spec.StopAtten) - 1);
    const double mu = asinh(1 / de) / order;

    ZPK proto;

    // Zeros on the imaginary axis, the middle one of an odd order is at infinity
    for (int m : poleIndices(order)) {
        if (m == 0)
            continue;

        proto.Zeros.push_back(cpx(0, 1 / sin(m * M_PI / (2.0 * order))));
    }

    for (int m : poleIndices(order)) {
        cpx p = -std::polar(1.0, M_PI * m / (2.0 * order));
        p = cpx(sinh(mu) * p.real(), cosh(mu) * p.imag());

        proto.Poles.push_back(1.0 / p);
    }

    cpx num = 1, den = 1;

    for (const auto& p : proto.Poles)
        num *= -p;
    for (const auto& z : proto.Zeros)
        den *= -z;

    proto.Gain = (num / den).real();

    return proto;
}

const std::vector<double>& Chebyshev2::FixedEdges(const FilterSpec& spec) const {
    return spec.StopEdges;
}

void Chebyshev2::ValidateFixed(const FilterSpec& spec) const {
    if (!(spec.StopAtten > 0))
        throw SpecificationError("Stop band attenuation must be positive");
}

EdgeRole Chebyshev2::ResolvedRole() const {
    return EdgeRole::Stop;
}

double Chebyshev2::OrderFor(double nat, double gpass, double gstop) const {
    return chebyshevOrder(nat, gpass, gstop);
}

std::vector<double> Chebyshev2::NaturalEdges(unsigned order, BandType band, const std::vector<double>& passb,
                                             const std::vector<double>&, double gpass, double gstop) const {
    // Where the response of this order reaches the stop band attenuation
    const double newFreq = 1 / cosh(acosh(sqrt((gstop - 1) / (gpass - 1))) / order);

    switch (band) {
        case BandType::Lowpass:
            return { passb[0] / newFreq };
        case BandType::Highpass:
            return { passb[0] * newFreq };
        case BandType::Bandstop: {
            const double delta = passb[0] - passb[1];
            const double nat0  = newFreq / 2 * delta + sqrt(newFreq * newFreq * delta * delta / 4 + passb[1] * passb[0]);

            return { nat0, passb[1] * passb[0] / nat0 };
        }
        case BandType::Bandpass: {
            const double delta = passb[0] - passb[1];
            const double nat0  = delta / (2 * newFreq) + sqrt(delta * delta / (4 * newFreq * newFreq) + passb[1] * passb[0]);

            return { nat0, passb[0] * passb[1] / nat0 };
        }
    }

    return { };
}

std::unique_ptr<FilterDesigner> MakeDesigner(const std::string& family, CoefFormat format) {
    if (family == "butter")
        return std::unique_ptr<FilterDesigner>(new Butterworth(format));
    if (family == "cheby1")
        return std::unique_ptr<FilterDesigner>(new Chebyshev1(format));
    if (family == "cheby2")
        return std::unique_ptr<FilterDesigner>(new Chebyshev2(format));

    throw SpecificationError("Unknown filter family '" + family + "'");
}
