#include <algorithm>
#include <cmath>
#include <string>

#include "iir.hpp"
#include "zpk.hpp"
#include "bmath.hpp"
#include "defines.h"
#include "logger.hpp"
#include "include/errors.h"

using namespace Rowan;

static std::string edgeList(const std::vector<double>& edges) {
    std::string out;

    for (size_t i = 0; i < edges.size(); i++) {
        if (i > 0)
            out += ", ";

        out += std::to_string(edges[i]);
    }

    return out;
}

static void checkEdges(const char* what, const std::vector<double>& edges, BandType band) {
    if (edges.size() != EdgeCount(band)) {
        throw SpecificationError(std::string(BandTypeName(band)) + " filter needs " + std::to_string(EdgeCount(band)) +
                                 " " + what + " edge(s), got " + std::to_string(edges.size()));
    }

    for (double edge : edges) {
        if (!(edge > 0 && edge < 0.5))
            throw SpecificationError(std::string(what) + " edge " + std::to_string(edge) + " is outside (0, 0.5)");
    }

    if (edges.size() == 2 && !(edges[0] < edges[1]))
        throw SpecificationError(std::string(what) + " edges must be increasing: " + edgeList(edges));
}

// Band ordering of a minimum order spec
static void checkOrdering(const FilterSpec& spec) {
    const auto& p = spec.PassEdges;
    const auto& s = spec.StopEdges;

    bool ok = false;
    const char* rule = "";

    switch (spec.Band) {
        case BandType::Lowpass:
            ok   = p[0] < s[0];
            rule = "pass < stop";
            break;
        case BandType::Highpass:
            ok   = s[0] < p[0];
            rule = "stop < pass";
            break;
        case BandType::Bandpass:
            ok   = s[0] < p[0] && p[1] < s[1];
            rule = "stop1 < pass1 < pass2 < stop2";
            break;
        case BandType::Bandstop:
            ok   = p[0] < s[0] && s[1] < p[1];
            rule = "pass1 < stop1 < stop2 < pass2";
            break;
    }

    if (!ok) {
        throw SpecificationError(std::string(BandTypeName(spec.Band)) + " edges must satisfy " + rule +
                                 " (pass: " + edgeList(p) + ", stop: " + edgeList(s) + ")");
    }
}

// Transition ratio of the equivalent lowpass prototype
static double transitionRatio(BandType band, const std::vector<double>& passb, const std::vector<double>& stopb) {
    switch (band) {
        case BandType::Lowpass:
            return stopb[0] / passb[0];
        case BandType::Highpass:
            return passb[0] / stopb[0];
        case BandType::Bandstop: {
            double nat0 = stopb[0] * (passb[0] - passb[1]) / (stopb[0] * stopb[0] - passb[0] * passb[1]);
            double nat1 = stopb[1] * (passb[0] - passb[1]) / (stopb[1] * stopb[1] - passb[0] * passb[1]);
            return std::min(fabs(nat0), fabs(nat1));
        }
        case BandType::Bandpass: {
            double nat0 = (stopb[0] * stopb[0] - passb[0] * passb[1]) / (stopb[0] * (passb[0] - passb[1]));
            double nat1 = (stopb[1] * stopb[1] - passb[0] * passb[1]) / (stopb[1] * (passb[0] - passb[1]));
            return std::min(fabs(nat0), fabs(nat1));
        }
    }

    return 0;
}

namespace {
struct BandStopSearch {
    const FilterDesigner* designer;
    std::vector<double> passb;
    std::vector<double> stopb;
    size_t index;
    double gpass;
    double gstop;
};
}

FilterDesigner::FilterDesigner(const char* name, CoefFormat format)
      : name(name), format(format) { }

FilterDesigner::~FilterDesigner() { }

const char* FilterDesigner::Name() const {
    return name.c_str();
}

CoefFormat FilterDesigner::Format() const {
    return format;
}

void FilterDesigner::ValidateFixed(const FilterSpec&) const { }

FilterResult FilterDesigner::Design(const FilterSpec& spec) const {
    if (spec.Order > 0)
        return DesignFixedOrder(spec);

    return DesignMinimumOrder(spec);
}

FilterResult FilterDesigner::DesignFixedOrder(const FilterSpec& spec) const {
    if (spec.Order == 0)
        throw SpecificationError("Fixed order design needs an order > 0");
    if (spec.Order > MAX_FILTER_ORDER)
        throw SpecificationError("Order " + std::to_string(spec.Order) + " exceeds the limit of " + std::to_string(MAX_FILTER_ORDER));

    const auto& edges = FixedEdges(spec);

    checkEdges(ResolvedRole() == EdgeRole::Stop ? "stop" : "pass", edges, spec.Band);
    ValidateFixed(spec);

    std::vector<double> wn(edges.size());

    for (size_t i = 0; i < edges.size(); i++)
        wn[i] = edges[i] * 2;

    return synthesize(spec.Order, wn, spec);
}

double FilterDesigner::bandStopObjective(double wp, void* ctx) {
    auto search = static_cast<BandStopSearch*>(ctx);

    std::vector<double> passb = search->passb;
    passb[search->index] = wp;

    double nat = transitionRatio(BandType::Bandstop, passb, search->stopb);

    return search->designer->OrderFor(nat, search->gpass, search->gstop);
}

FilterResult FilterDesigner::DesignMinimumOrder(const FilterSpec& spec) const {
    checkEdges("pass", spec.PassEdges, spec.Band);
    checkEdges("stop", spec.StopEdges, spec.Band);

    if (!(spec.PassRipple > 0))
        throw SpecificationError("Pass band ripple must be positive");
    if (!(spec.StopAtten > 0))
        throw SpecificationError("Stop band attenuation must be positive");
    if (!(spec.StopAtten > spec.PassRipple))
        throw SpecificationError("Stop band attenuation must exceed the pass band ripple");

    checkOrdering(spec);

    const double gpass = pow(10, 0.1 * spec.PassRipple);
    const double gstop = pow(10, 0.1 * spec.StopAtten);

    std::vector<double> passb, stopb;

    // Prewarp, edges doubled to Nyquist units first
    for (double edge : spec.PassEdges)
        passb.push_back(tan(M_PI * (edge * 2) / 2));
    for (double edge : spec.StopEdges)
        stopb.push_back(tan(M_PI * (edge * 2) / 2));

    // Move the pass edges inward as long as that lowers the order
    if (spec.Band == BandType::Bandstop) {
        BandStopSearch search = { this, passb, stopb, 0, gpass, gstop };

        passb[0] = FMinBound(bandStopObjective, &search, passb[0], stopb[0] - 1e-12);

        search.passb = passb;
        search.index = 1;

        passb[1] = FMinBound(bandStopObjective, &search, stopb[1] + 1e-12, passb[1]);
    }

    const double nat = transitionRatio(spec.Band, passb, stopb);

    if (!std::isfinite(nat) || nat <= 1)
        throw NumericDivergenceError(std::string(Name()) + ": transition ratio " + std::to_string(nat) + " allows no finite order");

    const double exact = OrderFor(nat, gpass, gstop);

    if (!std::isfinite(exact))
        throw NumericDivergenceError(std::string(Name()) + ": order estimate is not finite");

    const double rounded = std::max(ceil(exact), 1.0);

    if (rounded > MAX_FILTER_ORDER) {
        throw NumericDivergenceError(std::string(Name()) + ": spec needs order " + std::to_string((long long)rounded) +
                                     ", limit is " + std::to_string(MAX_FILTER_ORDER));
    }

    const unsigned order = (unsigned)rounded;

    auto natural = NaturalEdges(order, spec.Band, passb, stopb, gpass, gstop);

    std::vector<double> wn(natural.size());

    for (size_t i = 0; i < natural.size(); i++)
        wn[i] = 2 / M_PI * atan(natural[i]);

    std::sort(wn.begin(), wn.end());

    for (double w : wn) {
        if (!(w > 0 && w < 1))
            throw NumericDivergenceError(std::string(Name()) + ": corner frequency " + std::to_string(w / 2) + " is outside (0, 0.5)");
    }

    DispDebug("FilterDesigner::DesignMinimumOrder", "%s %s: order %u", Name(), BandTypeName(spec.Band), order);

    FilterResult res = synthesize(order, wn, spec);

    res.OrderComputed = true;
    res.ResolvedRole  = ResolvedRole();
    res.ResolvedEdges.resize(wn.size());

    for (size_t i = 0; i < wn.size(); i++)
        res.ResolvedEdges[i] = wn[i] / 2;

    return res;
}

static bool allFinite(const std::vector<double>& vals) {
    for (double v : vals) {
        if (!std::isfinite(v))
            return false;
    }

    return true;
}

// Largest linear magnitude difference between the polynomials and the roots they were expanded from
static double polyMismatch(const ZPK& zpk, const std::vector<double>& b, const std::vector<double>& a,
                           const std::vector<double>& wn) {
    FilterResult roots, poly;

    roots.Format = CoefFormat::ZPK;
    roots.Zpk    = zpk;
    poly.Format  = CoefFormat::BA;
    poly.B       = b;
    poly.A       = a;

    std::vector<double> freqs;
    for (int i = 0; i <= 64; i++)
        freqs.push_back(i / 128.0);
    for (double w : wn)
        freqs.push_back(w / 2);

    auto magRoots = Response(roots, freqs);
    auto magPoly  = Response(poly, freqs);

    double worst = 0;

    for (size_t i = 0; i < freqs.size(); i++) {
        double diff = fabs(pow(10, magRoots[i] / 20) - pow(10, magPoly[i] / 20));

        if (!std::isfinite(diff))
            return INFINITY;

        worst = std::max(worst, diff);
    }

    return worst;
}

FilterResult FilterDesigner::synthesize(unsigned order, const std::vector<double>& wn, const FilterSpec& spec) const {
    const double fs = 2;

    std::vector<double> warped(wn.size());

    for (size_t i = 0; i < wn.size(); i++)
        warped[i] = 2 * fs * tan(M_PI * wn[i] / fs);

    ZPK proto = Prototype(order, spec);
    ZPK analog;

    switch (spec.Band) {
        case BandType::Lowpass:
            analog = LowpassToLowpass(proto, warped[0]);
            break;
        case BandType::Highpass:
            analog = LowpassToHighpass(proto, warped[0]);
            break;
        case BandType::Bandpass:
            analog = LowpassToBandpass(proto, sqrt(warped[0] * warped[1]), warped[1] - warped[0]);
            break;
        case BandType::Bandstop:
            analog = LowpassToBandstop(proto, sqrt(warped[0] * warped[1]), warped[1] - warped[0]);
            break;
    }

    FilterResult res;

    res.Order  = order;
    res.Format = format;
    res.Zpk    = Bilinear(analog, fs);

    bool finite = std::isfinite(res.Zpk.Gain);

    for (const auto& r : res.Zpk.Zeros)
        finite &= std::isfinite(r.real()) && std::isfinite(r.imag());
    for (const auto& r : res.Zpk.Poles)
        finite &= std::isfinite(r.real()) && std::isfinite(r.imag());

    if (!finite)
        throw NumericDivergenceError(std::string(Name()) + ": order " + std::to_string(order) + " design is not finite");

    switch (format) {
        case CoefFormat::BA:
            ZpkToTf(res.Zpk, res.B, res.A);

            if (!allFinite(res.B) || !allFinite(res.A))
                throw NumericDivergenceError(std::string(Name()) + ": polynomial coefficients are not finite");

            if (polyMismatch(res.Zpk, res.B, res.A, wn) > 0.01) {
                DispWarning("FilterDesigner::synthesize", "%s order %u: ba coefficients are badly conditioned, "
                            "use zpk or sos output", Name(), order);
            }

            res.Zpk = ZPK();
            break;
        case CoefFormat::ZPK:
            break;
        case CoefFormat::SOS:
            res.Sections = ZpkToSos(res.Zpk);
            res.Zpk = ZPK();

            for (const auto& sec : res.Sections) {
                if (!allFinite(std::vector<double>(sec.B, sec.B + 3)) || !allFinite(std::vector<double>(sec.A, sec.A + 3)))
                    throw NumericDivergenceError(std::string(Name()) + ": section coefficients are not finite");
            }
            break;
    }

    return res;
}
