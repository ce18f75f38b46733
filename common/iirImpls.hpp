#ifndef _IIR_IMPL_
#define _IIR_IMPL_

#include <memory>
#include <string>

#include "iir.hpp"

// Maximally flat pass band, designed at the -3 dB pass edges
class Butterworth : public FilterDesigner {
public:
    explicit Butterworth(Rowan::CoefFormat format = Rowan::CoefFormat::BA);
protected:
    Rowan::ZPK Prototype(unsigned order, const Rowan::FilterSpec& spec) const override;
    const std::vector<double>& FixedEdges(const Rowan::FilterSpec& spec) const override;
    Rowan::EdgeRole ResolvedRole() const override;
    double OrderFor(double nat, double gpass, double gstop) const override;
    std::vector<double> NaturalEdges(unsigned order, Rowan::BandType band, const std::vector<double>& passb,
                                     const std::vector<double>& stopb, double gpass, double gstop) const override;
};

// Equiripple pass band, designed at the pass edges with the pass band ripple
class Chebyshev1 : public FilterDesigner {
public:
    explicit Chebyshev1(Rowan::CoefFormat format = Rowan::CoefFormat::BA);
protected:
    Rowan::ZPK Prototype(unsigned order, const Rowan::FilterSpec& spec) const override;
    const std::vector<double>& FixedEdges(const Rowan::FilterSpec& spec) const override;
    void ValidateFixed(const Rowan::FilterSpec& spec) const override;
    Rowan::EdgeRole ResolvedRole() const override;
    double OrderFor(double nat, double gpass, double gstop) const override;
    std::vector<double> NaturalEdges(unsigned order, Rowan::BandType band, const std::vector<double>& passb,
                                     const std::vector<double>& stopb, double gpass, double gstop) const override;
};

/*
* Inverse Chebyshev: monotonic pass band, equiripple stop band
*
* Designed at the stop edges, where the response first reaches the stop band
* attenuation. A minimum order design resolves the stop edges.
*/
class Chebyshev2 : public FilterDesigner {
public:
    explicit Chebyshev2(Rowan::CoefFormat format = Rowan::CoefFormat::BA);
protected:
    Rowan::ZPK Prototype(unsigned order, const Rowan::FilterSpec& spec) const override;
    const std::vector<double>& FixedEdges(const Rowan::FilterSpec& spec) const override;
    void ValidateFixed(const Rowan::FilterSpec& spec) const override;
    Rowan::EdgeRole ResolvedRole() const override;
    double OrderFor(double nat, double gpass, double gstop) const override;
    std::vector<double> NaturalEdges(unsigned order, Rowan::BandType band, const std::vector<double>& passb,
                                     const std::vector<double>& stopb, double gpass, double gstop) const override;
};

/*
* Creates a designer by family name: "butter", "cheby1" or "cheby2"
*
* Throws Rowan::SpecificationError for other names
*/
std::unique_ptr<FilterDesigner> MakeDesigner(const std::string& family, Rowan::CoefFormat format = Rowan::CoefFormat::BA);

/*
* Attenuation (dB) of a Chebyshev response of the given order at a transition
* ratio (stop / pass of the lowpass prototype, after prewarping)
*/
double ChebyshevOrderAttenuation(unsigned order, double rippleDb, double ratio);

#endif
