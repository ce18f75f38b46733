#ifndef _IIR_H_
#define _IIR_H_

#include <string>
#include <vector>

#include "include/filterSpec.h"

/*
* IIR filter design by the bilinear transform of an analog prototype
*
* Derived classes provide the prototype and the order estimation formulas of
* one approximation family, this class does validation, frequency mapping and
* output conversion. Edges in a FilterSpec are fractions of fs; internally they
* are doubled so that 1 is the Nyquist frequency.
*
* Designers are stateless, Design may be called from any thread.
*/
class FilterDesigner {
public:
    const char* Name() const;
    Rowan::CoefFormat Format() const;

    // Fixed order if spec.Order > 0, minimum order otherwise
    Rowan::FilterResult Design(const Rowan::FilterSpec& spec) const;

    /*
    * Designs a filter of spec.Order at the edges the family is specified by
    *
    * Throws Rowan::SpecificationError for an invalid spec,
    * Rowan::NumericDivergenceError if the coefficients are not finite
    */
    Rowan::FilterResult DesignFixedOrder(const Rowan::FilterSpec& spec) const;

    /*
    * Finds the lowest order meeting the ripple and attenuation at the pass and
    * stop edges, then designs it at the corner frequencies that order achieves.
    * The corners are returned in ResolvedEdges.
    *
    * Throws Rowan::SpecificationError for an invalid spec,
    * Rowan::NumericDivergenceError if no finite order exists
    */
    Rowan::FilterResult DesignMinimumOrder(const Rowan::FilterSpec& spec) const;

    virtual ~FilterDesigner();

    FilterDesigner(const FilterDesigner&) = delete;
    FilterDesigner& operator=(const FilterDesigner&) = delete;
protected:
    FilterDesigner(const char* name, Rowan::CoefFormat format);

    // Analog lowpass prototype with a 1 rad/s corner
    virtual Rowan::ZPK Prototype(unsigned order, const Rowan::FilterSpec& spec) const = 0;
    // Edges a fixed order design is placed at
    virtual const std::vector<double>& FixedEdges(const Rowan::FilterSpec& spec) const = 0;
    // Family specific checks of a fixed order spec
    virtual void ValidateFixed(const Rowan::FilterSpec& spec) const;
    // Which spec edges ResolvedEdges stand for
    virtual Rowan::EdgeRole ResolvedRole() const = 0;

    /*
    * Unrounded order
    *
    * nat   - stop / pass ratio of the lowpass prototype, > 1
    * gpass - 10^(ripple / 10)
    * gstop - 10^(attenuation / 10)
    */
    virtual double OrderFor(double nat, double gpass, double gstop) const = 0;

    /*
    * Analog (prewarped) corner frequencies of a filter of the given order
    *
    * passb, stopb - prewarped pass and stop edges, tan(pi * wn / 2)
    */
    virtual std::vector<double> NaturalEdges(unsigned order, Rowan::BandType band, const std::vector<double>& passb,
                                             const std::vector<double>& stopb, double gpass, double gstop) const = 0;

private:
    std::string       name;
    Rowan::CoefFormat format;

    // Edges in Nyquist units (1 == fs / 2)
    Rowan::FilterResult synthesize(unsigned order, const std::vector<double>& wn, const Rowan::FilterSpec& spec) const;

    static double bandStopObjective(double wp, void* ctx);
};

#endif
