#include <catch2/catch.hpp>

#include <cmath>
#include <memory>
#include <string>

#include "iirImpls.hpp"
#include "zpk.hpp"
#include "defines.h"
#include "logger.hpp"
#include "include/errors.h"

using namespace Rowan;

static FilterSpec makeSpec(BandType band, std::vector<double> pass, std::vector<double> stop, double ripple = 1, double atten = 40) {
    FilterSpec spec;

    spec.Band       = band;
    spec.PassEdges  = pass;
    spec.StopEdges  = stop;
    spec.PassRipple = ripple;
    spec.StopAtten  = atten;

    return spec;
}

static bool logged(const std::string& text) {
    for (const auto& message : GetDefaultLogger()->GetMessages())
        if (message.find(text) != std::string::npos)
            return true;

    return false;
}

static double prewarp(double edge) {
    return tan(M_PI * edge);
}

TEST_CASE("Chebyshev II minimum order lowpass", "[iir][cheby2]") {
    Chebyshev2 designer(CoefFormat::ZPK);
    auto spec = makeSpec(BandType::Lowpass, { 0.2 }, { 0.3 });

    auto res = designer.Design(spec);

    CHECK(res.Order == 5);
    CHECK(res.OrderComputed);
    CHECK(res.ResolvedRole == EdgeRole::Stop);
    REQUIRE(res.ResolvedEdges.size() == 1);

    // The corner where 40 dB is reached lies inside the requested transition band
    CHECK(res.ResolvedEdges[0] == Approx(0.29244).margin(1e-4));
    CHECK(res.ResolvedEdges[0] < 0.3);

    auto mag = Response(res, { 0, 0.2, res.ResolvedEdges[0], 0.3, 0.4 });

    CHECK(mag[0] == Approx(0).margin(1e-9));
    CHECK(mag[1] >= -1 - 1e-4);
    CHECK(mag[2] == Approx(-40).margin(1e-6));
    CHECK(mag[3] <= -40 + 1e-6);
    CHECK(mag[4] <= -40 + 1e-6);
}

TEST_CASE("Chebyshev II minimum order is tight", "[iir][cheby2]") {
    Chebyshev2 designer;
    auto spec = makeSpec(BandType::Lowpass, { 0.2 }, { 0.3 });

    unsigned order = designer.Design(spec).Order;
    double   ratio = prewarp(0.3) / prewarp(0.2);

    CHECK(ChebyshevOrderAttenuation(order, spec.PassRipple, ratio) >= spec.StopAtten);
    CHECK(ChebyshevOrderAttenuation(order - 1, spec.PassRipple, ratio) < spec.StopAtten);
}

TEST_CASE("Chebyshev II minimum order, all band types", "[iir][cheby2]") {
    Chebyshev2 designer(CoefFormat::SOS);

    struct Case {
        BandType            band;
        std::vector<double> pass;
        std::vector<double> stop;
        unsigned            order;
    };

    const Case cases[] = {
        { BandType::Lowpass,  { 0.2 },      { 0.3 },      5 },
        { BandType::Highpass, { 0.3 },      { 0.2 },      5 },
        { BandType::Bandpass, { 0.2, 0.3 }, { 0.1, 0.4 }, 3 },
        { BandType::Bandstop, { 0.1, 0.4 }, { 0.2, 0.3 }, 3 }
    };

    for (const auto& c : cases) {
        INFO(BandTypeName(c.band));

        auto res = designer.Design(makeSpec(c.band, c.pass, c.stop));

        CHECK(res.Order == c.order);
        REQUIRE(res.ResolvedEdges.size() == c.stop.size());

        auto pass = Response(res, c.pass);
        auto stop = Response(res, c.stop);
        auto corner = Response(res, res.ResolvedEdges);

        for (double p : pass)
            CHECK(p >= -1 - 1e-4);
        for (double s : stop)
            CHECK(s <= -40 + 1e-6);
        for (double r : corner)
            CHECK(r == Approx(-40).margin(1e-4));
    }
}

TEST_CASE("Chebyshev II fixed order places the stop edge", "[iir][cheby2]") {
    Chebyshev2 designer(CoefFormat::ZPK);

    auto spec  = makeSpec(BandType::Lowpass, { 0.2 }, { 0.3 });
    spec.Order = 4;

    auto res = designer.Design(spec);

    CHECK(res.Order == 4);
    CHECK_FALSE(res.OrderComputed);
    CHECK(res.ResolvedEdges.empty());
    CHECK(res.Zpk.Zeros.size() == 4);
    CHECK(res.Zpk.Poles.size() == 4);

    auto mag = Response(res, { 0, 0.3 });
    CHECK(mag[0] == Approx(0).margin(1e-9));
    CHECK(mag[1] == Approx(-40).margin(1e-6));

    SECTION("bandstop") {
        auto bs  = makeSpec(BandType::Bandstop, { 0.1, 0.4 }, { 0.2, 0.3 });
        bs.Order = 6;

        auto bsRes = designer.Design(bs);

        CHECK(bsRes.Zpk.Poles.size() == 12);

        auto bsMag = Response(bsRes, { 0, 0.2, 0.25, 0.3 });
        CHECK(bsMag[0] == Approx(0).margin(1e-9));
        CHECK(bsMag[1] == Approx(-40).margin(1e-6));
        CHECK(bsMag[2] <= -40 + 1e-6);
        CHECK(bsMag[3] == Approx(-40).margin(1e-6));
    }
}

TEST_CASE("Fixed order design is deterministic", "[iir]") {
    Chebyshev2 designer(CoefFormat::BA);

    auto spec  = makeSpec(BandType::Lowpass, { 0.2 }, { 0.3 });
    spec.Order = 6;

    auto a = designer.DesignFixedOrder(spec);
    auto b = designer.DesignFixedOrder(spec);

    REQUIRE(a.B.size() == 7);
    REQUIRE(a.A.size() == 7);
    CHECK(a.B == b.B);
    CHECK(a.A == b.A);
    CHECK(a.A[0] == Approx(1));
}

TEST_CASE("Coefficient formats describe the same filter", "[iir]") {
    auto spec = makeSpec(BandType::Bandpass, { 0.2, 0.3 }, { 0.1, 0.4 });

    auto ba  = Chebyshev2(CoefFormat::BA).Design(spec);
    auto zpk = Chebyshev2(CoefFormat::ZPK).Design(spec);
    auto sos = Chebyshev2(CoefFormat::SOS).Design(spec);

    CHECK_FALSE(ba.B.empty());
    CHECK(ba.Sections.empty());
    CHECK(ba.Zpk.Poles.empty());
    CHECK_FALSE(zpk.Zpk.Poles.empty());
    CHECK(zpk.B.empty());
    CHECK(sos.Sections.size() == (size_t)sos.Order);

    std::vector<double> freqs = { 0.05, 0.15, 0.2, 0.25, 0.3, 0.35, 0.45 };

    auto rBa  = Response(ba, freqs);
    auto rZpk = Response(zpk, freqs);
    auto rSos = Response(sos, freqs);

    for (size_t i = 0; i < freqs.size(); i++) {
        INFO(freqs[i]);
        CHECK(rBa[i] == Approx(rZpk[i]).margin(1e-6));
        CHECK(rSos[i] == Approx(rZpk[i]).margin(1e-6));
    }
}

TEST_CASE("High order polynomial output warns about conditioning", "[iir]") {
    auto spec  = makeSpec(BandType::Bandstop, { 0.1, 0.4 }, { 0.2, 0.3 });
    spec.Order = 20;

    GetDefaultLogger()->ClearMessages();

    auto sos = Chebyshev2(CoefFormat::SOS).Design(spec);
    CHECK_FALSE(logged("badly conditioned"));

    auto mag = Response(sos, { 0.2, 0.3 });
    CHECK(mag[0] == Approx(-40).margin(1e-4));
    CHECK(mag[1] == Approx(-40).margin(1e-4));

    Chebyshev2(CoefFormat::BA).Design(spec);
    CHECK(logged("Chebyshev II order 20: ba coefficients are badly conditioned"));

    SECTION("low orders stay quiet") {
        GetDefaultLogger()->ClearMessages();

        spec.Order = 3;
        Chebyshev2(CoefFormat::BA).Design(spec);
        Chebyshev2(CoefFormat::BA).Design(makeSpec(BandType::Lowpass, { 0.2 }, { 0.3 }));

        CHECK_FALSE(logged("badly conditioned"));
    }
}

TEST_CASE("Invalid specifications fail before any design", "[iir][errors]") {
    Chebyshev2 designer;

    SECTION("lowpass with pass above stop") {
        CHECK_THROWS_AS(designer.Design(makeSpec(BandType::Lowpass, { 0.3 }, { 0.2 })), SpecificationError);
    }
    SECTION("highpass with pass below stop") {
        CHECK_THROWS_AS(designer.Design(makeSpec(BandType::Highpass, { 0.2 }, { 0.3 })), SpecificationError);
    }
    SECTION("bandpass pass band outside the stop edges") {
        CHECK_THROWS_AS(designer.Design(makeSpec(BandType::Bandpass, { 0.05, 0.3 }, { 0.1, 0.4 })), SpecificationError);
    }
    SECTION("bandstop stop band outside the pass edges") {
        CHECK_THROWS_AS(designer.Design(makeSpec(BandType::Bandstop, { 0.2, 0.4 }, { 0.1, 0.3 })), SpecificationError);
    }
    SECTION("edge count does not match the band") {
        CHECK_THROWS_AS(designer.Design(makeSpec(BandType::Bandpass, { 0.2 }, { 0.1, 0.4 })), SpecificationError);
        CHECK_THROWS_AS(designer.Design(makeSpec(BandType::Lowpass, { 0.2, 0.25 }, { 0.3 })), SpecificationError);
    }
    SECTION("edges outside (0, 0.5)") {
        CHECK_THROWS_AS(designer.Design(makeSpec(BandType::Lowpass, { 0.2 }, { 0.5 })), SpecificationError);
        CHECK_THROWS_AS(designer.Design(makeSpec(BandType::Lowpass, { 0 }, { 0.3 })), SpecificationError);
    }
    SECTION("non-positive ripple or attenuation") {
        CHECK_THROWS_AS(designer.Design(makeSpec(BandType::Lowpass, { 0.2 }, { 0.3 }, 0, 40)), SpecificationError);
        CHECK_THROWS_AS(designer.Design(makeSpec(BandType::Lowpass, { 0.2 }, { 0.3 }, 1, -40)), SpecificationError);
        CHECK_THROWS_AS(designer.Design(makeSpec(BandType::Lowpass, { 0.2 }, { 0.3 }, 3, 3)), SpecificationError);
    }
    SECTION("fixed order") {
        auto spec = makeSpec(BandType::Lowpass, { 0.2 }, { 0.3 }, 1, 0);
        spec.Order = 4;
        CHECK_THROWS_AS(designer.Design(spec), SpecificationError);

        spec.StopAtten = 40;
        spec.Order     = MAX_FILTER_ORDER + 1;
        CHECK_THROWS_AS(designer.Design(spec), SpecificationError);

        spec.Order     = 4;
        spec.StopEdges = { 0.3, 0.4 };
        CHECK_THROWS_AS(designer.Design(spec), SpecificationError);

        spec.Order = 0;
        CHECK_THROWS_AS(designer.DesignFixedOrder(spec), SpecificationError);
    }
}

TEST_CASE("Unreachable specifications diverge", "[iir][errors]") {
    Chebyshev2 designer;

    // Nearly flat transition band needs thousands of orders
    CHECK_THROWS_AS(designer.Design(makeSpec(BandType::Lowpass, { 0.2 }, { 0.2000001 })), NumericDivergenceError);
}

TEST_CASE("Butterworth", "[iir][butter]") {
    Butterworth designer(CoefFormat::ZPK);

    SECTION("minimum order") {
        auto res = designer.Design(makeSpec(BandType::Lowpass, { 0.2 }, { 0.3 }));

        CHECK(res.Order == 9);
        CHECK(res.ResolvedRole == EdgeRole::Pass);
        REQUIRE(res.ResolvedEdges.size() == 1);

        auto mag = Response(res, { 0.2, res.ResolvedEdges[0], 0.3 });
        CHECK(mag[0] >= -1 - 1e-4);
        CHECK(mag[1] == Approx(-3.0103).margin(1e-3));
        CHECK(mag[2] <= -40);
    }

    SECTION("fixed order uses the pass edge as -3 dB corner") {
        auto spec  = makeSpec(BandType::Lowpass, { 0.2 }, { 0.3 });
        spec.Order = 4;

        auto mag = Response(designer.Design(spec), { 0, 0.2 });
        CHECK(mag[0] == Approx(0).margin(1e-9));
        CHECK(mag[1] == Approx(-3.0103).margin(1e-3));
    }

    SECTION("bandstop minimum order") {
        auto res = designer.Design(makeSpec(BandType::Bandstop, { 0.1, 0.4 }, { 0.2, 0.3 }));

        CHECK(res.Order == 4);

        auto mag = Response(res, { 0.1, 0.2, 0.3, 0.4 });
        CHECK(mag[0] >= -1 - 1e-4);
        CHECK(mag[1] <= -40);
        CHECK(mag[2] <= -40);
        CHECK(mag[3] >= -1 - 1e-4);
    }
}

TEST_CASE("Chebyshev I", "[iir][cheby1]") {
    Chebyshev1 designer(CoefFormat::ZPK);

    SECTION("minimum order keeps the pass edges") {
        auto res = designer.Design(makeSpec(BandType::Highpass, { 0.3 }, { 0.2 }));

        CHECK(res.Order == 5);
        CHECK(res.ResolvedRole == EdgeRole::Pass);
        REQUIRE(res.ResolvedEdges.size() == 1);
        CHECK(res.ResolvedEdges[0] == Approx(0.3));

        auto mag = Response(res, { 0.2, 0.3, 0.4999 });
        CHECK(mag[0] <= -40);
        CHECK(mag[1] == Approx(-1).margin(1e-6));
        CHECK(mag[2] == Approx(0).margin(1e-3));
    }

    SECTION("even order starts at the bottom of the ripple") {
        auto spec  = makeSpec(BandType::Lowpass, { 0.2 }, { 0.3 });
        spec.Order = 4;

        auto mag = Response(designer.Design(spec), { 0, 0.2 });
        CHECK(mag[0] == Approx(-1).margin(1e-9));
        CHECK(mag[1] == Approx(-1).margin(1e-9));
    }

    SECTION("fixed order needs a ripple") {
        auto spec  = makeSpec(BandType::Lowpass, { 0.2 }, { 0.3 }, 0, 40);
        spec.Order = 4;
        CHECK_THROWS_AS(designer.Design(spec), SpecificationError);
    }
}

TEST_CASE("MakeDesigner", "[iir]") {
    auto cheby2 = MakeDesigner("cheby2", CoefFormat::SOS);

    REQUIRE(cheby2 != nullptr);
    CHECK(std::string(cheby2->Name()) == "Chebyshev II");
    CHECK(cheby2->Format() == CoefFormat::SOS);

    CHECK(std::string(MakeDesigner("butter")->Name()) == "Butterworth");
    CHECK(std::string(MakeDesigner("cheby1")->Name()) == "Chebyshev I");

    CHECK_THROWS_AS(MakeDesigner("ellip"), SpecificationError);
}
