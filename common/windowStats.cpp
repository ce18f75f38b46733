#include <algorithm>
#include <cmath>
#include <complex>
#include <exception>
#include <stdexcept>

#include "windowStats.hpp"
#include "defines.h"
#include "fft.h"
#include "logger.hpp"

WindowStats AnalyzeWindow(const std::vector<double>& window) {
    if (window.empty())
        throw std::invalid_argument("AnalyzeWindow: empty window");

    const double len = window.size();

    double sum = 0, sumSq = 0;
    for (double w : window) {
        sum   += w;
        sumSq += w * w;
    }

    WindowStats stats;

    stats.CohGain       = sum / len;
    stats.EqNBW         = len * sumSq / (sum * sum);
    stats.ProcLoss      = 10 * log10(stats.EqNBW);
    stats.ScalLoss      = ScallopLoss(window);
    stats.WorstProcLoss = stats.ProcLoss + stats.ScalLoss;
    stats.OvrCor25      = OverlapCorrelation(window, 0.25);
    stats.OvrCor50      = OverlapCorrelation(window, 0.5);
    stats.OvrCor75      = OverlapCorrelation(window, 0.75);
    stats.PeakSideLevel = PeakSideLevel(FreqResponse(window));
    stats.Valid         = true;

    return stats;
}

double ScallopLoss(const std::vector<double>& window) {
    const double len = window.size();

    // Response half a bin away from the center
    double sum = 0, re = 0, im = 0;
    for (size_t i = 0; i < window.size(); i++) {
        sum += window[i];
        re  += window[i] * cos((M_PI * i) / len);
        im  -= window[i] * sin((M_PI * i) / len);
    }

    return -20 * log10(sqrt(re * re + im * im) / sum);
}

double OverlapCorrelation(const std::vector<double>& window, double ovr) {
    if (ovr < 0 || ovr >= 1)
        throw std::invalid_argument("OverlapCorrelation: overlap must be in [0, 1)");

    const size_t len   = window.size();
    const size_t shift = (size_t)std::lround((1 - ovr) * len);

    double sumSq = 0;
    for (double w : window)
        sumSq += w * w;

    double tp = 0;
    for (size_t i = 0; i + shift < len; i++)
        tp += window[i] * window[i + shift];

    return tp / sumSq;
}

std::vector<double> FreqResponse(const std::vector<double>& window, int mult) {
    if (window.empty() || mult < 1)
        throw std::invalid_argument("FreqResponse: empty window or bad padding factor");

    const size_t fftLen  = window.size() * mult;
    const size_t halfLen = std::max<size_t>(fftLen / 2, 1);

    std::vector<std::complex<double>> fftIn(fftLen, 0.0), fftOut(fftLen);

    for (size_t i = 0; i < window.size(); i++)
        fftIn[i] = window[i];

    fft(fftIn.data(), fftOut.data(), fftLen);

    std::vector<double> resp(halfLen);

    double peak = 0;
    for (size_t i = 0; i < halfLen; i++) {
        resp[i] = std::abs(fftOut[i]);
        peak    = std::max(peak, resp[i]);
    }

    if (peak == 0)
        throw std::runtime_error("FreqResponse: window has no energy");

    // -400 dB floor for exact nulls
    for (auto& r : resp)
        r = 20 * log10(std::max(r / peak, 1e-20));

    return resp;
}

double PeakSideLevel(const std::vector<double>& respDb) {
    if (respDb.empty())
        return 0;

    // Main lobe peak is not always at DC (flat top windows)
    size_t i = std::max_element(respDb.begin(), respDb.end()) - respDb.begin() + 1;

    while (i < respDb.size() && respDb[i] <= respDb[i - 1])
        i++;

    if (i >= respDb.size())
        return respDb.back();

    return *std::max_element(respDb.begin() + i - 1, respDb.end());
}

std::vector<WindowStats> AnalyzeCatalog(const WindowRegistry& registry, int len, bool sym) {
    const auto& catalog = registry.Catalog();
    const int   count   = (int)catalog.size();

    std::vector<WindowStats> stats(count);

    #pragma omp parallel for
    for (int i = 0; i < count; i++) {
        const auto& desc = catalog[i];

        try {
            auto res = registry.Compute(desc, len, sym, WindowRegistry::DefaultParams(desc));

            // Normalized window, the gain is taken from the compute result
            if (!res.IsFallback()) {
                stats[i] = AnalyzeWindow(res.Window);
                stats[i].CohGain = res.CohGain;
            }
        } catch (const std::exception& e) {
            DispError("AnalyzeCatalog", "%s: %s", desc.Name.c_str(), e.what());
        }

        stats[i].Name = desc.Name;
    }

    return stats;
}
