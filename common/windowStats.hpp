#ifndef _WINDOW_STATS_H_
#define _WINDOW_STATS_H_

#include <string>
#include <vector>

#include "window.hpp"

// Figures of merit of a window (F. J. Harris, 1978). Losses are positive dB
struct WindowStats {
    std::string Name;
    bool        Valid = false;       // false if the window fell back to rectangular

    double CohGain       = 0;
    double EqNBW         = 0;        // bins
    double ProcLoss      = 0;        // 10 log10(ENBW)
    double ScalLoss      = 0;        // loss for a tone half way between bins
    double WorstProcLoss = 0;        // ProcLoss + ScalLoss
    double OvrCor25      = 0;        // correlation of overlapped segments
    double OvrCor50      = 0;
    double OvrCor75      = 0;
    double PeakSideLevel = 0;        // dB relative to the main lobe peak
};

WindowStats AnalyzeWindow(const std::vector<double>& window);

double ScallopLoss(const std::vector<double>& window);
// ovr - fraction of overlap between consecutive segments, in [0, 1)
double OverlapCorrelation(const std::vector<double>& window, double ovr);

/*
* Log magnitude of the zero padded spectrum
*
* Args:
* window - window to transform
* mult   - zero padding factor, the FFT length is window.size() * mult
*
* Returns the positive frequency half, in dB relative to the peak
*/
std::vector<double> FreqResponse(const std::vector<double>& window, int mult = 8);

// Highest level past the first null right of the main lobe peak
double PeakSideLevel(const std::vector<double>& respDb);

/*
* Analyzes every family of a registry in parallel with the default parameters
*
* Args:
* registry - catalog to analyze
* len      - window length
* sym      - symmetric or periodic windows
*
* Returns one entry per catalog entry, in catalog order
*/
std::vector<WindowStats> AnalyzeCatalog(const WindowRegistry& registry, int len = 1024, bool sym = false);

#endif
