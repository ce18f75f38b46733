#ifndef __ROWAN_WINDOW_DESC__
#define __ROWAN_WINDOW_DESC__

#include <cmath>
#include <string>
#include <vector>

namespace Rowan {

// Window generators take at most this many shape parameters
constexpr unsigned MAX_WINDOW_PARAMS = 2;

struct WindowParam {
    std::string Name;
    double      Default = 0;
    double      Min     = 0;
    double      Max     = 0;

    // Out of range values are corrected, not rejected
    double Clamp(double val) const {
        if (std::isnan(val))
            return Default;
        if (val < Min)
            return Min;
        if (val > Max)
            return Max;

        return val;
    }
};

/*
* Window generator
*
* len - number of points (>= 1)
* sym - true: symmetric window (period len - 1, FIR design)
*       false: periodic window (period len, spectral analysis)
* par - shape parameters, already clamped, one per WindowParam
*
* May throw or return an empty array on failure.
*/
typedef std::vector<double> (*WindowImpl)(int len, bool sym, const std::vector<double>& par);

struct WindowDesc {
    std::string              Name;
    WindowImpl               Impl = nullptr;
    std::vector<WindowParam> Params;
};

enum class WindowStatus {
    Ok,
    Fallback // generator failed, rectangular window substituted
};

struct WindowResult {
    std::vector<double> Window;     // gain normalized, sum(Window) / len == 1
    double CohGain = 1;             // of the window before normalization
    double EqNBW   = 1;             // in bins, of the window before normalization

    WindowStatus Status = WindowStatus::Ok;
    std::string  Reason;            // why the fallback happened

    bool IsFallback() const { return Status == WindowStatus::Fallback; }
};

}

#endif
