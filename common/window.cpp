#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>

#include "window.hpp"
#include "windowImpls.hpp"
#include "cosineSum.hpp"
#include "logger.hpp"
#include "include/errors.h"

using namespace Rowan;

static std::string lower(const std::string& str) {
    std::string out(str);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return (char)tolower(c); });

    return out;
}

static bool nameLess(const std::string& a, const std::string& b) {
    std::string la = lower(a), lb = lower(b);

    if (la != lb)
        return la < lb;

    return a < b;
}

static WindowResult fallback(int len, const std::string& reason) {
    WindowResult res;

    res.Window = std::vector<double>(len, 1.0);
    res.Status = WindowStatus::Fallback;
    res.Reason = reason;

    return res;
}

WindowRegistry::WindowRegistry(const std::vector<WindowDesc>& catalog, const std::string& defaultFamily)
      : catalog(catalog)
{
    for (size_t i = 0; i < catalog.size(); i++) {
        for (size_t j = i + 1; j < catalog.size(); j++) {
            if (catalog[i].Name == catalog[j].Name)
                throw PreconditionError("WindowRegistry: duplicate window family '" + catalog[i].Name + "'");
        }
    }

    auto def = std::find_if(catalog.begin(), catalog.end(), [&](const WindowDesc& desc) { return desc.Name == defaultFamily; });

    if (def == catalog.end())
        throw PreconditionError("WindowRegistry: default family '" + defaultFamily + "' is not in the catalog");

    defaultIndex = def - catalog.begin();
}

const WindowDesc* WindowRegistry::find(const std::string& name) const {
    for (const auto& desc : catalog) {
        if (desc.Name == name)
            return &desc;
    }

    return nullptr;
}

std::vector<std::string> WindowRegistry::ListAvailable() const {
    std::vector<std::string> names;

    for (const auto& desc : catalog)
        names.push_back(desc.Name);

    std::sort(names.begin(), names.end(), nameLess);

    return names;
}

std::vector<std::string> WindowRegistry::ListAvailable(const std::vector<std::string>& filter) const {
    std::vector<std::string> names;

    for (const auto& name : filter) {
        if (find(name) == nullptr) {
            DispWarning("WindowRegistry::ListAvailable", "Unknown window '%s' ignored", name.c_str());
            continue;
        }

        if (std::find(names.begin(), names.end(), name) == names.end())
            names.push_back(name);
    }

    std::sort(names.begin(), names.end(), nameLess);

    return names;
}

bool WindowRegistry::Contains(const std::string& name) const {
    return find(name) != nullptr;
}

const WindowDesc& WindowRegistry::Resolve(const std::string& name) const {
    const WindowDesc* desc = find(name);

    if (desc != nullptr)
        return *desc;

    DispWarning("WindowRegistry::Resolve", "Unknown window '%s', using '%s'", name.c_str(), Default().Name.c_str());

    return Default();
}

const WindowDesc& WindowRegistry::Default() const {
    return catalog[defaultIndex];
}

const std::vector<WindowDesc>& WindowRegistry::Catalog() const {
    return catalog;
}

std::vector<double> WindowRegistry::DefaultParams(const WindowDesc& desc) {
    std::vector<double> vals;

    for (const auto& par : desc.Params)
        vals.push_back(par.Default);

    return vals;
}

WindowResult WindowRegistry::Compute(const WindowDesc& desc, int len, bool sym, const std::vector<double>& params) const {
    static const char* sdr = "WindowRegistry::Compute";

    if (len < 1)
        throw PreconditionError("Window length must be at least 1, got " + std::to_string(len));
    if (params.size() != desc.Params.size())
        throw PreconditionError(desc.Name + " window takes " + std::to_string(desc.Params.size()) + " parameter(s), got " + std::to_string(params.size()));

    std::string reason;
    std::vector<double> win;

    if (desc.Params.size() > MAX_WINDOW_PARAMS) {
        reason = "unsupported number of parameters (" + std::to_string(desc.Params.size()) + ")";
    } else if (desc.Impl == nullptr) {
        reason = "no generator";
    } else {
        std::vector<double> clamped(params.size());

        for (size_t i = 0; i < params.size(); i++)
            clamped[i] = desc.Params[i].Clamp(params[i]);

        try {
            win = desc.Impl(len, sym, clamped);
        } catch (const std::exception& e) {
            reason = e.what();
        }

        if (reason.empty() && win.size() != (size_t)len)
            reason = "generator returned " + std::to_string(win.size()) + " points";
    }

    double sum = 0, sumSq = 0;

    if (reason.empty()) {
        for (double w : win) {
            sum   += w;
            sumSq += w * w;
        }

        if (!std::isfinite(sum) || !std::isfinite(sumSq))
            reason = "non-finite window values";
        else if (sum <= 0)
            reason = "window sum is not positive";
    }

    if (!reason.empty()) {
        DispWarning(sdr, "%s window failed (%s), using rectangular window", desc.Name.c_str(), reason.c_str());
        return fallback(len, reason);
    }

    WindowResult res;

    res.CohGain = sum / len;
    res.EqNBW   = len * sumSq / (sum * sum);

    for (auto& w : win)
        w /= res.CohGain;

    res.Window = std::move(win);

    return res;
}

std::vector<WindowDesc> BuiltinWindows() {
    using namespace Windows;

    return {
        { "Barthann",         Barthann,         { } },
        { "Bartlett",         Bartlett,         { } },
        { "Blackman",         Blackman,         { } },
        { "Blackmanharris",   BlackmanHarris,   { } },
        { "Blackmanharris_5", BlackmanHarris5,  { } },
        { "Blackmanharris_7", BlackmanHarris7,  { } },
        { "Blackmanharris_9", BlackmanHarris9,  { } },
        { "Bohman",           Bohman,           { } },
        { "Boxcar",           Boxcar,           { } },
        { "Cosine",           Cosine,           { } },
        { "Dolph-Chebyshev",  DolphChebyshev,   { { "a", 80, 45, 300 } } },
        { "DPSS",             DPSS,             { { "NW", 3, 0, 100 } } },
        { "Flattop",          Flattop,          { } },
        { "Gauss",            Gauss,            { { "sigma", 5, 0, 100 } } },
        { "General Gaussian", GeneralGaussian,  { { "p", 1.5, 0, 20 }, { "sigma", 5, 0, 100 } } },
        { "Hamming",          Hamming,          { } },
        { "Hann",             Hann,             { } },
        { "Kaiser",           Kaiser,           { { "beta", 10, 0, 30 } } },
        { "Nuttall",          Nuttall,          { } },
        { "Parzen",           Parzen,           { } },
        { "Rectangular",      Boxcar,           { } },
        { "Slepian",          Slepian,          { { "BW", 0.3, 0, 100 } } },
        { "Triangular",       Triangular,       { } },
        { "Tukey",            Tukey,            { { "alpha", 0.25, 0, 1 } } }
    };
}

const WindowRegistry& GetWindowRegistry() {
    static const WindowRegistry registry(BuiltinWindows(), "Rectangular");

    return registry;
}

WindowState::WindowState(const WindowRegistry& registry, const std::string& family)
      : registry(registry)
{
    SelectFamily(family);
}

void WindowState::SelectFamily(const std::string& name) {
    const WindowDesc* next = &registry.Resolve(name);

    if (params.find(next->Name) == params.end())
        params[next->Name] = WindowRegistry::DefaultParams(*next);

    if (next != family) {
        family = next;
        Invalidate();
    }
}

const WindowDesc& WindowState::Family() const {
    return *family;
}

const std::vector<double>& WindowState::Params() const {
    return params.at(family->Name);
}

void WindowState::SetParam(unsigned index, double value) {
    if (index >= family->Params.size())
        throw PreconditionError(family->Name + " window has no parameter " + std::to_string(index));

    double& cur = params[family->Name][index];
    double  val = family->Params[index].Clamp(value);

    if (val != cur) {
        cur = val;
        Invalidate();
    }
}

const WindowResult& WindowState::Get(int len, bool sym) {
    if (IsCached(len, sym))
        return result;

    result    = registry.Compute(*family, len, sym, Params());
    cached    = true;
    cachedLen = len;
    cachedSym = sym;

    return result;
}

bool WindowState::IsCached(int len, bool sym) const {
    return cached && cachedLen == len && cachedSym == sym;
}

void WindowState::Invalidate() {
    cached = false;
}

double WindowState::CohGain() const {
    if (!cached)
        throw PreconditionError("WindowState: no window computed");

    return result.CohGain;
}

double WindowState::EqNBW() const {
    if (!cached)
        throw PreconditionError("WindowState: no window computed");

    return result.EqNBW;
}
