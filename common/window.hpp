#ifndef _WINDOW_H_
#define _WINDOW_H_

#include <map>
#include <string>
#include <vector>

#include "include/windowDesc.h"

/*
* Catalog of window families
*
* Read only after construction. Lookups by name never fail, unknown names
* resolve to the default family.
*/
class WindowRegistry {
public:
    // All family names, sorted alphabetically ignoring case
    std::vector<std::string> ListAvailable() const;
    // Names in filter that exist in the catalog, sorted. Unknown names are dropped with a warning
    std::vector<std::string> ListAvailable(const std::vector<std::string>& filter) const;

    bool Contains(const std::string& name) const;
    const Rowan::WindowDesc& Resolve(const std::string& name) const;
    const Rowan::WindowDesc& Default() const;
    const std::vector<Rowan::WindowDesc>& Catalog() const;

    /*
    * Computes a gain normalized window
    *
    * Args:
    * desc   - family, usually from Resolve()
    * len    - number of points, >= 1
    * sym    - symmetric (FIR design) or periodic (spectral analysis)
    * params - one value per desc.Params, clamped before use
    *
    * Throws Rowan::PreconditionError if len < 1 or params has the wrong size.
    * Any failure of the generator itself results in a rectangular window with
    * Status == Fallback.
    */
    Rowan::WindowResult Compute(const Rowan::WindowDesc& desc, int len, bool sym, const std::vector<double>& params) const;

    // Default parameter values of a family
    static std::vector<double> DefaultParams(const Rowan::WindowDesc& desc);

    /*
    * Args:
    * catalog       - families, names must be unique
    * defaultFamily - family used when a name does not resolve, must be in catalog
    */
    WindowRegistry(const std::vector<Rowan::WindowDesc>& catalog, const std::string& defaultFamily);

    WindowRegistry(const WindowRegistry&) = delete;
    WindowRegistry& operator=(const WindowRegistry&) = delete;
private:
    std::vector<Rowan::WindowDesc> catalog;
    size_t defaultIndex = 0;

    const Rowan::WindowDesc* find(const std::string& name) const;
};

/*
* Selected window family, its parameters and the last computed window
*
* Parameter values are kept per family, switching back to a family restores
* them. Not thread safe.
*/
class WindowState {
public:
    // Switches family, unknown names select the registry default
    void SelectFamily(const std::string& name);
    const Rowan::WindowDesc& Family() const;

    const std::vector<double>& Params() const;
    // Clamps the value to the parameter's range
    void SetParam(unsigned index, double value);

    // Cached window, recomputed only if the family, parameters, len or sym changed
    const Rowan::WindowResult& Get(int len, bool sym);
    bool IsCached(int len, bool sym) const;
    void Invalidate();

    // Statistics of the cached window
    double CohGain() const;
    double EqNBW() const;

    WindowState(const WindowRegistry& registry, const std::string& family);

    WindowState(const WindowState&) = delete;
    WindowState& operator=(const WindowState&) = delete;
private:
    const WindowRegistry&    registry;
    const Rowan::WindowDesc* family = nullptr;

    std::map<std::string, std::vector<double>> params;

    bool                cached    = false;
    int                 cachedLen = 0;
    bool                cachedSym = false;
    Rowan::WindowResult result;
};

// Every window family provided by the library
std::vector<Rowan::WindowDesc> BuiltinWindows();
// Registry built from BuiltinWindows(), default family "Rectangular"
const WindowRegistry& GetWindowRegistry();

#endif
