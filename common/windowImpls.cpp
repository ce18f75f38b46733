#include <algorithm>
#include <cmath>
#include <complex>
#include <stdexcept>
#include <string>

#include "windowImpls.hpp"
#include "cosineSum.hpp"
#include "bmath.hpp"
#include "defines.h"
#include "fft.h"

// Length of the symmetric window a request is computed from
static int extendedLen(int len, bool sym) {
    return sym ? len : len + 1;
}
// Drops the extra point of a periodic window
static std::vector<double> truncate(std::vector<double> win, bool sym) {
    if (!sym)
        win.pop_back();

    return win;
}

static std::vector<double> ones(int len) {
    return std::vector<double>(len, 1.0);
}

static double param(const std::vector<double>& par, size_t index, const char* window) {
    if (index >= par.size())
        throw std::invalid_argument(std::string(window) + ": missing shape parameter");

    return par[index];
}

// Cosine sums with alternating sign coefficients, zero at both ends of the symmetric window
static std::vector<double> generalCosine(int len, bool sym, std::initializer_list<double> coefs) {
    std::vector<double> signedCoefs;
    double sign = 1;

    for (double a : coefs) {
        signedCoefs.push_back(sign * a);
        sign = -sign;
    }

    return CosineSum(len, sym, signedCoefs);
}

namespace Windows {

std::vector<double> Boxcar(int len, bool, const std::vector<double>&) {
    return ones(len);
}

std::vector<double> Barthann(int len, bool sym, const std::vector<double>&) {
    if (len <= 1)
        return ones(len);

    const int m = extendedLen(len, sym);
    std::vector<double> win(m);

    for (int i = 0; i < m; i++) {
        double fac = fabs((double)i / (m - 1) - 0.5);
        win[i] = 0.62 - 0.48 * fac + 0.38 * cos(2 * M_PI * fac);
    }

    return truncate(win, sym);
}

std::vector<double> Bartlett(int len, bool sym, const std::vector<double>&) {
    if (len <= 1)
        return ones(len);

    const int m = extendedLen(len, sym);
    std::vector<double> win(m);

    for (int i = 0; i < m; i++)
        win[i] = i <= (m - 1) / 2.0 ? 2.0 * i / (m - 1) : 2.0 - 2.0 * i / (m - 1);

    return truncate(win, sym);
}

std::vector<double> Blackman(int len, bool sym, const std::vector<double>&) {
    return generalCosine(len, sym, { 0.42, 0.50, 0.08 });
}

std::vector<double> BlackmanHarris(int len, bool sym, const std::vector<double>&) {
    return generalCosine(len, sym, { 0.35875, 0.48829, 0.14128, 0.01168 });
}

std::vector<double> Bohman(int len, bool sym, const std::vector<double>&) {
    if (len <= 1)
        return ones(len);

    const int m = extendedLen(len, sym);
    std::vector<double> win(m, 0.0);

    // Both end points are exactly zero
    for (int i = 1; i < m - 1; i++) {
        double fac = fabs(-1.0 + 2.0 * i / (m - 1));
        win[i] = (1 - fac) * cos(M_PI * fac) + sin(M_PI * fac) / M_PI;
    }

    return truncate(win, sym);
}

std::vector<double> Cosine(int len, bool sym, const std::vector<double>&) {
    if (len <= 1)
        return ones(len);

    const int m = extendedLen(len, sym);
    std::vector<double> win(m);

    for (int i = 0; i < m; i++)
        win[i] = sin(M_PI / m * (i + 0.5));

    return truncate(win, sym);
}

std::vector<double> Flattop(int len, bool sym, const std::vector<double>&) {
    return generalCosine(len, sym, { 0.21557895, 0.41663158, 0.277263158, 0.083578947, 0.006947368 });
}

std::vector<double> Hamming(int len, bool sym, const std::vector<double>&) {
    return generalCosine(len, sym, { 0.54, 0.46 });
}

std::vector<double> Hann(int len, bool sym, const std::vector<double>&) {
    return generalCosine(len, sym, { 0.5, 0.5 });
}

std::vector<double> Nuttall(int len, bool sym, const std::vector<double>&) {
    return generalCosine(len, sym, { 0.3635819, 0.4891775, 0.1365995, 0.0106411 });
}

std::vector<double> Parzen(int len, bool sym, const std::vector<double>&) {
    if (len <= 1)
        return ones(len);

    const int m = extendedLen(len, sym);
    std::vector<double> win(m);

    const double half    = m / 2.0;
    const double quarter = (m - 1) / 4.0;

    for (int i = 0; i < m; i++) {
        double n = fabs(i - (m - 1) / 2.0);

        if (n <= quarter)
            win[i] = 1 - 6 * pow(n / half, 2) + 6 * pow(n / half, 3);
        else
            win[i] = 2 * pow(1 - n / half, 3);
    }

    return truncate(win, sym);
}

std::vector<double> Triangular(int len, bool sym, const std::vector<double>&) {
    if (len <= 1)
        return ones(len);

    const int m = extendedLen(len, sym);
    std::vector<double> win(m);

    for (int i = 0; i < m; i++) {
        int k = std::min(i, m - 1 - i) + 1;
        win[i] = m % 2 == 0 ? (2.0 * k - 1) / m : 2.0 * k / (m + 1);
    }

    return truncate(win, sym);
}

std::vector<double> DolphChebyshev(int len, bool sym, const std::vector<double>& par) {
    const double at = fabs(param(par, 0, "Dolph-Chebyshev"));

    if (len <= 1)
        return ones(len);

    const int    m     = extendedLen(len, sym);
    const double order = m - 1.0;
    const double beta  = cosh(acosh(pow(10, at / 20)) / order);

    // Chebyshev polynomial sampled around the unit circle
    std::vector<std::complex<double>> p(m);

    for (int k = 0; k < m; k++) {
        double x = beta * cos(M_PI * k / m);
        double val;

        if (x > 1)
            val = cosh(order * acosh(x));
        else if (x < -1)
            val = (2 * (m % 2) - 1) * cosh(order * acosh(-x));
        else
            val = cos(order * acos(x));

        if (m % 2)
            p[k] = val;
        else
            p[k] = val * std::polar(1.0, M_PI / m * k);
    }

    std::vector<std::complex<double>> spec(m);
    fft(p.data(), spec.data(), m);

    std::vector<double> win;
    win.reserve(m);

    if (m % 2) {
        const int n = (m + 1) / 2;

        for (int i = n - 1; i > 0; i--)
            win.push_back(spec[i].real());
        for (int i = 0; i < n; i++)
            win.push_back(spec[i].real());
    } else {
        const int n = m / 2 + 1;

        for (int i = n - 1; i > 0; i--)
            win.push_back(spec[i].real());
        for (int i = 1; i < n; i++)
            win.push_back(spec[i].real());
    }

    const double peak = *std::max_element(win.begin(), win.end());

    for (auto& w : win)
        w /= peak;

    return truncate(win, sym);
}

// First discrete prolate spheroidal sequence of length m, half bandwidth w (cycles / sample)
static std::vector<double> prolate(int m, double w) {
    std::vector<double> diag(m), off(m - 1);

    for (int i = 0; i < m; i++)
        diag[i] = pow((m - 1 - 2.0 * i) / 2, 2) * cos(2 * M_PI * w);
    for (int i = 1; i < m; i++)
        off[i - 1] = i * (m - i) / 2.0;

    std::vector<double> win = TridiagTopEigvec(diag, off);

    double sum = 0;
    for (double v : win)
        sum += v;

    const double peak = sum < 0 ? *std::min_element(win.begin(), win.end())
                                : *std::max_element(win.begin(), win.end());

    for (auto& v : win)
        v /= peak;

    return win;
}

std::vector<double> DPSS(int len, bool sym, const std::vector<double>& par) {
    const double nw = param(par, 0, "DPSS");

    if (len <= 1)
        return ones(len);

    const int m = extendedLen(len, sym);

    if (nw <= 0)
        throw std::invalid_argument("DPSS: NW must be positive");
    if (nw >= m / 2.0)
        throw std::invalid_argument("DPSS: NW must be less than half the window length");

    return truncate(prolate(m, nw / m), sym);
}

std::vector<double> Gauss(int len, bool sym, const std::vector<double>& par) {
    const double sigma = param(par, 0, "Gauss");

    if (len <= 1)
        return ones(len);
    if (sigma <= 0)
        throw std::invalid_argument("Gauss: standard deviation must be positive");

    const int m = extendedLen(len, sym);
    std::vector<double> win(m);

    for (int i = 0; i < m; i++) {
        double n = i - (m - 1) / 2.0;
        win[i] = exp(-n * n / (2 * sigma * sigma));
    }

    return truncate(win, sym);
}

std::vector<double> GeneralGaussian(int len, bool sym, const std::vector<double>& par) {
    const double p     = param(par, 0, "General Gaussian");
    const double sigma = param(par, 1, "General Gaussian");

    if (len <= 1)
        return ones(len);
    if (sigma <= 0)
        throw std::invalid_argument("General Gaussian: standard deviation must be positive");

    const int m = extendedLen(len, sym);
    std::vector<double> win(m);

    for (int i = 0; i < m; i++) {
        double n = i - (m - 1) / 2.0;
        win[i] = exp(-0.5 * pow(fabs(n / sigma), 2 * p));
    }

    return truncate(win, sym);
}

std::vector<double> Kaiser(int len, bool sym, const std::vector<double>& par) {
    const double beta = param(par, 0, "Kaiser");

    if (len <= 1)
        return ones(len);

    const int    m     = extendedLen(len, sym);
    const double alpha = (m - 1) / 2.0;
    const double norm  = std::cyl_bessel_i(0.0, beta);

    std::vector<double> win(m);

    for (int i = 0; i < m; i++) {
        double r = (i - alpha) / alpha;
        win[i] = std::cyl_bessel_i(0.0, beta * sqrt(std::max(0.0, 1 - r * r))) / norm;
    }

    return truncate(win, sym);
}

std::vector<double> Slepian(int len, bool sym, const std::vector<double>& par) {
    const double width = param(par, 0, "Slepian");

    if (len <= 1)
        return ones(len);

    const double w = width / 4;

    if (width <= 0)
        throw std::invalid_argument("Slepian: bandwidth must be positive");
    if (w >= 0.5)
        throw std::invalid_argument("Slepian: bandwidth must be below 2");

    return truncate(prolate(extendedLen(len, sym), w), sym);
}

std::vector<double> Tukey(int len, bool sym, const std::vector<double>& par) {
    const double alpha = param(par, 0, "Tukey");

    if (len <= 1)
        return ones(len);
    if (alpha <= 0)
        return ones(len);
    if (alpha >= 1)
        return Hann(len, sym, par);

    const int m     = extendedLen(len, sym);
    const int width = (int)floor(alpha * (m - 1) / 2.0);

    std::vector<double> win(m, 1.0);

    for (int i = 0; i <= width; i++)
        win[i] = 0.5 * (1 + cos(M_PI * (-1 + 2.0 * i / alpha / (m - 1))));

    for (int i = m - width - 1; i < m; i++)
        win[i] = 0.5 * (1 + cos(M_PI * (-2.0 / alpha + 1 + 2.0 * i / alpha / (m - 1))));

    return truncate(win, sym);
}

}
