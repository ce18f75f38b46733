#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "bmath.hpp"

static double sign(double x) {
    return (x > 0) - (x < 0);
}

double FMinBound(double (*func)(double x, void* ctx), void* ctx, double lo, double hi, double xtol, int maxfun) {
    if (lo > hi)
        throw std::invalid_argument("FMinBound: lower bound above upper bound");

    const double sqrtEps    = sqrt(2.2e-16);
    const double goldenMean = 0.5 * (3.0 - sqrt(5.0));

    double a = lo, b = hi;
    double fulc = a + goldenMean * (b - a);
    double nfc  = fulc;
    double xf   = fulc;
    double rat  = 0, e = 0;
    double x    = xf;
    double fx   = func(x, ctx);
    int    num  = 1;

    double ffulc = fx, fnfc = fx;
    double xm    = 0.5 * (a + b);
    double tol1  = sqrtEps * fabs(xf) + xtol / 3.0;
    double tol2  = 2.0 * tol1;

    while (fabs(xf - xm) > (tol2 - 0.5 * (b - a))) {
        bool golden = true;

        // Parabolic fit
        if (fabs(e) > tol1) {
            golden = false;

            double r = (xf - nfc) * (fx - ffulc);
            double q = (xf - fulc) * (fx - fnfc);
            double p = (xf - fulc) * q - (xf - nfc) * r;
            q = 2.0 * (q - r);

            if (q > 0)
                p = -p;

            q = fabs(q);
            r = e;
            e = rat;

            if (fabs(p) < fabs(0.5 * q * r) && p > q * (a - xf) && p < q * (b - xf)) {
                rat = p / q;
                x   = xf + rat;

                if ((x - a) < tol2 || (b - x) < tol2)
                    rat = tol1 * (sign(xm - xf) + ((xm - xf) == 0));
            } else {
                golden = true;
            }
        }

        if (golden) {
            e   = xf >= xm ? a - xf : b - xf;
            rat = goldenMean * e;
        }

        x = xf + (sign(rat) + (rat == 0)) * std::max(fabs(rat), tol1);
        double fu = func(x, ctx);
        num++;

        if (fu <= fx) {
            if (x >= xf)
                a = xf;
            else
                b = xf;

            fulc = nfc; ffulc = fnfc;
            nfc  = xf;  fnfc  = fx;
            xf   = x;   fx    = fu;
        } else {
            if (x < xf)
                a = x;
            else
                b = x;

            if (fu <= fnfc || nfc == xf) {
                fulc = nfc; ffulc = fnfc;
                nfc  = x;   fnfc  = fu;
            } else if (fu <= ffulc || fulc == xf || fulc == nfc) {
                fulc = x;   ffulc = fu;
            }
        }

        xm   = 0.5 * (a + b);
        tol1 = sqrtEps * fabs(xf) + xtol / 3.0;
        tol2 = 2.0 * tol1;

        if (num >= maxfun)
            break;
    }

    return xf;
}

// Number of eigenvalues below x
static size_t sturmCount(const std::vector<double>& diag, const std::vector<double>& off, double x) {
    const double tiny = std::numeric_limits<double>::min();

    size_t count = 0;
    double q = diag[0] - x;

    if (q < 0)
        count++;

    for (size_t i = 1; i < diag.size(); i++) {
        if (q == 0)
            q = tiny;

        q = diag[i] - x - off[i - 1] * off[i - 1] / q;

        if (q < 0)
            count++;
    }

    return count;
}

// Solves (T - shift * I) x = b in place, LU with partial pivoting
static void solveShifted(const std::vector<double>& diag, const std::vector<double>& off, double shift, std::vector<double>& b) {
    const size_t n = diag.size();

    std::vector<double> d(n), dl(off), du(off);

    double norm = 0;
    for (size_t i = 0; i < n; i++) {
        d[i] = diag[i] - shift;
        norm = std::max(norm, fabs(d[i]));
    }
    for (size_t i = 0; i < off.size(); i++)
        norm = std::max(norm, fabs(off[i]));

    const double tiny = std::max(norm, 1.0) * std::numeric_limits<double>::epsilon();

    for (size_t i = 0; i + 1 < n; i++) {
        if (fabs(d[i]) >= fabs(dl[i])) {
            if (d[i] == 0)
                d[i] = tiny;

            double fact = dl[i] / d[i];
            d[i + 1] -= fact * du[i];
            b[i + 1] -= fact * b[i];

            if (i + 2 < n)
                dl[i] = 0;
        } else {
            // Interchange rows i and i + 1
            double fact = d[i] / dl[i];
            d[i] = dl[i];

            double temp = d[i + 1];
            d[i + 1] = du[i] - fact * temp;

            if (i + 2 < n) {
                dl[i]     = du[i + 1];
                du[i + 1] = -fact * dl[i];
            }

            du[i] = temp;

            temp     = b[i];
            b[i]     = b[i + 1];
            b[i + 1] = temp - fact * b[i + 1];
        }
    }

    if (d[n - 1] == 0)
        d[n - 1] = tiny;

    b[n - 1] /= d[n - 1];

    if (n > 1)
        b[n - 2] = (b[n - 2] - du[n - 2] * b[n - 1]) / d[n - 2];

    for (size_t i = n - 2; i-- > 0;)
        b[i] = (b[i] - du[i] * b[i + 1] - dl[i] * b[i + 2]) / d[i];
}

static bool normalize(std::vector<double>& v) {
    double sum = 0;
    for (double x : v)
        sum += x * x;

    if (!std::isfinite(sum) || sum == 0)
        return false;

    const double scale = 1 / sqrt(sum);
    for (double& x : v)
        x *= scale;

    return true;
}

std::vector<double> TridiagTopEigvec(const std::vector<double>& diag, const std::vector<double>& off) {
    const size_t n = diag.size();

    if (n == 0)
        throw std::invalid_argument("TridiagTopEigvec: empty matrix");
    if (off.size() + 1 != n)
        throw std::invalid_argument("TridiagTopEigvec: off diagonal size mismatch");
    if (n == 1)
        return std::vector<double>(1, 1.0);

    // Gershgorin bounds
    double lo =  std::numeric_limits<double>::max();
    double hi = -std::numeric_limits<double>::max();

    for (size_t i = 0; i < n; i++) {
        double radius = (i > 0 ? fabs(off[i - 1]) : 0) + (i + 1 < n ? fabs(off[i]) : 0);
        lo = std::min(lo, diag[i] - radius);
        hi = std::max(hi, diag[i] + radius);
    }

    // Largest eigenvalue: every eigenvalue lies below hi, one lies above lo
    for (int i = 0; i < 200; i++) {
        double mid = 0.5 * (lo + hi);

        if (mid <= lo || mid >= hi)
            break;

        if (sturmCount(diag, off, mid) >= n)
            hi = mid;
        else
            lo = mid;
    }

    const double lambda = hi;
    const double shift  = lambda + 1e-10 * std::max(1.0, fabs(lambda));

    std::vector<double> vec(n, 1.0);
    normalize(vec);

    for (int it = 0; it < 4; it++) {
        solveShifted(diag, off, shift, vec);

        if (!normalize(vec))
            throw std::runtime_error("TridiagTopEigvec: inverse iteration diverged");
    }

    return vec;
}
