#include <cmath>
#include <stdexcept>

#include "cosineSum.hpp"
#include "defines.h"

std::vector<double> CosineSum(int len, bool sym, const std::vector<double>& coefs) {
    if (len < 1)
        throw std::invalid_argument("CosineSum: window length must be positive");
    if (coefs.empty())
        throw std::invalid_argument("CosineSum: no coefficients");

    if (len == 1)
        return std::vector<double>(1, 1.0);

    const double period = sym ? len - 1 : len;

    std::vector<double> win(len);

    for (int n = 0; n < len; n++) {
        const double x = n * 2 * M_PI / period;

        double sum = coefs[0];
        for (size_t j = 1; j < coefs.size(); j++)
            sum += coefs[j] * cos(j * x);

        win[n] = sum;
    }

    return win;
}

const std::vector<double>& BlackmanHarris5Coefs() {
    static const std::vector<double> coefs = {
         3.232153788877343e-001,
        -4.714921439576260e-001,
         1.755341299601972e-001,
        -2.849699010614994e-002,
         1.261357088292677e-003
    };

    return coefs;
}
const std::vector<double>& BlackmanHarris7Coefs() {
    static const std::vector<double> coefs = {
         2.712203605850388e-001,
        -4.334446123274422e-001,
         2.180041228929303e-001,
        -6.578534329560609e-002,
         1.076186730534183e-002,
        -7.700127105808265e-004,
         1.368088305992921e-005
    };

    return coefs;
}
const std::vector<double>& BlackmanHarris9Coefs() {
    static const std::vector<double> coefs = {
         2.384331152777942e-001,
        -4.005545348643820e-001,
         2.358242530472107e-001,
        -9.527918858383112e-002,
         2.537395516617152e-002,
        -4.152432907505835e-003,
         3.685604163298180e-004,
        -1.384355593917030e-005,
         1.161808358932861e-007
    };

    return coefs;
}

std::vector<double> BlackmanHarris5(int len, bool sym, const std::vector<double>&) {
    return CosineSum(len, sym, BlackmanHarris5Coefs());
}
std::vector<double> BlackmanHarris7(int len, bool sym, const std::vector<double>&) {
    return CosineSum(len, sym, BlackmanHarris7Coefs());
}
std::vector<double> BlackmanHarris9(int len, bool sym, const std::vector<double>&) {
    return CosineSum(len, sym, BlackmanHarris9Coefs());
}
