#ifndef _COSINE_SUM_H_
#define _COSINE_SUM_H_

#include <vector>

/*
* N term cosine sum window
*
* w[n] = a[0] + sum_{j=1..k} a[j] * cos(j * 2 * pi * n / L)
* L = len - 1 when symmetric, len otherwise. A single point window is 1.
*/
std::vector<double> CosineSum(int len, bool sym, const std::vector<double>& coefs);

// Blackman-Harris presets with successively deeper sidelobe suppression
const std::vector<double>& BlackmanHarris5Coefs(); // 125.427 dB, NBW 2.21535 bins
const std::vector<double>& BlackmanHarris7Coefs(); // 180.468 dB, NBW 2.63025 bins
const std::vector<double>& BlackmanHarris9Coefs(); // 234.734 dB, NBW 2.98588 bins

std::vector<double> BlackmanHarris5(int len, bool sym, const std::vector<double>& par);
std::vector<double> BlackmanHarris7(int len, bool sym, const std::vector<double>& par);
std::vector<double> BlackmanHarris9(int len, bool sym, const std::vector<double>& par);

#endif
