#ifndef _WINDOW_IMPL_
#define _WINDOW_IMPL_

#include <vector>

/*
* Window generators
*
* All share the Rowan::WindowImpl signature: (len, sym, par).
* A single point window is always { 1 }. Periodic windows are the first len
* points of the symmetric window of length len + 1.
*/
namespace Windows {
    std::vector<double> Boxcar(int len, bool sym, const std::vector<double>& par);
    std::vector<double> Barthann(int len, bool sym, const std::vector<double>& par);
    std::vector<double> Bartlett(int len, bool sym, const std::vector<double>& par);
    std::vector<double> Blackman(int len, bool sym, const std::vector<double>& par);
    std::vector<double> BlackmanHarris(int len, bool sym, const std::vector<double>& par);
    std::vector<double> Bohman(int len, bool sym, const std::vector<double>& par);
    std::vector<double> Cosine(int len, bool sym, const std::vector<double>& par);
    std::vector<double> Flattop(int len, bool sym, const std::vector<double>& par);
    std::vector<double> Hamming(int len, bool sym, const std::vector<double>& par);
    std::vector<double> Hann(int len, bool sym, const std::vector<double>& par);
    std::vector<double> Nuttall(int len, bool sym, const std::vector<double>& par);
    std::vector<double> Parzen(int len, bool sym, const std::vector<double>& par);
    std::vector<double> Triangular(int len, bool sym, const std::vector<double>& par);

    // par[0] - attenuation of the sidelobes in dB
    std::vector<double> DolphChebyshev(int len, bool sym, const std::vector<double>& par);
    // par[0] - standardized half bandwidth NW, 0 < NW < len / 2
    std::vector<double> DPSS(int len, bool sym, const std::vector<double>& par);
    // par[0] - standard deviation in samples
    std::vector<double> Gauss(int len, bool sym, const std::vector<double>& par);
    // par[0] - shape p (0.5 is Gaussian), par[1] - standard deviation in samples
    std::vector<double> GeneralGaussian(int len, bool sym, const std::vector<double>& par);
    // par[0] - beta, main lobe width / sidelobe level trade off
    std::vector<double> Kaiser(int len, bool sym, const std::vector<double>& par);
    // par[0] - full bandwidth, the half bandwidth used is BW / 4
    std::vector<double> Slepian(int len, bool sym, const std::vector<double>& par);
    // par[0] - fraction of the window inside the cosine taper
    std::vector<double> Tukey(int len, bool sym, const std::vector<double>& par);
}

#endif
