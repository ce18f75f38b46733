#ifndef __BMATH__
#define __BMATH__

#include <vector>

/*
* Bounded scalar minimization (Brent's method)
*
* Args:
* func   - objective
* ctx    - passed through to func
* lo, hi - search interval
* xtol   - absolute tolerance on the abscissa
* maxfun - maximum number of function evaluations
*
* Returns the abscissa of the minimum
*/
double FMinBound(double (*func)(double x, void* ctx), void* ctx, double lo, double hi, double xtol = 1e-5, int maxfun = 500);

/*
* Eigenvector of the largest eigenvalue of a symmetric tridiagonal matrix
* (bisection on the Sturm sequence, then inverse iteration)
*
* Args:
* diag - main diagonal, n elements
* off  - sub / super diagonal, n - 1 elements
*
* Returns a unit length vector, throws std::runtime_error if it did not converge
*/
std::vector<double> TridiagTopEigvec(const std::vector<double>& diag, const std::vector<double>& off);

#endif
