// Kernel density estimation by Tim Nugent (c) 2014

#ifndef KDE_HPP
#define KDE_HPP

#include "fftw3.h"
#include <cmath>
#include <stdint.h>
#include <stdlib.h>
#include <vector>

using namespace std;

// Sample quantile with linear interpolation between order statistics, h = (n-1)p.
double quantile(vector< double > data, double p);

// Gaussian kernel density of log10 transformed data, the bandwidth follows Silverman's rule of thumb.
class KDE
{

public:
    KDE() : extension(4), cut(3){};
    ~KDE(){};

    // Return false if fewer than two positive values, the non positive values are dropped.
    bool run(const vector< double >& input);

    // Density at x of log10 scale, 0 outside the density curve.
    double pdf(double x) const;

    // Local minimum of the density curve inside [lo, hi] by Brent's method,
    // return NaN if [lo, hi] does not overlap the curve.
    double local_minimum(double lo, double hi) const;

    // Indexes of the local minima of density curve
    vector< int > find_local_minima() const;

    const vector< double >& get_x() const
    {
        return vec_x;
    }
    const vector< double >& get_density() const
    {
        return density;
    }
    double get_bandwidth() const
    {
        return bw;
    }
    double get_min() const
    {
        return min;
    }
    double get_max() const
    {
        return max;
    }

private:
    void          initialization();
    double        bw_nrd0();
    double        gauss_pdf(double x);
    void          fft();
    fftw_complex* bindist();
    double        pdf_linear_interpol(double v) const;

private:
    double           min, max;
    double           from, to;
    double           xlo, xhi;
    vector< double > data_array;
    vector< double > kords, xords;
    vector< double > density, vec_x;
    double           bw;
    int              N, n_user, n;
    unsigned int     extension, cut;
};

#endif
