// Kernel density estimation by Tim Nugent (c) 2014
// Based on Philipp K. Janert's Perl module:
// http://search.cpan.org/~janert/Statistics-KernelEstimation-0.05
// Binned density by FFT follows density.default() of R.

#define _USE_MATH_DEFINES
#include "kde.hpp"
#include "fftw3.h"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <functional>
#include <limits>
#include <numeric>
#include <stdint.h>
#include <stdlib.h>

#include <boost/math/tools/minima.hpp>
#include <spdlog/spdlog.h>

double quantile(vector< double > data, double p)
{
    if (data.empty())
        return std::numeric_limits< double >::quiet_NaN();
    std::sort(data.begin(), data.end());
    double h  = (data.size() - 1) * p;
    size_t lo = ( size_t )floor(h);
    size_t hi = std::min(lo + 1, data.size() - 1);
    return data[lo] + (h - lo) * (data[hi] - data[lo]);
}

void KDE::initialization()
{
    n_user = 10000;
    n      = pow(2, ceil(log2(n_user)));
    kords.assign(n, 0);
    xords.assign(n, 0);
    density.assign(n_user, 0);
    vec_x.assign(n_user, 0);
}

double KDE::bw_nrd0()
{
    double mean = std::accumulate(data_array.begin(), data_array.end(), 0.0) / N;
    double var  = 0;
    for (auto& d : data_array)
        var += (d - mean) * (d - mean);
    double hi = sqrt(var / (N - 1));
    double lo = std::min(hi, (quantile(data_array, 0.75) - quantile(data_array, 0.25)) / 1.34);
    if (lo <= 0)
    {
        if (hi > 0)
            lo = hi;
        else if (fabs(data_array[0]) > 0)
            lo = fabs(data_array[0]);
        else
            lo = 1;
    }
    return 0.9 * lo * pow(N, -0.2);
}

void KDE::fft()
{
    int           i, Num = 2 * n;
    double        diff = 2 * (xhi - xlo) / (Num - 1);
    double        Temp;
    fftw_complex* in;
    fftw_complex *temp_out, *y_fft, *kords_fft;
    fftw_plan     p;
    y_fft     = ( fftw_complex* )fftw_malloc(sizeof(fftw_complex) * Num);
    kords_fft = ( fftw_complex* )fftw_malloc(sizeof(fftw_complex) * Num);
    temp_out  = ( fftw_complex* )fftw_malloc(sizeof(fftw_complex) * Num);

    in = bindist();  // "in" is actually in_y here.

    p = fftw_plan_dft_1d(Num, in, temp_out, FFTW_FORWARD, FFTW_ESTIMATE);
    fftw_execute(p);  // Calculate fft(y).

    memcpy(y_fft, temp_out, sizeof(fftw_complex) * Num);

    for (i = 0; i < n + 1; i++)
    {  // let in be initial in_kords
        Temp     = i * diff;
        in[i][0] = gauss_pdf(Temp);
        in[i][1] = 0;
    }
    for (i = n + 1; i < Num; i++)
    {
        in[i][0] = in[Num - i][0];
        in[i][1] = 0;
    }
    fftw_execute_dft(p, in, temp_out);  // calculate fft(kords)
    fftw_destroy_plan(p);

    for (i = 0; i < Num; i++)
    {
        kords_fft[i][0] = temp_out[i][0] * y_fft[i][0] + temp_out[i][1] * y_fft[i][1];
        kords_fft[i][1] = temp_out[i][0] * y_fft[i][1]
                          - temp_out[i][1] * y_fft[i][0];  // let kords_fft equals to "fft(y)*Conj(fft(kords))"
    }

    p = fftw_plan_dft_1d(Num, kords_fft, temp_out, FFTW_BACKWARD, FFTW_ESTIMATE);

    fftw_execute(p);

    double diff_new = (xhi - xlo) / (n - 1);
    for (i = 0; i < n; i++)
    {
        Temp     = temp_out[i][0] / Num;
        kords[i] = 0 > Temp ? 0 : Temp;
        xords[i] = xlo + diff_new * i;
    }
    fftw_destroy_plan(p);
    fftw_free(in);
    fftw_free(y_fft);
    fftw_free(temp_out);
    fftw_free(kords_fft);
}

fftw_complex* KDE::bindist()
{
    double        w = 1.0 / N;
    fftw_complex* bindens;
    bindens   = ( fftw_complex* )fftw_malloc(sizeof(fftw_complex) * 2 * n);
    int ixmin = 0, ixmax = n - 2;
    double xdelta = (xhi - xlo) / (n - 1);
    for (int i = 0; i < 2 * n; i++)
    {
        bindens[i][0] = 0;
        bindens[i][1] = 0;
    }
    for (int i = 0; i < N; i++)
    {
        double xpos = (data_array[i] - xlo) / xdelta;
        int    ix   = ( int )floor(xpos);
        double fx   = xpos - ix;
        if (ixmin <= ix && ix <= ixmax)
        {
            bindens[ix][0] += (1 - fx) * w;
            bindens[ix + 1][0] += fx * w;
        }
        else if (ix == -1)
            bindens[0][0] += fx * w;
        else if (ix == ixmax + 1)
            bindens[ix][0] += (1 - fx) * w;
    }

    return bindens;
}

double KDE::gauss_pdf(double x)
{
    double              m = 0, s = bw;
    static const double inv_sqrt_2pi = 0.3989422804014327;
    double              z            = (x - m) / s;
    return exp(-0.5 * z * z) / s * inv_sqrt_2pi;
}

double KDE::pdf_linear_interpol(double v) const
{
    double diff = xords[1] - xords[0];
    double pos  = (v - xlo) / diff;
    int    idx  = ( int )floor(pos);
    if (idx < 0)
        return kords[0];
    if (idx >= n - 1)
        return kords[n - 1];
    return kords[idx] + (kords[idx + 1] - kords[idx]) * (pos - idx);
}

double KDE::pdf(double x) const
{
    if (vec_x.empty() || x < vec_x.front() || x > vec_x.back())
        return 0;
    double diff = vec_x[1] - vec_x[0];
    double pos  = (x - vec_x[0]) / diff;
    int    idx  = std::min(( int )floor(pos), n_user - 2);
    return density[idx] + (density[idx + 1] - density[idx]) * (pos - idx);
}

double KDE::local_minimum(double lo, double hi) const
{
    if (vec_x.empty())
        return std::numeric_limits< double >::quiet_NaN();
    lo = std::max(lo, vec_x.front());
    hi = std::min(hi, vec_x.back());
    if (lo >= hi)
        return std::numeric_limits< double >::quiet_NaN();

    auto             f        = [this](double x) { return pdf(x); };
    int              bits     = std::numeric_limits< double >::digits / 2;
    boost::uintmax_t max_iter = 1000;
    auto             res      = boost::math::tools::brent_find_minima(f, lo, hi, bits, max_iter);
    spdlog::debug("Brent minimum of density: x:{} density:{} iterations:{}", res.first, res.second, max_iter);
    return res.first;
}

vector< int > KDE::find_local_minima() const
{
    vector< int > minima;
    for (int i = 1; i < int(density.size()) - 1; i++)
    {
        if (density[i] < density[i - 1] && density[i] <= density[i + 1])
            minima.push_back(i);
    }
    return minima;
}

bool KDE::run(const vector< double >& input)
{
    // Prepare data, we log10-transform the data
    data_array.clear();
    for (auto& d : input)
        if (d > 0)
            data_array.push_back(log10(d));
    N = data_array.size();
    if (N < 2)
        return false;

    initialization();

    auto minmax = std::minmax_element(data_array.begin(), data_array.end());
    min         = *minmax.first;
    max         = *minmax.second;
    bw          = bw_nrd0();
    from        = min - cut * bw;
    to          = max + cut * bw;
    xlo         = from - extension * bw;
    xhi         = to + extension * bw;

    // Do the FFT
    fft();

    // Interpolate the density curve on [from, to]
    double x_increment = (to - from) / (n_user - 1);
    for (int i = 0; i < n_user; i++)
    {
        vec_x[i]   = from + i * x_increment;
        density[i] = pdf_linear_interpol(vec_x[i]);
    }
    spdlog::debug("KDE values:{} bandwidth:{} range:[{},{}]", N, bw, from, to);

    return true;
}
