/*
 * GeoGrid: Multi-Representation Grids for Geoscience Data
 * Copyright (c) 2013-2016 by Elizabeth Fischer
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <cmath>
#include <algorithm>
#include <geogrid/interp.hpp>
#include <geogrid/error.hpp>

using namespace blitz;

namespace geogrid {

MonotonicAxis::MonotonicAxis(std::vector<double> const &vals) :
    _x(vals), _reversed(false)
{
    if (_x.size() == 0) {
        (*geogrid_error)(ERR_INVALID_ARGUMENT,
            "MonotonicAxis: axis must have at least one node");
    }
    if (_x.size() > 1 && _x.front() > _x.back()) {
        _reversed = true;
        std::reverse(_x.begin(), _x.end());
    }
}

MonotonicAxis MonotonicAxis::along(Array<double,3> const &A, int dim)
{
    TinyVector<int,3> ix(A.lbound());
    std::vector<double> vals;
    vals.reserve(A.extent(dim));
    for (int i=A.lbound(dim); i<=A.ubound(dim); ++i) {
        ix[dim] = i;
        vals.push_back(A(ix));
    }
    return MonotonicAxis(vals);
}

int MonotonicAxis::nearest(double x) const
{
    int best = 0;
    double best_dist = std::abs(_x[0] - x);
    for (int i=1; i<size(); ++i) {
        double const dist = std::abs(_x[i] - x);
        // Ties go to the first node in storage order
        if (dist < best_dist || (dist == best_dist && _reversed)) {
            best = i;
            best_dist = dist;
        }
    }
    return original_index(best);
}

bool MonotonicAxis::bracket(double x, Extrapolation extrap,
    int &i0, int &i1, double &t) const
{
    int const n = size();
    if (std::isnan(x)) return false;

    if (n == 1) {
        i0 = i1 = 0;
        t = 0;
        return true;
    }

    int j0, j1;
    if (x < _x.front() || x > _x.back()) {
        if (extrap == Extrapolation::FILL) return false;
        j0 = j1 = (x < _x.front() ? 0 : n-1);
        t = 0;
    } else {
        int k = std::upper_bound(_x.begin(), _x.end(), x) - _x.begin();
        if (k >= n) {
            // x == max
            j0 = n-2;
            j1 = n-1;
            t = 1;
        } else {
            j0 = k-1;
            j1 = k;
            double const dx = _x[j1] - _x[j0];
            t = (dx == 0 ? 0 : (x - _x[j0]) / dx);
        }
    }

    i0 = original_index(j0);
    i1 = original_index(j1);
    return true;
}

// ------------------------------------------------------------
double interp2(
    Array<double,3> const &A,
    MonotonicAxis const &ax0, MonotonicAxis const &ax1,
    double x0, double x1,
    Extrapolation extrap,
    double fill)
{
    int i0,i1, j0,j1;
    double ti, tj;
    if (!ax0.bracket(x0, extrap, i0, i1, ti)) return fill;
    if (!ax1.bracket(x1, extrap, j0, j1, tj)) return fill;

    int const b0 = A.lbound(0);
    int const b1 = A.lbound(1);
    int const k = A.lbound(2);
    double const v0 = lerp(A(b0+i0, b1+j0, k), A(b0+i1, b1+j0, k), ti);
    double const v1 = lerp(A(b0+i0, b1+j1, k), A(b0+i1, b1+j1, k), ti);
    return lerp(v0, v1, tj);
}

double interp3(
    Array<double,3> const &A,
    MonotonicAxis const &ax0, MonotonicAxis const &ax1, MonotonicAxis const &ax2,
    double x0, double x1, double x2,
    Extrapolation extrap,
    double fill)
{
    int i0,i1, j0,j1, k0,k1;
    double ti, tj, tk;
    if (!ax0.bracket(x0, extrap, i0, i1, ti)) return fill;
    if (!ax1.bracket(x1, extrap, j0, j1, tj)) return fill;
    if (!ax2.bracket(x2, extrap, k0, k1, tk)) return fill;

    int const b0 = A.lbound(0);
    int const b1 = A.lbound(1);
    int const b2 = A.lbound(2);
    i0 += b0; i1 += b0;
    j0 += b1; j1 += b1;
    k0 += b2; k1 += b2;

    double const v00 = lerp(A(i0,j0,k0), A(i1,j0,k0), ti);
    double const v10 = lerp(A(i0,j1,k0), A(i1,j1,k0), ti);
    double const v01 = lerp(A(i0,j0,k1), A(i1,j0,k1), ti);
    double const v11 = lerp(A(i0,j1,k1), A(i1,j1,k1), ti);

    double const v0 = lerp(v00, v10, tj);
    double const v1 = lerp(v01, v11, tj);
    return lerp(v0, v1, tk);
}

}   // namespace
