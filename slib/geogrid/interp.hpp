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

#ifndef GEOGRID_INTERP_HPP
#define GEOGRID_INTERP_HPP

#include <vector>
#include <limits>
#include <blitz/array.h>

namespace geogrid {

/** What to return for queries outside the hull of an axis */
enum class Extrapolation {
    FLAT,    // Clamp to the nearest edge node
    FILL     // Return the fill value (NaN by default)
};

/** A 1-D monotonic coordinate axis, as stored along one dimension of a
grid.  Axes stored in decreasing order are normalized to increasing
order; all indices handed back to the caller are in the ORIGINAL storage
order.  An axis of length 1 is constant: every query maps to its one
node. */
class MonotonicAxis {
    std::vector<double> _x;    // Always increasing
    bool _reversed;

public:
    MonotonicAxis() : _reversed(false) {}

    /** @param vals Node coordinates in storage order; either
        non-decreasing or non-increasing. */
    explicit MonotonicAxis(std::vector<double> const &vals);

    /** Axis dim of a coordinate array, taken at the first index of the
    other two dimensions. */
    static MonotonicAxis along(blitz::Array<double,3> const &A, int dim);

    int size() const { return (int)_x.size(); }
    bool reversed() const { return _reversed; }
    double min() const { return _x.front(); }
    double max() const { return _x.back(); }

    /** Converts an index into the increasing-order axis to a storage index */
    int original_index(int i) const
        { return _reversed ? size()-1-i : i; }

    /** Storage index of the node nearest to x */
    int nearest(double x) const;

    /** Finds the pair of nodes bracketing x.
    @param i0,i1 OUT: Storage indices of the two nodes
    @param t OUT: Weight of node i1 (0 <= t <= 1)
    @return false if x is outside the axis and extrap==FILL (or x is NaN). */
    bool bracket(double x, Extrapolation extrap, int &i0, int &i1, double &t) const;
};

/** Linear blend that reproduces the nodes exactly at t=0 and t=1 */
inline double lerp(double v0, double v1, double t)
{
    if (t == 0) return v0;
    if (t == 1) return v1;
    return v0 + t*(v1 - v0);
}

/** Bilinear interpolation of a surface stored in a 3-D array of shape
(nx,ny,1) (or any array, using k=lbound(2)). */
double interp2(
    blitz::Array<double,3> const &A,
    MonotonicAxis const &ax0, MonotonicAxis const &ax1,
    double x0, double x1,
    Extrapolation extrap,
    double fill = std::numeric_limits<double>::quiet_NaN());

/** Trilinear interpolation of a 3-D array */
double interp3(
    blitz::Array<double,3> const &A,
    MonotonicAxis const &ax0, MonotonicAxis const &ax1, MonotonicAxis const &ax2,
    double x0, double x1, double x2,
    Extrapolation extrap,
    double fill = std::numeric_limits<double>::quiet_NaN());

}   // namespace

#endif    // guard
