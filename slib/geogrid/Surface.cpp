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

#include <algorithm>
#include <cmath>
#include <vector>
#include <geogrid/Surface.hpp>
#include <geogrid/error.hpp>

using namespace blitz;

namespace geogrid {

bool is_surface(GridData const &V)
{
    return V.shape_class() == ShapeClass::SURFACE && V.shape()[2] == 1;
}

static void check_surface(char const *fn, GridData const &V)
{
    if (!is_surface(V)) {
        (*geogrid_error)(ERR_UNSUPPORTED_SHAPE,
            "%s: the %s is a %s, not a horizontal surface",
            fn, V.kind_name(), to_string(V.shape_class()));
    }
}

static bool same_value(double a, double b)
{
    if (std::isnan(a) && std::isnan(b)) return true;
    return std::abs(a - b) <= 1e-9 * std::max(1., std::abs(a));
}

/** Coordinates, fields and attributes of a (+/-) b */
static GridParts combine_parts(char const *fn,
    GridData const &a, GridData const &b, bool subtract)
{
    check_surface(fn, a);
    check_surface(fn, b);
    if (any(a.shape() != b.shape())) {
        (*geogrid_error)(ERR_SHAPE_MISMATCH,
            "%s: surfaces have different sizes (%d, %d) vs (%d, %d)",
            fn, a.shape()[0], a.shape()[1], b.shape()[0], b.shape()[1]);
    }

    for (int c=0; c<2; ++c) {
        ArrayT const &ca(a.coord_val(c));
        ArrayT const &cb(b.coord_val(c));
        for (int i=0; i<ca.extent(0); ++i) {
        for (int j=0; j<ca.extent(1); ++j) {
            double const va = ca(ca.lbound(0)+i, ca.lbound(1)+j, ca.lbound(2));
            double const vb = cb(cb.lbound(0)+i, cb.lbound(1)+j, cb.lbound(2));
            if (!same_value(va, vb)) {
                (*geogrid_error)(ERR_INVALID_ARGUMENT,
                    "%s: surfaces are not on the same %s nodes (%g vs %g at (%d,%d))",
                    fn, a.coord_names()[c].c_str(), va, vb, i, j);
            }
        }}
    }

    GridParts ret(a.parts());
    ret.coords[2] = (subtract ? a.coord(2) - b.coord(2) : a.coord(2) + b.coord(2));
    for (size_t i=0; i<b.fields().size(); ++i)
        ret.fields.add(b.fields().keys()[i], b.fields()[i]);
    return ret;
}

GeoData operator+(GeoData const &a, GeoData const &b)
    { return GeoData(combine_parts("GeoData +", a, b, false)); }

GeoData operator-(GeoData const &a, GeoData const &b)
    { return GeoData(combine_parts("GeoData -", a, b, true)); }

CartData operator+(CartData const &a, CartData const &b)
    { return CartData(combine_parts("CartData +", a, b, false)); }

CartData operator-(CartData const &a, CartData const &b)
    { return CartData(combine_parts("CartData -", a, b, true)); }

// ------------------------------------------------------------
/** Element of A at an offset from its lower bounds */
static double &at(ArrayT &A, TinyVector<int,3> const &off)
    { return A(A.lbound(0)+off[0], A.lbound(1)+off[1], A.lbound(2)+off[2]); }

static double at(ArrayT const &A, TinyVector<int,3> const &off)
    { return A(A.lbound(0)+off[0], A.lbound(1)+off[1], A.lbound(2)+off[2]); }

long remove_nan_surface(ArrayT &Z, ArrayT const &X, ArrayT const &Y)
{
    if (any(X.shape() != Z.shape()) || any(Y.shape() != Z.shape())) {
        (*geogrid_error)(ERR_SHAPE_MISMATCH,
            "remove_nan_surface(): X, Y and Z must have the same shape");
    }

    // Valid and missing nodes, in storage order
    std::vector<TinyVector<int,3>> valid, missing;
    for (int i=0; i<Z.extent(0); ++i) {
    for (int j=0; j<Z.extent(1); ++j) {
    for (int k=0; k<Z.extent(2); ++k) {
        TinyVector<int,3> const off(i,j,k);
        if (std::isnan(at(Z, off))) missing.push_back(off);
        else valid.push_back(off);
    }}}
    if (valid.size() == 0 || missing.size() == 0) return 0;

    for (auto mm=missing.begin(); mm != missing.end(); ++mm) {
        double const x = at(X, *mm);
        double const y = at(Y, *mm);

        size_t best = 0;
        double best_d2 = -1;
        for (size_t n=0; n<valid.size(); ++n) {
            double const dx = at(X, valid[n]) - x;
            double const dy = at(Y, valid[n]) - y;
            double const d2 = dx*dx + dy*dy;
            if (best_d2 < 0 || d2 < best_d2) {
                best = n;
                best_d2 = d2;
            }
        }
        at(Z, *mm) = at(Z, valid[best]);
    }
    return missing.size();
}

static GridParts nan_free_parts(char const *fn, GridData const &V)
{
    check_surface(fn, V);

    GridParts ret(V.parts());
    ArrayT Z(V.coord_val(2).copy());
    remove_nan_surface(Z, V.coord_val(0), V.coord_val(1));
    ret.coords[2] = GeoUnit(Z, V.coord(2).units);
    return ret;
}

GeoData remove_nan_surface(GeoData const &V)
    { return GeoData(nan_free_parts("remove_nan_surface(GeoData)", V)); }

CartData remove_nan_surface(CartData const &V)
    { return CartData(nan_free_parts("remove_nan_surface(CartData)", V)); }

}   // namespace
