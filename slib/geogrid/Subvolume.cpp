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
#include <geogrid/Subvolume.hpp>
#include <geogrid/interp.hpp>
#include <geogrid/error.hpp>

using namespace blitz;

namespace geogrid {

/** Interpolation axes of a gridded data set */
struct GridAxes {
    MonotonicAxis ax[3];

    explicit GridAxes(GridData const &V)
    {
        for (int i=0; i<3; ++i) ax[i] = MonotonicAxis::along(V.coord_val(i), i);
    }
};

static void check_target_shape(char const *fn, ArrayT const &X0, ArrayT const &X1, ArrayT const &X2)
{
    if (any(X0.shape() != X1.shape()) || any(X0.shape() != X2.shape())) {
        (*geogrid_error)(ERR_SHAPE_MISMATCH,
            "%s: target coordinate arrays must have the same shape", fn);
    }
}

GridParts resample_parts(GridData const &V,
    ArrayT const &X0, ArrayT const &X1, ArrayT const &X2)
{
    check_target_shape("interpolate_data_fields()", X0, X1, X2);
    GridAxes const axes(V);
    auto const shp(X0.shape());

    auto resample([&](ArrayT const &A) -> ArrayT {
        ArrayT ret(shp);
        for (int i=0; i<shp[0]; ++i) {
        for (int j=0; j<shp[1]; ++j) {
        for (int k=0; k<shp[2]; ++k) {
            ret(i,j,k) = interp3(A, axes.ax[0], axes.ax[1], axes.ax[2],
                X0(i,j,k), X1(i,j,k), X2(i,j,k), Extrapolation::FLAT);
        }}}
        return ret;
    });

    GridParts ret(V.parts());
    ret.coords[0] = GeoUnit(X0, V.coord(0).units);
    ret.coords[1] = GeoUnit(X1, V.coord(1).units);
    ret.coords[2] = GeoUnit(X2, V.coord(2).units);
    ret.fields = V.fields().map(resample);
    ret.rank = 3;
    return ret;
}

GeoData interpolate_data_fields(GeoData const &V,
    ArrayT const &lon, ArrayT const &lat, ArrayT const &depth)
{
    return GeoData(resample_parts(V, lon, lat, depth));
}

CartData interpolate_data_fields(CartData const &V,
    ArrayT const &x, ArrayT const &y, ArrayT const &z)
{
    return CartData(resample_parts(V, x, y, z));
}

UTMData interpolate_data_fields(UTMData const &V,
    ArrayT const &EW, ArrayT const &NS, ArrayT const &depth)
{
    GridParts parts(resample_parts(V, EW, NS, depth));
    auto const lb(V.zone().lbound());
    return UTMData(EW, NS, parts.coords[2], V.zone()(lb), V.northern()(lb),
        parts.fields, parts.atts);
}

GeoData interpolate_data_on_surface(GeoData const &V, GeoData const &surf)
{
    return interpolate_data_fields(V, surf.lon().val, surf.lat().val, surf.depth().val);
}

CartData interpolate_data_on_surface(CartData const &V, CartData const &surf)
{
    return interpolate_data_fields(V, surf.x().val, surf.y().val, surf.z().val);
}

// ------------------------------------------------------------
static Interpolated2D resample_2d(GridData const &V, ArrayT const &X0, ArrayT const &X1)
{
    if (any(X0.shape() != X1.shape())) {
        (*geogrid_error)(ERR_SHAPE_MISMATCH,
            "interpolate_datafields_2d(): target coordinate arrays must have the same shape");
    }
    MonotonicAxis const ax0(MonotonicAxis::along(V.coord_val(0), 0));
    MonotonicAxis const ax1(MonotonicAxis::along(V.coord_val(1), 1));
    auto const shp(X0.shape());

    auto resample([&](ArrayT const &A) -> ArrayT {
        ArrayT ret(shp);
        for (int i=0; i<shp[0]; ++i) {
        for (int j=0; j<shp[1]; ++j) {
        for (int k=0; k<shp[2]; ++k) {
            ret(i,j,k) = interp2(A, ax0, ax1, X0(i,j,k), X1(i,j,k), Extrapolation::FLAT);
        }}}
        return ret;
    });

    Interpolated2D ret;
    ret.depth.reference(resample(V.coord_val(2)));
    ret.fields = V.fields().map(resample);
    return ret;
}

Interpolated2D interpolate_datafields_2d(GeoData const &V,
    ArrayT const &lon, ArrayT const &lat)
{
    return resample_2d(V, lon, lat);
}

Interpolated2D interpolate_datafields_2d(UTMData const &V,
    ArrayT const &EW, ArrayT const &NS)
{
    return resample_2d(V, EW, NS);
}

// ------------------------------------------------------------
/** Nearest-index box, walked in storage order */
static Range index_range(MonotonicAxis const &ax, Bounds const &bounds, int base)
{
    int const i_s = ax.nearest(bounds.first);
    int const i_e = ax.nearest(bounds.second);
    return Range(base + std::min(i_s, i_e), base + std::max(i_s, i_e));
}

static Bounds get_bounds(GridData const &V, int i, boost::optional<Bounds> const &level)
{
    if (level) return *level;
    auto const ext(V.extent(i));
    return Bounds(ext[0], ext[1]);
}

/** Shared by the GeoData and CartData versions */
static GridParts subvolume_parts(GridData const &V, SubvolumeParams const &params)
{
    Bounds const b[3] = {
        get_bounds(V, 0, params.lon_level),
        get_bounds(V, 1, params.lat_level),
        get_bounds(V, 2, params.depth_level)};

    if (params.interpolate) {
        CoordArrays xyz(lonlatdepth_grid(
            linspace(b[0].first, b[0].second, params.dims[0]),
            linspace(b[1].first, b[1].second, params.dims[1]),
            linspace(b[2].first, b[2].second, params.dims[2])));
        return resample_parts(V, xyz[0], xyz[1], xyz[2]);
    }

    GridAxes const axes(V);
    Range r[3];
    for (int i=0; i<3; ++i)
        r[i] = index_range(axes.ax[i], b[i], V.coord_val(i).lbound(i));

    return extract_parts(V, r[0], r[1], r[2]);
}

GeoData extract_subvolume(GeoData const &V, SubvolumeParams const &params)
{
    return GeoData(subvolume_parts(V, params));
}

CartData extract_subvolume(CartData const &V, SubvolumeParams const &params)
{
    return CartData(subvolume_parts(V, params));
}

// ------------------------------------------------------------
static Array<bool,3> above_surface_impl(
    ArrayT const &X, ArrayT const &Y, ArrayT const &Z,
    GridData const &surf, bool above)
{
    if (surf.shape()[2] != 1) {
        (*geogrid_error)(ERR_UNSUPPORTED_SHAPE,
            "It seems that the %s passed as a surface is not a surface: shape (%d, %d, %d)",
            surf.kind_name(), surf.shape()[0], surf.shape()[1], surf.shape()[2]);
    }

    MonotonicAxis const ax0(MonotonicAxis::along(surf.coord_val(0), 0));
    MonotonicAxis const ax1(MonotonicAxis::along(surf.coord_val(1), 1));
    ArrayT const &surf_depth(surf.coord_val(2));

    auto const shp(X.shape());
    Array<bool,3> ret(shp);
    for (int i=0; i<shp[0]; ++i) {
    for (int j=0; j<shp[1]; ++j) {
    for (int k=0; k<shp[2]; ++k) {
        double const sdepth = interp2(surf_depth, ax0, ax1,
            X(i,j,k), Y(i,j,k), Extrapolation::FILL);
        // NaN compares false
        ret(i,j,k) = (above ? Z(i,j,k) > sdepth : Z(i,j,k) < sdepth);
    }}}
    return ret;
}

Array<bool,3> above_surface(GeoData const &data, GeoData const &surf, bool above)
{
    return above_surface_impl(data.lon().val, data.lat().val, data.depth().val, surf, above);
}

Array<bool,3> above_surface(CartData const &data, CartData const &surf, bool above)
{
    return above_surface_impl(data.x().val, data.y().val, data.z().val, surf, above);
}

Array<bool,3> above_surface(CartGrid const &grid, CartData const &surf, bool above)
{
    CoordArrays xyz(coordinate_grids(grid));
    return above_surface_impl(xyz[0], xyz[1], xyz[2], surf, above);
}

}   // namespace
