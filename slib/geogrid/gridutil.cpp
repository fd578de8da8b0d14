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
#include <limits>
#include <Eigen/Dense>
#include <geogrid/gridutil.hpp>
#include <geogrid/constant.hpp>
#include <geogrid/error.hpp>

using namespace blitz;

namespace geogrid {

static double const NaN = std::numeric_limits<double>::quiet_NaN();

std::vector<double> linspace(double a, double b, int n)
{
    std::vector<double> ret;
    if (n <= 0) return ret;
    if (n == 1) {
        ret.push_back(a);
        return ret;
    }

    ret.reserve(n);
    double const delta = (b - a) / (n - 1);
    for (int i=0; i<n-1; ++i) ret.push_back(a + i*delta);
    ret.push_back(b);    // Avoid roundoff at the far end
    return ret;
}

CoordArrays lonlatdepth_grid(
    std::vector<double> const &lon,
    std::vector<double> const &lat,
    std::vector<double> const &depth)
{
    int const nlon = lon.size();
    int const nlat = lat.size();
    int const ndepth = depth.size();

    if (nlon == 1 && nlat == 1 && ndepth == 1) {
        (*geogrid_error)(ERR_INVALID_ARGUMENT,
            "Cannot use lonlatdepth_grid() for a single 3D point");
    }
    if (nlon == 0 || nlat == 0 || ndepth == 0) {
        (*geogrid_error)(ERR_INVALID_ARGUMENT,
            "lonlatdepth_grid(): empty coordinate vector (%d, %d, %d)",
            nlon, nlat, ndepth);
    }

    ArrayT Lon(nlon, nlat, ndepth);
    ArrayT Lat(nlon, nlat, ndepth);
    ArrayT Depth(nlon, nlat, ndepth);
    for (int i=0; i<nlon; ++i) {
    for (int j=0; j<nlat; ++j) {
    for (int k=0; k<ndepth; ++k) {
        Lon(i,j,k) = lon[i];
        Lat(i,j,k) = lat[j];
        Depth(i,j,k) = depth[k];
    }}}

    return {{Lon, Lat, Depth}};
}

ArrayT as_points(std::vector<double> const &vals)
{
    ArrayT ret(vals.size(), 1, 1);
    for (size_t i=0; i<vals.size(); ++i) ret(i,0,0) = vals[i];
    return ret;
}


ArrayT average_q1(ArrayT const &d)
{
    int const n0 = std::max(0, d.extent(0)-1);
    int const n1 = std::max(0, d.extent(1)-1);
    int const n2 = std::max(0, d.extent(2)-1);
    int const b0 = d.lbound(0);
    int const b1 = d.lbound(1);
    int const b2 = d.lbound(2);

    ArrayT out(n0, n1, n2);
    for (int i=0; i<n0; ++i) {
    for (int j=0; j<n1; ++j) {
    for (int k=0; k<n2; ++k) {
        double sum = 0;
        for (int di=0; di<2; ++di)
        for (int dj=0; dj<2; ++dj)
        for (int dk=0; dk<2; ++dk)
            sum += d(b0+i+di, b1+j+dj, b2+k+dk);
        out(i,j,k) = sum / 8.;
    }}}
    return out;
}

CoordArrays coordinate_grids(GridData const &grid, bool cell)
{
    if (cell) {
        return {{average_q1(grid.coord_val(0)),
            average_q1(grid.coord_val(1)),
            average_q1(grid.coord_val(2))}};
    }
    return {{grid.coord_val(0), grid.coord_val(1), grid.coord_val(2)}};
}

// ------------------------------------------------------------
/** Mean of the non-NaN values; NaN if there are none */
static double nanmean(double sum, long n)
    { return (n == 0 ? NaN : sum / n); }

ArrayT subtract_horizontal_mean(ArrayT const &V, bool percentage)
{
    ArrayT ret(V.shape());
    for (int k=0; k<V.extent(2); ++k) {
        double sum = 0;
        long n = 0;
        for (int i=0; i<V.extent(0); ++i) {
        for (int j=0; j<V.extent(1); ++j) {
            double const v = V(V.lbound(0)+i, V.lbound(1)+j, V.lbound(2)+k);
            if (std::isnan(v)) continue;
            sum += v;
            ++n;
        }}
        double const average = nanmean(sum, n);

        for (int i=0; i<V.extent(0); ++i) {
        for (int j=0; j<V.extent(1); ++j) {
            double const v = V(V.lbound(0)+i, V.lbound(1)+j, V.lbound(2)+k) - average;
            ret(i,j,k) = (percentage ? v / average * 100.0 : v);
        }}
    }
    return ret;
}

Array<double,2> subtract_horizontal_mean(Array<double,2> const &V, bool percentage)
{
    Array<double,2> ret(V.shape());
    for (int k=0; k<V.extent(1); ++k) {
        double sum = 0;
        long n = 0;
        for (int i=0; i<V.extent(0); ++i) {
            double const v = V(V.lbound(0)+i, V.lbound(1)+k);
            if (std::isnan(v)) continue;
            sum += v;
            ++n;
        }
        double const average = nanmean(sum, n);

        for (int i=0; i<V.extent(0); ++i) {
            double const v = V(V.lbound(0)+i, V.lbound(1)+k) - average;
            ret(i,k) = (percentage ? v / average * 100.0 : v);
        }
    }
    return ret;
}

// ------------------------------------------------------------
GridParts extract_parts(GridData const &V,
    Range const &r0, Range const &r1, Range const &r2)
{
    GridParts ret(V.parts());
    for (int i=0; i<3; ++i) {
        ArrayT sub(V.coord_val(i)(r0, r1, r2).copy());
        ret.coords[i] = GeoUnit(sub, V.coord(i).units);
    }

    FieldSet fields;
    auto const &keys(V.fields().keys());
    for (size_t i=0; i<keys.size(); ++i) {
        fields.add(keys[i], V.fields()[i].map(
            [&](ArrayT const &A) -> ArrayT { return A(r0, r1, r2).copy(); }));
    }
    ret.fields = fields;
    return ret;
}

GeoData extract_datasets(GeoData const &V,
    Range const &ilon, Range const &ilat, Range const &idepth)
{
    return GeoData(extract_parts(V, ilon, ilat, idepth));
}

CartData extract_datasets(CartData const &V,
    Range const &ix, Range const &iy, Range const &iz)
{
    return CartData(extract_parts(V, ix, iy, iz));
}

/** Copy of A, reversed along dimension dim */
static ArrayT reversed(ArrayT const &A, int dim)
{
    ArrayT ret(A.shape());
    int const n = A.extent(dim);
    for (int i=0; i<A.extent(0); ++i) {
    for (int j=0; j<A.extent(1); ++j) {
    for (int k=0; k<A.extent(2); ++k) {
        TinyVector<int,3> src(i,j,k);
        src[dim] = n-1-src[dim];
        ret(i,j,k) = A(A.lbound(0)+src[0], A.lbound(1)+src[1], A.lbound(2)+src[2]);
    }}}
    return ret;
}

GeoData flip(GeoData const &V, int dim)
{
    if (dim < 0 || dim > 2) {
        (*geogrid_error)(ERR_INVALID_ARGUMENT,
            "flip(): dimension must be 0, 1 or 2; got %d", dim);
    }

    GridParts parts(V.parts());
    for (int i=0; i<3; ++i)
        parts.coords[i] = GeoUnit(reversed(V.coord_val(i), dim), V.coord(i).units);
    parts.fields = V.fields().map(
        [dim](ArrayT const &A) -> ArrayT { return reversed(A, dim); });
    return GeoData(parts);
}

// ------------------------------------------------------------
GeoData add_field(GeoData const &V, std::string const &name, Field const &field)
{
    GridParts parts(V.parts());
    parts.fields.add(name, field);
    return GeoData(parts);
}

CartData add_field(CartData const &V, std::string const &name, Field const &field)
{
    GridParts parts(V.parts());
    parts.fields.add(name, field);
    return CartData(parts);
}

GeoData remove_field(GeoData const &V, std::string const &name)
    { return remove_field(V, std::vector<std::string>{name}); }

GeoData remove_field(GeoData const &V, std::vector<std::string> const &names)
{
    GridParts parts(V.parts());
    parts.fields = V.fields().without(names);
    return GeoData(parts);
}

CartData remove_field(CartData const &V, std::string const &name)
    { return remove_field(V, std::vector<std::string>{name}); }

CartData remove_field(CartData const &V, std::vector<std::string> const &names)
{
    GridParts parts(V.parts());
    parts.fields = V.fields().without(names);
    return CartData(parts);
}

// ------------------------------------------------------------
CartData rotate_translate_scale(CartData const &V, TransformParams const &params)
{
    auto const shp(V.shape());
    ArrayT x(shp), y(shp), z(shp);
    x = V.x().val * params.scale[0];
    y = V.y().val * params.scale[1];
    z = V.z().val * params.scale[2];

    double const xm = mean(x);
    double const ym = mean(y);
    Eigen::Matrix2d const R(Eigen::Rotation2Dd(params.rotate * D2R).toRotationMatrix());
    for (int i=0; i<shp[0]; ++i) {
    for (int j=0; j<shp[1]; ++j) {
    for (int k=0; k<shp[2]; ++k) {
        Eigen::Vector2d const xy(R * Eigen::Vector2d(x(i,j,k) - xm, y(i,j,k) - ym));
        x(i,j,k) = xy(0) + xm + params.translate[0];
        y(i,j,k) = xy(1) + ym + params.translate[1];
        z(i,j,k) += params.translate[2];
    }}}

    return CartData(x, y, z, V.fields(), V.atts(), V.rank());
}

ArrayT lithostatic_pressure(ArrayT const &density, double dz, double g)
{
    ArrayT P(density.shape());
    int const nz = density.extent(2);
    for (int i=0; i<density.extent(0); ++i) {
    for (int j=0; j<density.extent(1); ++j) {
        // The surface layer carries no weight
        double sum = 0;
        if (nz > 0) P(i,j,nz-1) = 0;
        for (int k=nz-2; k>=0; --k) {
            sum += g * dz * density(density.lbound(0)+i, density.lbound(1)+j, density.lbound(2)+k);
            P(i,j,k) = sum;
        }
    }}
    return P;
}

}   // namespace
