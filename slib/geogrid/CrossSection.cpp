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
#include <Eigen/Dense>
#include <geogrid/CrossSection.hpp>
#include <geogrid/Subvolume.hpp>
#include <geogrid/gridutil.hpp>
#include <geogrid/interp.hpp>
#include <geogrid/convert.hpp>
#include <geogrid/geodesy.hpp>
#include <geogrid/error.hpp>

using namespace blitz;

namespace geogrid {

enum class Geometry { DEPTH, LAT, LON, DIAGONAL };

/** Finds the one geometry set in params */
static Geometry check_geometry(CrossSectionParams const &params)
{
    if (params.start.is_initialized() != params.end.is_initialized()) {
        (*geogrid_error)(ERR_MISSING_PAIRED_PARAMETER,
            "Also define the end coordinates if you indicate the start of a profile (or vice versa)");
    }

    int n = 0;
    Geometry ret = Geometry::DEPTH;
    if (params.depth_level) { ++n; ret = Geometry::DEPTH; }
    if (params.lat_level) { ++n; ret = Geometry::LAT; }
    if (params.lon_level) { ++n; ret = Geometry::LON; }
    if (params.start) { ++n; ret = Geometry::DIAGONAL; }

    if (n != 1) {
        (*geogrid_error)(ERR_INVALID_ARGUMENT,
            "Cross-section needs exactly one of depth_level, lat_level, lon_level or start/end; got %d", n);
    }
    return ret;
}

static void check_shape(char const *fn, GridData const &V, ShapeClass sc)
{
    if (V.shape_class() != sc) {
        (*geogrid_error)(ERR_UNSUPPORTED_SHAPE,
            "%s: the %s passed in is a %s, need a %s",
            fn, V.kind_name(), to_string(V.shape_class()), to_string(sc));
    }
}

/** Checks that level lies within the extent of coordinate i */
static void check_level(GridData const &V, int i, double level)
{
    auto const ext(V.extent(i));
    if (level < ext[0] || level > ext[1]) {
        (*geogrid_error)(ERR_OUT_OF_BOUNDS,
            "Cross-section level %s=%g is outside the data: [%g, %g]",
            V.coord_names()[i].c_str(), level, ext[0], ext[1]);
    }
}

/** Index box of the single node nearest to level along dim */
static Range nearest_layer(GridData const &V, int dim, double level)
{
    MonotonicAxis const ax(MonotonicAxis::along(V.coord_val(dim), dim));
    int const ix = V.coord_val(dim).lbound(dim) + ax.nearest(level);
    return Range(ix, ix);
}

static std::vector<double> span(GridData const &V, int i, int n)
{
    auto const ext(V.extent(i));
    return linspace(ext[0], ext[1], n);
}

// ------------------------------------------------------------
static GridParts volume_parts(GridData const &V, CrossSectionParams const &params)
{
    check_shape("cross_section_volume()", V, ShapeClass::VOLUME);
    Geometry const geom = check_geometry(params);
    int const d0 = params.dims[0];
    int const d1 = params.dims[1];

    switch(geom) {
        case Geometry::DEPTH : {
            double const level = *params.depth_level;
            check_level(V, 2, level);
            if (!params.interpolate)
                return extract_parts(V, Range::all(), Range::all(), nearest_layer(V, 2, level));

            CoordArrays xyz(lonlatdepth_grid(span(V,0,d0), span(V,1,d1), {level}));
            return resample_parts(V, xyz[0], xyz[1], xyz[2]);
        }
        case Geometry::LAT : {
            double const level = *params.lat_level;
            check_level(V, 1, level);
            if (!params.interpolate)
                return extract_parts(V, Range::all(), nearest_layer(V, 1, level), Range::all());

            CoordArrays xyz(lonlatdepth_grid(span(V,0,d0), {level}, span(V,2,d1)));
            return resample_parts(V, xyz[0], xyz[1], xyz[2]);
        }
        case Geometry::LON : {
            double const level = *params.lon_level;
            check_level(V, 0, level);
            if (!params.interpolate)
                return extract_parts(V, nearest_layer(V, 0, level), Range::all(), Range::all());

            CoordArrays xyz(lonlatdepth_grid({level}, span(V,1,d0), span(V,2,d1)));
            return resample_parts(V, xyz[0], xyz[1], xyz[2]);
        }
        default : {
            // Diagonal profiles are always interpolated
            LonLat const &start(*params.start);
            LonLat const &end(*params.end);
            auto const lon(linspace(start.first, end.first, d0));
            auto const lat(linspace(start.second, end.second, d0));
            auto const depth(span(V, 2, d1));

            ArrayT Lon(d0, d1, 1), Lat(d0, d1, 1), Depth(d0, d1, 1);
            for (int i=0; i<d0; ++i) {
            for (int j=0; j<d1; ++j) {
                Lon(i,j,0) = lon[i];
                Lat(i,j,0) = lat[i];
                Depth(i,j,0) = depth[j];
            }}
            return resample_parts(V, Lon, Lat, Depth);
        }
    }
}

GeoData cross_section_volume(GeoData const &V, CrossSectionParams const &params)
    { return GeoData(volume_parts(V, params)); }

CartData cross_section_volume(CartData const &V, CrossSectionParams const &params)
    { return CartData(volume_parts(V, params)); }

// ------------------------------------------------------------
static GridParts surface_parts(GridData const &V, CrossSectionParams const &params)
{
    check_shape("cross_section_surface()", V, ShapeClass::SURFACE);
    Geometry const geom = check_geometry(params);
    int const n = params.dims[0];

    std::vector<double> lon, lat;
    switch(geom) {
        case Geometry::DEPTH :
            (*geogrid_error)(ERR_UNSUPPORTED_SHAPE,
                "Horizontal cross-sections of a surface are not supported");
            break;
        case Geometry::LAT :
            lon = span(V, 0, n);
            lat.assign(n, *params.lat_level);
            break;
        case Geometry::LON :
            lat = span(V, 1, n);
            lon.assign(n, *params.lon_level);
            break;
        default :
            lon = linspace(params.start->first, params.end->first, n);
            lat = linspace(params.start->second, params.end->second, n);
            break;
    }

    MonotonicAxis const ax0(MonotonicAxis::along(V.coord_val(0), 0));
    MonotonicAxis const ax1(MonotonicAxis::along(V.coord_val(1), 1));
    auto profile([&](ArrayT const &A) -> ArrayT {
        ArrayT ret(n, 1, 1);
        for (int i=0; i<n; ++i)
            ret(i,0,0) = interp2(A, ax0, ax1, lon[i], lat[i], Extrapolation::FILL);
        return ret;
    });

    GridParts ret(V.parts());
    ret.coords[0] = GeoUnit(as_points(lon), V.coord(0).units);
    ret.coords[1] = GeoUnit(as_points(lat), V.coord(1).units);
    ret.coords[2] = GeoUnit(profile(V.coord_val(2)), V.coord(2).units);
    ret.fields = V.fields().map(profile);
    ret.rank = 1;
    return ret;
}

GeoData cross_section_surface(GeoData const &V, CrossSectionParams const &params)
    { return GeoData(surface_parts(V, params)); }

CartData cross_section_surface(CartData const &V, CrossSectionParams const &params)
    { return CartData(surface_parts(V, params)); }

// ------------------------------------------------------------
/** Visits every point of a grid in storage order */
template<class FnT>
static void for_each_point(ArrayT const &A, FnT const &fn)
{
    for (int i=A.lbound(0); i<=A.ubound(0); ++i) {
    for (int j=A.lbound(1); j<=A.ubound(1); ++j) {
    for (int k=A.lbound(2); k<=A.ubound(2); ++k) {
        fn(TinyVector<int,3>(i,j,k));
    }}}
}

GeoData cross_section_points(GeoData const &V, CrossSectionParams const &params)
{
    check_shape("cross_section_points()", V, ShapeClass::POINTS);
    Geometry const geom = check_geometry(params);
    double const half_width = 0.5 * params.section_width;    // km
    double const half_width_m = half_width * 1e3;

    ArrayT const &lon(V.lon().val);
    ArrayT const &lat(V.lat().val);
    ArrayT const &depth(V.depth().val);

    // Retained points, and their projection onto the section
    std::vector<TinyVector<int,3>> ind;
    std::vector<double> lon_proj, lat_proj, depth_proj;
    auto keep([&](TinyVector<int,3> const &ix, double plon, double plat, double pdepth) {
        ind.push_back(ix);
        lon_proj.push_back(plon);
        lat_proj.push_back(plat);
        depth_proj.push_back(pdepth);
    });

    switch(geom) {
        case Geometry::DEPTH : {
            double const level = *params.depth_level;
            for_each_point(depth, [&](TinyVector<int,3> const &ix) {
                double const d = depth(ix) - level;
                if (-half_width < d && d < half_width)
                    keep(ix, lon(ix), lat(ix), level);
            });
        } break;
        case Geometry::LAT : {
            double const level = *params.lat_level;
            ProjectionPoint const pp(level, mean(lon));
            UTMData const utm(to_utm_zone(V, pp));
            for_each_point(depth, [&](TinyVector<int,3> const &ix) {
                double const d = utm.NS().val(ix) - pp.NS;
                if (-half_width_m < d && d < half_width_m)
                    keep(ix, lon(ix), level, depth(ix));
            });
        } break;
        case Geometry::LON : {
            double const level = *params.lon_level;
            ProjectionPoint const pp(mean(lat), level);
            UTMData const utm(to_utm_zone(V, pp));
            for_each_point(depth, [&](TinyVector<int,3> const &ix) {
                double const d = utm.EW().val(ix) - pp.EW;
                if (-half_width_m < d && d < half_width_m)
                    keep(ix, level, lat(ix), depth(ix));
            });
        } break;
        default : {
            LonLat const &start(*params.start);
            LonLat const &end(*params.end);
            ProjectionPoint const pp(
                0.5*(start.second + end.second), 0.5*(start.first + end.first));
            UTMData const utm(to_utm_zone(V, pp));

            // Three points spanning the section plane: P1-P2 is vertical,
            // P1-P3 runs along the profile at the surface.
            std::vector<double> const plon {start.first, start.first, end.first};
            std::vector<double> const plat {start.second, start.second, end.second};
            std::vector<double> const pdepth {0., -200., 0.};
            GeoData const profile(as_points(plon), as_points(plat), as_points(pdepth),
                FieldSet(), Attributes(), 1);
            UTMData const profile_utm(to_utm_zone(profile, pp));

            auto utm_point([](UTMData const &U, int i) -> Eigen::Vector3d {
                return Eigen::Vector3d(U.EW().val(i,0,0), U.NS().val(i,0,0), U.depth().val(i,0,0));
            });
            Eigen::Vector3d const P1(utm_point(profile_utm, 0));
            Eigen::Vector3d const P2(utm_point(profile_utm, 1));
            Eigen::Vector3d const P3(utm_point(profile_utm, 2));

            // Normal of the section plane (m^2)
            Eigen::Vector3d const normal((P2 - P1).cross(P3 - P1));
            double const norm2 = normal.squaredNorm();

            Proj2 const inverse(utm_sproj(pp.zone, pp.isnorth), Proj2::Direction::XY2LL);
            for_each_point(depth, [&](TinyVector<int,3> const &ix) {
                Eigen::Vector3d const X(utm.EW().val(ix), utm.NS().val(ix), utm.depth().val(ix));
                double const t = normal.dot(P1 - X) / norm2;
                double const dist = std::abs(t) * std::sqrt(norm2);
                if (!(dist < half_width_m)) return;

                Eigen::Vector3d const projected(X + t*normal);
                double plon, plat, palt;
                inverse.transform(projected[0], projected[1], projected[2], plon, plat, palt);
                keep(ix, plon, plat, palt / 1e3);
            });
        } break;
    }

    // Carry every field at the retained points
    int const n = ind.size();
    auto gather([&](ArrayT const &A) -> ArrayT {
        ArrayT ret(n, 1, 1);
        for (int i=0; i<n; ++i) ret(i,0,0) = A(ind[i]);
        return ret;
    });

    GridParts parts(V.parts());
    for (int i=0; i<3; ++i)
        parts.coords[i] = GeoUnit(gather(V.coord_val(i)), V.coord(i).units);
    parts.fields = V.fields().map(gather);
    parts.fields.add("depth_proj", Field(as_points(depth_proj), UNITS_KM));
    parts.fields.add("lat_proj", Field(as_points(lat_proj), UNITS_DEGREE));
    parts.fields.add("lon_proj", Field(as_points(lon_proj), UNITS_DEGREE));
    parts.rank = 1;
    return GeoData(parts);
}

// ------------------------------------------------------------
GeoData cross_section(GeoData const &V, CrossSectionParams const &params)
{
    check_geometry(params);
    switch(V.shape_class()) {
        case ShapeClass::VOLUME : return cross_section_volume(V, params);
        case ShapeClass::SURFACE : return cross_section_surface(V, params);
        default : return cross_section_points(V, params);
    }
}

CartData cross_section(CartData const &V, CrossSectionParams const &params)
{
    check_geometry(params);
    if (V.shape_class() == ShapeClass::POINTS) {
        (*geogrid_error)(ERR_UNSUPPORTED_SHAPE,
            "cross_section(): point sets are only supported for GeoData");
    }
    if (V.shape_class() == ShapeClass::VOLUME) return cross_section_volume(V, params);
    return cross_section_surface(V, params);
}

}   // namespace
