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

#ifndef GEOGRID_GRIDUTIL_HPP
#define GEOGRID_GRIDUTIL_HPP

#include <array>
#include <vector>
#include <string>
#include <utility>
#include <blitz/array.h>
#include <geogrid/GridData.hpp>

namespace geogrid {

/** Three coordinate arrays of one shape */
typedef std::array<ArrayT,3> CoordArrays;

/** (min, max) of an interval along one axis */
typedef std::pair<double,double> Bounds;

/** n evenly spaced values from a to b (inclusive).  n==1 gives {a}. */
std::vector<double> linspace(double a, double b, int n);

/** Creates 3-D arrays of lon, lat and depth from 1-D vectors.  Any of
the vectors may have length 1.
@throws InvalidArgumentError if all three have length 1 */
CoordArrays lonlatdepth_grid(
    std::vector<double> const &lon,
    std::vector<double> const &lat,
    std::vector<double> const &depth);

/** Same as lonlatdepth_grid(), for Cartesian coordinates */
inline CoordArrays xyz_grid(
    std::vector<double> const &x,
    std::vector<double> const &y,
    std::vector<double> const &z)
    { return lonlatdepth_grid(x, y, z); }

/** Stores a 1-D vector as a point set, shape (n,1,1) */
ArrayT as_points(std::vector<double> const &vals);

/** 3-D linear averaging of the 8 corner nodes of each cell.  Result has
extent n-1 along every dimension. */
ArrayT average_q1(ArrayT const &d);

/** Coordinate arrays of a grid.
@param cell If set, return cell-centered (average_q1) coordinates. */
CoordArrays coordinate_grids(GridData const &grid, bool cell = false);

/** Subtracts the horizontal average (ignoring NaNs) of every depth
layer (last dimension) of V.
@param percentage If set, the result is given in percent of the layer
    average. */
ArrayT subtract_horizontal_mean(ArrayT const &V, bool percentage = false);
blitz::Array<double,2> subtract_horizontal_mean(
    blitz::Array<double,2> const &V, bool percentage = false);

// ------------------------------------------------------------
/** Copies the index box (r0, r1, r2) of any grid, including all
fields.  Ranges may have a negative stride. */
GridParts extract_parts(GridData const &V,
    blitz::Range const &r0, blitz::Range const &r1, blitz::Range const &r2);

/** Extracts the index box (ilon, ilat, idepth) of a grid, including
all fields. */
GeoData extract_datasets(GeoData const &V,
    blitz::Range const &ilon, blitz::Range const &ilat, blitz::Range const &idepth);
CartData extract_datasets(CartData const &V,
    blitz::Range const &ix, blitz::Range const &iy, blitz::Range const &iz);

/** Reverses the coordinates and every field along dimension dim (0-based) */
GeoData flip(GeoData const &V, int dim = 2);

/** Returns a new grid with a field added (or replaced) */
GeoData add_field(GeoData const &V, std::string const &name, Field const &field);
CartData add_field(CartData const &V, std::string const &name, Field const &field);

/** Returns a new grid with a field removed */
GeoData remove_field(GeoData const &V, std::string const &name);
GeoData remove_field(GeoData const &V, std::vector<std::string> const &names);
CartData remove_field(CartData const &V, std::string const &name);
CartData remove_field(CartData const &V, std::vector<std::string> const &names);

// ------------------------------------------------------------
/** Parameters for rotate_translate_scale() */
struct TransformParams {
    /** Rotation in the x/y plane, degrees counter-clockwise */
    double rotate;
    std::array<double,3> translate;
    std::array<double,3> scale;

    TransformParams() :
        rotate(0.), translate{{0.,0.,0.}}, scale{{1.,1.,1.}} {}
};

/** Transforms the coordinates of a Cartesian data set, in this order:
 1. x, y and z are multiplied by scale.
 2. x and y are rotated around the center of the (scaled) data,
    taken as the mean of x and of y.
 3. translate is added.
Fields and attributes are carried over unchanged. */
CartData rotate_translate_scale(CartData const &V,
    TransformParams const &params = TransformParams());

/** Lithostatic pressure from a 3-D density array with constant
vertical spacing dz.  Axis 2 points upwards: its last layer is the
surface, where pressure is 0.  Below, each layer holds the weight
g*dz*density of the layers above it, starting with its own.
In SI units (kg/m^3, m, m/s^2) the result is in Pa. */
ArrayT lithostatic_pressure(ArrayT const &density, double dz, double g = 9.81);

}   // namespace

#endif    // guard
