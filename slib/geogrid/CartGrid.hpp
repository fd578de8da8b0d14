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

#ifndef GEOGRID_CARTGRID_HPP
#define GEOGRID_CARTGRID_HPP

#include <vector>
#include <iostream>
#include <boost/optional.hpp>
#include <geogrid/GridData.hpp>
#include <geogrid/gridutil.hpp>

namespace geogrid {

/** Regular, axis-aligned 1D, 2D or 3D Cartesian grid, described by 1-D
coordinate vectors.  Spacing is constant along each axis.  The vectors
hold the corner (vertex) points; coord1D_cen holds the N-1 cell
centers.

In 2D, the second axis is the vertical (z) axis. */
class CartGrid {
public:
    /** Number of grid points in every direction */
    std::vector<int> N;
    /** Spacing in every direction */
    std::vector<double> delta;
    /** Domain size */
    std::vector<double> L;
    std::vector<double> min;
    std::vector<double> max;
    std::vector<std::vector<double>> coord1D;
    std::vector<std::vector<double>> coord1D_cen;

    int ndim() const { return N.size(); }

    /** Wraps fields defined on this grid (3D only; for 2D, see y_val)
    into a CartData.
    @param y_val y coordinate at which a 2D grid is placed.  Fields of a
        2D grid may be given with shape (N1,N2,1) or (N1,1,N2); they are
        stored as (N1,1,N2). */
    CartData to_cartdata(FieldSet const &fields, double y_val = 0.0) const;
};

/** Creates a Cartesian grid, by giving either the extent of the domain
in each direction, or its start and end points.
@param size Number of points in each direction (1, 2 or 3 of them)
@param extent Length in each direction.  Gives x=(0,e[0]),
    z=(-e[1],0) and y=(0,e[2]).  Overrides x, y and z.
@throws InvalidArgumentError if the domain is under-specified */
CartGrid create_cart_grid(
    std::vector<int> const &size,
    boost::optional<Bounds> const &x,
    boost::optional<Bounds> const &y,
    boost::optional<Bounds> const &z,
    boost::optional<std::vector<double>> const &extent = boost::none);

/** Convenience: domain given by its extent only */
inline CartGrid create_cart_grid(
    std::vector<int> const &size,
    std::vector<double> const &extent)
{
    return create_cart_grid(size, boost::none, boost::none, boost::none,
        boost::optional<std::vector<double>>(extent));
}

/** 3D coordinate arrays of the grid; a 2D grid lies in the plane y=0.
@param cell If set, use cell-center vectors. */
CoordArrays coordinate_grids(CartGrid const &grid, bool cell = false);

std::ostream &operator<<(std::ostream &out, CartGrid const &grid);

}   // namespace

#endif    // guard
