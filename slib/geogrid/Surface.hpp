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

#ifndef GEOGRID_SURFACE_HPP
#define GEOGRID_SURFACE_HPP

#include <geogrid/GridData.hpp>

namespace geogrid {

/** True for a horizontal surface: a grid (not a point set) with a
single layer along the depth axis. */
bool is_surface(GridData const &V);

/** Combines two horizontal surfaces on the same horizontal nodes.
Depth (or z) values are added; b's depth is converted to a's units.
The result has a's fields, then b's; a field of b replaces the field
of a with the same name.  Attributes are taken from a.
@throws UnsupportedDatasetShapeError if either grid is not a surface
@throws ShapeMismatchError if the shapes differ
@throws InvalidArgumentError if the horizontal coordinates differ */
GeoData operator+(GeoData const &a, GeoData const &b);
CartData operator+(CartData const &a, CartData const &b);

/** Same as operator+(), with b's depth (or z) subtracted */
GeoData operator-(GeoData const &a, GeoData const &b);
CartData operator-(CartData const &a, CartData const &b);

/** Replaces every NaN of Z, in place, with the value of the nearest
(in X/Y) node that is not NaN.  Ties go to the first such node in
storage order.  If Z has no valid values it is left unchanged.
@return Number of values replaced. */
long remove_nan_surface(ArrayT &Z, ArrayT const &X, ArrayT const &Y);

/** Copy of a surface with its NaN depths (or z) filled in.
@throws UnsupportedDatasetShapeError if V is not a surface */
GeoData remove_nan_surface(GeoData const &V);
CartData remove_nan_surface(CartData const &V);

}   // namespace

#endif    // guard
