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

#ifndef GEOGRID_SUBVOLUME_HPP
#define GEOGRID_SUBVOLUME_HPP

#include <array>
#include <boost/optional.hpp>
#include <geogrid/GridData.hpp>
#include <geogrid/gridutil.hpp>
#include <geogrid/CartGrid.hpp>

namespace geogrid {

/** Parameters for extract_subvolume().  For CartData, the lon / lat /
depth bounds apply to x / y / z. */
struct SubvolumeParams {
    /** (min,max) along each axis; default is the extent of the data */
    boost::optional<Bounds> lon_level;
    boost::optional<Bounds> lat_level;
    boost::optional<Bounds> depth_level;

    /** If set, interpolate onto a new regular grid of size dims, spanning
    exactly the bounds.  Otherwise, cut out the closest index box. */
    bool interpolate;
    std::array<int,3> dims;

    SubvolumeParams() : interpolate(false), dims{{50,50,50}} {}
};

/** Cuts a piece out of a 2D or 3D data set.
Without interpolation, the nearest node to each bound is found along
each axis and the index box between them is copied verbatim (in storage
order).  With interpolation, every field is resampled trilinearly, with
flat extrapolation outside the data. */
GeoData extract_subvolume(GeoData const &V, SubvolumeParams const &params = SubvolumeParams());
CartData extract_subvolume(CartData const &V, SubvolumeParams const &params = SubvolumeParams());

/** Resamples every field of any grid onto the points (X0,X1,X2),
given in V's coordinate units. */
GridParts resample_parts(GridData const &V,
    ArrayT const &X0, ArrayT const &X1, ArrayT const &X2);

/** Interpolates all fields of V onto the points (lon, lat, depth).
Trilinear, with flat extrapolation.  Handles axes stored in either
order. */
GeoData interpolate_data_fields(GeoData const &V,
    ArrayT const &lon, ArrayT const &lat, ArrayT const &depth);
CartData interpolate_data_fields(CartData const &V,
    ArrayT const &x, ArrayT const &y, ArrayT const &z);
/** Result is placed in the zone of V's first point.
@param depth In m */
UTMData interpolate_data_fields(UTMData const &V,
    ArrayT const &EW, ArrayT const &NS, ArrayT const &depth);

/** Interpolates a 3D data set onto the nodes of a surface */
GeoData interpolate_data_on_surface(GeoData const &V, GeoData const &surf);
CartData interpolate_data_on_surface(CartData const &V, CartData const &surf);

/** Depth and fields of a horizontal surface, interpolated to new
horizontal positions. */
struct Interpolated2D {
    ArrayT depth;
    FieldSet fields;
};

/** Bilinear interpolation over the two horizontal axes of the first
depth layer of V, with flat extrapolation.  Output arrays have the shape
of lon. */
Interpolated2D interpolate_datafields_2d(GeoData const &V,
    ArrayT const &lon, ArrayT const &lat);
Interpolated2D interpolate_datafields_2d(UTMData const &V,
    ArrayT const &EW, ArrayT const &NS);

/** True where points of data lie above the surface.  The surface depth
is interpolated at the data's horizontal positions; outside the surface
it is NaN, and the result there is false.
@param above Set to false for below_surface()
@throws UnsupportedDatasetShapeError if surf is not a surface */
blitz::Array<bool,3> above_surface(GeoData const &data, GeoData const &surf, bool above = true);
blitz::Array<bool,3> above_surface(CartData const &data, CartData const &surf, bool above = true);
blitz::Array<bool,3> above_surface(CartGrid const &grid, CartData const &surf, bool above = true);

inline blitz::Array<bool,3> below_surface(GeoData const &data, GeoData const &surf)
    { return above_surface(data, surf, false); }
inline blitz::Array<bool,3> below_surface(CartData const &data, CartData const &surf)
    { return above_surface(data, surf, false); }
inline blitz::Array<bool,3> below_surface(CartGrid const &grid, CartData const &surf)
    { return above_surface(grid, surf, false); }

}   // namespace

#endif    // guard
