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

#ifndef GEOGRID_CONVERT_HPP
#define GEOGRID_CONVERT_HPP

#include <geogrid/GridData.hpp>
#include <geogrid/ProjectionPoint.hpp>

namespace geogrid {

/** Converts geographic data to Earth-Centered Earth-Fixed Cartesian
coordinates (km) on the WGS84 ellipsoid.  Every 3-component field whose
name does not contain "color" is taken to be a (east, north, up) vector
and rotated into the x/y/z frame.  The magnitude is preserved, but the
original components are not recoverable; keep them as separate scalar
fields if they are needed. */
ECEFData to_ecef(GeoData const &d);

/** Rotates a (east, north, up) vector field, defined on the points of
d, into the ECEF x/y/z frame. */
Field velocity_spherical_to_cartesian(GeoData const &d, Field const &velocity);

/** Converts to UTM, each point in its own standard zone.  Points with
a NaN lat or lon get NaN easting/northing and zone 0. */
UTMData to_utm(GeoData const &d);

/** Converts to UTM, all points in the zone of the projection point */
UTMData to_utm_zone(GeoData const &d, ProjectionPoint const &proj);

/** Cartesian (km, relative to proj) to UTM (m) in proj's zone */
UTMData to_utm_zone(CartData const &d, ProjectionPoint const &proj);

/** Converts back to lon/lat, using the zone stored with each point.
Points in zone 0 come back as NaN. */
GeoData to_geo(UTMData const &d);

/** Cartesian (km, relative to proj) back to lon/lat */
GeoData to_geo(CartData const &d, ProjectionPoint const &proj);

/** UTM (m) to Cartesian (km), relative to the projection point */
CartData to_cart(UTMData const &d, ProjectionPoint const &proj);

/** Geographic to Cartesian (km), via UTM in proj's zone.  Depth is kept
as it is (km). */
CartData to_cart(GeoData const &d, ProjectionPoint const &proj);

}   // namespace

#endif    // guard
