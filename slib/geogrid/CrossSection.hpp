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

#ifndef GEOGRID_CROSSSECTION_HPP
#define GEOGRID_CROSSSECTION_HPP

#include <array>
#include <utility>
#include <boost/optional.hpp>
#include <geogrid/GridData.hpp>

namespace geogrid {

/** A horizontal position: (lon, lat), or (x, y) for Cartesian data */
typedef std::pair<double,double> LonLat;

/** Geometry and resolution of a cross-section.  Exactly one of
depth_level, lat_level, lon_level or (start, end) must be given.  For
CartData, lon / lat / depth address x / y / z. */
struct CrossSectionParams {
    /** Horizontal slice at this depth (km) */
    boost::optional<double> depth_level;
    /** Vertical slice at this latitude */
    boost::optional<double> lat_level;
    /** Vertical slice at this longitude */
    boost::optional<double> lon_level;
    /** Diagonal profile; start and end must be given together */
    boost::optional<LonLat> start;
    boost::optional<LonLat> end;

    /** Resolution of interpolated profiles: (along profile, depth).
    Surfaces only use dims[0]. */
    std::array<int,2> dims;

    /** Interpolate volumes onto a regular grid, rather than picking the
    nearest index.  Diagonal profiles always interpolate. */
    bool interpolate;

    /** Width (km) of the band around the profile from which point data
    are taken */
    double section_width;

    CrossSectionParams() :
        dims{{100,100}}, interpolate(false), section_width(50.0) {}
};

/** Creates a cross-section through a data set.  Volumes are cut
(or interpolated), surfaces are interpolated onto a profile line, and
points within section_width of the profile are projected onto it.
@throws MissingPairedParameterError if start is given without end, or vice versa
@throws InvalidArgumentError if not exactly one geometry is given
@throws OutOfBoundsError if a level lies outside the data (volumes)
@throws UnsupportedDatasetShapeError for horizontal slices of surfaces */
GeoData cross_section(GeoData const &V, CrossSectionParams const &params);

/** Cartesian version; point sets are not supported. */
CartData cross_section(CartData const &V, CrossSectionParams const &params);

/** Cross-section of a volume.  Output shapes:
 - depth_level: (nx,ny,1), or (dims[0],dims[1],1) if interpolated
 - lat_level:   (nx,1,nz), or (dims[0],1,dims[1])
 - lon_level:   (1,ny,nz), or (1,dims[0],dims[1])
 - start/end:   (dims[0],dims[1],1) */
GeoData cross_section_volume(GeoData const &V, CrossSectionParams const &params);
CartData cross_section_volume(CartData const &V, CrossSectionParams const &params);

/** Profile through a surface, as a point set of dims[0] points.  Depth
and every field are interpolated bilinearly, NaN outside the surface. */
GeoData cross_section_surface(GeoData const &V, CrossSectionParams const &params);
CartData cross_section_surface(CartData const &V, CrossSectionParams const &params);

/** Selects the points within section_width/2 of the profile, and adds
the fields depth_proj, lat_proj and lon_proj holding their projection
onto it. */
GeoData cross_section_points(GeoData const &V, CrossSectionParams const &params);

}   // namespace

#endif    // guard
