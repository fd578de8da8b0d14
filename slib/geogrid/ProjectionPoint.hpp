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

#ifndef GEOGRID_PROJECTIONPOINT_HPP
#define GEOGRID_PROJECTIONPOINT_HPP

#include <iostream>

namespace geogrid {

/** Anchor point used to project a data set from lon/lat to a local
Cartesian frame and back.  Binds a geographic location to its UTM
coordinates.  Immutable once constructed. */
class ProjectionPoint {
public:
    double const lat;
    double const lon;
    /** UTM easting / northing (m) */
    double const EW;
    double const NS;
    int const zone;
    bool const isnorth;

    /** Defines the projection point by latitude and longitude; UTM
    coordinates are computed in the point's standard zone.  Default is
    Mainz. */
    explicit ProjectionPoint(double _lat = 49.9929, double _lon = 8.2473);

    /** Defines the projection point by UTM coordinates. */
    ProjectionPoint(double _EW, double _NS, int _zone, bool _isnorth);

private:
    ProjectionPoint(double _lat, double _lon, double _EW, double _NS, int _zone, bool _isnorth) :
        lat(_lat), lon(_lon), EW(_EW), NS(_NS), zone(_zone), isnorth(_isnorth) {}

    static ProjectionPoint from_latlon(double lat, double lon);
    static ProjectionPoint from_utm(double EW, double NS, int zone, bool isnorth);
};

std::ostream &operator<<(std::ostream &out, ProjectionPoint const &p);

}

#endif
