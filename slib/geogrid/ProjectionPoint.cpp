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

#include <boost/format.hpp>
#include <geogrid/ProjectionPoint.hpp>
#include <geogrid/geodesy.hpp>

namespace geogrid {

ProjectionPoint::ProjectionPoint(double _lat, double _lon) :
    ProjectionPoint(from_latlon(_lat, _lon)) {}

ProjectionPoint::ProjectionPoint(double _EW, double _NS, int _zone, bool _isnorth) :
    ProjectionPoint(from_utm(_EW, _NS, _zone, _isnorth)) {}

ProjectionPoint ProjectionPoint::from_latlon(double lat, double lon)
{
    double EW, NS;
    int zone;
    bool isnorth;
    lla_to_utmz(lat, lon, EW, NS, zone, isnorth);
    return ProjectionPoint(lat, lon, EW, NS, zone, isnorth);
}

ProjectionPoint ProjectionPoint::from_utm(double EW, double NS, int zone, bool isnorth)
{
    Proj2 proj(utm_sproj(zone, isnorth), Proj2::Direction::XY2LL);
    double lon, lat;
    proj.transform(EW, NS, lon, lat);
    return ProjectionPoint(lat, lon, EW, NS, zone, isnorth);
}

std::ostream &operator<<(std::ostream &out, ProjectionPoint const &p)
{
    out << boost::format("ProjectionPoint(lat=%g, lon=%g, EW=%.3f, NS=%.3f, zone=%d%s)")
        % p.lat % p.lon % p.EW % p.NS % p.zone % (p.isnorth ? "N" : "S");
    return out;
}

}
