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

#ifndef GEOGRID_GEODESY_HPP
#define GEOGRID_GEODESY_HPP

#include <map>
#include <tuple>
#include <geogrid/Proj.hpp>

namespace geogrid {

/** Standard UTM zone of a point, including the Norway / Svalbard
exceptions.  Longitudes are wrapped into [-180,180).
@return The zone (1-60); 0 if lat or lon is NaN. */
int utm_zone(double lat, double lon);

/** PROJ string for a WGS84 UTM zone */
std::string utm_sproj(int zone, bool isnorth);

/** PROJ string for WGS84 Earth-Centered Earth-Fixed coordinates */
extern std::string const ECEF_SPROJ;

/** Lazily creates and keeps one Proj2 per (zone, hemisphere,
direction).  Used when converting point-by-point through many zones. */
class UTMProjCache {
    std::map<std::tuple<int,bool,int>, Proj2> _cache;
public:
    Proj2 const &get(int zone, bool isnorth, Proj2::Direction direction);
};

/** Lat/lon to UTM, in the point's own zone. */
void lla_to_utmz(double lat, double lon,
    double &EW, double &NS, int &zone, bool &isnorth);

/** Lat/lon/altitude to ECEF (m), on WGS84 */
void lla_to_ecef(Proj2 const &ecef, double lat, double lon, double alt,
    double &x, double &y, double &z);

}   // namespace

#endif
