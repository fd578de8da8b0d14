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
#include <boost/format.hpp>
#include <geogrid/geodesy.hpp>

namespace geogrid {

std::string const ECEF_SPROJ = "+proj=cart +ellps=WGS84";

int utm_zone(double lat, double lon)
{
    if (std::isnan(lat) || std::isnan(lon)) return 0;

    // Wrap into [-180,180)
    lon = fmod(lon + 180.0, 360.0);
    if (lon < 0) lon += 360.0;
    lon -= 180.0;

    int zone = (int)std::floor((lon + 180.0) / 6.0) + 1;
    if (zone > 60) zone = 60;

    // Southwest Norway
    if (lat >= 56.0 && lat < 64.0 && lon >= 3.0 && lon < 12.0)
        return 32;

    // Svalbard
    if (lat >= 72.0 && lat < 84.0) {
        if (lon >= 0.0 && lon < 9.0) return 31;
        if (lon >= 9.0 && lon < 21.0) return 33;
        if (lon >= 21.0 && lon < 33.0) return 35;
        if (lon >= 33.0 && lon < 42.0) return 37;
    }

    return zone;
}

std::string utm_sproj(int zone, bool isnorth)
{
    return (boost::format("+proj=utm +zone=%d%s +ellps=WGS84")
        % zone % (isnorth ? "" : " +south")).str();
}

Proj2 const &UTMProjCache::get(int zone, bool isnorth, Proj2::Direction direction)
{
    auto key(std::make_tuple(zone, isnorth, (int)direction));
    auto ii(_cache.find(key));
    if (ii != _cache.end()) return ii->second;

    auto ret(_cache.insert(std::make_pair(key,
        Proj2(utm_sproj(zone, isnorth), direction))));
    return ret.first->second;
}

void lla_to_utmz(double lat, double lon,
    double &EW, double &NS, int &zone, bool &isnorth)
{
    zone = utm_zone(lat, lon);
    isnorth = (lat >= 0);
    Proj2 proj(utm_sproj(zone, isnorth), Proj2::Direction::LL2XY);
    proj.transform(lon, lat, EW, NS);
}

void lla_to_ecef(Proj2 const &ecef, double lat, double lon, double alt,
    double &x, double &y, double &z)
{
    ecef.transform(lon, lat, alt, x, y, z);
}

}   // namespace
