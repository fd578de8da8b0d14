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

#ifndef GEOGRID_GEOUNIT_HPP
#define GEOGRID_GEOUNIT_HPP

#include <string>
#include <blitz/array.h>

namespace geogrid {

/** Canonical units used by the grid variants */
extern std::string const UNITS_KM;
extern std::string const UNITS_M;
extern std::string const UNITS_DEGREE;

/** A numeric array bound to a physical unit (UDUNITS-2 syntax).  The
array is a (reference-counted) Blitz view; conversion produces a new
array. */
class GeoUnit {
public:
    blitz::Array<double,3> val;
    std::string units;

    /** Set when the array came in bare and the units were assumed,
    rather than given by the caller. */
    bool assumed_units;

    GeoUnit() : assumed_units(false) {}

    GeoUnit(blitz::Array<double,3> const &_val, std::string const &_units) :
        val(_val), units(_units), assumed_units(false) {}

    GeoUnit(GeoUnit const &rhs) :
        val(rhs.val), units(rhs.units), assumed_units(rhs.assumed_units) {}

    /** Shares rhs's array (Blitz operator=() would copy elements). */
    GeoUnit &operator=(GeoUnit const &rhs)
    {
        val.reference(rhs.val);
        units = rhs.units;
        assumed_units = rhs.assumed_units;
        return *this;
    }

    /** Wraps an untagged array, assuming default_units. */
    static GeoUnit bare(blitz::Array<double,3> const &_val, std::string const &default_units);

    /** @return true if values in this unit can be converted to units. */
    bool convertible_to(std::string const &units) const;

    /** Converts to another (compatible) unit.  If the unit is already
    the same, the returned value shares this one's array.
    @throws UnitsError if units are not compatible. */
    GeoUnit to(std::string const &units) const;

    blitz::TinyVector<int,3> shape() const
        { return val.shape(); }

    /** Minimum, ignoring NaNs */
    double min() const;
    /** Maximum, ignoring NaNs */
    double max() const;
};

/** Sum of two unit-tagged values; rhs is converted to lhs's units. */
GeoUnit operator+(GeoUnit const &lhs, GeoUnit const &rhs);

/** Difference of two unit-tagged values; rhs is converted to lhs's units. */
GeoUnit operator-(GeoUnit const &lhs, GeoUnit const &rhs);

/** Converts a single value between units. */
double convert_units(double val, std::string const &from, std::string const &to);

}   // namespace

#endif    // guard
