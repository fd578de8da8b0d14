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
#include <limits>
#include <geogrid/GeoUnit.hpp>
#include <geogrid/udunits2.hpp>
#include <geogrid/error.hpp>

using namespace blitz;

namespace geogrid {

static double const NaN = std::numeric_limits<double>::quiet_NaN();

std::string const UNITS_KM = "km";
std::string const UNITS_M = "m";
std::string const UNITS_DEGREE = "degree";

GeoUnit GeoUnit::bare(blitz::Array<double,3> const &_val, std::string const &default_units)
{
    GeoUnit ret(_val, default_units);
    ret.assumed_units = true;
    return ret;
}

bool GeoUnit::convertible_to(std::string const &_units) const
{
    UTSystem const &ut_system(default_ut_system());
    UTUnit u0(ut_system.parse(units));
    UTUnit u1(ut_system.parse(_units));
    return u0.convertible_to(u1);
}

GeoUnit GeoUnit::to(std::string const &_units) const
{
    if (_units == units) return *this;

    UTSystem const &ut_system(default_ut_system());
    UTUnit u0(ut_system.parse(units));
    UTUnit u1(ut_system.parse(_units));
    if (!u0.convertible_to(u1)) {
        (*geogrid_error)(ERR_UNITS,
            "Cannot convert units %s -> %s", units.c_str(), _units.c_str());
    }
    CVConverter cv(u0, u1);

    // cv_convert_doubles() needs contiguous storage
    blitz::Array<double,3> src(val.copy());
    blitz::Array<double,3> dst(src.shape());
    cv.convert(src.data(), src.numElements(), dst.data());

    GeoUnit ret(dst, _units);
    ret.assumed_units = assumed_units;
    return ret;
}

double GeoUnit::min() const
{
    double ret = NaN;
    for (auto ii=val.begin(); ii != val.end(); ++ii) {
        double const v = *ii;
        if (std::isnan(v)) continue;
        if (std::isnan(ret) || v < ret) ret = v;
    }
    return ret;
}

double GeoUnit::max() const
{
    double ret = NaN;
    for (auto ii=val.begin(); ii != val.end(); ++ii) {
        double const v = *ii;
        if (std::isnan(v)) continue;
        if (std::isnan(ret) || v > ret) ret = v;
    }
    return ret;
}

// ---------------------------------------------------------
static void check_same_shape(GeoUnit const &lhs, GeoUnit const &rhs)
{
    for (int i=0; i<3; ++i) {
        if (lhs.val.extent(i) != rhs.val.extent(i)) {
            (*geogrid_error)(ERR_SHAPE_MISMATCH,
                "GeoUnit arithmetic: extent(%d) differs: %d vs %d",
                i, lhs.val.extent(i), rhs.val.extent(i));
        }
    }
}

GeoUnit operator+(GeoUnit const &lhs, GeoUnit const &rhs)
{
    check_same_shape(lhs, rhs);
    GeoUnit rr(rhs.to(lhs.units));
    blitz::Array<double,3> sum(lhs.val.shape());
    sum = lhs.val + rr.val;
    return GeoUnit(sum, lhs.units);
}

GeoUnit operator-(GeoUnit const &lhs, GeoUnit const &rhs)
{
    check_same_shape(lhs, rhs);
    GeoUnit rr(rhs.to(lhs.units));
    blitz::Array<double,3> diff(lhs.val.shape());
    diff = lhs.val - rr.val;
    return GeoUnit(diff, lhs.units);
}

double convert_units(double val, std::string const &from, std::string const &to)
{
    if (from == to) return val;
    UTSystem const &ut_system(default_ut_system());
    UTUnit u0(ut_system.parse(from));
    UTUnit u1(ut_system.parse(to));
    CVConverter cv(u0, u1);
    return cv.convert(val);
}

}   // namespace
