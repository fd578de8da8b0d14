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

#ifndef GEOGRID_UDUNITS2_HPP
#define GEOGRID_UDUNITS2_HPP

#include <udunits2.h>
#include <iostream>
#include <mutex>
#include <string>

namespace geogrid {

class UTSystem;

/** UDUNITS-2 keeps its parser and error status in global state.  Every
call into it that reads or sets that state holds this lock. */
std::mutex &ut_mutex();

/** Memory-safe peer class for a unit in the UDUNITS-2 C library. */
class UTUnit
{
    friend class UTSystem;
    friend class CVConverter;
    friend std::ostream &operator<<(std::ostream &out, UTUnit const &unit);

    ut_unit *_self;
    bool _free_me;
    std::string _str;   // String used to instantiate this unit

    UTUnit(ut_unit *self, bool free_me, std::string const &str) :
        _self(self), _free_me(free_me), _str(str) {}

public:

    UTUnit() : _self(0), _free_me(false) {}

    ~UTUnit() {
        if (_free_me && _self) {
            std::lock_guard<std::mutex> lock(ut_mutex());
            ut_free(_self);
        }
    }

    /** True if values in this unit can be converted to other. */
    bool convertible_to(UTUnit const &other) const
    {
        std::lock_guard<std::mutex> lock(ut_mutex());
        return ut_are_convertible(_self, other._self) != 0;
    }

    std::string const &str() const
        { return _str; }

    char const *c_str() const
        { return _str.c_str(); }

    // ---------- Implement Move Semantics
    UTUnit(UTUnit const &) = delete;
    UTUnit& operator=(UTUnit const &src) = delete;

    UTUnit(UTUnit &&src) {
        _self = src._self;
        _free_me = src._free_me;
        _str = std::move(src._str);
        src._self = 0;
    }

    UTUnit &operator=(UTUnit &&src) {
        if (_free_me && _self) {
            std::lock_guard<std::mutex> lock(ut_mutex());
            ut_free(_self);
        }
        _self = src._self;
        _free_me = src._free_me;
        _str = std::move(src._str);
        src._self = 0;
        return *this;
    }

};

inline std::ostream &operator<<(std::ostream &out, UTUnit const &unit)
    { return out << unit.str(); }


class UTSystem
{
    friend class UTUnit;

    ut_system *_self;
    bool _free_me;

public:
    /** Reads a unit system from an XML database.
    @param path Database to read; "" for the UDUNITS default (or
        $UDUNITS2_XML_PATH if set). */
    UTSystem(std::string const &path);

    ~UTSystem();

    UTUnit parse(std::string const &str, ut_encoding encoding = UT_ASCII) const;


    // ---------- Implement Move Semantics
    UTSystem(UTSystem const &) = delete;
    UTSystem& operator=(UTSystem const&) = delete;

    UTSystem(UTSystem &&src) {
        _self = src._self;
        _free_me = src._free_me;
        src._self = 0;
    }

    UTSystem &operator=(UTSystem &&src) {
        if (_self && _free_me) {
            std::lock_guard<std::mutex> lock(ut_mutex());
            ut_free_system(_self);
        }
        _self = src._self;
        _free_me = src._free_me;
        src._self = 0;
        return *this;
    }

};

class CVConverter
{
    cv_converter *_self;

public:
    CVConverter(UTUnit const &from, UTUnit const &to);

    ~CVConverter()
        { if (_self) cv_free(_self); }

    /** Converters are immutable; conversions need no lock. */
    double convert(double const val) const
        { return cv_convert_double(_self, val); }

    double *convert(double const *in, size_t count, double *out) const
        { return cv_convert_doubles(_self, in, count, out); }


    // ---------- Implement Move Semantics
    CVConverter(CVConverter const &) = delete;
    CVConverter& operator=(CVConverter const&) = delete;

    CVConverter(CVConverter &&src) {
        _self = src._self;
        src._self = 0;
    }

    CVConverter &operator=(CVConverter &&src) {
        if (_self) cv_free(_self);
        _self = src._self;
        src._self = 0;
        return *this;
    }

};

/** The unit system shared by all GeoUnit values, read once from the
default UDUNITS database. */
UTSystem const &default_ut_system();

}   // namespace geogrid

#endif
