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

#include <cstdio>
#include <cstring>
#include <vector>
#include <geogrid/udunits2.hpp>
#include <geogrid/error.hpp>

namespace geogrid {

std::mutex &ut_mutex()
{
    static std::mutex mutex;
    return mutex;
}

UTSystem::UTSystem(std::string const &path) :
    _self(0), _free_me(true)
{
    ut_status status;
    {
        std::lock_guard<std::mutex> lock(ut_mutex());
        _self = ut_read_xml(path == "" ? NULL : path.c_str());
        status = ut_get_status();
    }
    if (_self) return;

    switch(status) {
        case UT_OPEN_ARG :
            (*geogrid_error)(ERR_UNITS, "UTSystem(): Cannot open unit database '%s'", path.c_str());
        break;
        case UT_OPEN_ENV :
            (*geogrid_error)(ERR_UNITS, "UTSystem(): Cannot open unit database named by UDUNITS2_XML_PATH");
        break;
        case UT_OPEN_DEFAULT :
            (*geogrid_error)(ERR_UNITS, "UTSystem(): Cannot open default unit database");
        break;
        case UT_PARSE :
            (*geogrid_error)(ERR_UNITS, "UTSystem(): Error parsing unit database");
        break;
        default :
            (*geogrid_error)(ERR_UNITS, "UTSystem(): Unknown error reading unit database");
        break;
    }
}

UTSystem::~UTSystem()
{
    if (_self && _free_me) {
        std::lock_guard<std::mutex> lock(ut_mutex());
        ut_free_system(_self);
    }
}

UTUnit UTSystem::parse(std::string const &str, ut_encoding encoding) const
{
    std::vector<char> cstr(str.size()+1);
    strcpy(&cstr[0], str.c_str());

    ut_unit *unit;
    ut_status status;
    {
        std::lock_guard<std::mutex> lock(ut_mutex());
        ut_trim(&cstr[0], encoding);
        unit = ut_parse(_self, &cstr[0], encoding);
        status = ut_get_status();
    }

    UTUnit ret(unit, true, str);
    if (ret._self) return ret;

    switch(status) {
        case UT_BAD_ARG :
            (*geogrid_error)(ERR_UNITS, "UTSystem::parse(): UT_BAD_ARG, system or str is null.");
        break;
        case UT_SYNTAX :
            (*geogrid_error)(ERR_UNITS, "UTSystem::parse(): UT_SYNTAX error in '%s'", str.c_str());
        break;
        case UT_UNKNOWN :
            (*geogrid_error)(ERR_UNITS, "UTSystem::parse(): String '%s' contains an unknown identifier", str.c_str());
        break;
        case UT_OS :
            (*geogrid_error)(ERR_UNITS, "UTSystem::parse(): UT_OS");
        break;
        default :
            (*geogrid_error)(ERR_UNITS, "UTSystem::parse(): Unknown error");
        break;
    }
    return ret;
}



CVConverter::CVConverter(UTUnit const &from, UTUnit const &to)
    : _self(0)
{
    ut_status status;
    {
        std::lock_guard<std::mutex> lock(ut_mutex());
        _self = ut_get_converter(from._self, to._self);
        status = ut_get_status();
    }
    if (_self) return;

    switch(status) {
        case UT_BAD_ARG :
            (*geogrid_error)(ERR_UNITS, "CVConverter(%s -> %s): UT_BAD_ARG", from.c_str(), to.c_str()); break;
        case UT_NOT_SAME_SYSTEM :
            (*geogrid_error)(ERR_UNITS, "CVConverter(%s -> %s): UT_NOT_SAME_SYSTEM", from.c_str(), to.c_str()); break;
        case UT_MEANINGLESS :
            (*geogrid_error)(ERR_UNITS, "CVConverter(%s -> %s): UT_MEANINGLESS", from.c_str(), to.c_str()); break;
        case UT_OS :
            (*geogrid_error)(ERR_UNITS, "CVConverter(%s -> %s): UT_OS", from.c_str(), to.c_str()); break;
        default :
            (*geogrid_error)(ERR_UNITS, "CVConverter(%s -> %s): Unknown problem", from.c_str(), to.c_str()); break;
    }
}

// The XML database redefines some units; UDUNITS complains loudly about it.
static bool silence_udunits()
{
    std::lock_guard<std::mutex> lock(ut_mutex());
    ut_set_error_message_handler(&ut_ignore);
    return true;
}

UTSystem const &default_ut_system()
{
    static bool silenced = silence_udunits();
    static UTSystem system("");
    (void)silenced;
    return system;
}

}   // namespace geogrid
