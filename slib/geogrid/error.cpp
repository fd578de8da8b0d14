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
#include <cstdarg>
#include <exception>
#include <geogrid/error.hpp>

namespace geogrid {

void throw_error(int retcode, std::string const &msg)
{
    switch(retcode) {
        case ERR_SHAPE_MISMATCH :
            throw ShapeMismatchError(retcode, msg);
        case ERR_INVALID_ATTRIBUTES :
            throw InvalidAttributesError(retcode, msg);
        case ERR_OUT_OF_BOUNDS :
            throw OutOfBoundsError(retcode, msg);
        case ERR_MISSING_PAIRED_PARAMETER :
            throw MissingPairedParameterError(retcode, msg);
        case ERR_UNSUPPORTED_SHAPE :
            throw UnsupportedDatasetShapeError(retcode, msg);
        case ERR_INVALID_CRITERION :
            throw InvalidCriterionError(retcode, msg);
        case ERR_INVALID_FIELDS :
            throw InvalidFieldsError(retcode, msg);
        case ERR_INVALID_ARGUMENT :
            throw InvalidArgumentError(retcode, msg);
        case ERR_UNITS :
            throw UnitsError(retcode, msg);
        case ERR_PROJ :
            throw ProjError(retcode, msg);
        default :
            throw Exception(retcode, msg);
    }
}

void default_error(int retcode, const char *format, ...)
{
    char buf[1024];
    va_list arglist;

    va_start(arglist, format);
    vsnprintf(buf, sizeof(buf), format, arglist);
    va_end(arglist);

    fprintf(stderr, "%s\n", buf);
    throw_error(retcode, std::string(buf));
}

void default_warning(int retcode, const char *format, ...)
{
    va_list arglist;

    fprintf(stderr, "WARNING: ");
    va_start(arglist, format);
    vfprintf(stderr, format, arglist);
    va_end(arglist);
    fprintf(stderr, "\n");
}

error_ptr geogrid_error = &default_error;
error_ptr geogrid_warning = &default_warning;

}   // Namespace
