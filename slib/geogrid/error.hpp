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

#ifndef GEOGRID_ERROR_HPP
#define GEOGRID_ERROR_HPP

#include <exception>
#include <string>

/** @defgroup geogrid geogrid.hpp
@brief Basic stuff common to all geogrid */
namespace geogrid {

/** Return codes passed to geogrid_error().  The default error handler
throws the exception class corresponding to the code. */
enum ErrorCode {
    ERR_GENERIC = -1,
    ERR_SHAPE_MISMATCH = 1,
    ERR_INVALID_ATTRIBUTES = 2,
    ERR_OUT_OF_BOUNDS = 3,
    ERR_MISSING_PAIRED_PARAMETER = 4,
    ERR_UNSUPPORTED_SHAPE = 5,
    ERR_INVALID_CRITERION = 6,
    ERR_INVALID_FIELDS = 7,
    ERR_INVALID_ARGUMENT = 8,
    ERR_UNITS = 9,
    ERR_PROJ = 10
};

class Exception : public std::exception
{
    int _code;
    std::string _what;
public:
    Exception(int code, std::string const &what) : _code(code), _what(what) {}
    virtual ~Exception() throw() {}

    int code() const { return _code; }
    virtual char const *what() const throw()
        { return _what.c_str(); }
};

#define GEOGRID_EXCEPTION(NAME) \
    class NAME : public Exception { \
    public: \
        NAME(int code, std::string const &what) : Exception(code, what) {} \
    }

/** Coordinate and field arrays disagree in shape */
GEOGRID_EXCEPTION(ShapeMismatchError);
/** Attribute map is malformed */
GEOGRID_EXCEPTION(InvalidAttributesError);
/** Requested fixed depth/lat/lon is outside the data extent */
GEOGRID_EXCEPTION(OutOfBoundsError);
/** Start given without End, or vice versa */
GEOGRID_EXCEPTION(MissingPairedParameterError);
/** Operation not defined for this shape class (eg: horizontal slice
    of a surface) */
GEOGRID_EXCEPTION(UnsupportedDatasetShapeError);
/** Vote criterion does not parse, or names a field that isn't there */
GEOGRID_EXCEPTION(InvalidCriterionError);
/** Unnamed field tuple of length >1 */
GEOGRID_EXCEPTION(InvalidFieldsError);
GEOGRID_EXCEPTION(InvalidArgumentError);
GEOGRID_EXCEPTION(UnitsError);
GEOGRID_EXCEPTION(ProjError);

#undef GEOGRID_EXCEPTION

/** Throws the exception class that goes with retcode. */
void throw_error(int retcode, std::string const &msg);

typedef void (*error_ptr) (int retcode, char const *format, ...);

/** Prints the message to stderr, then throws (see throw_error()).
User or other library can change if needed. */
extern error_ptr geogrid_error;

/** Non-fatal diagnostics (eg: suspicious axis ordering).  Default
prints to stderr and returns. */
extern error_ptr geogrid_warning;

}   // namespace
/** @} */

#endif // Guard
