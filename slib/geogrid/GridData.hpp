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

#ifndef GEOGRID_GRIDDATA_HPP
#define GEOGRID_GRIDDATA_HPP

#include <array>
#include <map>
#include <string>
#include <iostream>
#include <blitz/array.h>
#include <geogrid/GeoUnit.hpp>
#include <geogrid/FieldSet.hpp>

namespace geogrid {

/** The four coordinate representations */
enum class GridKind { GEO, UTM, CART, ECEF };

/** Dimensionality of a data set, derived from the shape of its
coordinate arrays. */
enum class ShapeClass { POINTS, SURFACE, VOLUME };

char const *to_string(ShapeClass sc);

typedef std::map<std::string, std::string> Attributes;

/** Coordinates, fields and attributes, independent of representation.
Used to hand results from the engines back to a concrete variant. */
struct GridParts {
    std::array<GeoUnit,3> coords;
    FieldSet fields;
    Attributes atts;
    /** 1 for point sets (stored as (n,1,1)); otherwise 3 */
    int rank;

    GridParts() : rank(3) {}
};

// ---------------------------------------------------------------
/** Capability interface shared by the four grid variants.  Holds three
unit-tagged coordinate arrays of identical shape, an ordered map of
fields of the same shape, and an attribute map.

Axis 0 varies (primarily) with the first coordinate (lon/x/EW), axis 1
with the second (lat/y/NS) and axis 2 with depth/z.  Depth may be stored
increasing or decreasing along axis 2. */
class GridData {
protected:
    std::array<GeoUnit,3> _coords;
    FieldSet _fields;
    Attributes _atts;
    int _rank;

    GridData() : _rank(3) {}

    /** Checks that coordinates and fields share one shape, and that
    point sets are stored as (n,1,1).  Constructors call this before
    converting any units.
    @throws ShapeMismatchError */
    void check_shapes(std::array<blitz::TinyVector<int,3>,3> const &coord_shapes,
        FieldSet const &fields, int rank) const;

    /** Validates the shape invariants and stores everything.  Coordinates
    must already be in canonical units.
    @throws ShapeMismatchError, InvalidAttributesError */
    void init(std::array<GeoUnit,3> const &coords,
        FieldSet const &fields, Attributes const &atts, int rank);

public:
    virtual ~GridData() {}

    virtual GridKind kind() const = 0;

    /** Name of the variant, eg: "GeoData" */
    virtual char const *kind_name() const = 0;

    /** Names of the three coordinates, eg: lon, lat, depth */
    virtual std::array<std::string,3> const &coord_names() const = 0;

    GeoUnit const &coord(int i) const { return _coords[i]; }
    ArrayT const &coord_val(int i) const { return _coords[i].val; }

    FieldSet const &fields() const { return _fields; }
    Attributes const &atts() const { return _atts; }

    /** Rank of the arrays as given by the user; 1 for point sets. */
    int rank() const { return _rank; }

    blitz::TinyVector<int,3> shape() const
        { return _coords[0].val.shape(); }

    /** Total number of points */
    long size() const
        { return _coords[0].val.numElements(); }

    /** Point set, surface or volume.  Computed from the current shape. */
    ShapeClass shape_class() const;

    /** (min, max) of coordinate i, ignoring NaNs */
    std::array<double,2> extent(int i) const
        { return {{_coords[i].min(), _coords[i].max()}}; }

    /** A copy of the contents, to be modified and used to build a new
    grid of the same variant. */
    GridParts parts() const;
};

std::ostream &operator<<(std::ostream &out, GridData const &grid);

// ---------------------------------------------------------------
/** Geographic data: lon/lat in degrees, depth in km */
class GeoData : public GridData {
public:
    static std::array<std::string,3> const COORD_NAMES;

    /** @param depth Any length unit; converted to km. */
    GeoData(ArrayT const &lon, ArrayT const &lat, GeoUnit const &depth,
        FieldSet const &fields, Attributes const &atts = Attributes(), int rank = 3);

    /** @param depth Untagged; assumed to be in km */
    GeoData(ArrayT const &lon, ArrayT const &lat, ArrayT const &depth,
        FieldSet const &fields, Attributes const &atts = Attributes(), int rank = 3);

    explicit GeoData(GridParts const &parts);

    GridKind kind() const { return GridKind::GEO; }
    char const *kind_name() const { return "GeoData"; }
    std::array<std::string,3> const &coord_names() const { return COORD_NAMES; }

    GeoUnit const &lon() const { return _coords[0]; }
    GeoUnit const &lat() const { return _coords[1]; }
    GeoUnit const &depth() const { return _coords[2]; }
};

/** UTM-projected data: easting/northing/depth in m, with a UTM zone
and hemisphere stored per point. */
class UTMData : public GridData {
    blitz::Array<int,3> _zone;
    blitz::Array<bool,3> _northern;

    void init_zones(blitz::Array<int,3> const &zone, blitz::Array<bool,3> const &northern);
public:
    static std::array<std::string,3> const COORD_NAMES;

    /** @param depth Any length unit; converted to m. */
    UTMData(ArrayT const &EW, ArrayT const &NS, GeoUnit const &depth,
        blitz::Array<int,3> const &zone, blitz::Array<bool,3> const &northern,
        FieldSet const &fields, Attributes const &atts = Attributes(), int rank = 3);

    /** All points in one zone. */
    UTMData(ArrayT const &EW, ArrayT const &NS, GeoUnit const &depth,
        int zone, bool northern,
        FieldSet const &fields, Attributes const &atts = Attributes(), int rank = 3);

    /** All points in one zone; depth untagged, assumed to be in m */
    UTMData(ArrayT const &EW, ArrayT const &NS, ArrayT const &depth,
        int zone, bool northern,
        FieldSet const &fields, Attributes const &atts = Attributes(), int rank = 3);

    UTMData(UTMData const &rhs) = default;

    /** Blitz operator=() copies element data; re-reference instead. */
    UTMData &operator=(UTMData const &rhs)
    {
        GridData::operator=(rhs);
        _zone.reference(rhs._zone);
        _northern.reference(rhs._northern);
        return *this;
    }

    GridKind kind() const { return GridKind::UTM; }
    char const *kind_name() const { return "UTMData"; }
    std::array<std::string,3> const &coord_names() const { return COORD_NAMES; }

    GeoUnit const &EW() const { return _coords[0]; }
    GeoUnit const &NS() const { return _coords[1]; }
    GeoUnit const &depth() const { return _coords[2]; }
    blitz::Array<int,3> const &zone() const { return _zone; }
    blitz::Array<bool,3> const &northern() const { return _northern; }
};

/** Local Cartesian data: x/y/z in km */
class CartData : public GridData {
public:
    static std::array<std::string,3> const COORD_NAMES;

    /** Coordinates in any length unit; converted to km. */
    CartData(GeoUnit const &x, GeoUnit const &y, GeoUnit const &z,
        FieldSet const &fields, Attributes const &atts = Attributes(), int rank = 3);

    /** Untagged coordinates, assumed to be in km */
    CartData(ArrayT const &x, ArrayT const &y, ArrayT const &z,
        FieldSet const &fields, Attributes const &atts = Attributes(), int rank = 3);

    explicit CartData(GridParts const &parts);

    GridKind kind() const { return GridKind::CART; }
    char const *kind_name() const { return "CartData"; }
    std::array<std::string,3> const &coord_names() const { return COORD_NAMES; }

    GeoUnit const &x() const { return _coords[0]; }
    GeoUnit const &y() const { return _coords[1]; }
    GeoUnit const &z() const { return _coords[2]; }
};

/** Earth-Centered Earth-Fixed Cartesian data (km), used for rendering */
class ECEFData : public GridData {
public:
    static std::array<std::string,3> const COORD_NAMES;

    /** Untagged coordinates, assumed to be in km */
    ECEFData(ArrayT const &x, ArrayT const &y, ArrayT const &z,
        FieldSet const &fields, Attributes const &atts = Attributes(), int rank = 3);

    GridKind kind() const { return GridKind::ECEF; }
    char const *kind_name() const { return "ECEFData"; }
    std::array<std::string,3> const &coord_names() const { return COORD_NAMES; }

    GeoUnit const &x() const { return _coords[0]; }
    GeoUnit const &y() const { return _coords[1]; }
    GeoUnit const &z() const { return _coords[2]; }
};

}   // namespace geogrid

#endif    // guard
