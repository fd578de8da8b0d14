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
#include <sstream>
#include <boost/format.hpp>
#include <geogrid/GridData.hpp>
#include <geogrid/error.hpp>

using namespace blitz;

namespace geogrid {

std::array<std::string,3> const GeoData::COORD_NAMES {{"lon", "lat", "depth"}};
std::array<std::string,3> const UTMData::COORD_NAMES {{"EW", "NS", "depth"}};
std::array<std::string,3> const CartData::COORD_NAMES {{"x", "y", "z"}};
std::array<std::string,3> const ECEFData::COORD_NAMES {{"x", "y", "z"}};

char const *to_string(ShapeClass sc)
{
    switch(sc) {
        case ShapeClass::POINTS : return "points";
        case ShapeClass::SURFACE : return "surface";
        default : return "volume";
    }
}

static std::string shape_str(TinyVector<int,3> const &shp)
{
    return (boost::format("(%d, %d, %d)") % shp[0] % shp[1] % shp[2]).str();
}

/** Largest absolute difference between neighbors along dimension dim */
static double max_abs_diff(ArrayT const &A, int dim)
{
    TinyVector<int,3> step(0,0,0);
    step[dim] = 1;

    double ret = 0;
    for (int i=A.lbound(0); i<=A.ubound(0) - step[0]; ++i) {
    for (int j=A.lbound(1); j<=A.ubound(1) - step[1]; ++j) {
    for (int k=A.lbound(2); k<=A.ubound(2) - step[2]; ++k) {
        double d = std::abs(A(i+step[0], j+step[1], k+step[2]) - A(i,j,k));
        if (d > ret) ret = d;
    }}}
    return ret;
}

// ---------------------------------------------------------------
void GridData::check_shapes(std::array<TinyVector<int,3>,3> const &coord_shapes,
    FieldSet const &fields, int rank) const
{
    auto const &shp(coord_shapes[0]);
    auto const &names(coord_names());

    for (int i=1; i<3; ++i) {
        if (any(coord_shapes[i] != shp)) {
            (*geogrid_error)(ERR_SHAPE_MISMATCH,
                "%s: coordinate %s has shape %s, expected %s",
                kind_name(), names[i].c_str(),
                shape_str(coord_shapes[i]).c_str(), shape_str(shp).c_str());
        }
    }

    for (size_t i=0; i<fields.size(); ++i) {
        Field const &field(fields[i]);
        for (size_t j=0; j<field.ncomp(); ++j) {
            if (any(field[j].shape() != shp)) {
                (*geogrid_error)(ERR_SHAPE_MISMATCH,
                    "%s: field %s[%d] has shape %s, but coordinates have shape %s",
                    kind_name(), fields.keys()[i].c_str(), (int)j,
                    shape_str(field[j].shape()).c_str(), shape_str(shp).c_str());
            }
        }
    }

    if (rank == 1 && (shp[1] != 1 || shp[2] != 1)) {
        (*geogrid_error)(ERR_SHAPE_MISMATCH,
            "%s: point sets must be stored with shape (n,1,1), got %s",
            kind_name(), shape_str(shp).c_str());
    }
}

void GridData::init(std::array<GeoUnit,3> const &coords,
    FieldSet const &fields, Attributes const &atts, int rank)
{
    auto const shp(coords[0].shape());
    auto const &names(coord_names());

    check_shapes({{coords[0].shape(), coords[1].shape(), coords[2].shape()}},
        fields, rank);

    for (auto ii=atts.begin(); ii != atts.end(); ++ii) {
        if (ii->first.size() == 0) {
            (*geogrid_error)(ERR_INVALID_ATTRIBUTES,
                "%s: attribute keys must be non-empty strings", kind_name());
        }
    }

    // Check ordering of the arrays in case of 3D
    if (shp[0] > 1 && shp[1] > 1 && shp[2] > 1) {
        ArrayT const &x0(coords[0].val);
        ArrayT const &x1(coords[1].val);
        double const d00 = max_abs_diff(x0, 0);
        if (max_abs_diff(x0, 1) > d00 || max_abs_diff(x0, 2) > d00) {
            (*geogrid_warning)(ERR_GENERIC,
                "It appears that the %s array has a wrong ordering", names[0].c_str());
        }
        double const d11 = max_abs_diff(x1, 1);
        if (max_abs_diff(x1, 0) > d11 || max_abs_diff(x1, 2) > d11) {
            (*geogrid_warning)(ERR_GENERIC,
                "It appears that the %s array has a wrong ordering", names[1].c_str());
        }
    }

    _coords = coords;
    _fields = fields;
    _rank = rank;
    if (atts.size() == 0) {
        _atts.clear();
        _atts["note"] = "No attributes were given to this dataset";
    } else {
        _atts = atts;
    }
}

ShapeClass GridData::shape_class() const
{
    if (_rank == 1) return ShapeClass::POINTS;

    auto const shp(shape());
    int nsingle = 0;
    for (int i=0; i<3; ++i) if (shp[i] == 1) ++nsingle;
    return (nsingle == 1 ? ShapeClass::SURFACE : ShapeClass::VOLUME);
}

GridParts GridData::parts() const
{
    GridParts ret;
    ret.coords = _coords;
    ret.fields = _fields;
    ret.atts = _atts;
    ret.rank = _rank;
    return ret;
}

std::ostream &operator<<(std::ostream &out, GridData const &grid)
{
    auto const &names(grid.coord_names());
    out << grid.kind_name() << std::endl;
    out << "  size      : " << shape_str(grid.shape()) << std::endl;
    for (int i=0; i<3; ++i) {
        auto ext(grid.extent(i));
        out << boost::format("  %-10s: [ %g : %g ] %s")
            % names[i] % ext[0] % ext[1] % grid.coord(i).units << std::endl;
    }
    out << "  fields    : " << grid.fields() << std::endl;
    out << "  attributes: [";
    for (auto ii=grid.atts().begin(); ii != grid.atts().end(); ++ii) {
        if (ii != grid.atts().begin()) out << ", ";
        out << ii->first;
    }
    out << "]" << std::endl;
    return out;
}

// ---------------------------------------------------------------
GeoData::GeoData(ArrayT const &lon, ArrayT const &lat, GeoUnit const &depth,
    FieldSet const &fields, Attributes const &atts, int rank)
{
    check_shapes({{lon.shape(), lat.shape(), depth.shape()}}, fields, rank);
    init({{GeoUnit(lon, UNITS_DEGREE), GeoUnit(lat, UNITS_DEGREE), depth.to(UNITS_KM)}},
        fields, atts, rank);
}

GeoData::GeoData(ArrayT const &lon, ArrayT const &lat, ArrayT const &depth,
    FieldSet const &fields, Attributes const &atts, int rank)
    : GeoData(lon, lat, GeoUnit::bare(depth, UNITS_KM), fields, atts, rank)
{}

GeoData::GeoData(GridParts const &parts)
    : GeoData(parts.coords[0].val, parts.coords[1].val, parts.coords[2],
        parts.fields, parts.atts, parts.rank)
{}

// ---------------------------------------------------------------
void UTMData::init_zones(Array<int,3> const &zone, Array<bool,3> const &northern)
{
    auto const shp(shape());
    if (any(zone.shape() != shp) || any(northern.shape() != shp)) {
        (*geogrid_error)(ERR_SHAPE_MISMATCH,
            "UTMData: zone/northern arrays must have the coordinate shape %s",
            shape_str(shp).c_str());
    }
    _zone.reference(zone);
    _northern.reference(northern);
}

UTMData::UTMData(ArrayT const &EW, ArrayT const &NS, GeoUnit const &depth,
    Array<int,3> const &zone, Array<bool,3> const &northern,
    FieldSet const &fields, Attributes const &atts, int rank)
{
    check_shapes({{EW.shape(), NS.shape(), depth.shape()}}, fields, rank);
    init({{GeoUnit(EW, UNITS_M), GeoUnit(NS, UNITS_M), depth.to(UNITS_M)}},
        fields, atts, rank);
    init_zones(zone, northern);
}

UTMData::UTMData(ArrayT const &EW, ArrayT const &NS, GeoUnit const &depth,
    int zone, bool northern,
    FieldSet const &fields, Attributes const &atts, int rank)
{
    check_shapes({{EW.shape(), NS.shape(), depth.shape()}}, fields, rank);
    init({{GeoUnit(EW, UNITS_M), GeoUnit(NS, UNITS_M), depth.to(UNITS_M)}},
        fields, atts, rank);

    Array<int,3> zones(shape());
    zones = zone;
    Array<bool,3> isnorth(shape());
    isnorth = northern;
    init_zones(zones, isnorth);
}

UTMData::UTMData(ArrayT const &EW, ArrayT const &NS, ArrayT const &depth,
    int zone, bool northern,
    FieldSet const &fields, Attributes const &atts, int rank)
    : UTMData(EW, NS, GeoUnit::bare(depth, UNITS_M), zone, northern, fields, atts, rank)
{}

// ---------------------------------------------------------------
CartData::CartData(GeoUnit const &x, GeoUnit const &y, GeoUnit const &z,
    FieldSet const &fields, Attributes const &atts, int rank)
{
    check_shapes({{x.shape(), y.shape(), z.shape()}}, fields, rank);
    init({{x.to(UNITS_KM), y.to(UNITS_KM), z.to(UNITS_KM)}},
        fields, atts, rank);
}

CartData::CartData(ArrayT const &x, ArrayT const &y, ArrayT const &z,
    FieldSet const &fields, Attributes const &atts, int rank)
    : CartData(GeoUnit::bare(x, UNITS_KM), GeoUnit::bare(y, UNITS_KM),
        GeoUnit::bare(z, UNITS_KM), fields, atts, rank)
{}

CartData::CartData(GridParts const &parts)
    : CartData(parts.coords[0], parts.coords[1], parts.coords[2],
        parts.fields, parts.atts, parts.rank)
{}

// ---------------------------------------------------------------
ECEFData::ECEFData(ArrayT const &x, ArrayT const &y, ArrayT const &z,
    FieldSet const &fields, Attributes const &atts, int rank)
{
    init({{GeoUnit::bare(x, UNITS_KM), GeoUnit::bare(y, UNITS_KM), GeoUnit::bare(z, UNITS_KM)}},
        fields, atts, rank);
}

}   // namespace
