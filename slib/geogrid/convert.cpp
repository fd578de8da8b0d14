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
#include <cstdio>
#include <limits>
#include <Eigen/Dense>
#include <geogrid/convert.hpp>
#include <geogrid/geodesy.hpp>
#include <geogrid/constant.hpp>
#include <geogrid/error.hpp>

using namespace blitz;

namespace geogrid {

static double const NaN = std::numeric_limits<double>::quiet_NaN();

Field velocity_spherical_to_cartesian(GeoData const &d, Field const &velocity)
{
    if (velocity.ncomp() != 3) {
        (*geogrid_error)(ERR_INVALID_ARGUMENT,
            "velocity_spherical_to_cartesian(): need 3 components, got %d",
            (int)velocity.ncomp());
    }

    auto const shp(d.shape());
    std::vector<ArrayT> xyz;
    for (int c=0; c<3; ++c) xyz.push_back(ArrayT(shp));

    ArrayT const &lon(d.lon().val);
    ArrayT const &lat(d.lat().val);
    for (int i=0; i<shp[0]; ++i) {
    for (int j=0; j<shp[1]; ++j) {
    for (int k=0; k<shp[2]; ++k) {
        double const az = lon(i,j,k) * D2R;
        double const el = lat(i,j,k) * D2R;

        Eigen::Matrix3d R;
        R << -sin(az), -sin(el)*cos(az), cos(el)*cos(az),
              cos(az), -sin(el)*sin(az), cos(el)*sin(az),
              0.0,      cos(el),         sin(el);

        Eigen::Vector3d v_sph(velocity[0](i,j,k), velocity[1](i,j,k), velocity[2](i,j,k));
        Eigen::Vector3d v_xyz(R * v_sph);

        for (int c=0; c<3; ++c) xyz[c](i,j,k) = v_xyz(c);
    }}}

    return Field(xyz, velocity.units);
}

ECEFData to_ecef(GeoData const &d)
{
    auto const shp(d.shape());
    ArrayT X(shp), Y(shp), Z(shp);

    Proj2 ecef(ECEF_SPROJ, Proj2::Direction::LL2XY);
    ArrayT const &lon(d.lon().val);
    ArrayT const &lat(d.lat().val);
    ArrayT const &depth(d.depth().val);
    for (int i=0; i<shp[0]; ++i) {
    for (int j=0; j<shp[1]; ++j) {
    for (int k=0; k<shp[2]; ++k) {
        double x, y, z;
        lla_to_ecef(ecef, lat(i,j,k), lon(i,j,k), depth(i,j,k)*1e3, x, y, z);
        X(i,j,k) = x / 1e3;
        Y(i,j,k) = y / 1e3;
        Z(i,j,k) = z / 1e3;
    }}}

    // Any field with 3 components is assumed to be a vector
    FieldSet fields;
    auto const &keys(d.fields().keys());
    for (size_t i=0; i<keys.size(); ++i) {
        Field const &field(d.fields()[i]);
        if (field.ncomp() == 3 && keys[i].find("color") == std::string::npos) {
            printf("Applying a vector transformation to field: %s\n", keys[i].c_str());
            fields.add(keys[i], velocity_spherical_to_cartesian(d, field));
        } else {
            fields.add(keys[i], field);
        }
    }

    return ECEFData(X, Y, Z, fields, d.atts(), d.rank());
}

// ------------------------------------------------------------
UTMData to_utm(GeoData const &d)
{
    auto const shp(d.shape());
    ArrayT EW(shp), NS(shp), depth(shp);
    Array<int,3> zone(shp);
    Array<bool,3> northern(shp);

    UTMProjCache projs;
    ArrayT const &lon(d.lon().val);
    ArrayT const &lat(d.lat().val);
    for (int i=0; i<shp[0]; ++i) {
    for (int j=0; j<shp[1]; ++j) {
    for (int k=0; k<shp[2]; ++k) {
        depth(i,j,k) = d.depth().val(i,j,k) * 1e3;
        int const z = utm_zone(lat(i,j,k), lon(i,j,k));
        bool const isnorth = (lat(i,j,k) >= 0);
        zone(i,j,k) = z;
        northern(i,j,k) = isnorth;

        // No zone for a missing point
        if (z == 0) {
            EW(i,j,k) = NaN;
            NS(i,j,k) = NaN;
            continue;
        }
        Proj2 const &proj(projs.get(z, isnorth, Proj2::Direction::LL2XY));
        proj.transform(lon(i,j,k), lat(i,j,k), EW(i,j,k), NS(i,j,k));
    }}}

    return UTMData(EW, NS, GeoUnit(depth, UNITS_M), zone, northern,
        d.fields(), d.atts(), d.rank());
}

UTMData to_utm_zone(GeoData const &d, ProjectionPoint const &pp)
{
    auto const shp(d.shape());
    ArrayT EW(shp), NS(shp), depth(shp);

    Proj2 proj(utm_sproj(pp.zone, pp.isnorth), Proj2::Direction::LL2XY);
    ArrayT const &lon(d.lon().val);
    ArrayT const &lat(d.lat().val);
    for (int i=0; i<shp[0]; ++i) {
    for (int j=0; j<shp[1]; ++j) {
    for (int k=0; k<shp[2]; ++k) {
        proj.transform(lon(i,j,k), lat(i,j,k), EW(i,j,k), NS(i,j,k));
        depth(i,j,k) = d.depth().val(i,j,k) * 1e3;
    }}}

    return UTMData(EW, NS, GeoUnit(depth, UNITS_M), pp.zone, pp.isnorth,
        d.fields(), d.atts(), d.rank());
}

UTMData to_utm_zone(CartData const &d, ProjectionPoint const &pp)
{
    auto const shp(d.shape());
    ArrayT EW(shp), NS(shp), depth(shp);
    EW = d.x().val * 1e3 + pp.EW;
    NS = d.y().val * 1e3 + pp.NS;
    depth = d.z().val * 1e3;

    return UTMData(EW, NS, GeoUnit(depth, UNITS_M), pp.zone, pp.isnorth,
        d.fields(), d.atts(), d.rank());
}

// ------------------------------------------------------------
GeoData to_geo(UTMData const &d)
{
    auto const shp(d.shape());
    ArrayT lon(shp), lat(shp);

    UTMProjCache projs;
    ArrayT const &EW(d.EW().val);
    ArrayT const &NS(d.NS().val);
    for (int i=0; i<shp[0]; ++i) {
    for (int j=0; j<shp[1]; ++j) {
    for (int k=0; k<shp[2]; ++k) {
        if (d.zone()(i,j,k) == 0) {
            lon(i,j,k) = NaN;
            lat(i,j,k) = NaN;
            continue;
        }
        Proj2 const &proj(projs.get(d.zone()(i,j,k), d.northern()(i,j,k),
            Proj2::Direction::XY2LL));
        proj.transform(EW(i,j,k), NS(i,j,k), lon(i,j,k), lat(i,j,k));
    }}}

    // GeoData's constructor converts depth m -> km
    return GeoData(lon, lat, d.depth(), d.fields(), d.atts(), d.rank());
}

GeoData to_geo(CartData const &d, ProjectionPoint const &pp)
{
    return to_geo(to_utm_zone(d, pp));
}

// ------------------------------------------------------------
CartData to_cart(UTMData const &d, ProjectionPoint const &pp)
{
    auto const shp(d.shape());
    ArrayT x(shp), y(shp), z(shp);
    x = (d.EW().val - pp.EW) / 1e3;
    y = (d.NS().val - pp.NS) / 1e3;
    z = d.depth().val / 1e3;

    return CartData(x, y, z, d.fields(), d.atts(), d.rank());
}

CartData to_cart(GeoData const &d, ProjectionPoint const &pp)
{
    UTMData const d_utm(to_utm_zone(d, pp));

    auto const shp(d.shape());
    ArrayT x(shp), y(shp);
    x = (d_utm.EW().val - pp.EW) / 1e3;
    y = (d_utm.NS().val - pp.NS) / 1e3;

    return CartData(x, y, d.depth().val, d.fields(), d.atts(), d.rank());
}

}   // namespace
