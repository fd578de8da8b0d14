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

// https://github.com/google/googletest/blob/master/googletest/docs/Primer.md

#include <cmath>
#include <iostream>
#include <thread>
#include <gtest/gtest.h>
#include <geogrid/convert.hpp>
#include <geogrid/geodesy.hpp>
#include <geogrid/gridutil.hpp>
#include <geogrid/error.hpp>
#include "test_datasets.hpp"

using namespace geogrid;
using namespace blitz;

// The fixture for testing conversions between grid variants.
class ConvertTest : public ::testing::Test {
protected:
    /** Small volume in the Alps, with a velocity field */
    GeoData alps() const
    {
        CoordArrays lld(lonlatdepth_grid(
            test::range(8, 12, 1), test::range(45, 48, 1), test::range(-20, 0, 10)));
        ArrayT ones(lld[0].shape());
        ones = 1;
        ArrayT zeros(lld[0].shape());
        zeros = 0;

        FieldSet fields;
        fields.add("Temperature", Field(lld[2], "degC"));
        fields.add("Velocity", Field(std::vector<ArrayT>{ones, zeros, zeros}));
        fields.add("color", Field(std::vector<ArrayT>{ones, ones, zeros}));
        return GeoData(lld[0], lld[1], lld[2], fields);
    }

    void expect_near(ArrayT const &a, ArrayT const &b, double eps, std::string const &msg = "")
    {
        ASSERT_EQ(a.numElements(), b.numElements());
        for (int i=0; i<a.extent(0); ++i)
        for (int j=0; j<a.extent(1); ++j)
        for (int k=0; k<a.extent(2); ++k) {
            EXPECT_NEAR(a(i,j,k), b(i,j,k), eps) << msg << " (" << i << "," << j << "," << k << ")";
        }
    }
};

TEST_F(ConvertTest, utm_zone)
{
    EXPECT_EQ(32, utm_zone(49.9929, 8.2473));
    EXPECT_EQ(33, utm_zone(35., 16.));
    EXPECT_EQ(31, utm_zone(0., 0.));
    EXPECT_EQ(1, utm_zone(0., -180.));
    EXPECT_EQ(1, utm_zone(0., 180.));    // wrapped

    // Norway and Svalbard
    EXPECT_EQ(32, utm_zone(60., 5.));
    EXPECT_EQ(33, utm_zone(78., 15.));
}

TEST_F(ConvertTest, projection_point)
{
    ProjectionPoint const p;
    EXPECT_DOUBLE_EQ(49.9929, p.lat);
    EXPECT_DOUBLE_EQ(8.2473, p.lon);
    EXPECT_EQ(32, p.zone);
    EXPECT_TRUE(p.isnorth);

    // Rebuilding from UTM gives back the same place
    ProjectionPoint const q(p.EW, p.NS, p.zone, p.isnorth);
    EXPECT_NEAR(p.lat, q.lat, 1e-8);
    EXPECT_NEAR(p.lon, q.lon, 1e-8);

    ProjectionPoint const s(-33.9, 18.4);
    EXPECT_FALSE(s.isnorth);
    EXPECT_EQ(34, s.zone);
    EXPECT_GT(s.NS, 0.);    // False northing
}

TEST_F(ConvertTest, utm_roundtrip)
{
    GeoData const V(alps());
    UTMData const U(to_utm(V));

    EXPECT_EQ(UNITS_M, U.depth().units);
    EXPECT_DOUBLE_EQ(-20000., U.depth().val(0,0,0));
    EXPECT_EQ(32, U.zone()(0,0,0));         // lon 8
    EXPECT_EQ(33, U.zone()(4,0,0));         // lon 12
    EXPECT_TRUE(U.northern()(0,0,0));

    GeoData const V2(to_geo(U));
    expect_near(V.lon().val, V2.lon().val, 1e-6, "lon");
    expect_near(V.lat().val, V2.lat().val, 1e-6, "lat");
    expect_near(V.depth().val, V2.depth().val, 1e-9, "depth");
    EXPECT_EQ(V.fields().keys(), V2.fields().keys());
}

TEST_F(ConvertTest, utm_missing_points)
{
    EXPECT_EQ(0, utm_zone(NAN, 8.));
    EXPECT_EQ(0, utm_zone(45., NAN));

    std::vector<double> lon {8., NAN, 12.};
    std::vector<double> lat {45., 46., NAN};
    std::vector<double> depth {-10., -20., -30.};
    GeoData const P(as_points(lon), as_points(lat), as_points(depth),
        FieldSet(), Attributes(), 1);

    UTMData const U(to_utm(P));
    EXPECT_EQ(32, U.zone()(0,0,0));
    EXPECT_FALSE(std::isnan(U.EW().val(0,0,0)));
    for (int i=1; i<3; ++i) {
        EXPECT_EQ(0, U.zone()(i,0,0));
        EXPECT_TRUE(std::isnan(U.EW().val(i,0,0)));
        EXPECT_TRUE(std::isnan(U.NS().val(i,0,0)));
    }
    EXPECT_DOUBLE_EQ(-20000., U.depth().val(1,0,0));

    GeoData const P2(to_geo(U));
    EXPECT_NEAR(8., P2.lon().val(0,0,0), 1e-6);
    EXPECT_TRUE(std::isnan(P2.lon().val(1,0,0)));
    EXPECT_TRUE(std::isnan(P2.lat().val(2,0,0)));
    EXPECT_DOUBLE_EQ(-30., P2.depth().val(2,0,0));
}

TEST_F(ConvertTest, utm_zone_roundtrip)
{
    GeoData const V(alps());
    ProjectionPoint const pp(46.5, 10.);
    UTMData const U(to_utm_zone(V, pp));

    // All in one zone, even the points east of 12E
    EXPECT_EQ(32, U.zone()(4,3,2));

    GeoData const V2(to_geo(U));
    expect_near(V.lon().val, V2.lon().val, 1e-6, "lon");
    expect_near(V.lat().val, V2.lat().val, 1e-6, "lat");
}

TEST_F(ConvertTest, concurrent_conversions)
{
    GeoData const V(alps());
    UTMData const U(to_utm(V));
    GeoData const expected(to_geo(U));

    // Each thread works on its own data; results must match the serial run
    int const nthreads = 4;
    std::vector<GeoData> results;
    for (int n=0; n<nthreads; ++n) results.push_back(alps());
    std::vector<std::thread> threads;
    for (int n=0; n<nthreads; ++n) {
        threads.push_back(std::thread([this, &results, n]() {
            GeoData const mine(alps());
            for (int rep=0; rep<5; ++rep)
                results[n] = to_geo(to_utm(mine));
        }));
    }
    for (auto &t : threads) t.join();

    for (int n=0; n<nthreads; ++n) {
        expect_near(expected.lon().val, results[n].lon().val, 1e-12, "lon");
        expect_near(expected.lat().val, results[n].lat().val, 1e-12, "lat");
        expect_near(expected.depth().val, results[n].depth().val, 1e-12, "depth");
        EXPECT_EQ(UNITS_KM, results[n].depth().units);
    }
}

TEST_F(ConvertTest, cart_roundtrip)
{
    GeoData const V(alps());
    ProjectionPoint const pp(46.5, 10.);
    CartData const C(to_cart(V, pp));

    // Depth stays in km
    EXPECT_DOUBLE_EQ(-20., C.z().val(0,0,0));

    // The projection point is the origin
    CoordArrays lld(lonlatdepth_grid({10.}, {46.5}, {0., -1.}));
    CartData const origin(to_cart(GeoData(lld[0], lld[1], lld[2], FieldSet()), pp));
    EXPECT_NEAR(0., origin.x().val(0,0,0), 1e-6);
    EXPECT_NEAR(0., origin.y().val(0,0,0), 1e-6);

    GeoData const V2(to_geo(C, pp));
    expect_near(V.lon().val, V2.lon().val, 1e-6, "lon");
    expect_near(V.lat().val, V2.lat().val, 1e-6, "lat");
    expect_near(V.depth().val, V2.depth().val, 1e-9, "depth");

    UTMData const U(to_utm_zone(C, pp));
    CartData const C2(to_cart(U, pp));
    expect_near(C.x().val, C2.x().val, 1e-9, "x");
    expect_near(C.y().val, C2.y().val, 1e-9, "y");
}

TEST_F(ConvertTest, ecef)
{
    CoordArrays lld(lonlatdepth_grid({0., 90.}, {0.}, {0., -10.}));
    GeoData const V(lld[0], lld[1], lld[2], FieldSet());
    ECEFData const E(to_ecef(V));

    double const a = 6378.137;    // WGS84 equatorial radius (km)
    EXPECT_NEAR(a, E.x().val(0,0,0), 1e-6);
    EXPECT_NEAR(0., E.y().val(0,0,0), 1e-6);
    EXPECT_NEAR(0., E.z().val(0,0,0), 1e-6);
    EXPECT_NEAR(a - 10., E.x().val(0,0,1), 1e-6);
    EXPECT_NEAR(a, E.y().val(1,0,0), 1e-6);
}

TEST_F(ConvertTest, ecef_vectors)
{
    GeoData const V(alps());
    ECEFData const E(to_ecef(V));

    // Vector magnitude is preserved
    Field const &vel(E.fields().at("Velocity"));
    for (int i=0; i<V.shape()[0]; ++i) {
        double const mag = std::sqrt(
            vel[0](i,1,1)*vel[0](i,1,1) + vel[1](i,1,1)*vel[1](i,1,1) + vel[2](i,1,1)*vel[2](i,1,1));
        EXPECT_NEAR(1., mag, 1e-12);
    }

    // Colors are not rotated
    Field const &color(E.fields().at("color"));
    EXPECT_DOUBLE_EQ(1., color[0](2,2,2));
    EXPECT_DOUBLE_EQ(1., color[1](2,2,2));
    EXPECT_DOUBLE_EQ(0., color[2](2,2,2));

    // Scalars are carried as they are
    EXPECT_DOUBLE_EQ(-20., E.fields().at("Temperature")[0](0,0,0));
}

TEST_F(ConvertTest, velocity_rotation)
{
    CoordArrays lld(lonlatdepth_grid({0., 90.}, {0., 90.}, {0.}));
    GeoData const V(lld[0], lld[1], lld[2], FieldSet());
    ArrayT east(lld[0].shape());
    east = 1;
    ArrayT zero(lld[0].shape());
    zero = 0;

    // Eastward at (0,0) points along +y; upward at (0,0) along +x
    Field const v(velocity_spherical_to_cartesian(V, Field(std::vector<ArrayT>{east, zero, zero})));
    EXPECT_NEAR(0., v[0](0,0,0), 1e-12);
    EXPECT_NEAR(1., v[1](0,0,0), 1e-12);
    EXPECT_NEAR(0., v[2](0,0,0), 1e-12);

    Field const up(velocity_spherical_to_cartesian(V, Field(std::vector<ArrayT>{zero, zero, east})));
    EXPECT_NEAR(1., up[0](0,0,0), 1e-12);
    EXPECT_NEAR(1., up[2](0,1,0), 1e-12);    // North pole

    EXPECT_THROW(velocity_spherical_to_cartesian(V, Field(east)), InvalidArgumentError);
}

// ------------------------------------------------------------
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
