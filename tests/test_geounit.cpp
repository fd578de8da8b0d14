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
#include <limits>
#include <gtest/gtest.h>
#include <geogrid/GeoUnit.hpp>
#include <geogrid/error.hpp>

using namespace geogrid;
using namespace blitz;

// The fixture for testing class GeoUnit.
class GeoUnitTest : public ::testing::Test {
protected:
    Array<double,3> vals;

    GeoUnitTest() : vals(3,1,1) {}

    virtual void SetUp()
    {
        vals(0,0,0) = -1.5;
        vals(1,0,0) = 0.;
        vals(2,0,0) = 2.25;
    }
};

TEST_F(GeoUnitTest, convert_km_m)
{
    GeoUnit const km(vals, UNITS_KM);
    GeoUnit const m(km.to(UNITS_M));

    EXPECT_EQ(UNITS_M, m.units);
    EXPECT_DOUBLE_EQ(-1500., m.val(0,0,0));
    EXPECT_DOUBLE_EQ(0., m.val(1,0,0));
    EXPECT_DOUBLE_EQ(2250., m.val(2,0,0));

    // Conversion produces a new array
    EXPECT_DOUBLE_EQ(-1.5, km.val(0,0,0));

    GeoUnit const back(m.to(UNITS_KM));
    for (int i=0; i<3; ++i) EXPECT_DOUBLE_EQ(vals(i,0,0), back.val(i,0,0));
}

TEST_F(GeoUnitTest, same_units_shares)
{
    GeoUnit const km(vals, UNITS_KM);
    GeoUnit const km2(km.to(UNITS_KM));
    EXPECT_EQ(km.val.data(), km2.val.data());
}

TEST_F(GeoUnitTest, bare)
{
    GeoUnit const a(GeoUnit::bare(vals, UNITS_KM));
    EXPECT_TRUE(a.assumed_units);
    EXPECT_EQ(UNITS_KM, a.units);

    GeoUnit const b(vals, UNITS_KM);
    EXPECT_FALSE(b.assumed_units);

    // Assumed-ness survives conversion
    EXPECT_TRUE(a.to(UNITS_M).assumed_units);
}

TEST_F(GeoUnitTest, incompatible_units)
{
    GeoUnit const km(vals, UNITS_KM);
    EXPECT_FALSE(km.convertible_to(UNITS_DEGREE));
    EXPECT_TRUE(km.convertible_to("cm"));
    EXPECT_THROW(km.to("s"), UnitsError);
}

TEST_F(GeoUnitTest, minmax_ignore_nan)
{
    vals(1,0,0) = std::numeric_limits<double>::quiet_NaN();
    GeoUnit const km(vals, UNITS_KM);
    EXPECT_DOUBLE_EQ(-1.5, km.min());
    EXPECT_DOUBLE_EQ(2.25, km.max());

    Array<double,3> all_nan(2,1,1);
    all_nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(std::isnan(GeoUnit(all_nan, UNITS_KM).min()));
}

TEST_F(GeoUnitTest, arithmetic)
{
    GeoUnit const km(vals, UNITS_KM);
    Array<double,3> mvals(3,1,1);
    mvals = 500.;
    GeoUnit const m(mvals, UNITS_M);

    GeoUnit const sum(km + m);
    EXPECT_EQ(UNITS_KM, sum.units);
    EXPECT_DOUBLE_EQ(-1.0, sum.val(0,0,0));
    EXPECT_DOUBLE_EQ(2.75, sum.val(2,0,0));

    GeoUnit const diff(m - km);
    EXPECT_EQ(UNITS_M, diff.units);
    EXPECT_DOUBLE_EQ(2000., diff.val(0,0,0));

    Array<double,3> other(2,1,1);
    other = 0;
    EXPECT_THROW(km + GeoUnit(other, UNITS_KM), ShapeMismatchError);
}

TEST_F(GeoUnitTest, assignment_shares_array)
{
    GeoUnit a(vals, UNITS_KM);
    Array<double,3> other(5,1,1);
    other = 7.;
    GeoUnit const b(other, UNITS_M);

    // Blitz would refuse (or copy into) an array of the wrong shape
    a = b;
    EXPECT_EQ(5, a.val.extent(0));
    EXPECT_EQ(other.data(), a.val.data());
    EXPECT_EQ(UNITS_M, a.units);
}

TEST_F(GeoUnitTest, convert_scalar)
{
    EXPECT_DOUBLE_EQ(1000., convert_units(1., UNITS_KM, UNITS_M));
    EXPECT_DOUBLE_EQ(3., convert_units(3., UNITS_KM, UNITS_KM));
}

// ------------------------------------------------------------
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
