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
#include <gtest/gtest.h>
#include <geogrid/Surface.hpp>
#include <geogrid/error.hpp>
#include "test_datasets.hpp"

using namespace geogrid;
using namespace geogrid::test;
using namespace blitz;

// The fixture for testing surface arithmetic and NaN removal.
class SurfaceTest : public ::testing::Test {
protected:
    /** x 1:4, y 1:5 at height z, with the field Z = z */
    CartData cart_surface(double z) const
    {
        CoordArrays xyz(xyz_grid(range(1, 4, 1), range(1, 5, 1), {z}));
        FieldSet fields;
        fields.add("Z", Field(xyz[2]));
        return CartData(xyz[0], xyz[1], xyz[2], fields);
    }

    GeoData geo_surface(double depth) const
    {
        CoordArrays lld(lonlatdepth_grid(range(1, 4, 1), range(1, 5, 1), {depth}));
        FieldSet fields;
        fields.add("Z", Field(lld[2]));
        return GeoData(lld[0], lld[1], lld[2], fields);
    }

    static bool any_nan(ArrayT const &A)
    {
        for (auto ii=A.begin(); ii != A.end(); ++ii)
            if (std::isnan(*ii)) return true;
        return false;
    }
};

TEST_F(SurfaceTest, is_surface)
{
    EXPECT_TRUE(is_surface(cart_surface(0.)));
    EXPECT_TRUE(is_surface(geo_surface(2.)));
    EXPECT_TRUE(is_surface(moho()));
    EXPECT_FALSE(is_surface(volume()));

    // Vertical sheets and point sets are not horizontal surfaces
    CoordArrays xyz(xyz_grid({1.}, range(1, 5, 1), range(2, 5, 1)));
    EXPECT_FALSE(is_surface(CartData(xyz[0], xyz[1], xyz[2], FieldSet())));
    std::vector<double> p {1., 2.};
    EXPECT_FALSE(is_surface(GeoData(as_points(p), as_points(p), as_points(p),
        FieldSet(), Attributes(), 1)));
}

TEST_F(SurfaceTest, cartesian_arithmetic)
{
    CartData const c1(cart_surface(0.));
    CartData const c2(add_field(cart_surface(2.), "Z2", Field(cart_surface(2.).x().val)));

    CartData const sum(c1 + c2);
    EXPECT_EQ(2, (int)sum.fields().size());
    EXPECT_DOUBLE_EQ(2., sum.z().val(1,0,0));
    EXPECT_EQ(UNITS_KM, sum.z().units);
    EXPECT_TRUE(is_surface(sum));

    // b's field of the same name wins
    EXPECT_DOUBLE_EQ(2., sum.fields().at("Z")[0](1,0,0));
    EXPECT_DOUBLE_EQ(2., sum.fields().at("Z2")[0](1,0,0));

    CartData const diff(c1 - c2);
    EXPECT_EQ(2, (int)diff.fields().size());
    EXPECT_DOUBLE_EQ(-2., diff.z().val(1,0,0));
    EXPECT_DOUBLE_EQ(3., diff.x().val(2,4,0));
}

TEST_F(SurfaceTest, geographic_arithmetic)
{
    GeoData const g1(geo_surface(0.));
    GeoData const g2(geo_surface(2.));

    GeoData const sum(g1 + g2);
    EXPECT_EQ(1, (int)sum.fields().size());
    EXPECT_DOUBLE_EQ(2., sum.depth().val(1,0,0));

    GeoData const diff(g1 - g2);
    EXPECT_EQ(1, (int)diff.fields().size());
    EXPECT_DOUBLE_EQ(-2., diff.depth().val(1,0,0));

    // Depth given in m is normalized before adding
    CoordArrays lld(lonlatdepth_grid(range(1, 4, 1), range(1, 5, 1), {500.}));
    GeoData const g3(lld[0], lld[1], GeoUnit(lld[2], UNITS_M), FieldSet());
    EXPECT_DOUBLE_EQ(2.5, (g2 + g3).depth().val(3,4,0));
}

TEST_F(SurfaceTest, arithmetic_errors)
{
    EXPECT_THROW(volume() + moho(), UnsupportedDatasetShapeError);

    CoordArrays xyz(xyz_grid(range(1, 4, 1), range(1, 6, 1), {0.}));
    CartData const wider(xyz[0], xyz[1], xyz[2], FieldSet());
    EXPECT_THROW(cart_surface(0.) - wider, ShapeMismatchError);

    CoordArrays lld(lonlatdepth_grid(range(2, 5, 1), range(1, 5, 1), {0.}));
    GeoData const shifted(lld[0], lld[1], lld[2], FieldSet());
    EXPECT_THROW(geo_surface(0.) + shifted, InvalidArgumentError);
}

TEST_F(SurfaceTest, remove_nan_arrays)
{
    CartData const c(cart_surface(0.));
    ArrayT Z(c.z().val.shape());
    Z = c.x().val + 10. * c.y().val;
    Z(1,1,0) = NAN;     // x=2, y=2

    EXPECT_EQ(1, remove_nan_surface(Z, c.x().val, c.y().val));
    EXPECT_FALSE(any_nan(Z));

    // Four neighbors at distance 1; the first in storage order is (x=1, y=2)
    EXPECT_DOUBLE_EQ(21., Z(1,1,0));
    EXPECT_DOUBLE_EQ(33., Z(2,2,0));

    // Nothing to fill from
    ArrayT none(c.z().val.shape());
    none = NAN;
    EXPECT_EQ(0, remove_nan_surface(none, c.x().val, c.y().val));
    EXPECT_TRUE(any_nan(none));
}

TEST_F(SurfaceTest, remove_nan_grid)
{
    GeoData const m(moho());
    ArrayT depth(m.depth().val.copy());
    depth(0,0,0) = NAN;
    depth(10,10,0) = NAN;
    GeoData const holes(m.lon().val, m.lat().val, depth, m.fields());

    GeoData const filled(remove_nan_surface(holes));
    EXPECT_FALSE(any_nan(filled.depth().val));
    EXPECT_DOUBLE_EQ(-30., filled.depth().val(0,0,0));     // From lon 10, lat 31
    EXPECT_DOUBLE_EQ(-21., filled.depth().val(10,10,0));   // From lon 19, lat 40
    EXPECT_EQ(m.fields().keys(), filled.fields().keys());

    // The input is left alone
    EXPECT_TRUE(std::isnan(holes.depth().val(0,0,0)));

    EXPECT_THROW(remove_nan_surface(volume()), UnsupportedDatasetShapeError);
}

// ------------------------------------------------------------
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
