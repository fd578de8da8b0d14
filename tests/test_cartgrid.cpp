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

#include <sstream>
#include <gtest/gtest.h>
#include <geogrid/CartGrid.hpp>
#include <geogrid/Subvolume.hpp>
#include <geogrid/error.hpp>

using namespace geogrid;
using namespace blitz;

// The fixture for testing class CartGrid.
class CartGridTest : public ::testing::Test {};

TEST_F(CartGridTest, grid_3d)
{
    CartGrid const grid(create_cart_grid({11, 21, 31},
        Bounds(0., 10.), Bounds(-5., 5.), Bounds(-30., 0.)));

    EXPECT_EQ(3, grid.ndim());
    EXPECT_DOUBLE_EQ(1., grid.delta[0]);
    EXPECT_DOUBLE_EQ(0.5, grid.delta[1]);
    EXPECT_DOUBLE_EQ(1., grid.delta[2]);
    EXPECT_DOUBLE_EQ(30., grid.L[2]);
    EXPECT_DOUBLE_EQ(-5., grid.min[1]);
    EXPECT_DOUBLE_EQ(0., grid.max[2]);

    ASSERT_EQ(21, grid.coord1D[1].size());
    EXPECT_DOUBLE_EQ(5., grid.coord1D[1].back());
    ASSERT_EQ(10, grid.coord1D_cen[0].size());
    EXPECT_DOUBLE_EQ(0.5, grid.coord1D_cen[0][0]);
    EXPECT_DOUBLE_EQ(9.5, grid.coord1D_cen[0].back());

    CoordArrays xyz(coordinate_grids(grid));
    EXPECT_EQ(11, xyz[0].extent(0));
    EXPECT_EQ(21, xyz[0].extent(1));
    EXPECT_EQ(31, xyz[0].extent(2));
    EXPECT_DOUBLE_EQ(-30., xyz[2](3,4,0));

    CoordArrays cen(coordinate_grids(grid, true));
    EXPECT_EQ(10, cen[0].extent(0));
    EXPECT_EQ(30, cen[2].extent(2));
    EXPECT_DOUBLE_EQ(-29.5, cen[2](0,0,0));
}

TEST_F(CartGridTest, grid_extent)
{
    // 2D: x, z
    CartGrid const g2(create_cart_grid({101, 11}, {100., 20.}));
    EXPECT_EQ(2, g2.ndim());
    EXPECT_DOUBLE_EQ(0., g2.min[0]);
    EXPECT_DOUBLE_EQ(100., g2.max[0]);
    EXPECT_DOUBLE_EQ(-20., g2.min[1]);
    EXPECT_DOUBLE_EQ(0., g2.max[1]);

    CoordArrays xyz(coordinate_grids(g2));
    EXPECT_EQ(101, xyz[0].extent(0));
    EXPECT_EQ(1, xyz[0].extent(1));
    EXPECT_EQ(11, xyz[0].extent(2));
    EXPECT_DOUBLE_EQ(0., xyz[1](50,0,5));
    EXPECT_DOUBLE_EQ(-20., xyz[2](50,0,0));

    // 3D: x, z, y in the extent vector
    CartGrid const g3(create_cart_grid({11, 11, 11}, {10., 30., 20.}));
    EXPECT_DOUBLE_EQ(20., g3.max[1]);
    EXPECT_DOUBLE_EQ(-30., g3.min[2]);
}

TEST_F(CartGridTest, grid_1d)
{
    CartGrid const grid(create_cart_grid({5}, Bounds(0., 4.), boost::none, boost::none));
    EXPECT_EQ(1, grid.ndim());
    CoordArrays xyz(coordinate_grids(grid));
    EXPECT_EQ(5, xyz[0].extent(0));
    EXPECT_EQ(1, xyz[0].extent(1));
    EXPECT_EQ(1, xyz[0].extent(2));

    EXPECT_THROW(grid.to_cartdata(FieldSet()), InvalidArgumentError);
}

TEST_F(CartGridTest, errors)
{
    // Fewer than 2 points
    EXPECT_THROW(create_cart_grid({1, 5}, {1., 1.}), InvalidArgumentError);
    // Missing bounds
    EXPECT_THROW(create_cart_grid({5, 5, 5}, Bounds(0., 1.), boost::none, Bounds(0., 1.)),
        InvalidArgumentError);
    // Too many dimensions
    EXPECT_THROW(create_cart_grid({2, 2, 2, 2}, {1., 1., 1., 1.}), InvalidArgumentError);
}

TEST_F(CartGridTest, to_cartdata)
{
    CartGrid const grid(create_cart_grid({4, 3}, {3., 2.}));

    // Given as (N1,N2,1)
    ArrayT T(4, 3, 1);
    for (int i=0; i<4; ++i)
    for (int k=0; k<3; ++k) T(i,k,0) = 10*i + k;

    FieldSet fields;
    fields.add("T", Field(T));
    CartData const C(grid.to_cartdata(fields, 7.));

    EXPECT_EQ(ShapeClass::SURFACE, C.shape_class());
    EXPECT_EQ(4, C.shape()[0]);
    EXPECT_EQ(1, C.shape()[1]);
    EXPECT_EQ(3, C.shape()[2]);
    EXPECT_DOUBLE_EQ(7., C.y().val(2,0,1));
    EXPECT_DOUBLE_EQ(-1., C.z().val(2,0,1));

    ArrayT const &T2(C.fields().at("T").scalar());
    EXPECT_DOUBLE_EQ(21., T2(2,0,1));
}

TEST_F(CartGridTest, above_surface)
{
    CartGrid const grid(create_cart_grid({11, 11, 11},
        Bounds(0., 10.), Bounds(0., 10.), Bounds(-10., 0.)));

    // Flat surface at z=-4.5, over part of the domain
    CoordArrays sxyz(xyz_grid({0., 5.}, {0., 10.}, {0.}));
    ArrayT z(sxyz[0].shape());
    z = -4.5;
    CartData const surf(sxyz[0], sxyz[1], z, FieldSet());

    Array<bool,3> const above(above_surface(grid, surf));
    EXPECT_TRUE(above(0,0,10));
    EXPECT_TRUE(above(5,3,6));      // z=-4
    EXPECT_FALSE(above(5,3,5));     // z=-5
    EXPECT_FALSE(above(6,3,10));    // Outside the surface

    Array<bool,3> const below(below_surface(grid, surf));
    EXPECT_TRUE(below(5,3,5));
    EXPECT_FALSE(below(5,3,6));
    EXPECT_FALSE(below(6,3,0));
}

TEST_F(CartGridTest, print)
{
    CartGrid const grid(create_cart_grid({101, 11}, {100., 20.}));
    std::stringstream buf;
    buf << grid;
    EXPECT_NE(std::string::npos, buf.str().find("CartGrid 2D"));
    EXPECT_NE(std::string::npos, buf.str().find("z in [-20, 0]"));
}

// ------------------------------------------------------------
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
