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

#include <boost/format.hpp>
#include <geogrid/CartGrid.hpp>
#include <geogrid/error.hpp>

using namespace blitz;

namespace geogrid {

CartGrid create_cart_grid(
    std::vector<int> const &size,
    boost::optional<Bounds> const &_x,
    boost::optional<Bounds> const &_y,
    boost::optional<Bounds> const &_z,
    boost::optional<std::vector<double>> const &extent)
{
    int const dim = size.size();
    if (dim < 1 || dim > 3) {
        (*geogrid_error)(ERR_INVALID_ARGUMENT,
            "create_cart_grid(): size must have 1, 2 or 3 entries, got %d", dim);
    }
    for (int i=0; i<dim; ++i) {
        if (size[i] < 2) {
            (*geogrid_error)(ERR_INVALID_ARGUMENT,
                "create_cart_grid(): need at least 2 points in direction %d", i);
        }
    }

    boost::optional<Bounds> x(_x), y(_y), z(_z);

    // Specify domain by length in every direction
    if (extent) {
        if ((int)extent->size() < dim) {
            (*geogrid_error)(ERR_INVALID_ARGUMENT,
                "create_cart_grid(): extent has %d entries, need %d",
                (int)extent->size(), dim);
        }
        x = Bounds(0.0, (*extent)[0]);
        if (dim > 1) z = Bounds(-(*extent)[1], 0.0);    // vertical direction (negative)
        if (dim > 2) y = Bounds(0.0, (*extent)[2]);
    }

    // Axis order: x; x,z; x,y,z
    std::vector<boost::optional<Bounds>> axes;
    axes.push_back(x);
    if (dim == 2) axes.push_back(z);
    if (dim == 3) {
        axes.push_back(y);
        axes.push_back(z);
    }

    char const *names2[] = {"x", "z"};
    char const *names3[] = {"x", "y", "z"};
    CartGrid grid;
    for (int i=0; i<dim; ++i) {
        if (!axes[i]) {
            (*geogrid_error)(ERR_INVALID_ARGUMENT,
                "create_cart_grid(): no bounds given for %s",
                (dim == 2 ? names2[i] : names3[i]));
        }
        double const x0 = axes[i]->first;
        double const L = axes[i]->second - x0;
        double const delta = L / (size[i] - 1);

        grid.N.push_back(size[i]);
        grid.L.push_back(L);
        grid.delta.push_back(delta);
        grid.min.push_back(x0);
        grid.max.push_back(x0 + L);
        grid.coord1D.push_back(linspace(x0, x0 + L, size[i]));
        grid.coord1D_cen.push_back(
            linspace(x0 + delta/2, x0 + L - delta/2, size[i]-1));
    }
    return grid;
}

/** The three 1-D vectors a grid spans, with y={y_val} in 2D */
static std::array<std::vector<double>,3> xyz_vectors(
    CartGrid const &grid, std::vector<std::vector<double>> const &coords, double y_val)
{
    std::vector<double> const yv {y_val};
    switch(grid.ndim()) {
        case 1 : return {{coords[0], yv, {0.0}}};
        case 2 : return {{coords[0], yv, coords[1]}};
        default : return {{coords[0], coords[1], coords[2]}};
    }
}

CoordArrays coordinate_grids(CartGrid const &grid, bool cell)
{
    auto vecs(xyz_vectors(grid, cell ? grid.coord1D_cen : grid.coord1D, 0.0));
    return xyz_grid(vecs[0], vecs[1], vecs[2]);
}

CartData CartGrid::to_cartdata(FieldSet const &fields, double y_val) const
{
    if (ndim() < 2) {
        (*geogrid_error)(ERR_INVALID_ARGUMENT,
            "CartGrid::to_cartdata(): not defined for a 1D grid");
    }

    auto vecs(xyz_vectors(*this, coord1D, y_val));
    CoordArrays xyz(xyz_grid(vecs[0], vecs[1], vecs[2]));

    if (ndim() == 3) return CartData(xyz[0], xyz[1], xyz[2], fields);

    // 2D: fields given as (N1,N2,1) are stored as (N1,1,N2)
    int const n1 = N[0];
    int const n2 = N[1];
    FieldSet fields3;
    for (size_t i=0; i<fields.size(); ++i) {
        fields3.add(fields.keys()[i], fields[i].map(
            [n1,n2](ArrayT const &A) -> ArrayT {
                if (A.extent(0) != n1 || A.extent(1) != n2 || A.extent(2) != 1)
                    return A;
                ArrayT ret(n1, 1, n2);
                for (int i=0; i<n1; ++i)
                for (int k=0; k<n2; ++k)
                    ret(i,0,k) = A(A.lbound(0)+i, A.lbound(1)+k, A.lbound(2));
                return ret;
            }));
    }
    return CartData(xyz[0], xyz[1], xyz[2], fields3);
}

std::ostream &operator<<(std::ostream &out, CartGrid const &grid)
{
    char const *names2[] = {"x", "z"};
    char const *names3[] = {"x", "y", "z"};

    out << "CartGrid " << grid.ndim() << "D" << std::endl;
    out << "           size: (";
    for (int i=0; i<grid.ndim(); ++i) out << (i>0 ? ", " : "") << grid.N[i];
    out << ")" << std::endl;
    out << "         domain: ";
    for (int i=0; i<grid.ndim(); ++i) {
        out << boost::format("%s%s in [%g, %g]")
            % (i>0 ? ", " : "") % (grid.ndim() == 2 ? names2[i] : names3[i])
            % grid.min[i] % grid.max[i];
    }
    out << std::endl;
    out << " grid spacing  : (";
    for (int i=0; i<grid.ndim(); ++i) out << (i>0 ? ", " : "") << grid.delta[i];
    out << ")" << std::endl;
    return out;
}

}   // namespace
