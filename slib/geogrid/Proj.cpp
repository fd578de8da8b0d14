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
#include <limits>
#include <geogrid/Proj.hpp>
#include <geogrid/constant.hpp>
#include <geogrid/error.hpp>

namespace geogrid {

static double const NaN = std::numeric_limits<double>::quiet_NaN();

Proj::Proj(std::string const &definition) :
    ctx(proj_context_create()), pj(0), _sproj(definition)
{
    if (!ctx) {
        (*geogrid_error)(ERR_PROJ, "Proj(\"%s\"): cannot create a PROJ context",
            definition.c_str());
    }

    pj = proj_create(ctx, definition.c_str());
    if (pj) return;

    int const err = proj_context_errno(ctx);
    std::string const msg(proj_context_errno_string(ctx, err));
    clear();
    (*geogrid_error)(ERR_PROJ, "Proj(\"%s\"): %s",
        definition.c_str(), msg.c_str());
}


int Proj2::transform(double x0, double y0, double z0,
    double &x1, double &y1, double &z1) const
{
    if (!is_valid()) {
        x1 = x0;
        y1 = y0;
        z1 = z0;
        return 0;
    }

    PJ_COORD c1;
    if (direction == Direction::XY2LL) {
        c1 = _proj.trans(PJ_INV, proj_coord(x0, y0, z0, 0));
        x1 = c1.xyz.x * R2D;
        y1 = c1.xyz.y * R2D;
        z1 = c1.xyz.z;
    } else {
        c1 = _proj.trans(PJ_FWD, proj_coord(x0 * D2R, y0 * D2R, z0, 0));
        x1 = c1.xyz.x;
        y1 = c1.xyz.y;
        z1 = c1.xyz.z;
    }

    if (c1.xyz.x == HUGE_VAL) {
        x1 = NaN;
        y1 = NaN;
        z1 = NaN;
        return -1;
    }
    return 0;
}

}   // namespace geogrid
