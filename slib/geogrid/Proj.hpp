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

#ifndef GEOGRID_PROJ_HPP
#define GEOGRID_PROJ_HPP

#include <proj.h>
#include <string>

namespace geogrid {

/** Memory-safe peer class for a coordinate operation in the PROJ
library.  Operations are given as PROJ strings, eg:
<pre>+proj=utm +zone=32 +ellps=WGS84</pre>
Each instance has its own PROJ context, so separate instances may be
used from separate threads.
@see https://proj.org */
class Proj {
    PJ_CONTEXT *ctx;
    PJ *pj;
    std::string _sproj;

public:
    Proj() : ctx(0), pj(0) {}

    bool is_valid() const { return (pj != 0); }

    std::string const &sproj() const { return _sproj; }

    // ------------------ Five Standard constructors/methods for C++

    /** Create a projection.
    @param definition The PROJ string describing the operation. */
    explicit Proj(std::string const &definition);

    void clear() {
        if (pj) proj_destroy(pj);
        pj = 0;
        if (ctx) proj_context_destroy(ctx);
        ctx = 0;
    }

    ~Proj()
        { clear(); }

    /** Transfer ownership (move) */
    Proj(Proj&& h) : ctx(h.ctx), pj(h.pj), _sproj(std::move(h._sproj))
    {
        h.ctx = 0;
        h.pj = 0;
    }

    /** Transfer value */
    Proj& operator=(Proj&& h)
    {
        clear();
        ctx = h.ctx;
        pj = h.pj;
        _sproj = std::move(h._sproj);
        h.ctx = 0;
        h.pj = 0;
        return *this;
    }

    /** Copy constructor: re-creates the operation from its definition */
    Proj(const Proj &h) : ctx(0), pj(0)
    {
        if (h.pj) *this = Proj(h._sproj);
    }

    /** Copying of Proj not allowed.
    No copy with operator=() */
    Proj& operator=(const Proj&) = delete;

    // --------------------------- Other Stuff

    /** Applies the operation to one coordinate.  Angular input/output
    is in radians, linear in meters.
    @return The transformed coordinate; components are HUGE_VAL on failure. */
    PJ_COORD trans(PJ_DIRECTION direction, PJ_COORD coord) const
        { return proj_trans(pj, direction, coord); }
};


/** Wraps a projection to implement both the forward and backward
translation together in one.  Instances have a <i>direction</i>, which
can be either spherical-to-map, or map-to-spherical.  Angles are in
degrees, as seen by the user. */
class Proj2 {
public:
    /** Direction enums for latlon-to-xy, and xy-to-latlon */
    enum class Direction {LL2XY, XY2LL};
    /** The direction of translation for this instance. */
    Direction direction;
protected:
    Proj _proj;
public:

    /** Tests if this projection has been initialized. */
    bool is_valid() const { return _proj.is_valid(); }

    std::string const &sproj() const { return _proj.sproj(); }

    /** @param _sproj The projection string.
    @param _direction Direction of translation. */
    Proj2(std::string const &_sproj, Direction _direction) :
        direction(_direction), _proj(_sproj) {}

    Proj2() : direction(Direction::LL2XY) {}

    /** Copies an existing Proj2, but with a different direction. */
    Proj2(Proj2 const &rhs, Direction _direction) :
        direction(_direction), _proj(rhs._proj) {}

    /** Transforms a single coordinate triple.
    @param x0 Source x (or longitude) coordinate (degrees)
    @param y0 Source y (or latitude) coordinate (degrees)
    @param z0 Source height (m)
    @param x1 Destination x (or longitude) coordinate (degrees)
    @param y1 Destination y (or latitude) coordinate (degrees)
    @param z1 Destination height (m)
    @return 0 on success; on failure, outputs are NaN. */
    int transform(double x0, double y0, double z0,
        double &x1, double &y1, double &z1) const;

    int transform(double x0, double y0, double &x1, double &y1) const
    {
        double z1;
        return transform(x0, y0, 0., x1, y1, z1);
    }
};

}

#endif
