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

#ifndef GEOGRID_FIELDSET_HPP
#define GEOGRID_FIELDSET_HPP

#include <map>
#include <string>
#include <vector>
#include <functional>
#include <iostream>
#include <blitz/array.h>

namespace geogrid {

typedef blitz::Array<double,3> ArrayT;

/** One data field on a grid: either a scalar array, or a tuple of
component arrays (a 3-tuple is treated as a vector field). */
struct Field {
    std::vector<ArrayT> comps;
    /** The units of the field, in UDUNITS format ("" if none). */
    std::string units;

    Field() {}

    Field(ArrayT const &scalar, std::string const &_units = "") :
        comps({scalar}), units(_units) {}

    Field(std::vector<ArrayT> const &_comps, std::string const &_units = "") :
        comps(_comps), units(_units) {}

    Field(Field const &) = default;
    Field(Field &&) = default;
    Field &operator=(Field &&) = default;

    /** Blitz operator=() copies element data; re-reference instead. */
    Field &operator=(Field const &rhs)
    {
        if (this == &rhs) return *this;
        comps.clear();
        comps.insert(comps.end(), rhs.comps.begin(), rhs.comps.end());
        units = rhs.units;
        return *this;
    }

    size_t ncomp() const { return comps.size(); }
    bool is_vector() const { return comps.size() > 1; }

    ArrayT const &operator[](size_t i) const
        { return comps[i]; }

    /** The scalar value (or first component) */
    ArrayT const &scalar() const
        { return comps[0]; }

    /** Applies fn to every component, producing a new Field with the
    same units. */
    Field map(std::function<ArrayT (ArrayT const &)> const &fn) const;
};

/** Ordered mapping from field name to Field.  Keys keep the order in
which they were first added. */
class FieldSet
{
    std::vector<std::string> _keys;
    std::map<std::string, size_t> _index;
    std::vector<Field> _data;

public:
    FieldSet() {}

    /** A single bare array: stored under the name DEFAULT_NAME. */
    FieldSet(ArrayT const &bare);

    /** Wraps an unnamed tuple of fields.  A tuple of length 1 is stored
    under DEFAULT_NAME.
    @throws InvalidFieldsError if the tuple has more than one field. */
    static FieldSet from_tuple(std::vector<Field> const &tuple);

    static std::string const DEFAULT_NAME;

    std::vector<std::string> const &keys() const
        { return _keys; }

    size_t size() const { return _data.size(); }

    bool contains(std::string const &name) const
        { return _index.find(name) != _index.end(); }

    /** Adds a field; replaces (in place) a field of the same name.
    @return Index of the field. */
    size_t add(std::string const &name, Field const &field);

    Field const &operator[](size_t ix) const
        { return _data[ix]; }

    /** @throws InvalidArgumentError if there is no such field */
    Field const &at(std::string const &name) const;

    /** A copy with some fields removed */
    FieldSet without(std::vector<std::string> const &names) const;

    /** Applies fn to every component of every field. */
    FieldSet map(std::function<ArrayT (ArrayT const &)> const &fn) const;
};

std::ostream &operator<<(std::ostream &out, FieldSet const &fields);

}   // namespace

#endif    // guard
