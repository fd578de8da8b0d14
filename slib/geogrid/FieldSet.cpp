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

#include <algorithm>
#include <geogrid/FieldSet.hpp>
#include <geogrid/error.hpp>

namespace geogrid {

std::string const FieldSet::DEFAULT_NAME = "DataSet1";

Field Field::map(std::function<ArrayT (ArrayT const &)> const &fn) const
{
    Field ret;
    ret.units = units;
    for (auto ii=comps.begin(); ii != comps.end(); ++ii)
        ret.comps.push_back(fn(*ii));
    return ret;
}

// -----------------------------------------------------
FieldSet::FieldSet(ArrayT const &bare)
{
    add(DEFAULT_NAME, Field(bare));
}

FieldSet FieldSet::from_tuple(std::vector<Field> const &tuple)
{
    if (tuple.size() > 1) {
        (*geogrid_error)(ERR_INVALID_FIELDS,
            "Got an unnamed tuple of %d fields; please name the fields",
            (int)tuple.size());
    }

    FieldSet ret;
    if (tuple.size() == 1) ret.add(DEFAULT_NAME, tuple[0]);
    return ret;
}

size_t FieldSet::add(std::string const &name, Field const &field)
{
    auto ii(_index.find(name));
    if (ii != _index.end()) {
        _data[ii->second] = field;
        return ii->second;
    }

    size_t ix = _data.size();
    _keys.push_back(name);
    _index.insert(std::make_pair(name, ix));
    _data.push_back(field);
    return ix;
}

Field const &FieldSet::at(std::string const &name) const
{
    auto ii(_index.find(name));
    if (ii == _index.end()) {
        (*geogrid_error)(ERR_INVALID_ARGUMENT,
            "No field named '%s'", name.c_str());
    }
    return _data[ii->second];
}

FieldSet FieldSet::without(std::vector<std::string> const &names) const
{
    FieldSet ret;
    for (size_t i=0; i<_keys.size(); ++i) {
        if (std::find(names.begin(), names.end(), _keys[i]) != names.end()) continue;
        ret.add(_keys[i], _data[i]);
    }
    return ret;
}

FieldSet FieldSet::map(std::function<ArrayT (ArrayT const &)> const &fn) const
{
    FieldSet ret;
    for (size_t i=0; i<_keys.size(); ++i)
        ret.add(_keys[i], _data[i].map(fn));
    return ret;
}

std::ostream &operator<<(std::ostream &out, FieldSet const &fields)
{
    out << "(";
    for (size_t i=0; i<fields.size(); ++i) {
        if (i > 0) out << ", ";
        out << fields.keys()[i];
        if (fields[i].is_vector()) out << "[" << fields[i].ncomp() << "]";
    }
    out << ")";
    return out;
}

}   // namespace
