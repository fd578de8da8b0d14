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
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <geogrid/VoteMap.hpp>
#include <geogrid/Subvolume.hpp>
#include <geogrid/error.hpp>

using namespace blitz;

namespace geogrid {

static double const NaN = std::numeric_limits<double>::quiet_NaN();

// Two-character operators first, so "<=" is not read as "<"
static std::array<std::pair<std::string, Criterion::Op>, 6> const OPS {{
    {"<=", Criterion::Op::LE},
    {">=", Criterion::Op::GE},
    {"==", Criterion::Op::EQ},
    {"!=", Criterion::Op::NE},
    {"<", Criterion::Op::LT},
    {">", Criterion::Op::GT}
}};

static char const *op_str(Criterion::Op op)
{
    for (auto const &ii : OPS) if (ii.second == op) return ii.first.c_str();
    return "?";
}

Criterion Criterion::parse(std::string const &text)
{
    size_t const pos = text.find_first_of("<>=!");
    if (pos == std::string::npos) {
        (*geogrid_error)(ERR_INVALID_CRITERION,
            "Criterion '%s' has no comparison operator", text.c_str());
    }

    Criterion ret;
    ret.field = boost::algorithm::trim_copy(text.substr(0, pos));

    bool found = false;
    std::string rest;
    for (auto const &ii : OPS) {
        if (text.compare(pos, ii.first.size(), ii.first) == 0) {
            ret.op = ii.second;
            rest = boost::algorithm::trim_copy(text.substr(pos + ii.first.size()));
            found = true;
            break;
        }
    }
    if (!found || ret.field.empty()) {
        (*geogrid_error)(ERR_INVALID_CRITERION,
            "Cannot parse criterion '%s'; expected 'field op value'", text.c_str());
    }

    try {
        ret.value = boost::lexical_cast<double>(rest);
    } catch(boost::bad_lexical_cast const &) {
        (*geogrid_error)(ERR_INVALID_CRITERION,
            "Criterion '%s': '%s' is not a number", text.c_str(), rest.c_str());
    }
    return ret;
}

bool Criterion::operator()(double v) const
{
    switch(op) {
        case Op::LT : return v < value;
        case Op::LE : return v <= value;
        case Op::GT : return v > value;
        case Op::GE : return v >= value;
        case Op::EQ : return v == value;
        default : return v != value;
    }
}

/** Checks the field is there, before any interpolation is done */
static void check_field(GridData const &V, std::string const &field)
{
    if (!V.fields().contains(field)) {
        (*geogrid_error)(ERR_INVALID_CRITERION,
            "The %s does not have the field: %s", V.kind_name(), field.c_str());
    }
}

Array<int,3> Criterion::evaluate(GridData const &V) const
{
    check_field(V, field);
    ArrayT const &A(V.fields().at(field).scalar());

    Array<int,3> ret(A.shape());
    for (int i=0; i<A.extent(0); ++i) {
    for (int j=0; j<A.extent(1); ++j) {
    for (int k=0; k<A.extent(2); ++k) {
        ret(i,j,k) = ((*this)(A(A.lbound(0)+i, A.lbound(1)+j, A.lbound(2)+k)) ? 1 : 0);
    }}}
    return ret;
}

std::ostream &operator<<(std::ostream &out, Criterion const &crit)
{
    out << crit.field << " " << op_str(crit.op) << " " << crit.value;
    return out;
}

// ------------------------------------------------------------
/** Common domain of all data sets: (lon, lat, depth) bounds */
static std::array<Bounds,3> model_limits(
    std::vector<GeoData> const &datasets,
    ModelSize modelsize, ModelBox const &box)
{
    std::array<Bounds,3> ret;
    if (modelsize == ModelSize::EXPLICIT) {
        ret[0] = Bounds(std::min(box.lon.first, box.lon.second),
            std::max(box.lon.first, box.lon.second));
        ret[1] = Bounds(std::min(box.lat.first, box.lat.second),
            std::max(box.lat.first, box.lat.second));
        // Depth is given positive downwards
        ret[2] = Bounds(std::min(-box.depth.first, -box.depth.second),
            std::max(-box.depth.first, -box.depth.second));
        return ret;
    }

    for (int i=0; i<3; ++i) {
        auto const ext(datasets[0].extent(i));
        ret[i] = Bounds(ext[0], ext[1]);
    }
    for (size_t n=1; n<datasets.size(); ++n) {
        for (int i=0; i<3; ++i) {
            auto const ext(datasets[n].extent(i));
            if (modelsize == ModelSize::OVERLAPPING) {
                ret[i].first = std::max(ret[i].first, ext[0]);
                ret[i].second = std::min(ret[i].second, ext[1]);
            } else {
                ret[i].first = std::min(ret[i].first, ext[0]);
                ret[i].second = std::max(ret[i].second, ext[1]);
            }
        }
    }
    return ret;
}

static SubvolumeParams resample_params(
    std::array<Bounds,3> const &limits, std::array<int,3> const &dims)
{
    SubvolumeParams ret;
    ret.lon_level = limits[0];
    ret.lat_level = limits[1];
    ret.depth_level = limits[2];
    ret.interpolate = true;
    ret.dims = dims;
    return ret;
}

static CoordArrays common_grid(
    std::array<Bounds,3> const &limits, std::array<int,3> const &dims)
{
    return lonlatdepth_grid(
        linspace(limits[0].first, limits[0].second, dims[0]),
        linspace(limits[1].first, limits[1].second, dims[1]),
        linspace(limits[2].first, limits[2].second, dims[2]));
}

static ArrayT to_double(Array<int,3> const &A)
{
    ArrayT ret(A.shape());
    for (int i=0; i<A.extent(0); ++i)
    for (int j=0; j<A.extent(1); ++j)
    for (int k=0; k<A.extent(2); ++k)
        ret(i,j,k) = A(i,j,k);
    return ret;
}

static void check_count(char const *fn, size_t ndatasets, size_t nother, char const *what)
{
    if (ndatasets != nother) {
        (*geogrid_error)(ERR_INVALID_ARGUMENT,
            "%s: need the same number of %s (%d) as data sets (%d)",
            fn, what, (int)nother, (int)ndatasets);
    }
    if (ndatasets == 0) {
        (*geogrid_error)(ERR_INVALID_ARGUMENT, "%s: no data sets given", fn);
    }
}

GeoData vote_map(
    std::vector<GeoData> const &datasets,
    std::vector<std::string> const &criteria,
    VoteMapParams const &params)
{
    check_count("vote_map()", datasets.size(), criteria.size(), "criteria");

    std::vector<Criterion> crits;
    for (size_t i=0; i<criteria.size(); ++i) {
        crits.push_back(Criterion::parse(criteria[i]));
        check_field(datasets[i], crits.back().field);
    }

    auto const limits(model_limits(datasets, params.modelsize, params.box));
    SubvolumeParams const sp(resample_params(limits, params.dims));

    Array<int,3> votes(params.dims[0], params.dims[1], params.dims[2]);
    votes = 0;
    for (size_t i=0; i<datasets.size(); ++i) {
        GeoData const sub(extract_subvolume(datasets[i], sp));
        votes += crits[i].evaluate(sub);
    }

    CoordArrays const xyz(common_grid(limits, params.dims));
    FieldSet fields;
    fields.add("votemap", Field(to_double(votes)));
    return GeoData(xyz[0], xyz[1], xyz[2], fields);
}

GeoData vote_map(GeoData const &dataset, std::string const &criterion,
    VoteMapParams const &params)
{
    return vote_map(
        std::vector<GeoData>{dataset},
        std::vector<std::string>{criterion}, params);
}

// ------------------------------------------------------------
/** Mean and sample standard deviation over the masked cells */
struct MaskedStats {
    double mean;
    double stdev;

    MaskedStats(ArrayT const &A, Array<bool,3> const &mask)
    {
        double sum = 0;
        long n = 0;
        for (auto ii=A.begin(); ii != A.end(); ++ii) {
            if (!mask(ii.position())) continue;
            sum += *ii;
            ++n;
        }
        mean = (n == 0 ? NaN : sum / n);

        double ss = 0;
        for (auto ii=A.begin(); ii != A.end(); ++ii) {
            if (!mask(ii.position())) continue;
            double const d = *ii - mean;
            ss += d*d;
        }
        stdev = (n < 2 ? NaN : std::sqrt(ss / (n-1)));
    }
};

static bool inside(Bounds const &b, double x)
    { return b.first <= x && x <= b.second; }

StatisticalVotes statistical_votes(
    std::vector<GeoData> const &datasets,
    std::vector<std::string> const &field_names,
    StatVoteParams const &params)
{
    check_count("statistical_votes()", datasets.size(), field_names.size(), "field names");
    for (size_t i=0; i<datasets.size(); ++i)
        check_field(datasets[i], field_names[i]);

    // Depths are negative
    double const mindepth = (params.mindepth > 0 ? -params.mindepth : params.mindepth);
    double const t = params.threshold_stadev;

    auto const limits(model_limits(datasets, params.modelsize, params.box));
    SubvolumeParams const sp(resample_params(limits, params.dims));
    CoordArrays const xyz(common_grid(limits, params.dims));
    auto const shp(xyz[0].shape());

    Array<int,3> votes(shp);
    votes = 0;
    Array<int,3> coverage(shp);
    coverage = 0;

    for (size_t n=0; n<datasets.size(); ++n) {
        GeoData const &ds(datasets[n]);
        GeoData const sub(extract_subvolume(ds, sp));
        ArrayT A(sub.fields().at(field_names[n]).scalar().copy());

        // Original model boundaries
        Bounds box[3];
        for (int i=0; i<3; ++i) {
            auto const ext(ds.extent(i));
            box[i] = Bounds(ext[0], ext[1]);
        }

        // Zero is "no data"; so is anything outside the original model
        Array<bool,3> valid(shp);
        Array<bool,3> stats(shp);
        for (int i=0; i<shp[0]; ++i) {
        for (int j=0; j<shp[1]; ++j) {
        for (int k=0; k<shp[2]; ++k) {
            if (!inside(box[0], xyz[0](i,j,k)) ||
                !inside(box[1], xyz[1](i,j,k)) ||
                !inside(box[2], xyz[2](i,j,k)))
            {
                A(i,j,k) = 0;
            }
            valid(i,j,k) = (A(i,j,k) != 0);
            if (valid(i,j,k)) ++coverage(i,j,k);
            stats(i,j,k) = valid(i,j,k) && (xyz[2](i,j,k) < mindepth);
        }}}

        // Remove outliers from the statistics
        double const sigma0 = MaskedStats(A, stats).stdev;
        for (int i=0; i<shp[0]; ++i) {
        for (int j=0; j<shp[1]; ++j) {
        for (int k=0; k<shp[2]; ++k) {
            stats(i,j,k) = stats(i,j,k) && (std::abs(A(i,j,k)) < 5*sigma0);
        }}}

        if (params.meancorrection) A -= MaskedStats(A, stats).mean;
        double const sigma = MaskedStats(A, stats).stdev;
        if (std::isnan(sigma)) {
            fprintf(stderr, "statistical_votes(): too few cells with data in data set %d (%s); it casts no votes\n",
                (int)n, field_names[n].c_str());
        }

        for (int i=0; i<shp[0]; ++i) {
        for (int j=0; j<shp[1]; ++j) {
        for (int k=0; k<shp[2]; ++k) {
            if (!valid(i,j,k)) continue;
            bool const vote = (t > 0 ? A(i,j,k) > t*sigma : A(i,j,k) < t*sigma);
            if (vote) ++votes(i,j,k);
        }}}
    }

    return StatisticalVotes(xyz, votes, coverage);
}

GeoData StatisticalVotes::absolute() const
{
    FieldSet fields;
    fields.add("votemap", Field(to_double(_votes)));
    return GeoData(_coords[0], _coords[1], _coords[2], fields);
}

GeoData StatisticalVotes::relative() const
{
    ArrayT rel(_votes.shape());
    for (int i=0; i<rel.extent(0); ++i) {
    for (int j=0; j<rel.extent(1); ++j) {
    for (int k=0; k<rel.extent(2); ++k) {
        rel(i,j,k) = (_coverage(i,j,k) > 0 ?
            (double)_votes(i,j,k) / (double)_coverage(i,j,k) : 0.);
    }}}

    FieldSet fields;
    fields.add("votemap_relative", Field(rel));
    return GeoData(_coords[0], _coords[1], _coords[2], fields);
}

}   // namespace
