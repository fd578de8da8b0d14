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

#ifndef GEOGRID_VOTEMAP_HPP
#define GEOGRID_VOTEMAP_HPP

#include <array>
#include <string>
#include <vector>
#include <iostream>
#include <geogrid/GridData.hpp>
#include <geogrid/gridutil.hpp>

namespace geogrid {

/** A pointwise test of one field against a constant, eg: "Vs > 1.0" */
struct Criterion {
    enum class Op { LT, LE, GT, GE, EQ, NE };

    std::string field;
    Op op;
    double value;

    /** Parses "field op value", with op one of < <= > >= == !=.
    Whitespace around the operator is optional.
    @throws InvalidCriterionError if the text does not parse. */
    static Criterion parse(std::string const &text);

    bool operator()(double v) const;

    /** 1 where the criterion holds for the named field of V, 0 elsewhere.
    @throws InvalidCriterionError if V has no such field. */
    blitz::Array<int,3> evaluate(GridData const &V) const;
};

std::ostream &operator<<(std::ostream &out, Criterion const &crit);

/** How to choose the common domain of several data sets */
enum class ModelSize {
    OVERLAPPING,    // Intersection of all extents
    MAXIMUM,        // Union of all extents
    EXPLICIT        // Given by the caller
};

/** Explicit domain.  Depth is given positive downwards (eg: (0,400)). */
struct ModelBox {
    Bounds lon;
    Bounds lat;
    Bounds depth;
};

struct VoteMapParams {
    /** Size of the common grid */
    std::array<int,3> dims;
    ModelSize modelsize;
    /** Only used with ModelSize::EXPLICIT */
    ModelBox box;

    VoteMapParams() : dims{{50,50,50}}, modelsize(ModelSize::OVERLAPPING) {}
};

/** Interpolates every data set onto a common grid and counts, at every
point, how many data sets fulfill their criterion.
@param criteria One per data set, eg: "Vs > 4.5"
@return Grid with the integer-valued field "votemap"
@throws InvalidArgumentError if criteria and datasets differ in number
@throws InvalidCriterionError */
GeoData vote_map(
    std::vector<GeoData> const &datasets,
    std::vector<std::string> const &criteria,
    VoteMapParams const &params = VoteMapParams());

GeoData vote_map(GeoData const &dataset, std::string const &criterion,
    VoteMapParams const &params = VoteMapParams());

// ------------------------------------------------------------
struct StatVoteParams {
    std::array<int,3> dims;
    /** Votes where the (mean corrected) anomaly exceeds
    threshold_stadev * standard deviation; if negative, where it is
    below. */
    double threshold_stadev;
    /** Subtract the mean of each data set first */
    bool meancorrection;
    ModelSize modelsize;
    ModelBox box;
    /** Shallower than this (km, either sign), cells are left out of the
    statistics. */
    double mindepth;

    StatVoteParams() :
        dims{{50,50,50}}, threshold_stadev(1.0), meancorrection(true),
        modelsize(ModelSize::OVERLAPPING), mindepth(0.) {}
};

/** Result of statistical_votes() */
class StatisticalVotes {
    CoordArrays _coords;
    blitz::Array<int,3> _votes;
    /** Number of data sets with data at each point */
    blitz::Array<int,3> _coverage;

public:
    StatisticalVotes(CoordArrays const &coords,
        blitz::Array<int,3> const &votes, blitz::Array<int,3> const &coverage) :
        _coords(coords), _votes(votes), _coverage(coverage) {}

    blitz::Array<int,3> const &votes() const { return _votes; }
    blitz::Array<int,3> const &coverage() const { return _coverage; }

    /** Grid with the vote count in field "votemap" */
    GeoData absolute() const;

    /** Grid with votes / coverage in field "votemap_relative" (0 where
    no data set has data) */
    GeoData relative() const;
};

/** Vote map based on the statistics of each data set, rather than on
fixed criteria: a data set votes at a point if its anomaly there is
significant, relative to its own standard deviation.  Zero values are
taken to mean "no data".
@param field_names The field to use from each data set
@throws InvalidArgumentError if field_names and datasets differ in number
@throws InvalidCriterionError if a data set lacks its field */
StatisticalVotes statistical_votes(
    std::vector<GeoData> const &datasets,
    std::vector<std::string> const &field_names,
    StatVoteParams const &params = StatVoteParams());

}   // namespace

#endif    // guard
