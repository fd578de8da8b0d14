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
#include <geogrid/VoteMap.hpp>
#include <geogrid/Subvolume.hpp>
#include <geogrid/error.hpp>
#include "test_datasets.hpp"

using namespace geogrid;
using namespace geogrid::test;
using namespace blitz;

// The fixture for testing vote maps.
class VoteMapTest : public ::testing::Test {
protected:
    GeoData V;
    GeoData V_reverse;

    VoteMapTest() : V(volume()), V_reverse(volume(true)) {}

    /** The volume, with a velocity anomaly of sign*(lon-15) */
    GeoData anomaly(std::string const &name, double sign) const
    {
        ArrayT dv(V.lon().val.shape());
        dv = sign * (V.lon().val - 15.);
        return add_field(V, name, Field(dv, "km/s"));
    }

    ArrayT const &votes(GeoData const &vm) const
        { return vm.fields().at("votemap").scalar(); }
};

TEST_F(VoteMapTest, parse_criterion)
{
    Criterion const a(Criterion::parse("Vs >= 4.5"));
    EXPECT_EQ("Vs", a.field);
    EXPECT_EQ(Criterion::Op::GE, a.op);
    EXPECT_DOUBLE_EQ(4.5, a.value);
    EXPECT_TRUE(a(4.5));
    EXPECT_FALSE(a(4.4));

    Criterion const b(Criterion::parse("a!=1"));
    EXPECT_EQ("a", b.field);
    EXPECT_EQ(Criterion::Op::NE, b.op);
    EXPECT_TRUE(b(2.));
    EXPECT_FALSE(b(1.));

    Criterion const c(Criterion::parse("Depthdata<-560"));
    EXPECT_EQ(Criterion::Op::LT, c.op);
    EXPECT_DOUBLE_EQ(-560., c.value);

    std::stringstream buf;
    buf << a;
    EXPECT_EQ("Vs >= 4.5", buf.str());

    EXPECT_THROW(Criterion::parse("Vs 4.5"), InvalidCriterionError);
    EXPECT_THROW(Criterion::parse("Vs = 4.5"), InvalidCriterionError);
    EXPECT_THROW(Criterion::parse("< 4.5"), InvalidCriterionError);
    EXPECT_THROW(Criterion::parse("Vs < fast"), InvalidCriterionError);
}

TEST_F(VoteMapTest, evaluate)
{
    Array<int,3> const ind(Criterion::parse("LonData > 17").evaluate(V));
    EXPECT_EQ(0, ind(7,3,3));
    EXPECT_EQ(1, ind(8,3,3));
    EXPECT_THROW(Criterion::parse("Vp > 1").evaluate(V), InvalidCriterionError);
}

TEST_F(VoteMapTest, single_dataset)
{
    VoteMapParams params;
    params.dims = {{10, 10, 10}};

    GeoData const vm(vote_map(V, "Depthdata<-560", params));
    EXPECT_EQ(10, vm.shape()[0]);
    EXPECT_EQ(10, vm.shape()[2]);
    EXPECT_EQ(1., flat(votes(vm), 99));
    EXPECT_EQ(0., flat(votes(vm), 100));

    // Storage order of the input does not matter
    GeoData const rvm(vote_map(V_reverse, "Depthdata<-560", params));
    EXPECT_EQ(1., flat(votes(rvm), 99));
    EXPECT_EQ(0., flat(votes(rvm), 100));
    EXPECT_DOUBLE_EQ(-300., rvm.depth().val(0,0,0));
}

TEST_F(VoteMapTest, two_datasets)
{
    VoteMapParams params;
    params.dims = {{10, 10, 10}};
    GeoData const vm(vote_map(
        std::vector<GeoData>{V_reverse, V},
        std::vector<std::string>{"Depthdata<-560", "LonData>19"}, params));

    ArrayT const &v(votes(vm));
    EXPECT_EQ(2., v(9,8,0));
    EXPECT_EQ(1., v(8,8,0));
    EXPECT_EQ(0., v(8,8,1));
    EXPECT_EQ(1., v(9,8,1));

    // Criteria that always hold give the number of data sets
    GeoData const all(vote_map(
        std::vector<GeoData>{V, V_reverse},
        std::vector<std::string>{"LonData > 0", "Depthdata <= 0"}, params));
    EXPECT_EQ(2., min(votes(all)));
    EXPECT_EQ(2., max(votes(all)));
}

TEST_F(VoteMapTest, order_of_datasets)
{
    VoteMapParams params;
    params.dims = {{10, 10, 10}};
    GeoData const dvs(anomaly("dVs", 1.));

    GeoData const abc(vote_map(
        std::vector<GeoData>{V, V_reverse, dvs},
        std::vector<std::string>{"Depthdata<-560", "LonData>19", "dVs > 2"}, params));
    GeoData const cab(vote_map(
        std::vector<GeoData>{dvs, V, V_reverse},
        std::vector<std::string>{"dVs > 2", "Depthdata<-560", "LonData>19"}, params));

    EXPECT_TRUE(all(votes(abc) == votes(cab)));
    EXPECT_EQ(3., max(votes(abc)));

    StatVoteParams sparams;
    sparams.dims = {{11, 11, 13}};
    sparams.modelsize = ModelSize::MAXIMUM;
    SubvolumeParams sp;
    sp.lon_level = Bounds(10., 15.);
    GeoData const half(extract_subvolume(anomaly("dVp", -1.), sp));

    StatisticalVotes const sv1(statistical_votes(
        std::vector<GeoData>{dvs, anomaly("dVp", -1.), half},
        std::vector<std::string>{"dVs", "dVp", "dVp"}, sparams));
    StatisticalVotes const sv2(statistical_votes(
        std::vector<GeoData>{half, dvs, anomaly("dVp", -1.)},
        std::vector<std::string>{"dVp", "dVs", "dVp"}, sparams));

    EXPECT_TRUE(all(sv1.votes() == sv2.votes()));
    EXPECT_TRUE(all(sv1.coverage() == sv2.coverage()));
}

TEST_F(VoteMapTest, errors)
{
    EXPECT_THROW(vote_map(
        std::vector<GeoData>{V, V},
        std::vector<std::string>{"LonData > 0"}), InvalidArgumentError);
    EXPECT_THROW(vote_map(
        std::vector<GeoData>{},
        std::vector<std::string>{}), InvalidArgumentError);
    EXPECT_THROW(vote_map(V, "Vs > 4"), InvalidCriterionError);
    EXPECT_THROW(vote_map(V, "LonData >> 4"), InvalidCriterionError);
}

TEST_F(VoteMapTest, model_size)
{
    SubvolumeParams sp;
    sp.lon_level = Bounds(10., 15.);
    GeoData const half(extract_subvolume(V, sp));

    VoteMapParams params;
    params.dims = {{6, 6, 6}};

    params.modelsize = ModelSize::OVERLAPPING;
    GeoData const vm1(vote_map(
        std::vector<GeoData>{V, half},
        std::vector<std::string>{"LonData > 0", "LonData > 0"}, params));
    EXPECT_DOUBLE_EQ(10., vm1.extent(0)[0]);
    EXPECT_DOUBLE_EQ(15., vm1.extent(0)[1]);

    params.modelsize = ModelSize::MAXIMUM;
    GeoData const vm2(vote_map(
        std::vector<GeoData>{half, V},
        std::vector<std::string>{"LonData > 0", "LonData > 0"}, params));
    EXPECT_DOUBLE_EQ(10., vm2.extent(0)[0]);
    EXPECT_DOUBLE_EQ(20., vm2.extent(0)[1]);

    // Depth given positive downwards
    params.modelsize = ModelSize::EXPLICIT;
    params.box.lon = Bounds(12., 14.);
    params.box.lat = Bounds(33., 31.);
    params.box.depth = Bounds(0., 100.);
    GeoData const vm3(vote_map(V, "LonData > 13", params));
    EXPECT_DOUBLE_EQ(12., vm3.extent(0)[0]);
    EXPECT_DOUBLE_EQ(31., vm3.extent(1)[0]);
    EXPECT_DOUBLE_EQ(-100., vm3.extent(2)[0]);
    EXPECT_DOUBLE_EQ(0., vm3.extent(2)[1]);
    EXPECT_EQ(0., votes(vm3)(2,0,0));      // lon 12.8
    EXPECT_EQ(1., votes(vm3)(3,0,0));      // lon 13.2
}

TEST_F(VoteMapTest, statistical_votes)
{
    StatVoteParams params;
    params.dims = {{11, 11, 13}};

    StatisticalVotes const sv(statistical_votes(
        std::vector<GeoData>{anomaly("dVs", 1.), anomaly("dVp", -1.)},
        std::vector<std::string>{"dVs", "dVp"}, params));

    // Zero anomaly (lon 15) counts as no data
    EXPECT_EQ(0, sv.coverage()(5,3,3));
    EXPECT_EQ(2, sv.coverage()(4,3,3));

    // sigma is about 3.3: anomalies of 4 and 5 vote
    Array<int,3> const &v(sv.votes());
    EXPECT_EQ(1, v(10,3,3));
    EXPECT_EQ(1, v(9,3,3));
    EXPECT_EQ(0, v(8,3,3));
    EXPECT_EQ(1, v(0,3,3));        // From dVp
    EXPECT_EQ(0, v(5,3,3));
    EXPECT_EQ(1, v(10,3,12));      // Shallow cells vote too

    GeoData const abs(sv.absolute());
    EXPECT_EQ(1., abs.fields().at("votemap")[0](9,3,3));

    GeoData const rel(sv.relative());
    ArrayT const &r(rel.fields().at("votemap_relative").scalar());
    EXPECT_DOUBLE_EQ(0.5, r(9,3,3));
    EXPECT_DOUBLE_EQ(0., r(5,3,3));
    EXPECT_GE(min(r), 0.);
    EXPECT_LE(max(r), 1.);
}

TEST_F(VoteMapTest, statistical_votes_negative)
{
    StatVoteParams params;
    params.dims = {{11, 11, 13}};
    params.threshold_stadev = -1.;

    StatisticalVotes const sv(statistical_votes(
        std::vector<GeoData>{anomaly("dVs", 1.)},
        std::vector<std::string>{"dVs"}, params));
    EXPECT_EQ(1, sv.votes()(0,3,3));
    EXPECT_EQ(1, sv.votes()(1,3,3));
    EXPECT_EQ(0, sv.votes()(2,3,3));
    EXPECT_EQ(0, sv.votes()(10,3,3));
}

TEST_F(VoteMapTest, statistical_votes_coverage)
{
    GeoData const full(anomaly("dVs", 1.));
    SubvolumeParams sp;
    sp.lon_level = Bounds(10., 15.);
    GeoData const half(extract_subvolume(full, sp));

    StatVoteParams params;
    params.dims = {{11, 11, 13}};
    params.modelsize = ModelSize::MAXIMUM;
    StatisticalVotes const sv(statistical_votes(
        std::vector<GeoData>{full, half},
        std::vector<std::string>{"dVs", "dVs"}, params));

    // Outside the second data set, only the first one has data
    EXPECT_EQ(1, sv.coverage()(8,3,3));
    EXPECT_EQ(2, sv.coverage()(2,3,3));
    EXPECT_EQ(0, sv.coverage()(5,3,3));

    EXPECT_THROW(statistical_votes(
        std::vector<GeoData>{full},
        std::vector<std::string>{"dVs", "dVs"}), InvalidArgumentError);
    EXPECT_THROW(statistical_votes(
        std::vector<GeoData>{full},
        std::vector<std::string>{"Vs"}), InvalidCriterionError);
}

// ------------------------------------------------------------
int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
