/*
Copyright (c) 2025, 2026 acrion innovations GmbH
Authors: Stefan Zipproth, s.zipproth@acrion.ch

This file is part of agora.

agora is offered under a commercial and under the AGPL license.
For commercial licensing, contact us at https://acrion.ch/sales. For AGPL licensing, see below.

AGPL licensing:

agora is free software: you can redistribute it and/or modify
it under the terms of the GNU Affero General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

agora is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
GNU Affero General Public License for more details.

You should have received a copy of the GNU Affero General Public License
along with agora. If not, see <https://www.gnu.org/licenses/>.
*/

#include "errors.hpp"
#include "graph.hpp"

#include <catch2/catch.hpp>

using namespace agora;
using namespace agora::graph;

namespace
{
    std::string offending_id(const GraphBuilder& builder)
    {
        try
        {
            builder.freeze();
        }
        catch (const structural_error& e)
        {
            return e.get_id();
        }
        return "<no error>";
    }
}

TEST_CASE("Frozen graph resolves ids and adjacency", "[graph]")
{
    GraphBuilder builder;
    builder.add_claim("a", "the first claim", UnitType::Fact);
    builder.add_claim("b");
    builder.add_warrant("w");
    builder.add_support("a", "b", 0.5);
    builder.add_attack("b", "a", RelationKind::Undercut);
    builder.add_gated("a", "b", RelationKind::Rebut, {"w"}, GateMode::And);

    const Graph g = builder.freeze();

    REQUIRE(g.count() == 3);
    REQUIRE(g.node("b") == 1);
    REQUIRE(g.id(0) == "a");
    REQUIRE(g.unit(0).text == "the first claim");
    REQUIRE(g.unit(0).type == UnitType::Fact);
    REQUIRE(g.is_warrant(g.node("w")));
    REQUIRE_FALSE(g.find("missing").has_value());
    REQUIRE_THROWS_AS(g.node("missing"), structural_error);

    REQUIRE(g.relations().size() == 3);
    REQUIRE(g.outgoing(0) == std::vector<std::size_t>{0, 2});
    REQUIRE(g.incoming(1) == std::vector<std::size_t>{0, 2});
    REQUIRE(g.incoming(0) == std::vector<std::size_t>{1});
    REQUIRE(g.edge(2).warrants == NodeList{2});
    REQUIRE(g.edge(2).gate_mode == GateMode::And);
    REQUIRE(g.edge(0).magnitude == Approx(0.5));
}

TEST_CASE("Signed relation weights", "[graph]")
{
    Relation r;
    REQUIRE(r.signed_weight() == Approx(1.0));

    r.weight = -0.25;
    REQUIRE(r.signed_weight() == Approx(0.25));

    r.kind = RelationKind::Rebut;
    REQUIRE(r.signed_weight() == Approx(-0.25));

    REQUIRE(is_attack(RelationKind::Undercut));
    REQUIRE_FALSE(is_attack(RelationKind::Support));
}

TEST_CASE("Freeze rejects structural defects", "[graph][errors]")
{
    GraphBuilder builder;
    builder.add_claim("a");
    builder.add_claim("b");

    SECTION("dangling relation endpoint")
    {
        builder.add_support("a", "ghost");
        REQUIRE(offending_id(builder) == "ghost");
    }

    SECTION("dangling warrant")
    {
        builder.add_gated("a", "b", RelationKind::Support, {"w"}, GateMode::Or);
        REQUIRE(offending_id(builder) == "w");
    }

    SECTION("warrant id naming a claim")
    {
        builder.add_gated("a", "b", RelationKind::Support, {"a"}, GateMode::Or);
        REQUIRE(offending_id(builder) == "a");
    }

    SECTION("duplicate unit")
    {
        builder.add_claim("b");
        REQUIRE(offending_id(builder) == "b");
    }

    SECTION("axiom without score")
    {
        builder.unit("a").is_axiom = true;
        REQUIRE(offending_id(builder) == "a");
    }

    SECTION("empty evidence bounds")
    {
        builder.unit("b").evidence_min = 0.8;
        builder.unit("b").evidence_max = 0.2;
        REQUIRE(offending_id(builder) == "b");
    }

    SECTION("evidence for an unknown unit")
    {
        builder.attach_evidence("c", EvidenceItem{"e1", Stance::Supports, 0.5});
        REQUIRE(offending_id(builder) == "c");
    }

    SECTION("unit in two bundles")
    {
        builder.define_bundle("x", {"a"});
        builder.define_bundle("y", {"a", "b"});
        REQUIRE(offending_id(builder) == "a");
    }

    SECTION("bundle with unknown member")
    {
        builder.define_bundle("x", {"a", "z"});
        REQUIRE(offending_id(builder) == "z");
    }

    SECTION("empty bundle")
    {
        builder.define_bundle("x", {});
        REQUIRE(offending_id(builder) == "x");
    }
}

TEST_CASE("Builder keeps intermediate states unchecked", "[graph]")
{
    GraphBuilder builder;
    builder.add_support("a", "b");
    REQUIRE(builder.relation_count() == 1);

    builder.add_claim("a");
    builder.add_claim("b");
    REQUIRE_NOTHROW(builder.freeze());

    REQUIRE_THROWS_AS(builder.add_attack("a", "b", RelationKind::Support), std::invalid_argument);
    REQUIRE_THROWS_AS(builder.unit("c"), std::invalid_argument);
}

TEST_CASE("Evidence is attached to the frozen unit", "[graph]")
{
    GraphBuilder builder;
    builder.add_claim("a");
    builder.attach_evidence("a", EvidenceItem{"e1", Stance::Supports, 0.7});
    builder.attach_evidence("a", EvidenceItem{"e2", Stance::Attacks, std::nullopt});

    const Graph g = builder.freeze();
    REQUIRE(g.unit(0).evidence.size() == 2);
    REQUIRE(g.unit(0).evidence[1].stance == Stance::Attacks);
}

TEST_CASE("Enum names parse back", "[graph]")
{
    REQUIRE(parse_relation_kind(" Undercut ") == RelationKind::Undercut);
    REQUIRE(parse_gate_mode("and") == GateMode::And);
    REQUIRE(parse_unit_type(to_string(UnitType::Policy)) == UnitType::Policy);
    REQUIRE(parse_stance("neutral") == Stance::Neutral);
    REQUIRE_THROWS_AS(parse_relation_kind("defeats"), std::invalid_argument);
}
