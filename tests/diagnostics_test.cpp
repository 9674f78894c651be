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

#include "diagnostics.hpp"

#include <catch2/catch.hpp>

using namespace agora;
using namespace agora::graph;
using utils::IdList;

TEST_CASE("Structural report", "[diagnostics]")
{
    GraphBuilder builder;
    builder.add_claim("A");
    builder.add_claim("B");
    builder.add_claim("C");
    builder.add_claim("D");
    builder.add_attack("A", "B");
    builder.add_attack("B", "A", RelationKind::Rebut);
    builder.add_support("C", "A");

    const auto r = diagnostics::diagnose(builder.freeze());

    REQUIRE(r.node_count == 4);
    REQUIRE(r.relation_count == 3);
    REQUIRE(r.attack_edge_count == 2);
    REQUIRE(r.support_edge_count == 1);

    REQUIRE(r.cycle_count() == 1);
    REQUIRE(r.cycles[0] == IdList{"A", "B"});

    REQUIRE(r.component_count() == 2);
    REQUIRE(r.components == std::vector<IdList>{{"A", "B", "C"}, {"D"}});

    REQUIRE(r.scc_count() == 3);
    REQUIRE(r.strongly_connected.back() == IdList{"A", "B"});

    REQUIRE(r.isolated_units == IdList{"D"});
    REQUIRE(r.unsupported_units == IdList{"B", "C", "D"});

    REQUIRE(r.reachability.at("A") == IdList{"A", "B"});
    REQUIRE(r.reachability.at("C") == IdList{"A", "B"});
    REQUIRE(r.reachability.at("D").empty());

    REQUIRE(r.degrees.at("A").in == 2);
    REQUIRE(r.degrees.at("A").out == 1);
    REQUIRE(r.degrees.at("D").in == 0);
    REQUIRE(r.degree_summary.max_in == 2);
    REQUIRE(r.degree_summary.max_out == 1);
    REQUIRE(r.degree_summary.avg_in == Approx(0.75));

    REQUIRE(r.warnings.empty());
}

TEST_CASE("Cycles are reported once", "[diagnostics]")
{
    GraphBuilder builder;
    builder.add_claim("x");
    builder.add_claim("y");
    builder.add_claim("z");
    builder.add_support("y", "z");
    builder.add_support("z", "x");
    builder.add_support("x", "y");
    builder.add_attack("z", "z");

    const auto r = diagnostics::diagnose(builder.freeze());
    REQUIRE(r.cycles == std::vector<IdList>{{"x", "y", "z"}, {"z"}});
    REQUIRE(r.scc_count() == 1);
    REQUIRE(r.isolated_units.empty());
}

TEST_CASE("Axioms are flagged", "[diagnostics]")
{
    GraphBuilder builder;
    builder.add_axiom("fact", 1.0);
    builder.add_axiom("rule", 0.9, UnitRole::Warrant);
    builder.add_claim("c");
    builder.add_gated("fact", "c", RelationKind::Support, {"rule"}, GateMode::Or);

    const auto r = diagnostics::diagnose(builder.freeze());
    REQUIRE(r.axiom_claims == IdList{"fact"});
    REQUIRE(r.axiom_warrants == IdList{"rule"});
    REQUIRE(r.warnings == std::vector<std::string>{"axiom claim 'fact' bypasses evidence requirements.",
                                                   "axiom warrant 'rule' bypasses evidence requirements."});
    // warrants gate relations but are not endpoints
    REQUIRE(r.isolated_units == IdList{"rule"});
}
