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
#include "reasoner.hpp"

#include <catch2/catch.hpp>

#include <algorithm>

using namespace agora;
using namespace agora::reasoning;
using dung::Extension;
using dung::Label;

namespace
{
    // a and b attack each other, c stands alone
    graph::Graph two_cycle()
    {
        graph::GraphBuilder builder;
        builder.add_claim("a");
        builder.add_claim("b");
        builder.add_claim("c");
        builder.add_attack("a", "b");
        builder.add_attack("b", "a");
        return builder.freeze();
    }

    bool contains(const std::vector<std::string>& lines, const std::string& line)
    {
        return std::find(lines.begin(), lines.end(), line) != lines.end();
    }
}

TEST_CASE("Task names", "[reasoner]")
{
    REQUIRE(parse_task("bundle_extensions") == Task::BundleExtensions);
    REQUIRE(parse_task(" Bundles ") == Task::BundleExtensions);
    REQUIRE(parse_task("aba") == Task::AbaSolve);
    REQUIRE(parse_task(to_string(Task::Diagnostics)) == Task::Diagnostics);

    try
    {
        parse_task("summarize");
        FAIL("unknown task accepted");
    }
    catch (const configuration_error& e)
    {
        REQUIRE(e.get_option() == "task");
    }
}

TEST_CASE("Extensions with explanations", "[reasoner][dung]")
{
    const graph::Graph g = two_cycle();

    SECTION("grounded")
    {
        const Reasoner r(g);
        const auto     result = r.extensions();
        REQUIRE(result.extensions == std::vector<Extension>{{"c"}});
        REQUIRE(result.labelings[0].at("a") == Label::Undec);
    }

    SECTION("preferred")
    {
        const Reasoner r(g, Config::parse("semantics=preferred"));
        const auto     result = r.extensions();
        REQUIRE(result.semantics == dung::Semantics::Preferred);
        REQUIRE(result.extensions == std::vector<Extension>{{"a", "c"}, {"b", "c"}});
        REQUIRE(result.labelings.size() == 2);

        const auto& a = result.explanations[0].at("a");
        REQUIRE(a.label == Label::In);
        REQUIRE(a.attackers == std::vector<std::string>{"b"});
        REQUIRE(a.attacked_by_members.empty());
        REQUIRE(a.defenders == std::vector<std::string>{"a"});

        const auto& b = result.explanations[0].at("b");
        REQUIRE(b.label == Label::Out);
        REQUIRE(b.attacked_by_members == std::vector<std::string>{"a"});
        REQUIRE(b.defenders.empty());

        REQUIRE(r.labelings() == result.labelings);

        const auto lines = r.explain(r.run(Task::Extensions));
        REQUIRE(lines.front() == "extensions: 2 preferred extensions");
        REQUIRE(contains(lines, "extension {a, c}"));
        REQUIRE(contains(lines, "  a: in, defended by {a}"));
        REQUIRE(contains(lines, "  b: out, attacked by {a}"));
        REQUIRE(contains(lines, "  c: in"));
    }

    SECTION("threads do not change the result")
    {
        const Reasoner single(g, Config::parse("semantics=complete"));
        const Reasoner parallel(g, Config::parse("semantics=complete; threads=4"));
        REQUIRE(single.extensions().extensions == parallel.extensions().extensions);
        REQUIRE(single.extensions().extensions.size() == 3);
    }
}

TEST_CASE("Acceptance queries", "[reasoner][dung]")
{
    const graph::Graph g = two_cycle();
    const Reasoner     r(g, Config::parse("semantics=preferred"));

    const auto a = r.acceptance("a");
    REQUIRE_FALSE(a.skeptical);
    REQUIRE(a.credulous);
    REQUIRE(a.grounded_label == Label::Undec);

    const auto c = r.acceptance("c");
    REQUIRE(c.skeptical);
    REQUIRE(c.grounded_label == Label::In);

    REQUIRE_THROWS_AS(r.acceptance("zz"), structural_error);

    try
    {
        r.run(Task::Acceptance);
        FAIL("acceptance without argument accepted");
    }
    catch (const configuration_error& e)
    {
        REQUIRE(e.get_option() == "argument");
    }

    Query q;
    q.argument         = "b";
    const auto outcome = r.run(Task::Acceptance, q);
    REQUIRE(outcome.summary == "b: skeptical no, credulous yes");
    REQUIRE(contains(r.explain(outcome), "grounded label of b: undec"));
}

TEST_CASE("Several tasks in one call", "[reasoner]")
{
    const graph::Graph g = two_cycle();
    const Reasoner     r(g, Config::parse("semantics=preferred"));

    const auto outcomes = r.run({Task::Extensions, Task::BundleExtensions, Task::Credibility, Task::Diagnostics});
    REQUIRE(outcomes.size() == 4);

    REQUIRE(outcomes[0].extensions);
    REQUIRE_FALSE(outcomes[0].scores);

    const auto& bundled = *outcomes[1].bundle_extensions;
    REQUIRE(bundled.projection.bundles.size() == 3);
    REQUIRE(bundled.extensions.extensions == std::vector<Extension>{{"arg_1", "arg_3"}, {"arg_2", "arg_3"}});
    REQUIRE(outcomes[1].summary == "2 preferred extensions over 3 bundles");

    REQUIRE(outcomes[2].scores->converged);
    REQUIRE(outcomes[2].scores->scores.at("c") == Approx(0.0));

    REQUIRE(outcomes[3].report->cycle_count() == 1);
    REQUIRE(outcomes[3].summary == "3 units, 2 relations, 1 cycle");
    REQUIRE(contains(r.explain(outcomes[3]), "cycle a -> b"));
}

TEST_CASE("ABA tasks through the reasoner", "[reasoner][aba]")
{
    const graph::Graph g = two_cycle();

    SECTION("no framework attached")
    {
        const Reasoner r(g);
        REQUIRE_THROWS_AS(r.derive("x"), configuration_error);
        REQUIRE_THROWS_AS(r.dispute({"x"}), configuration_error);
        try
        {
            r.aba_solve();
            FAIL("solved without a framework");
        }
        catch (const configuration_error& e)
        {
            REQUIRE(e.get_option() == "framework");
        }
    }

    SECTION("solve, derive and dispute")
    {
        Reasoner       r(g);
        aba::Framework f = r.new_framework();
        f.add_assumption("a");
        f.add_contrary("a", "not_a");
        f.add_rule("b", {"a"});
        r.set_framework(&f);

        const auto solved = r.run(Task::AbaSolve);
        REQUIRE(solved.solution->claims[0] == std::vector<std::string>{"a", "b"});

        Query q;
        q.goals             = {"b"};
        const auto derived  = r.run(Task::Derive, q);
        REQUIRE(derived.derivations == std::vector<aba::AssumptionSet>{{"a"}});
        REQUIRE(derived.summary == "b: 1 minimal support");

        const auto disputed = r.run(Task::Dispute, q);
        REQUIRE(disputed.dispute->accepted);
        REQUIRE(disputed.summary == "{b} accepted");

        const auto lines = r.explain(disputed);
        REQUIRE(contains(lines, "defence {a}, culprits {}"));
        REQUIRE(contains(lines, "P: {a} |- b (won)"));

        try
        {
            r.run(Task::Dispute);
            FAIL("dispute without goals accepted");
        }
        catch (const configuration_error& e)
        {
            REQUIRE(e.get_option() == "goals");
        }
    }

    SECTION("circular rules follow the configuration")
    {
        const Reasoner r(g, Config::parse("allow_circular_rules=true"));
        aba::Framework f = r.new_framework();
        f.add_rule("p", {"q"});
        REQUIRE_NOTHROW(f.add_rule("q", {"p"}));
    }
}

TEST_CASE("Credibility explanation names the critical warrants", "[reasoner]")
{
    graph::GraphBuilder builder;
    builder.add_axiom("source", 1.0);
    builder.add_axiom("w1", 0.7, graph::UnitRole::Warrant);
    builder.add_axiom("w2", 0.3, graph::UnitRole::Warrant);
    builder.add_claim("t");
    builder.add_gated("source", "t", graph::RelationKind::Support, {"w1", "w2"}, graph::GateMode::And);

    const graph::Graph g = builder.freeze();
    const Reasoner     r(g);
    const auto         lines = r.explain(r.run(Task::Credibility));
    REQUIRE(contains(lines, "gate to t (AND): 0.3000, critical {w2}"));
    REQUIRE(contains(lines, "  support from source: gate closed"));
}

TEST_CASE("Non-convergence is reported", "[reasoner]")
{
    const graph::Graph       g = two_cycle();
    std::vector<std::string> messages;
    auto                     print = [&](const std::string& message, bool important)
    {
        if (important) messages.push_back(message);
    };

    SECTION("credibility")
    {
        const Reasoner r(g, Config::parse("max_iterations=0"), print);
        const auto     outcome = r.run(Task::Credibility);
        REQUIRE_FALSE(outcome.scores->converged);
        REQUIRE(outcome.summary == "not converged after 0 iterations");
        REQUIRE(messages.size() == 1);
    }

    SECTION("dispute")
    {
        Reasoner       r(g, Config::parse("semantics=preferred; dispute_max_depth=0"), print);
        aba::Framework f;
        f.add_assumption("a");
        f.add_assumption("c");
        f.add_contrary("a", "not_a");
        f.add_contrary("c", "not_c");
        f.add_rule("not_a", {"c"});
        f.add_rule("not_c", {"a"});
        r.set_framework(&f);

        const auto result = r.dispute({"a"});
        REQUIRE_FALSE(result.converged);
        REQUIRE(messages.size() == 1);
    }

    SECTION("converged runs stay quiet")
    {
        const Reasoner r(g, Config{}, print);
        r.propagate();
        REQUIRE(messages.empty());
    }
}

TEST_CASE("Invalid configuration is rejected up front", "[reasoner]")
{
    const graph::Graph g = two_cycle();

    Config config;
    config.gate_threshold = 2;
    REQUIRE_THROWS_AS(Reasoner(g, config), configuration_error);

    config         = Config{};
    config.threads = 0;
    REQUIRE_THROWS_AS(Reasoner(g, config), configuration_error);
}
