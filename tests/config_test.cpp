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

#include "config.hpp"
#include "errors.hpp"

#include <catch2/catch.hpp>

using namespace agora;

namespace
{
    std::string rejected_option(const std::string& text)
    {
        try
        {
            Config::parse(text);
        }
        catch (const configuration_error& e)
        {
            return e.get_option();
        }
        return "<accepted>";
    }
}

TEST_CASE("Config defaults", "[config]")
{
    const Config c;
    REQUIRE(c.semantics == dung::Semantics::Grounded);
    REQUIRE(c.bundle_aggregation == bundles::Aggregation::SumClamp);
    REQUIRE(c.gate_threshold == 0.5);
    REQUIRE(c.max_iterations == 100);
    REQUIRE(c.convergence_epsilon == 1e-6);
    REQUIRE(c.dispute_max_depth == 32);
    REQUIRE(c.threads == 1);
    REQUIRE_FALSE(c.allow_circular_rules);
    REQUIRE_NOTHROW(c.validate());
}

TEST_CASE("Config parsing", "[config]")
{
    const Config c = Config::parse("semantics = \"Preferred\"; Gate-Threshold=0.7\n"
                                   "bundle_aggregation=max; max_iterations=20;;"
                                   "allow_circular_rules=yes; threads=3; record_history=on");

    REQUIRE(c.semantics == dung::Semantics::Preferred);
    REQUIRE(c.gate_threshold == Approx(0.7));
    REQUIRE(c.bundle_aggregation == bundles::Aggregation::Max);
    REQUIRE(c.max_iterations == 20);
    REQUIRE(c.allow_circular_rules);
    REQUIRE(c.threads == 3);
    REQUIRE(c.record_history);
    REQUIRE_FALSE(c.verbose);

    REQUIRE(Config::parse("").to_string() == Config().to_string());
}

TEST_CASE("Invalid options name the option", "[config]")
{
    REQUIRE(rejected_option("Foo=1") == "foo");
    REQUIRE(rejected_option("semantics") == "semantics");
    REQUIRE(rejected_option("max_iterations=-1") == "max_iterations");
    REQUIRE(rejected_option("max_iterations=abc") == "max_iterations");
    REQUIRE(rejected_option("gate_threshold=1.5") == "gate_threshold");
    REQUIRE(rejected_option("semantics=ideal") == "semantics");
    REQUIRE(rejected_option("bundle_aggregation=median") == "bundle_aggregation");
    REQUIRE(rejected_option("threads=0") == "threads");
    REQUIRE(rejected_option("verbose=maybe") == "verbose");
    REQUIRE(rejected_option("convergence_epsilon=0") == "convergence_epsilon");
    REQUIRE(rejected_option("dispute_max_depth=-2") == "dispute_max_depth");
    REQUIRE(rejected_option("evidence_min=0.8; evidence_max=0.2") == "evidence_min");
    REQUIRE(rejected_option("lambda=0.25") == "<accepted>");
}

TEST_CASE("Config text round trip", "[config]")
{
    Config c;
    c.set("semantics", "stable");
    c.set("bundle-aggregation", "mean");
    c.set("lambda", "0.25");
    c.set("dispute_max_depth", "8");
    c.set("verbose", "true");

    const Config back = Config::parse(c.to_string());
    REQUIRE(back.to_string() == c.to_string());
    REQUIRE(back.semantics == dung::Semantics::Stable);
    REQUIRE(back.dispute_max_depth == 8);
}

TEST_CASE("Credibility parameters from config", "[config][credibility]")
{
    const Config c = Config::parse("lambda=0.3; gate_threshold=0.6; max_iterations=7; evidence_max=0.9");
    const auto   p = c.credibility_parameters();

    REQUIRE(p.lambda == Approx(0.3));
    REQUIRE(p.gate_threshold == Approx(0.6));
    REQUIRE(p.max_iterations == 7);
    REQUIRE(p.evidence_min == 0);
    REQUIRE(p.evidence_max == Approx(0.9));
    REQUIRE(p.convergence_epsilon == c.convergence_epsilon);
}
