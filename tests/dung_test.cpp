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

#include "dung.hpp"
#include "errors.hpp"
#include "thread_pool.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <random>

using namespace agora;
using namespace agora::dung;

namespace
{
    ArgumentationFramework make(const std::vector<std::string>& arguments, const std::vector<std::pair<std::string, std::string>>& attacks)
    {
        ArgumentationFramework af;
        for (const auto& a : arguments) af.add_argument(a);
        for (const auto& [x, y] : attacks) af.add_attack(x, y);
        return af;
    }

    ArgumentationFramework random_framework(std::mt19937& rng, const int n, const double density)
    {
        std::bernoulli_distribution attack(density);

        ArgumentationFramework af;
        for (int i = 0; i < n; ++i) af.add_argument("a" + std::to_string(i));
        for (int i = 0; i < n; ++i)
            for (int j = 0; j < n; ++j)
                if (attack(rng)) af.add_attack("a" + std::to_string(i), "a" + std::to_string(j));
        return af;
    }

    // every subset S with F(S) = S that is conflict-free, by enumeration
    std::vector<Extension> complete_by_enumeration(const ArgumentationFramework& af)
    {
        const std::vector<std::string> args = af.arguments();
        std::vector<Extension>         result;

        for (unsigned bits = 0; bits < (1u << args.size()); ++bits)
        {
            Extension s;
            for (size_t i = 0; i < args.size(); ++i)
                if (bits & (1u << i)) s.push_back(args[i]);

            if (af.conflict_free(s) && af.characteristic(s) == s) result.push_back(s);
        }
        std::sort(result.begin(), result.end());
        return result;
    }

    bool subset(const Extension& a, const Extension& b)
    {
        return std::includes(b.begin(), b.end(), a.begin(), a.end());
    }
}

TEST_CASE("Single attack", "[dung]")
{
    const auto af = make({"A", "B"}, {{"A", "B"}});

    REQUIRE(af.grounded_extension() == Extension{"A"});
    REQUIRE(af.complete_extensions() == std::vector<Extension>{{"A"}});
    REQUIRE(af.preferred_extensions() == std::vector<Extension>{{"A"}});
    REQUIRE(af.stable_extensions() == std::vector<Extension>{{"A"}});

    const Labeling l = af.labeling_from_extension({"A"});
    REQUIRE(l.at("A") == Label::In);
    REQUIRE(l.at("B") == Label::Out);

    REQUIRE(af.skeptical_acceptance("A", Semantics::Preferred));
    REQUIRE_FALSE(af.credulous_acceptance("B", Semantics::Stable));
}

TEST_CASE("Symmetric two-cycle", "[dung]")
{
    const auto af = make({"A", "B"}, {{"A", "B"}, {"B", "A"}});

    REQUIRE(af.grounded_extension().empty());
    REQUIRE(af.complete_extensions() == std::vector<Extension>{{}, {"A"}, {"B"}});
    REQUIRE(af.preferred_extensions() == std::vector<Extension>{{"A"}, {"B"}});
    REQUIRE(af.stable_extensions() == std::vector<Extension>{{"A"}, {"B"}});

    const auto grounded = af.labelings(Semantics::Grounded);
    REQUIRE(grounded.size() == 1);
    REQUIRE(grounded[0].at("A") == Label::Undec);
    REQUIRE(grounded[0].at("B") == Label::Undec);

    REQUIRE(af.credulous_acceptance("A", Semantics::Preferred));
    REQUIRE_FALSE(af.skeptical_acceptance("A", Semantics::Preferred));
    REQUIRE_FALSE(af.credulous_acceptance("A", Semantics::Grounded));
}

TEST_CASE("Odd cycle has no stable extension", "[dung]")
{
    const auto af = make({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}, {"c", "a"}});

    REQUIRE(af.grounded_extension().empty());
    REQUIRE(af.preferred_extensions() == std::vector<Extension>{{}});
    REQUIRE(af.stable_extensions().empty());

    // no extensions: skeptical acceptance holds vacuously, credulous does not
    REQUIRE(af.skeptical_acceptance("a", Semantics::Stable));
    REQUIRE_FALSE(af.credulous_acceptance("a", Semantics::Stable));
}

TEST_CASE("Self-attacking argument and reinstatement", "[dung]")
{
    // c attacks b, b attacks a, d attacks itself and c
    const auto af = make({"a", "b", "c", "d"}, {{"c", "b"}, {"b", "a"}, {"d", "d"}, {"d", "c"}});

    REQUIRE(af.grounded_extension().empty());
    REQUIRE(af.preferred_extensions() == std::vector<Extension>{{}});

    const auto af2 = make({"a", "b", "c"}, {{"c", "b"}, {"b", "a"}});
    REQUIRE(af2.grounded_extension() == Extension{"a", "c"});
    REQUIRE(af2.defended_by({"c"}, "a"));
    REQUIRE_FALSE(af2.defended_by({}, "a"));
    REQUIRE(af2.characteristic({"c"}) == Extension{"a", "c"});
}

TEST_CASE("Set predicates", "[dung]")
{
    const auto af = make({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}});

    REQUIRE(af.conflict_free({"a", "c"}));
    REQUIRE_FALSE(af.conflict_free({"a", "b"}));
    REQUIRE(af.admissible({"a", "c"}));
    REQUIRE_FALSE(af.admissible({"c"}));
    REQUIRE(af.stable({"a", "c"}));
    REQUIRE_FALSE(af.stable({"a"}));

    REQUIRE(af.attackers_of("b") == Extension{"a"});
    REQUIRE(af.attacks_of("b") == Extension{"c"});
    REQUIRE(af.attacks("a", "b"));
    REQUIRE_FALSE(af.attacks("b", "a"));
}

TEST_CASE("Unknown arguments are structural errors", "[dung][errors]")
{
    ArgumentationFramework af;
    af.add_argument("a");
    af.add_argument("a");
    REQUIRE(af.count() == 1);

    REQUIRE_THROWS_AS(af.add_attack("a", "b"), structural_error);
    REQUIRE_THROWS_AS(af.add_argument(""), structural_error);
    REQUIRE_THROWS_AS(af.skeptical_acceptance("b", Semantics::Grounded), structural_error);
    REQUIRE_THROWS_AS(af.conflict_free({"a", "x"}), structural_error);
}

TEST_CASE("Semantics names", "[dung]")
{
    REQUIRE(parse_semantics("Preferred") == Semantics::Preferred);
    REQUIRE(to_string(Semantics::Stable) == "stable");
    REQUIRE_THROWS_AS(parse_semantics("ideal"), std::invalid_argument);
}

TEST_CASE("Extension inclusions on random frameworks", "[dung][random]")
{
    std::mt19937 rng(20260101);

    for (int round = 0; round < 60; ++round)
    {
        const int  n  = 1 + round % 8;
        const auto af = random_framework(rng, n, round % 3 == 0 ? 0.15 : 0.3);

        const Extension              grounded  = af.grounded_extension();
        const std::vector<Extension> complete  = af.complete_extensions();
        const std::vector<Extension> preferred = af.preferred_extensions();
        const std::vector<Extension> stable    = af.stable_extensions();

        REQUIRE(complete == complete_by_enumeration(af));
        REQUIRE(std::is_sorted(complete.begin(), complete.end()));

        // grounded is the least complete extension
        REQUIRE(std::find(complete.begin(), complete.end(), grounded) != complete.end());
        for (const Extension& c : complete) REQUIRE(subset(grounded, c));

        for (const Extension& s : stable)
        {
            REQUIRE(af.stable(s));
            REQUIRE(std::find(preferred.begin(), preferred.end(), s) != preferred.end());
        }

        REQUIRE_FALSE(preferred.empty());
        for (const Extension& p : preferred)
        {
            REQUIRE(af.admissible(p));
            REQUIRE(af.conflict_free(p));
            for (const Extension& c : complete)
            {
                if (c != p) REQUIRE_FALSE((subset(p, c) && p.size() < c.size()));
            }
        }

        // labels follow the extension
        for (const Extension& c : complete)
        {
            const Labeling l = af.labeling_from_extension(c);
            REQUIRE(l.size() == af.count());
            for (const auto& [argument, label] : l)
            {
                const bool member = std::binary_search(c.begin(), c.end(), argument);
                REQUIRE((label == Label::In) == member);
            }
        }
    }
}

TEST_CASE("Parallel search returns the same extensions", "[dung][threads]")
{
    std::mt19937 rng(7);
    ThreadPool   pool(4);

    for (int round = 0; round < 20; ++round)
    {
        const auto af = random_framework(rng, 6 + round % 5, 0.2);

        REQUIRE(af.complete_extensions(&pool) == af.complete_extensions());
        REQUIRE(af.preferred_extensions(&pool) == af.preferred_extensions());
        REQUIRE(af.stable_extensions(&pool) == af.stable_extensions());
    }
}
