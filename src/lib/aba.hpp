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

#pragma once

#include "dung.hpp"
#include "utils.hpp"

#include <agora_export.h>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agora
{
    class ThreadPool;

    namespace aba
    {
        using Atom          = std::string;
        using AssumptionSet = utils::IdList; // canonical

        struct Rule
        {
            Atom              head;
            std::vector<Atom> body;
        };

        // A claim together with one minimal set of assumptions it can be derived from.
        struct Argument
        {
            std::string   id;
            Atom          claim;
            AssumptionSet support;
        };

        // Dung framework over the arguments of an ABA framework
        struct Translation
        {
            dung::ArgumentationFramework af;
            std::vector<Argument>        arguments; // ordered by (claim, support)

            const Argument* find(const std::string& id) const;
        };

        struct Solution
        {
            dung::Semantics              semantics{dung::Semantics::Grounded};
            std::vector<dung::Extension> extensions;  // argument ids
            std::vector<AssumptionSet>   assumptions; // union of the supports, per extension
            std::vector<std::vector<Atom>> claims;    // accepted claims, per extension
        };

        // Flat assumption-based argumentation framework.
        //
        // Assumptions, contraries and rules are registered in any order, except that an
        // assumption should be registered before the rules using it: add_rule rejects a
        // circular rule based on the assumptions known at that point. validate(), which
        // every reasoning method calls first, checks everything that depends on the
        // complete framework, circularity included.
        class AGORA_EXPORT Framework
        {
        public:
            explicit Framework(bool allow_circular_rules = false);

            void add_assumption(const Atom& assumption);
            void add_contrary(const Atom& assumption, const Atom& contrary);
            void add_rule(const Atom& head, const std::vector<Atom>& body = {});

            bool allows_circular_rules() const { return _allow_circular_rules; }
            void allow_circular_rules(bool allow) { _allow_circular_rules = allow; }

            bool                                     is_assumption(const Atom& atom) const;
            std::optional<Atom>                      contrary(const Atom& assumption) const;
            const std::vector<Atom>&                 assumptions() const { return _assumptions; }
            const std::vector<std::pair<Atom, Atom>>& contraries() const { return _contraries; }
            const std::vector<Rule>&                 rules() const { return _rules; }

            // every atom mentioned anywhere, sorted
            std::vector<Atom> language() const;

            void validate() const;

            // minimal assumption sets from which the atom is derivable, in canonical order
            std::vector<AssumptionSet> derive(const Atom& atom) const;

            std::vector<Argument> arguments() const;
            Translation           to_af() const;
            Solution              solve(dung::Semantics semantics, ThreadPool* pool = nullptr) const;

            static std::string argument_id(const Atom& claim, const AssumptionSet& support);

        private:
            using Memo = ankerl::unordered_dense::map<Atom, std::vector<AssumptionSet>>;

            bool                       reaches(const std::vector<Atom>& from, const Atom& target) const;
            std::vector<AssumptionSet> derive(const Atom& atom, std::vector<Atom>& path, Memo& memo, size_t& cut) const;

            bool                                       _allow_circular_rules;
            std::vector<Atom>                          _assumptions; // registration order
            ankerl::unordered_dense::set<Atom>         _assumption_set;
            std::vector<std::pair<Atom, Atom>>         _contraries; // registration order
            std::vector<Rule>                          _rules;
            ankerl::unordered_dense::map<Atom, std::vector<size_t>> _rules_by_head;
        };
    }
}
