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

#include "graph.hpp"

#include <agora_export.h>

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace agora
{
    class ThreadPool;

    namespace bundles
    {
        struct BundleGraph;
    }

    namespace dung
    {
        enum class Semantics
        {
            Grounded,
            Complete,
            Preferred,
            Stable
        };

        enum class Label
        {
            In,
            Out,
            Undec
        };

        // argument ids, sorted ascending
        using Extension = std::vector<std::string>;
        using Labeling  = std::map<std::string, Label>;

        std::string AGORA_EXPORT to_string(Semantics semantics);
        std::string AGORA_EXPORT to_string(Label label);
        Semantics AGORA_EXPORT   parse_semantics(const std::string& name);

        // Abstract argumentation framework: a set of arguments and a binary attack relation.
        //
        // Every method taking argument ids throws structural_error for an id that is not
        // part of the framework. Methods returning several extensions order them
        // canonically: members ascending, extensions lexicographically by their members.
        // Passing a ThreadPool splits the search for complete extensions into
        // independent branches, which does not change the result.
        class AGORA_EXPORT ArgumentationFramework
        {
        public:
            ArgumentationFramework() = default;

            // units become arguments, attack/undercut/rebut relations become attacks
            static ArgumentationFramework from_graph(const graph::Graph& graph);

            // bundles become arguments, cross-bundle edges with negative weight become attacks
            static ArgumentationFramework from_bundles(const bundles::BundleGraph& bundle_graph);

            void add_argument(const std::string& argument);
            void add_attack(const std::string& attacker, const std::string& target);

            size_t                          count() const { return _arguments.size(); }
            bool                            has_argument(const std::string& argument) const;
            std::vector<std::string>        arguments() const;
            std::vector<std::pair<std::string, std::string>> attack_list() const;
            bool                            attacks(const std::string& attacker, const std::string& target) const;
            Extension                       attackers_of(const std::string& argument) const;
            Extension                       attacks_of(const std::string& argument) const;

            bool      conflict_free(const Extension& s) const;
            bool      defended_by(const Extension& s, const std::string& argument) const;
            bool      admissible(const Extension& s) const;
            bool      stable(const Extension& s) const;
            Extension characteristic(const Extension& s) const;

            Extension              grounded_extension() const;
            std::vector<Extension> complete_extensions(ThreadPool* pool = nullptr) const;
            std::vector<Extension> preferred_extensions(ThreadPool* pool = nullptr) const;
            std::vector<Extension> stable_extensions(ThreadPool* pool = nullptr) const;
            std::vector<Extension> extensions(Semantics semantics, ThreadPool* pool = nullptr) const;

            // the only place where labelings are derived from extensions
            Labeling              labeling_from_extension(const Extension& s) const;
            std::vector<Labeling> labelings(Semantics semantics, ThreadPool* pool = nullptr) const;

            bool skeptical_acceptance(const std::string& argument, Semantics semantics, ThreadPool* pool = nullptr) const;
            bool credulous_acceptance(const std::string& argument, Semantics semantics, ThreadPool* pool = nullptr) const;

        private:
            using Index = uint32_t;
            using Mask  = std::vector<uint8_t>;

            Index     index(const std::string& argument) const;
            Mask      to_mask(const Extension& s) const;
            Extension to_extension(const Mask& m) const;
            bool      attacks(Index a, Index b) const;
            bool      conflict_free(const Mask& m) const;
            bool      defended(const Mask& m, Index a) const;
            bool      admissible(const Mask& m) const;
            Mask      characteristic(const Mask& m) const;
            Mask      grounded_mask() const;
            std::vector<Mask> complete_masks(ThreadPool* pool) const;
            std::vector<Mask> preferred_masks(ThreadPool* pool) const;
            std::vector<Extension> canonical(const std::vector<Mask>& masks) const;

            class Search;

            std::vector<std::string>                         _arguments; // insertion order
            ankerl::unordered_dense::map<std::string, Index> _index;
            std::vector<std::vector<Index>>                  _attackers;
            std::vector<std::vector<Index>>                  _targets;
            ankerl::unordered_dense::set<uint64_t>           _attack_set;
        };
    }
}
