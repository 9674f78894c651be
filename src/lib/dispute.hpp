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

#include "aba.hpp"

#include <agora_export.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace agora
{
    class ThreadPool;

    namespace aba
    {
        enum class Move
        {
            Proponent,
            Opponent
        };

        enum class Status
        {
            Won,        // proponent move whose every attack was answered
            Failed,     // proponent move with an unanswered attack
            Countered,  // opponent move answered by a proponent counter-attack
            Defeated,   // opponent move using an assumption that is already a culprit
            Unanswered, // opponent move the proponent could not answer
            Truncated   // depth bound reached
        };

        std::string AGORA_EXPORT to_string(Move move);
        std::string AGORA_EXPORT to_string(Status status);

        struct DisputeNode
        {
            Move                move{Move::Proponent};
            std::string         claim;       // for the root, the goals separated by ", "
            AssumptionSet       assumptions; // support of the move
            Atom                target;      // assumption attacked by this move, empty for the root
            Status              status{Status::Won};
            size_t              depth{0};
            std::vector<size_t> children; // indices into DisputeTree::nodes()
        };

        // Immutable record of one dispute. Node 0 is the root. The tree keeps a copy of
        // the assumptions, contraries and rules its moves rely on, so it stays readable
        // after the framework it was derived from is gone.
        class AGORA_EXPORT DisputeTree
        {
        public:
            const DisputeNode&              root() const { return _nodes.front(); }
            const DisputeNode&              node(size_t index) const { return _nodes.at(index); }
            const std::vector<DisputeNode>& nodes() const { return _nodes; }
            size_t                          size() const { return _nodes.size(); }

            bool                 won() const { return _won; }
            const AssumptionSet& defence() const { return _defence; }
            const AssumptionSet& culprits() const { return _culprits; }

            const AssumptionSet&                      assumptions() const { return _assumptions; }
            const std::vector<std::pair<Atom, Atom>>& contraries() const { return _contraries; }
            const std::vector<Rule>&                  rules() const { return _rules; }

            // one line per move, indented by depth
            std::string format() const;

        private:
            friend class DisputeBuilder;

            std::vector<DisputeNode>           _nodes;
            bool                               _won{false};
            AssumptionSet                      _defence;
            AssumptionSet                      _culprits;
            AssumptionSet                      _assumptions;
            std::vector<std::pair<Atom, Atom>> _contraries;
            std::vector<Rule>                  _rules;
        };

        struct DisputeResult
        {
            std::vector<Atom>        goals;
            dung::Semantics          semantics{dung::Semantics::Grounded};
            bool                     accepted{false};
            bool                     converged{true}; // false if the depth bound left the outcome open
            std::vector<DisputeTree> trees;           // one per candidate support of the goals
            size_t                   moves{0};        // number of moves tried during the search

            // first won tree, nullptr if the goals are not accepted
            const DisputeTree* winning() const;
        };

        // Searches for a dispute tree for the goals directly on the framework, without
        // translation into a Dung framework.
        //
        // Grounded semantics answers every attack on its own branch and never defends an
        // assumption again below its own defence, so a won tree is finite and its root is
        // in the grounded extension. Complete and preferred semantics share the defence
        // and the culprits across the whole tree: attacks using a culprit are defeated,
        // defended assumptions are not defended again, and a failing move makes the
        // search revise the culprits chosen for earlier moves. A won tree then has an
        // admissible defence set. Stable semantics is not supported and raises
        // configuration_error.
        DisputeResult AGORA_EXPORT dispute_trees(const Framework& framework, const std::vector<Atom>& goals, dung::Semantics semantics, int max_depth, ThreadPool* pool = nullptr);
    }
}
