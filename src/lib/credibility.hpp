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

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace agora
{
    namespace credibility
    {
        struct Parameters
        {
            double lambda{0.5};         // weight of the evidence term
            double gate_threshold{0.5}; // a warrant is active above this score
            int    max_iterations{100};
            double convergence_epsilon{1e-6};
            double evidence_min{0}; // default evidence bounds for units without their own
            double evidence_max{1};
            bool   record_history{false};
        };

        // scores indexed by graph::Node
        using Scores = std::vector<double>;

        struct Contribution
        {
            size_t              relation; // index into Graph::relations()
            std::string         src;
            graph::RelationKind kind{graph::RelationKind::Support};
            bool                open{true};
            double              value{0};
        };

        struct Breakdown
        {
            double                    evidence{0};      // E_i
            double                    evidence_term{0}; // lambda * E_i
            double                    propagated_term{0};
            bool                      fixed{false}; // axiom
            std::vector<Contribution> contributions;
        };

        // Which warrants a gated relation depends on: the weakest ones for an AND gate,
        // the strongest ones for an OR gate.
        struct Fragility
        {
            size_t                   relation{0}; // index into Graph::relations()
            std::string              dst;
            graph::GateMode          gate_mode{graph::GateMode::And};
            double                   gate_score{0}; // min (AND) or max (OR) warrant score
            std::vector<std::string> critical_warrants;
        };

        struct Result
        {
            std::map<std::string, double>    scores;
            std::map<std::string, bool>      warrant_active;
            std::vector<bool>                gate_open; // per relation, evaluated on the final scores
            std::vector<Fragility>           fragility; // per relation with warrants
            std::map<std::string, Breakdown> breakdown;
            int                              iterations{0};
            bool                             converged{false};
            double                           delta{0}; // max |change| of the last iteration
            std::vector<std::map<std::string, double>> history; // initial scores first, only with record_history
        };

        // Warrant-gated iterative scoring:
        //
        //   score_i(t+1) = tanh(lambda * E_i + sum over incoming relations j->i of gate * |w| * sign * s_j)
        //
        // with s_j = score_j for support (sign +1) and |score_j| for every attack kind
        // (sign -1). A relation without warrants is always open. Gates and sources are
        // read from the previous iteration. A unit without evidence items has no evidence
        // term. Axioms keep their fixed score, and units with ignore_influence do not
        // influence others.
        class AGORA_EXPORT Propagator
        {
        public:
            explicit Propagator(const graph::Graph& graph, Parameters parameters = {});

            const Parameters& parameters() const { return _parameters; }

            double evidence(graph::Node node) const { return _evidence.at(node); }
            Scores initial() const;
            bool   gate_open(size_t relation, const Scores& scores) const;
            bool   warrant_active(graph::Node warrant, const Scores& scores) const;

            // one synchronous update
            Scores step(const Scores& scores) const;

            std::vector<Fragility> fragility(const Scores& scores) const;

            Result run() const;

        private:
            double propagated(graph::Node node, const Scores& scores, std::vector<Contribution>* contributions) const;
            std::map<std::string, double> to_map(const Scores& scores) const;

            const graph::Graph& _graph;
            Parameters          _parameters;
            std::vector<double> _evidence;
        };
    }
}
