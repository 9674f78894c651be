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

#include "graph_types.hpp"

#include <agora_export.h>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agora
{
    namespace graph
    {
        struct EvidenceItem
        {
            std::string           id;
            Stance                stance{Stance::Supports};
            std::optional<double> strength; // [0,1], 1 if unset
        };

        struct ArgumentUnit
        {
            std::string               id;
            std::string               text; // opaque to the reasoning core
            UnitType                  type{UnitType::Other};
            UnitRole                  role{UnitRole::Claim};
            std::optional<double>     score;
            bool                      is_axiom{false};
            bool                      ignore_influence{false};
            std::optional<double>     evidence_min;
            std::optional<double>     evidence_max;
            std::vector<EvidenceItem> evidence;
        };

        struct Relation
        {
            std::string              src;
            std::string              dst;
            RelationKind             kind{RelationKind::Support};
            std::optional<double>    weight;
            std::vector<std::string> warrant_ids;
            GateMode                 gate_mode{GateMode::Or};
            std::string              rationale;

            // |weight| (1 if unset) for support, -|weight| for every attack kind
            double signed_weight() const;
        };

        struct ArgumentBundle
        {
            std::string              id;
            std::vector<std::string> units;
        };

        // Resolved view of a Relation: endpoints and warrants as dense indices.
        struct Edge
        {
            Node         src{no_node};
            Node         dst{no_node};
            RelationKind kind{RelationKind::Support};
            double       magnitude{1}; // |weight|
            NodeList     warrants;
            GateMode     gate_mode{GateMode::Or};
        };

        class GraphBuilder;

        // Frozen argument graph. Instances are created by GraphBuilder::freeze(), which
        // checks referential integrity. A Graph is never modified afterwards and may be
        // shared between concurrent reasoning calls without locking.
        class AGORA_EXPORT Graph
        {
        public:
            Graph() = default;

            Node                       count() const { return static_cast<Node>(_units.size()); }
            const ArgumentUnit&        unit(Node node) const { return _units.at(node); }
            const std::string&         id(Node node) const { return _units.at(node).id; }
            bool                       is_warrant(Node node) const { return _units.at(node).role == UnitRole::Warrant; }
            Node                       node(const std::string& id) const;
            std::optional<Node>        find(const std::string& id) const;
            std::vector<std::string>   ids() const;
            const std::vector<ArgumentUnit>& units() const { return _units; }

            const std::vector<Relation>& relations() const { return _relations; }
            const Edge&                  edge(std::size_t relation) const { return _edges.at(relation); }
            const std::vector<Edge>&     edges() const { return _edges; }
            const std::vector<std::size_t>& incoming(Node node) const { return _incoming.at(node); }
            const std::vector<std::size_t>& outgoing(Node node) const { return _outgoing.at(node); }

            const std::vector<ArgumentBundle>& bundles() const { return _bundles; }

        private:
            friend class GraphBuilder;

            std::vector<ArgumentUnit>                     _units;
            ankerl::unordered_dense::map<std::string, Node> _index;
            std::vector<Relation>                         _relations;
            std::vector<Edge>                             _edges;
            std::vector<std::vector<std::size_t>>         _incoming;
            std::vector<std::vector<std::size_t>>         _outgoing;
            std::vector<ArgumentBundle>                   _bundles;
        };

        // Mutable construction phase. References are not checked while building,
        // so intermediate states may dangle; freeze() rejects every structural defect.
        class AGORA_EXPORT GraphBuilder
        {
        public:
            GraphBuilder() = default;

            void        add_unit(ArgumentUnit unit);
            std::string add_claim(const std::string& id, const std::string& text = {}, UnitType type = UnitType::Other);
            std::string add_warrant(const std::string& id, const std::string& text = {}, UnitType type = UnitType::Other);
            std::string add_axiom(const std::string& id, double score, UnitRole role = UnitRole::Claim);

            // access to an already added unit for setting flags and scores
            ArgumentUnit& unit(const std::string& id);

            void attach_evidence(const std::string& unit_id, EvidenceItem item);

            // returns the index of the relation, which stays valid in the frozen graph
            std::size_t add_relation(Relation relation);
            std::size_t add_support(const std::string& src, const std::string& dst, std::optional<double> weight = std::nullopt);
            std::size_t add_attack(const std::string& src, const std::string& dst, RelationKind kind = RelationKind::Attack, std::optional<double> weight = std::nullopt);
            std::size_t add_gated(const std::string& src, const std::string& dst, RelationKind kind, const std::vector<std::string>& warrant_ids, GateMode mode);

            void define_bundle(const std::string& id, const std::vector<std::string>& units);

            std::size_t unit_count() const { return _units.size(); }
            std::size_t relation_count() const { return _relations.size(); }

            Graph freeze() const;

        private:
            std::vector<ArgumentUnit>                         _units;
            std::vector<Relation>                             _relations;
            std::vector<std::pair<std::string, EvidenceItem>> _evidence;
            std::vector<ArgumentBundle>                       _bundles;
        };
    }
}
