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
    namespace bundles
    {
        enum class Aggregation
        {
            SumClamp, // signed sum, clamped
            Mean,
            Max // signed weight of largest magnitude
        };

        constexpr double weight_floor   = -1.0;
        constexpr double weight_ceiling = 1.0;

        std::string AGORA_EXPORT to_string(Aggregation aggregation);
        Aggregation AGORA_EXPORT parse_aggregation(const std::string& name);

        // Aggregates the signed weights of the claim-level relations crossing one bundle
        // boundary. The result is clamped to [weight_floor, weight_ceiling].
        double AGORA_EXPORT aggregate(const std::vector<double>& signed_weights, Aggregation aggregation);

        struct CrossEdge
        {
            std::string              src; // bundle ids
            std::string              dst;
            double                   weight{0};
            graph::RelationKind      kind{graph::RelationKind::Support}; // Attack if weight < 0
            std::vector<std::size_t> relations;                          // contributing claim-level relations
            std::vector<double>      signed_weights;                     // in relation order
        };

        // Projection of a graph onto its argument bundles. It owns copies of everything
        // it reports, so it stays valid independently of the graph it was built from.
        struct AGORA_EXPORT BundleGraph
        {
            Aggregation                                         aggregation{Aggregation::SumClamp};
            std::vector<graph::ArgumentBundle>                  bundles;
            std::vector<CrossEdge>                              cross_edges; // ordered by (src, dst)
            std::map<std::string, std::vector<graph::Relation>> internal;    // relations inside each bundle, unchanged

            // bundle containing the unit, empty if none
            std::string bundle_of(const std::string& unit) const;

            // in-bundle relations followed by one bundle-level relation per cross edge
            std::vector<graph::Relation> relations() const;
        };

        // weakly connected components of the support relations between claims
        std::vector<graph::ArgumentBundle> AGORA_EXPORT support_components(const graph::Graph& graph);

        // Uses the bundles defined on the graph, or support_components() if there are none.
        // Units that belong to no bundle do not take part in the projection.
        BundleGraph AGORA_EXPORT project(const graph::Graph& graph, Aggregation aggregation = Aggregation::SumClamp);
    }
}
