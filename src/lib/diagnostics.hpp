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
#include "utils.hpp"

#include <agora_export.h>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace agora
{
    namespace diagnostics
    {
        struct Degree
        {
            size_t in{0};
            size_t out{0};
        };

        struct DegreeSummary
        {
            double avg_in{0};
            double avg_out{0};
            size_t max_in{0};
            size_t max_out{0};
        };

        // Structural overview of a graph. Every relation counts as a directed edge,
        // regardless of its kind.
        struct Report
        {
            size_t node_count{0};
            size_t relation_count{0};
            size_t attack_edge_count{0}; // attack, undercut and rebut
            size_t support_edge_count{0};

            std::vector<utils::IdList> cycles;             // smallest id first, sorted
            std::vector<utils::IdList> components;         // weakly connected, sorted
            std::vector<utils::IdList> strongly_connected; // sorted by size, then members

            std::map<std::string, Degree>        degrees;
            DegreeSummary                        degree_summary;
            utils::IdList                        isolated_units;    // no relation at all
            utils::IdList                        unsupported_units; // no incoming support
            std::map<std::string, utils::IdList> reachability;      // sorted, excludes the unit unless it is on a cycle

            utils::IdList            axiom_claims;
            utils::IdList            axiom_warrants;
            std::vector<std::string> warnings;

            size_t cycle_count() const { return cycles.size(); }
            size_t component_count() const { return components.size(); }
            size_t scc_count() const { return strongly_connected.size(); }
        };

        Report AGORA_EXPORT diagnose(const graph::Graph& graph);
    }
}
