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

#include "bundles.hpp"

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace agora;
using namespace agora::bundles;

std::string agora::bundles::to_string(const Aggregation aggregation)
{
    switch (aggregation)
    {
    case Aggregation::SumClamp:
        return "sum-clamp";
    case Aggregation::Mean:
        return "mean";
    case Aggregation::Max:
        return "max";
    }
    return "sum-clamp";
}

Aggregation agora::bundles::parse_aggregation(const std::string& name)
{
    const std::string n = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
    if (n == "sum-clamp" || n == "sum") return Aggregation::SumClamp;
    if (n == "mean") return Aggregation::Mean;
    if (n == "max") return Aggregation::Max;
    throw std::invalid_argument("Unknown bundle aggregation '" + name + "'");
}

double agora::bundles::aggregate(const std::vector<double>& signed_weights, const Aggregation aggregation)
{
    if (signed_weights.empty()) return 0;

    double value = 0;
    switch (aggregation)
    {
    case Aggregation::SumClamp:
        for (double w : signed_weights) value += w;
        break;
    case Aggregation::Mean:
        for (double w : signed_weights) value += w;
        value /= static_cast<double>(signed_weights.size());
        break;
    case Aggregation::Max:
        value = signed_weights.front();
        for (double w : signed_weights)
        {
            if (std::fabs(w) > std::fabs(value)) value = w; // first one wins ties
        }
        break;
    }

    return std::clamp(value, weight_floor, weight_ceiling);
}

std::string BundleGraph::bundle_of(const std::string& unit) const
{
    for (const auto& b : bundles)
    {
        if (std::find(b.units.begin(), b.units.end(), unit) != b.units.end()) return b.id;
    }
    return {};
}

std::vector<graph::Relation> BundleGraph::relations() const
{
    std::vector<graph::Relation> result;
    for (const auto& b : bundles)
    {
        auto it = internal.find(b.id);
        if (it != internal.end())
        {
            result.insert(result.end(), it->second.begin(), it->second.end());
        }
    }

    for (const CrossEdge& e : cross_edges)
    {
        graph::Relation r;
        r.src    = e.src;
        r.dst    = e.dst;
        r.kind   = e.kind;
        r.weight = e.weight;
        result.push_back(std::move(r));
    }
    return result;
}

std::vector<graph::ArgumentBundle> agora::bundles::support_components(const graph::Graph& graph)
{
    const graph::Node n = graph.count();

    // union-find over claims joined by support relations
    std::vector<graph::Node> parent(n);
    for (graph::Node i = 0; i < n; ++i) parent[i] = i;

    auto find = [&](graph::Node x)
    {
        while (parent[x] != x)
        {
            parent[x] = parent[parent[x]];
            x         = parent[x];
        }
        return x;
    };

    for (const auto& e : graph.edges())
    {
        if (e.kind != graph::RelationKind::Support) continue;
        if (graph.is_warrant(e.src) || graph.is_warrant(e.dst)) continue;

        graph::Node a = find(e.src);
        graph::Node b = find(e.dst);
        if (a != b) parent[a] = b;
    }

    std::map<graph::Node, std::vector<std::string>> groups;
    for (graph::Node i = 0; i < n; ++i)
    {
        if (!graph.is_warrant(i)) groups[find(i)].push_back(graph.id(i));
    }

    std::vector<std::vector<std::string>> members;
    for (auto& [root, ids] : groups)
    {
        std::sort(ids.begin(), ids.end());
        members.push_back(std::move(ids));
    }
    std::sort(members.begin(), members.end());

    std::vector<graph::ArgumentBundle> result;
    for (auto& m : members)
    {
        result.push_back(graph::ArgumentBundle{"arg_" + std::to_string(result.size() + 1), std::move(m)});
    }
    return result;
}

BundleGraph agora::bundles::project(const graph::Graph& graph, const Aggregation aggregation)
{
    BundleGraph bg;
    bg.aggregation = aggregation;
    bg.bundles     = graph.bundles().empty() ? support_components(graph) : graph.bundles();

    std::vector<std::string> owner(graph.count());
    for (const auto& b : bg.bundles)
    {
        bg.internal[b.id];
        for (const std::string& u : b.units)
        {
            owner[graph.node(u)] = b.id;
        }
    }

    std::map<std::pair<std::string, std::string>, CrossEdge> crossing;

    for (std::size_t i = 0; i < graph.relations().size(); ++i)
    {
        const graph::Relation& r   = graph.relations()[i];
        const graph::Edge&     e   = graph.edge(i);
        const std::string&     src = owner[e.src];
        const std::string&     dst = owner[e.dst];

        if (src.empty() || dst.empty()) continue;

        if (src == dst)
        {
            bg.internal[src].push_back(r);
            continue;
        }

        CrossEdge& ce = crossing[{src, dst}];
        ce.src        = src;
        ce.dst        = dst;
        ce.relations.push_back(i);
        ce.signed_weights.push_back(r.signed_weight());
    }

    for (auto& [key, ce] : crossing)
    {
        ce.weight = aggregate(ce.signed_weights, aggregation);
        ce.kind   = ce.weight < 0 ? graph::RelationKind::Attack : graph::RelationKind::Support;
        bg.cross_edges.push_back(std::move(ce));
    }

    return bg;
}
