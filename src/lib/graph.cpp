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

#include "graph.hpp"
#include "errors.hpp"

#include <cmath>
#include <stdexcept>

using namespace agora::graph;

double Relation::signed_weight() const
{
    const double base = std::fabs(weight.value_or(1.0));
    return kind == RelationKind::Support ? base : -base;
}

Node Graph::node(const std::string& id) const
{
    auto it = _index.find(id);
    if (it == _index.end())
    {
        throw structural_error("Graph::node: unknown unit id '" + id + "'", id);
    }
    return it->second;
}

std::optional<Node> Graph::find(const std::string& id) const
{
    auto it = _index.find(id);
    if (it == _index.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> Graph::ids() const
{
    std::vector<std::string> result;
    result.reserve(_units.size());
    for (const auto& u : _units)
    {
        result.push_back(u.id);
    }
    return result;
}

void GraphBuilder::add_unit(ArgumentUnit unit)
{
    _units.push_back(std::move(unit));
}

std::string GraphBuilder::add_claim(const std::string& id, const std::string& text, const UnitType type)
{
    ArgumentUnit u;
    u.id   = id;
    u.text = text;
    u.type = type;
    add_unit(std::move(u));
    return id;
}

std::string GraphBuilder::add_warrant(const std::string& id, const std::string& text, const UnitType type)
{
    ArgumentUnit u;
    u.id   = id;
    u.text = text;
    u.type = type;
    u.role = UnitRole::Warrant;
    add_unit(std::move(u));
    return id;
}

std::string GraphBuilder::add_axiom(const std::string& id, const double score, const UnitRole role)
{
    ArgumentUnit u;
    u.id       = id;
    u.role     = role;
    u.score    = score;
    u.is_axiom = true;
    add_unit(std::move(u));
    return id;
}

ArgumentUnit& GraphBuilder::unit(const std::string& id)
{
    // the last definition wins lookups; duplicates are reported by freeze()
    for (auto it = _units.rbegin(); it != _units.rend(); ++it)
    {
        if (it->id == id) return *it;
    }
    throw std::invalid_argument("GraphBuilder::unit: unknown unit id '" + id + "'");
}

void GraphBuilder::attach_evidence(const std::string& unit_id, EvidenceItem item)
{
    _evidence.emplace_back(unit_id, std::move(item));
}

std::size_t GraphBuilder::add_relation(Relation relation)
{
    _relations.push_back(std::move(relation));
    return _relations.size() - 1;
}

std::size_t GraphBuilder::add_support(const std::string& src, const std::string& dst, std::optional<double> weight)
{
    Relation r;
    r.src    = src;
    r.dst    = dst;
    r.kind   = RelationKind::Support;
    r.weight = weight;
    return add_relation(std::move(r));
}

std::size_t GraphBuilder::add_attack(const std::string& src, const std::string& dst, const RelationKind kind, std::optional<double> weight)
{
    if (kind == RelationKind::Support)
    {
        throw std::invalid_argument("GraphBuilder::add_attack: support is not an attack kind");
    }

    Relation r;
    r.src    = src;
    r.dst    = dst;
    r.kind   = kind;
    r.weight = weight;
    return add_relation(std::move(r));
}

std::size_t GraphBuilder::add_gated(const std::string& src, const std::string& dst, const RelationKind kind, const std::vector<std::string>& warrant_ids, const GateMode mode)
{
    Relation r;
    r.src         = src;
    r.dst         = dst;
    r.kind        = kind;
    r.warrant_ids = warrant_ids;
    r.gate_mode   = mode;
    return add_relation(std::move(r));
}

void GraphBuilder::define_bundle(const std::string& id, const std::vector<std::string>& units)
{
    _bundles.push_back(ArgumentBundle{id, units});
}

Graph GraphBuilder::freeze() const
{
    Graph g;
    g._units.reserve(_units.size());

    for (const ArgumentUnit& u : _units)
    {
        if (u.id.empty())
        {
            throw structural_error("GraphBuilder::freeze: unit without id");
        }

        if (u.is_axiom && !u.score)
        {
            throw structural_error("GraphBuilder::freeze: axiom '" + u.id + "' has no score", u.id);
        }

        if (u.evidence_min && u.evidence_max && *u.evidence_min > *u.evidence_max)
        {
            throw structural_error("GraphBuilder::freeze: unit '" + u.id + "' has evidence_min > evidence_max", u.id);
        }

        const Node node = static_cast<Node>(g._units.size());
        if (!g._index.emplace(u.id, node).second)
        {
            throw structural_error("GraphBuilder::freeze: duplicate unit id '" + u.id + "'", u.id);
        }
        g._units.push_back(u);
    }

    for (const auto& [unit_id, item] : _evidence)
    {
        auto it = g._index.find(unit_id);
        if (it == g._index.end())
        {
            throw structural_error("GraphBuilder::freeze: evidence '" + item.id + "' attached to unknown unit '" + unit_id + "'", unit_id);
        }
        g._units[it->second].evidence.push_back(item);
    }

    g._incoming.resize(g._units.size());
    g._outgoing.resize(g._units.size());
    g._relations = _relations;
    g._edges.reserve(_relations.size());

    auto resolve = [&](const std::string& id, const char* what)
    {
        auto it = g._index.find(id);
        if (it == g._index.end())
        {
            throw structural_error(std::string("GraphBuilder::freeze: dangling ") + what + " '" + id + "'", id);
        }
        return it->second;
    };

    for (std::size_t i = 0; i < _relations.size(); ++i)
    {
        const Relation& r = _relations[i];

        Edge e;
        e.src       = resolve(r.src, "relation source");
        e.dst       = resolve(r.dst, "relation destination");
        e.kind      = r.kind;
        e.magnitude = std::fabs(r.weight.value_or(1.0));
        e.gate_mode = r.gate_mode;

        for (const std::string& w : r.warrant_ids)
        {
            Node wn = resolve(w, "warrant reference");
            if (g._units[wn].role != UnitRole::Warrant)
            {
                throw structural_error("GraphBuilder::freeze: relation gated by '" + w + "', which is not a warrant", w);
            }
            e.warrants.push_back(wn);
        }

        g._outgoing[e.src].push_back(i);
        g._incoming[e.dst].push_back(i);
        g._edges.push_back(std::move(e));
    }

    ankerl::unordered_dense::set<std::string> bundle_ids;
    ankerl::unordered_dense::map<std::string, std::string> owner; // unit -> bundle

    for (const ArgumentBundle& b : _bundles)
    {
        if (b.id.empty() || b.units.empty())
        {
            throw structural_error("GraphBuilder::freeze: bundle '" + b.id + "' has no id or no units", b.id);
        }

        if (!bundle_ids.insert(b.id).second)
        {
            throw structural_error("GraphBuilder::freeze: duplicate bundle id '" + b.id + "'", b.id);
        }

        for (const std::string& u : b.units)
        {
            resolve(u, "bundle member");
            auto [it, inserted] = owner.emplace(u, b.id);
            if (!inserted && it->second != b.id)
            {
                throw structural_error("GraphBuilder::freeze: unit '" + u + "' is assigned to bundles '" + it->second + "' and '" + b.id + "'", u);
            }
        }
    }

    g._bundles = _bundles;
    return g;
}
