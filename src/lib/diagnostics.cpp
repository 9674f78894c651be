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

#include "diagnostics.hpp"

#include <algorithm>
#include <deque>
#include <set>

using namespace agora;
using namespace agora::diagnostics;
using graph::Node;

namespace
{
    using Adjacency = std::vector<std::vector<Node>>;

    class CycleFinder
    {
    public:
        CycleFinder(const graph::Graph& graph, const Adjacency& adjacency)
            : _graph(graph)
            , _adjacency(adjacency)
            , _seen(adjacency.size(), false)
            , _on_stack(adjacency.size(), false)
        {
        }

        std::vector<utils::IdList> run()
        {
            for (Node n = 0; n < _adjacency.size(); ++n)
            {
                if (!_seen[n]) visit(n);
            }
            return std::vector<utils::IdList>(_cycles.begin(), _cycles.end());
        }

    private:
        void visit(const Node node)
        {
            _seen[node]     = true;
            _on_stack[node] = true;
            _stack.push_back(node);

            for (Node next : _adjacency[node])
            {
                if (!_seen[next])
                    visit(next);
                else if (_on_stack[next])
                    record(next);
            }

            _stack.pop_back();
            _on_stack[node] = false;
        }

        // the back edge closes the cycle from `start` to the top of the stack
        void record(const Node start)
        {
            auto          from = std::find(_stack.begin(), _stack.end(), start);
            utils::IdList cycle;
            for (auto it = from; it != _stack.end(); ++it) cycle.push_back(_graph.id(*it));

            std::rotate(cycle.begin(), std::min_element(cycle.begin(), cycle.end()), cycle.end());
            _cycles.insert(std::move(cycle));
        }

        const graph::Graph&     _graph;
        const Adjacency&        _adjacency;
        std::vector<bool>       _seen;
        std::vector<bool>       _on_stack;
        std::vector<Node>       _stack;
        std::set<utils::IdList> _cycles;
    };

    // Tarjan
    class SccFinder
    {
    public:
        explicit SccFinder(const Adjacency& adjacency)
            : _adjacency(adjacency)
            , _index(adjacency.size(), graph::no_node)
            , _low(adjacency.size(), 0)
            , _on_stack(adjacency.size(), false)
        {
        }

        std::vector<std::vector<Node>> run()
        {
            for (Node n = 0; n < _adjacency.size(); ++n)
            {
                if (_index[n] == graph::no_node) visit(n);
            }
            return std::move(_components);
        }

    private:
        void visit(const Node node)
        {
            _index[node] = _low[node] = _counter++;
            _stack.push_back(node);
            _on_stack[node] = true;

            for (Node next : _adjacency[node])
            {
                if (_index[next] == graph::no_node)
                {
                    visit(next);
                    _low[node] = std::min(_low[node], _low[next]);
                }
                else if (_on_stack[next])
                {
                    _low[node] = std::min(_low[node], _index[next]);
                }
            }

            if (_low[node] != _index[node]) return;

            std::vector<Node> component;
            Node              member;
            do
            {
                member = _stack.back();
                _stack.pop_back();
                _on_stack[member] = false;
                component.push_back(member);
            } while (member != node);

            _components.push_back(std::move(component));
        }

        const Adjacency&               _adjacency;
        std::vector<Node>              _index;
        std::vector<Node>              _low;
        std::vector<bool>              _on_stack;
        std::vector<Node>              _stack;
        Node                           _counter{0};
        std::vector<std::vector<Node>> _components;
    };

    utils::IdList to_ids(const graph::Graph& graph, const std::vector<Node>& nodes)
    {
        utils::IdList ids;
        for (Node n : nodes) ids.push_back(graph.id(n));
        std::sort(ids.begin(), ids.end());
        return ids;
    }
}

Report agora::diagnostics::diagnose(const graph::Graph& graph)
{
    Report    report;
    const Node n = graph.count();

    report.node_count     = n;
    report.relation_count = graph.relations().size();

    Adjacency forward(n);
    Adjacency undirected(n);
    for (const graph::Edge& e : graph.edges())
    {
        forward[e.src].push_back(e.dst);
        undirected[e.src].push_back(e.dst);
        undirected[e.dst].push_back(e.src);

        if (e.kind == graph::RelationKind::Support)
            ++report.support_edge_count;
        else
            ++report.attack_edge_count;
    }

    report.cycles = CycleFinder(graph, forward).run();

    // weakly connected components
    std::vector<bool> assigned(n, false);
    for (Node start = 0; start < n; ++start)
    {
        if (assigned[start]) continue;

        std::vector<Node> members{start};
        std::deque<Node>  queue{start};
        assigned[start] = true;
        while (!queue.empty())
        {
            Node node = queue.front();
            queue.pop_front();
            for (Node next : undirected[node])
            {
                if (assigned[next]) continue;
                assigned[next] = true;
                members.push_back(next);
                queue.push_back(next);
            }
        }
        report.components.push_back(to_ids(graph, members));
    }
    std::sort(report.components.begin(), report.components.end());

    for (const auto& c : SccFinder(forward).run())
    {
        report.strongly_connected.push_back(to_ids(graph, c));
    }
    std::sort(report.strongly_connected.begin(), report.strongly_connected.end(), [](const utils::IdList& a, const utils::IdList& b)
              { return a.size() != b.size() ? a.size() < b.size() : a < b; });

    // degrees
    size_t in_total  = 0;
    size_t out_total = 0;
    for (Node i = 0; i < n; ++i)
    {
        Degree d{graph.incoming(i).size(), graph.outgoing(i).size()};
        report.degrees.emplace(graph.id(i), d);

        in_total += d.in;
        out_total += d.out;
        report.degree_summary.max_in  = std::max(report.degree_summary.max_in, d.in);
        report.degree_summary.max_out = std::max(report.degree_summary.max_out, d.out);

        if (d.in == 0 && d.out == 0) report.isolated_units.push_back(graph.id(i));

        bool supported = std::any_of(graph.incoming(i).begin(), graph.incoming(i).end(), [&](size_t r)
                                     { return graph.edge(r).kind == graph::RelationKind::Support; });
        if (!supported) report.unsupported_units.push_back(graph.id(i));
    }
    if (n > 0)
    {
        report.degree_summary.avg_in  = static_cast<double>(in_total) / n;
        report.degree_summary.avg_out = static_cast<double>(out_total) / n;
    }
    std::sort(report.isolated_units.begin(), report.isolated_units.end());
    std::sort(report.unsupported_units.begin(), report.unsupported_units.end());

    // reachability
    for (Node start = 0; start < n; ++start)
    {
        std::vector<bool> visited(n, false);
        std::vector<Node> reached;
        std::deque<Node>  queue{start};
        while (!queue.empty())
        {
            Node node = queue.front();
            queue.pop_front();
            for (Node next : forward[node])
            {
                if (visited[next]) continue;
                visited[next] = true;
                reached.push_back(next);
                queue.push_back(next);
            }
        }
        report.reachability.emplace(graph.id(start), to_ids(graph, reached));
    }

    for (const graph::ArgumentUnit& u : graph.units())
    {
        if (!u.is_axiom) continue;
        (u.role == graph::UnitRole::Warrant ? report.axiom_warrants : report.axiom_claims).push_back(u.id);
    }
    std::sort(report.axiom_claims.begin(), report.axiom_claims.end());
    std::sort(report.axiom_warrants.begin(), report.axiom_warrants.end());

    for (const std::string& id : report.axiom_claims)
    {
        report.warnings.push_back("axiom claim '" + id + "' bypasses evidence requirements.");
    }
    for (const std::string& id : report.axiom_warrants)
    {
        report.warnings.push_back("axiom warrant '" + id + "' bypasses evidence requirements.");
    }

    return report;
}
