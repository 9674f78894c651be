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

#include "credibility.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>

using namespace agora;
using namespace agora::credibility;

Propagator::Propagator(const graph::Graph& graph, Parameters parameters)
    : _graph(graph)
    , _parameters(parameters)
{
    if (_parameters.max_iterations < 0)
    {
        throw configuration_error("max_iterations must not be negative", "max_iterations");
    }
    if (!(_parameters.convergence_epsilon > 0))
    {
        throw configuration_error("convergence_epsilon must be positive", "convergence_epsilon");
    }

    _evidence.resize(graph.count(), 0);

    for (graph::Node i = 0; i < graph.count(); ++i)
    {
        const graph::ArgumentUnit& u = graph.unit(i);

        if (u.is_axiom)
        {
            _evidence[i] = std::clamp(u.score.value_or(0), -1.0, 1.0);
            continue;
        }

        if (u.evidence.empty()) continue; // no evidence term

        const double low  = u.evidence_min.value_or(_parameters.evidence_min);
        const double high = u.evidence_max.value_or(_parameters.evidence_max);
        if (low > high)
        {
            throw structural_error("Evidence bounds of '" + u.id + "' are empty", u.id);
        }

        double sum = 0;
        for (const graph::EvidenceItem& e : u.evidence)
        {
            sum += std::clamp(e.strength.value_or(1.0), low, high);
        }
        _evidence[i] = sum / static_cast<double>(u.evidence.size());
    }
}

Scores Propagator::initial() const
{
    return _evidence;
}

bool Propagator::warrant_active(const graph::Node warrant, const Scores& scores) const
{
    return scores.at(warrant) > _parameters.gate_threshold;
}

bool Propagator::gate_open(const size_t relation, const Scores& scores) const
{
    const graph::Edge& e = _graph.edge(relation);
    if (e.warrants.empty()) return true;

    if (e.gate_mode == graph::GateMode::And)
    {
        return std::all_of(e.warrants.begin(), e.warrants.end(), [&](graph::Node w)
                           { return warrant_active(w, scores); });
    }
    return std::any_of(e.warrants.begin(), e.warrants.end(), [&](graph::Node w)
                       { return warrant_active(w, scores); });
}

double Propagator::propagated(const graph::Node node, const Scores& scores, std::vector<Contribution>* contributions) const
{
    double sum = 0;
    for (size_t r : _graph.incoming(node))
    {
        const graph::Edge& e = _graph.edge(r);
        if (_graph.unit(e.src).ignore_influence) continue;

        const bool open  = gate_open(r, scores);
        double     value = 0;
        if (open)
        {
            const double s = scores[e.src];
            value          = e.kind == graph::RelationKind::Support ? e.magnitude * s : -e.magnitude * std::fabs(s);
        }
        sum += value;

        if (contributions)
        {
            contributions->push_back(Contribution{r, _graph.id(e.src), e.kind, open, value});
        }
    }
    return sum;
}

Scores Propagator::step(const Scores& scores) const
{
    Scores next(scores.size());
    for (graph::Node i = 0; i < _graph.count(); ++i)
    {
        if (_graph.unit(i).is_axiom)
        {
            next[i] = _evidence[i];
            continue;
        }
        next[i] = std::tanh(_parameters.lambda * _evidence[i] + propagated(i, scores, nullptr));
    }
    return next;
}

std::map<std::string, double> Propagator::to_map(const Scores& scores) const
{
    std::map<std::string, double> m;
    for (graph::Node i = 0; i < _graph.count(); ++i)
    {
        m.emplace(_graph.id(i), scores[i]);
    }
    return m;
}

std::vector<Fragility> Propagator::fragility(const Scores& scores) const
{
    std::vector<Fragility> result;
    for (size_t r = 0; r < _graph.relations().size(); ++r)
    {
        const graph::Edge& e = _graph.edge(r);
        if (e.warrants.empty()) continue;

        const bool and_gate = e.gate_mode == graph::GateMode::And;

        Fragility f;
        f.relation   = r;
        f.dst        = _graph.id(e.dst);
        f.gate_mode  = e.gate_mode;
        f.gate_score = scores[e.warrants.front()];
        for (graph::Node w : e.warrants)
        {
            f.gate_score = and_gate ? std::min(f.gate_score, scores[w]) : std::max(f.gate_score, scores[w]);
        }

        for (graph::Node w : e.warrants)
        {
            if (scores[w] == f.gate_score) f.critical_warrants.push_back(_graph.id(w));
        }
        result.push_back(std::move(f));
    }
    return result;
}

Result Propagator::run() const
{
    Result result;
    Scores scores = initial();

    if (_parameters.record_history) result.history.push_back(to_map(scores));

    for (int it = 1; it <= _parameters.max_iterations; ++it)
    {
        Scores next  = step(scores);
        double delta = 0;
        for (size_t i = 0; i < next.size(); ++i)
        {
            delta = std::max(delta, std::fabs(next[i] - scores[i]));
        }

        scores            = std::move(next);
        result.iterations = it;
        result.delta      = delta;
        if (_parameters.record_history) result.history.push_back(to_map(scores));

        if (delta < _parameters.convergence_epsilon)
        {
            result.converged = true;
            break;
        }
    }

    result.scores = to_map(scores);

    for (size_t r = 0; r < _graph.relations().size(); ++r)
    {
        result.gate_open.push_back(gate_open(r, scores));
    }

    result.fragility = fragility(scores);

    for (graph::Node i = 0; i < _graph.count(); ++i)
    {
        if (_graph.is_warrant(i))
        {
            result.warrant_active.emplace(_graph.id(i), warrant_active(i, scores));
        }

        Breakdown b;
        b.evidence = _evidence[i];
        b.fixed    = _graph.unit(i).is_axiom;
        if (!b.fixed)
        {
            b.evidence_term   = _parameters.lambda * _evidence[i];
            b.propagated_term = propagated(i, scores, &b.contributions);
        }
        result.breakdown.emplace(_graph.id(i), std::move(b));
    }

    return result;
}
