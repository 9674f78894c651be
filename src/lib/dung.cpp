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

#include "dung.hpp"
#include "bundles.hpp"
#include "errors.hpp"
#include "thread_pool.hpp"

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace agora;
using namespace agora::dung;

std::string agora::dung::to_string(const Semantics semantics)
{
    switch (semantics)
    {
    case Semantics::Grounded:
        return "grounded";
    case Semantics::Complete:
        return "complete";
    case Semantics::Preferred:
        return "preferred";
    case Semantics::Stable:
        return "stable";
    }
    return "grounded";
}

std::string agora::dung::to_string(const Label label)
{
    switch (label)
    {
    case Label::In:
        return "in";
    case Label::Out:
        return "out";
    case Label::Undec:
        return "undec";
    }
    return "undec";
}

Semantics agora::dung::parse_semantics(const std::string& name)
{
    const std::string n = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
    if (n == "grounded") return Semantics::Grounded;
    if (n == "complete") return Semantics::Complete;
    if (n == "preferred") return Semantics::Preferred;
    if (n == "stable") return Semantics::Stable;
    throw std::invalid_argument("Unknown semantics '" + name + "'");
}

// Backtracking enumeration of complete extensions.
//
// The grounded extension is part of every complete extension, so it is forced in;
// arguments in conflict with it, and self-attacking arguments, are forced out. The
// remaining arguments are decided in canonical (id) order. A branch is cut as soon as
// an included argument has an attacker that can no longer be counter-attacked, and an
// argument defended by the current set is never excluded (F is monotone).
class ArgumentationFramework::Search
{
public:
    explicit Search(const ArgumentationFramework& af)
        : _af(af)
    {
        const size_t n = af._arguments.size();
        _in.assign(n, 0);
        _out.assign(n, 0);

        Mask grounded = af.grounded_mask();
        for (Index a = 0; a < n; ++a)
        {
            if (!grounded[a]) continue;
            _in[a] = 1;
            for (Index b : af._attackers[a]) _out[b] = 1;
            for (Index b : af._targets[a]) _out[b] = 1;
        }

        for (Index a = 0; a < n; ++a)
        {
            if (af.attacks(a, a)) _out[a] = 1;
            if (!_in[a] && !_out[a]) _order.push_back(a);
        }

        std::sort(_order.begin(), _order.end(), [&](Index a, Index b)
                  { return af._arguments[a] < af._arguments[b]; });
    }

    std::vector<Mask> run(ThreadPool* pool)
    {
        std::vector<Mask> results;

        if (!pool || pool->count() < 2 || _order.size() < 4)
        {
            explore(0, _in, _out, results, nullptr, _order.size() + 1);
            return results;
        }

        // split the first levels of the search tree into independent branches
        size_t levels = 1;
        while ((size_t(1) << levels) < pool->count() * 4 && levels < _order.size()) ++levels;

        std::vector<Frame> frontier;
        explore(0, _in, _out, results, &frontier, levels);

        std::vector<std::vector<Mask>> partial(frontier.size());
        for (size_t i = 0; i < frontier.size(); ++i)
        {
            pool->enqueue([this, &frontier, &partial, i]
                          {
                Frame& f = frontier[i];
                explore(f.k, f.in, f.out, partial[i], nullptr, _order.size() + 1); });
        }
        pool->wait();

        for (auto& p : partial)
        {
            results.insert(results.end(), std::make_move_iterator(p.begin()), std::make_move_iterator(p.end()));
        }
        return results;
    }

private:
    struct Frame
    {
        size_t k;
        Mask   in;
        Mask   out;
    };

    void explore(size_t k, Mask in, Mask out, std::vector<Mask>& results, std::vector<Frame>* frontier, size_t stop_at) const
    {
        if (frontier && k == stop_at)
        {
            frontier->push_back(Frame{k, std::move(in), std::move(out)});
            return;
        }

        if (k == _order.size())
        {
            if (_af.admissible(in) && _af.characteristic(in) == in)
            {
                results.push_back(std::move(in));
            }
            return;
        }

        const Index a = _order[k];

        if (!conflicts(in, a))
        {
            in[a] = 1;
            if (!hopeless(in, out)) explore(k + 1, in, out, results, frontier, stop_at);
            in[a] = 0;
        }

        if (!_af.defended(in, a))
        {
            out[a] = 1;
            if (!hopeless(in, out)) explore(k + 1, std::move(in), std::move(out), results, frontier, stop_at);
        }
    }

    bool conflicts(const Mask& in, Index a) const
    {
        for (Index b : _af._targets[a])
            if (in[b]) return true;
        for (Index b : _af._attackers[a])
            if (in[b]) return true;
        return false;
    }

    // true if some included argument has an attacker whose attackers are all excluded
    bool hopeless(const Mask& in, const Mask& out) const
    {
        for (Index x = 0; x < in.size(); ++x)
        {
            if (!in[x]) continue;

            for (Index b : _af._attackers[x])
            {
                bool can_defend = false;
                for (Index c : _af._attackers[b])
                {
                    if (in[c] || !out[c])
                    {
                        can_defend = true;
                        break;
                    }
                }
                if (!can_defend) return true;
            }
        }
        return false;
    }

    const ArgumentationFramework& _af;
    std::vector<Index>            _order;
    Mask                          _in;
    Mask                          _out;
};

ArgumentationFramework ArgumentationFramework::from_graph(const graph::Graph& graph)
{
    ArgumentationFramework af;
    for (const auto& unit : graph.units())
    {
        af.add_argument(unit.id);
    }

    for (const auto& edge : graph.edges())
    {
        if (graph::is_attack(edge.kind))
        {
            af.add_attack(graph.id(edge.src), graph.id(edge.dst));
        }
    }
    return af;
}

ArgumentationFramework ArgumentationFramework::from_bundles(const bundles::BundleGraph& bundle_graph)
{
    ArgumentationFramework af;
    for (const auto& bundle : bundle_graph.bundles)
    {
        af.add_argument(bundle.id);
    }

    for (const auto& edge : bundle_graph.cross_edges)
    {
        if (edge.kind != graph::RelationKind::Support)
        {
            af.add_attack(edge.src, edge.dst);
        }
    }
    return af;
}

void ArgumentationFramework::add_argument(const std::string& argument)
{
    if (argument.empty())
    {
        throw structural_error("ArgumentationFramework::add_argument: empty argument id");
    }

    if (_index.find(argument) != _index.end()) return;

    _index.emplace(argument, static_cast<Index>(_arguments.size()));
    _arguments.push_back(argument);
    _attackers.emplace_back();
    _targets.emplace_back();
}

void ArgumentationFramework::add_attack(const std::string& attacker, const std::string& target)
{
    const Index a = index(attacker);
    const Index b = index(target);

    if (_attack_set.insert((uint64_t(a) << 32) | b).second)
    {
        _targets[a].push_back(b);
        _attackers[b].push_back(a);
    }
}

bool ArgumentationFramework::has_argument(const std::string& argument) const
{
    return _index.find(argument) != _index.end();
}

std::vector<std::string> ArgumentationFramework::arguments() const
{
    std::vector<std::string> result = _arguments;
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<std::pair<std::string, std::string>> ArgumentationFramework::attack_list() const
{
    std::vector<std::pair<std::string, std::string>> result;
    for (Index a = 0; a < _targets.size(); ++a)
    {
        for (Index b : _targets[a])
        {
            result.emplace_back(_arguments[a], _arguments[b]);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

bool ArgumentationFramework::attacks(const std::string& attacker, const std::string& target) const
{
    return attacks(index(attacker), index(target));
}

Extension ArgumentationFramework::attackers_of(const std::string& argument) const
{
    Extension result;
    for (Index b : _attackers[index(argument)]) result.push_back(_arguments[b]);
    std::sort(result.begin(), result.end());
    return result;
}

Extension ArgumentationFramework::attacks_of(const std::string& argument) const
{
    Extension result;
    for (Index b : _targets[index(argument)]) result.push_back(_arguments[b]);
    std::sort(result.begin(), result.end());
    return result;
}

bool ArgumentationFramework::conflict_free(const Extension& s) const
{
    return conflict_free(to_mask(s));
}

bool ArgumentationFramework::defended_by(const Extension& s, const std::string& argument) const
{
    return defended(to_mask(s), index(argument));
}

bool ArgumentationFramework::admissible(const Extension& s) const
{
    return admissible(to_mask(s));
}

bool ArgumentationFramework::stable(const Extension& s) const
{
    const Mask m = to_mask(s);
    if (!conflict_free(m)) return false;

    for (Index a = 0; a < m.size(); ++a)
    {
        if (m[a]) continue;
        bool attacked = std::any_of(_attackers[a].begin(), _attackers[a].end(), [&](Index b)
                                    { return m[b] != 0; });
        if (!attacked) return false;
    }
    return true;
}

Extension ArgumentationFramework::characteristic(const Extension& s) const
{
    return to_extension(characteristic(to_mask(s)));
}

Extension ArgumentationFramework::grounded_extension() const
{
    return to_extension(grounded_mask());
}

std::vector<Extension> ArgumentationFramework::complete_extensions(ThreadPool* pool) const
{
    return canonical(complete_masks(pool));
}

std::vector<Extension> ArgumentationFramework::preferred_extensions(ThreadPool* pool) const
{
    return canonical(preferred_masks(pool));
}

std::vector<Extension> ArgumentationFramework::stable_extensions(ThreadPool* pool) const
{
    // every stable extension is preferred
    std::vector<Extension> result;
    for (Extension& e : canonical(preferred_masks(pool)))
    {
        if (stable(e)) result.push_back(std::move(e));
    }
    return result;
}

std::vector<Extension> ArgumentationFramework::extensions(const Semantics semantics, ThreadPool* pool) const
{
    switch (semantics)
    {
    case Semantics::Grounded:
        return {grounded_extension()};
    case Semantics::Complete:
        return complete_extensions(pool);
    case Semantics::Preferred:
        return preferred_extensions(pool);
    case Semantics::Stable:
        return stable_extensions(pool);
    }
    return {};
}

Labeling ArgumentationFramework::labeling_from_extension(const Extension& s) const
{
    const Mask m = to_mask(s);
    Labeling   labeling;

    for (Index a = 0; a < _arguments.size(); ++a)
    {
        Label label = Label::Undec;
        if (m[a])
        {
            label = Label::In;
        }
        else if (std::any_of(_attackers[a].begin(), _attackers[a].end(), [&](Index b)
                             { return m[b] != 0; }))
        {
            label = Label::Out;
        }
        labeling.emplace(_arguments[a], label);
    }
    return labeling;
}

std::vector<Labeling> ArgumentationFramework::labelings(const Semantics semantics, ThreadPool* pool) const
{
    std::vector<Labeling> result;
    for (const Extension& e : extensions(semantics, pool))
    {
        result.push_back(labeling_from_extension(e));
    }
    return result;
}

bool ArgumentationFramework::skeptical_acceptance(const std::string& argument, const Semantics semantics, ThreadPool* pool) const
{
    index(argument);
    const auto exts = extensions(semantics, pool);
    return std::all_of(exts.begin(), exts.end(), [&](const Extension& e)
                       { return std::binary_search(e.begin(), e.end(), argument); });
}

bool ArgumentationFramework::credulous_acceptance(const std::string& argument, const Semantics semantics, ThreadPool* pool) const
{
    index(argument);
    const auto exts = extensions(semantics, pool);
    return std::any_of(exts.begin(), exts.end(), [&](const Extension& e)
                       { return std::binary_search(e.begin(), e.end(), argument); });
}

ArgumentationFramework::Index ArgumentationFramework::index(const std::string& argument) const
{
    auto it = _index.find(argument);
    if (it == _index.end())
    {
        throw structural_error("ArgumentationFramework: unknown argument '" + argument + "'", argument);
    }
    return it->second;
}

ArgumentationFramework::Mask ArgumentationFramework::to_mask(const Extension& s) const
{
    Mask m(_arguments.size(), 0);
    for (const std::string& a : s)
    {
        m[index(a)] = 1;
    }
    return m;
}

Extension ArgumentationFramework::to_extension(const Mask& m) const
{
    Extension e;
    for (Index a = 0; a < m.size(); ++a)
    {
        if (m[a]) e.push_back(_arguments[a]);
    }
    std::sort(e.begin(), e.end());
    return e;
}

bool ArgumentationFramework::attacks(const Index a, const Index b) const
{
    return _attack_set.find((uint64_t(a) << 32) | b) != _attack_set.end();
}

bool ArgumentationFramework::conflict_free(const Mask& m) const
{
    for (Index a = 0; a < m.size(); ++a)
    {
        if (!m[a]) continue;
        for (Index b : _targets[a])
            if (m[b]) return false;
    }
    return true;
}

bool ArgumentationFramework::defended(const Mask& m, const Index a) const
{
    for (Index b : _attackers[a])
    {
        bool countered = std::any_of(_attackers[b].begin(), _attackers[b].end(), [&](Index c)
                                     { return m[c] != 0; });
        if (!countered) return false;
    }
    return true;
}

bool ArgumentationFramework::admissible(const Mask& m) const
{
    if (!conflict_free(m)) return false;

    for (Index a = 0; a < m.size(); ++a)
    {
        if (m[a] && !defended(m, a)) return false;
    }
    return true;
}

ArgumentationFramework::Mask ArgumentationFramework::characteristic(const Mask& m) const
{
    Mask result(_arguments.size(), 0);
    for (Index a = 0; a < _arguments.size(); ++a)
    {
        result[a] = defended(m, a) ? 1 : 0;
    }
    return result;
}

ArgumentationFramework::Mask ArgumentationFramework::grounded_mask() const
{
    // least fixed point of F, reached after at most |arguments| + 1 applications
    Mask current(_arguments.size(), 0);
    while (true)
    {
        Mask next = characteristic(current);
        if (next == current) return current;
        current = std::move(next);
    }
}

std::vector<ArgumentationFramework::Mask> ArgumentationFramework::complete_masks(ThreadPool* pool) const
{
    return Search(*this).run(pool);
}

std::vector<ArgumentationFramework::Mask> ArgumentationFramework::preferred_masks(ThreadPool* pool) const
{
    // preferred extensions are the subset-maximal complete extensions
    const std::vector<Mask> complete = complete_masks(pool);

    auto strict_subset = [](const Mask& a, const Mask& b)
    {
        bool smaller = false;
        for (size_t i = 0; i < a.size(); ++i)
        {
            if (a[i] && !b[i]) return false;
            if (!a[i] && b[i]) smaller = true;
        }
        return smaller;
    };

    std::vector<Mask> result;
    for (const Mask& candidate : complete)
    {
        bool dominated = std::any_of(complete.begin(), complete.end(), [&](const Mask& other)
                                     { return strict_subset(candidate, other); });
        if (!dominated) result.push_back(candidate);
    }
    return result;
}

std::vector<Extension> ArgumentationFramework::canonical(const std::vector<Mask>& masks) const
{
    std::vector<Extension> result;
    result.reserve(masks.size());
    for (const Mask& m : masks)
    {
        result.push_back(to_extension(m));
    }
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}
