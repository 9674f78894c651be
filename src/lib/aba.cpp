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

#include "aba.hpp"
#include "errors.hpp"

#include <algorithm>
#include <limits>

using namespace agora;
using namespace agora::aba;

const Argument* Translation::find(const std::string& id) const
{
    auto it = std::find_if(arguments.begin(), arguments.end(), [&](const Argument& a)
                           { return a.id == id; });
    return it == arguments.end() ? nullptr : &*it;
}

Framework::Framework(const bool allow_circular_rules)
    : _allow_circular_rules(allow_circular_rules)
{
}

void Framework::add_assumption(const Atom& assumption)
{
    if (assumption.empty())
    {
        throw structural_error("aba::Framework::add_assumption: empty atom");
    }

    if (_assumption_set.insert(assumption).second)
    {
        _assumptions.push_back(assumption);
    }
}

void Framework::add_contrary(const Atom& assumption, const Atom& contrary)
{
    if (assumption.empty() || contrary.empty())
    {
        throw structural_error("aba::Framework::add_contrary: empty atom", assumption);
    }

    _contraries.emplace_back(assumption, contrary);
}

void Framework::add_rule(const Atom& head, const std::vector<Atom>& body)
{
    if (head.empty() || std::any_of(body.begin(), body.end(), [](const Atom& a)
                                    { return a.empty(); }))
    {
        throw structural_error("aba::Framework::add_rule: empty atom", head);
    }

    if (!_allow_circular_rules && !is_assumption(head) && reaches(body, head))
    {
        throw structural_error("Rule for '" + head + "' is circular: '" + head + "' is derivable only from itself", head);
    }

    _rules_by_head[head].push_back(_rules.size());
    _rules.push_back(Rule{head, body});
}

bool Framework::is_assumption(const Atom& atom) const
{
    return _assumption_set.find(atom) != _assumption_set.end();
}

std::optional<Atom> Framework::contrary(const Atom& assumption) const
{
    for (const auto& [a, c] : _contraries)
    {
        if (a == assumption) return c;
    }
    return std::nullopt;
}

std::vector<Atom> Framework::language() const
{
    std::vector<Atom> atoms(_assumptions.begin(), _assumptions.end());
    for (const auto& [a, c] : _contraries)
    {
        atoms.push_back(a);
        atoms.push_back(c);
    }
    for (const Rule& r : _rules)
    {
        atoms.push_back(r.head);
        atoms.insert(atoms.end(), r.body.begin(), r.body.end());
    }
    utils::canonicalize(atoms);
    return atoms;
}

void Framework::validate() const
{
    ankerl::unordered_dense::set<Atom> with_contrary;
    for (const auto& [a, c] : _contraries)
    {
        if (!is_assumption(a))
        {
            throw structural_error("Contrary '" + c + "' registered for '" + a + "', which is not an assumption", a);
        }

        if (!with_contrary.insert(a).second)
        {
            throw structural_error("Assumption '" + a + "' has more than one contrary", a);
        }
    }

    for (const Rule& r : _rules)
    {
        for (const Atom& b : r.body)
        {
            if (!is_assumption(b) && _rules_by_head.find(b) == _rules_by_head.end())
            {
                throw structural_error("Rule for '" + r.head + "' uses '" + b + "', which is neither an assumption nor the head of a rule", b);
            }
        }

        // again on the complete framework, the rule may predate allow_circular_rules(false)
        if (!_allow_circular_rules && !is_assumption(r.head) && reaches(r.body, r.head))
        {
            throw structural_error("Rule for '" + r.head + "' is circular: '" + r.head + "' is derivable only from itself", r.head);
        }
    }
}

bool Framework::reaches(const std::vector<Atom>& from, const Atom& target) const
{
    std::vector<Atom>                  stack(from.begin(), from.end());
    ankerl::unordered_dense::set<Atom> visited;

    while (!stack.empty())
    {
        Atom atom = std::move(stack.back());
        stack.pop_back();

        if (is_assumption(atom)) continue; // derivation ends here
        if (atom == target) return true;
        if (!visited.insert(atom).second) continue;

        auto it = _rules_by_head.find(atom);
        if (it == _rules_by_head.end()) continue;

        for (size_t r : it->second)
        {
            stack.insert(stack.end(), _rules[r].body.begin(), _rules[r].body.end());
        }
    }
    return false;
}

std::vector<AssumptionSet> Framework::derive(const Atom& atom) const
{
    validate();

    std::vector<Atom> path;
    Memo              memo;
    size_t            cut = std::numeric_limits<size_t>::max();
    return derive(atom, path, memo, cut);
}

// Backward chaining. An atom already in progress on the current path is not entered
// again, which bounds the path length by the number of distinct atoms. `cut` receives
// the lowest path position that was refused this way; results computed below such a
// position depend on the path and are not memoized.
std::vector<AssumptionSet> Framework::derive(const Atom& atom, std::vector<Atom>& path, Memo& memo, size_t& cut) const
{
    auto known = memo.find(atom);
    if (known != memo.end()) return known->second;

    auto on_path = std::find(path.begin(), path.end(), atom);
    if (on_path != path.end())
    {
        cut = std::min(cut, static_cast<size_t>(on_path - path.begin()));
        return {};
    }

    const size_t               depth = path.size();
    std::vector<AssumptionSet> result;

    if (is_assumption(atom))
    {
        result.push_back(AssumptionSet{atom});
    }

    auto rules = _rules_by_head.find(atom);
    if (rules != _rules_by_head.end())
    {
        path.push_back(atom);

        for (size_t r : rules->second)
        {
            std::vector<AssumptionSet> partial{AssumptionSet{}};

            for (const Atom& b : _rules[r].body)
            {
                const std::vector<AssumptionSet> supports = derive(b, path, memo, cut);

                std::vector<AssumptionSet> combined;
                for (const AssumptionSet& p : partial)
                {
                    for (const AssumptionSet& s : supports)
                    {
                        combined.push_back(utils::unite(p, s));
                    }
                }
                utils::minimize(combined);
                partial = std::move(combined);

                if (partial.empty()) break;
            }

            result.insert(result.end(), partial.begin(), partial.end());
        }

        path.pop_back();
    }

    utils::minimize(result);

    if (cut >= depth)
    {
        memo[atom] = result;
    }
    return result;
}

std::string Framework::argument_id(const Atom& claim, const AssumptionSet& support)
{
    return utils::format_set(support) + " |- " + claim;
}

std::vector<Argument> Framework::arguments() const
{
    validate();

    std::vector<Argument> result;
    Memo                  memo;

    for (const Atom& atom : language())
    {
        std::vector<Atom> path;
        size_t            cut = std::numeric_limits<size_t>::max();

        for (AssumptionSet& support : derive(atom, path, memo, cut))
        {
            std::string id = argument_id(atom, support);
            result.push_back(Argument{std::move(id), atom, std::move(support)});
        }
    }
    return result;
}

Translation Framework::to_af() const
{
    Translation t;
    t.arguments = arguments();

    for (const Argument& a : t.arguments)
    {
        t.af.add_argument(a.id);
    }

    // contrary atom -> assumptions it is the contrary of
    ankerl::unordered_dense::map<Atom, std::vector<Atom>> contrary_of;
    for (const auto& [a, c] : _contraries)
    {
        contrary_of[c].push_back(a);
    }

    for (const Argument& attacker : t.arguments)
    {
        auto it = contrary_of.find(attacker.claim);
        if (it == contrary_of.end()) continue;

        for (const Argument& target : t.arguments)
        {
            bool hit = std::any_of(it->second.begin(), it->second.end(), [&](const Atom& x)
                                   { return std::binary_search(target.support.begin(), target.support.end(), x); });
            if (hit)
            {
                t.af.add_attack(attacker.id, target.id);
            }
        }
    }
    return t;
}

Solution Framework::solve(const dung::Semantics semantics, ThreadPool* pool) const
{
    const Translation t = to_af();

    Solution solution;
    solution.semantics  = semantics;
    solution.extensions = t.af.extensions(semantics, pool);

    for (const dung::Extension& e : solution.extensions)
    {
        AssumptionSet     assumptions;
        std::vector<Atom> claims;

        for (const std::string& id : e)
        {
            const Argument* a = t.find(id);
            if (!a) continue;
            assumptions = utils::unite(assumptions, a->support);
            claims.push_back(a->claim);
        }

        utils::canonicalize(claims);
        solution.assumptions.push_back(std::move(assumptions));
        solution.claims.push_back(std::move(claims));
    }
    return solution;
}
