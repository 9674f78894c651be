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

#include "dispute.hpp"
#include "errors.hpp"
#include "thread_pool.hpp"

#include <algorithm>
#include <limits>
#include <optional>

using namespace agora;
using namespace agora::aba;

std::string agora::aba::to_string(const Move move)
{
    return move == Move::Proponent ? "P" : "O";
}

std::string agora::aba::to_string(const Status status)
{
    switch (status)
    {
    case Status::Won:
        return "won";
    case Status::Failed:
        return "failed";
    case Status::Countered:
        return "countered";
    case Status::Defeated:
        return "defeated";
    case Status::Unanswered:
        return "unanswered";
    case Status::Truncated:
        return "truncated";
    }
    return "failed";
}

std::string DisputeTree::format() const
{
    std::string result;
    for (const DisputeNode& n : _nodes)
    {
        result += std::string(2 * n.depth, ' ') + to_string(n.move) + ": " + Framework::argument_id(n.claim, n.assumptions);
        if (!n.target.empty()) result += " against " + n.target;
        result += " (" + to_string(n.status) + ")\n";
    }
    return result;
}

const DisputeTree* DisputeResult::winning() const
{
    for (const DisputeTree& t : trees)
    {
        if (t.won()) return &t;
    }
    return nullptr;
}

namespace
{
    bool contains(const AssumptionSet& set, const Atom& atom)
    {
        return std::binary_search(set.begin(), set.end(), atom);
    }

    void insert(AssumptionSet& set, const Atom& atom)
    {
        set = utils::unite(set, AssumptionSet{atom});
    }

    // minimal supports of every atom a dispute may need to argue for, computed once and
    // shared read-only by all searches
    using SupportTable = ankerl::unordered_dense::map<Atom, std::vector<AssumptionSet>>;

    constexpr size_t no_parent = std::numeric_limits<size_t>::max();
}

namespace agora
{
    namespace aba
    {
        // Depth-first search for one dispute tree, starting from one candidate support of
        // the goals. Moves are appended to a flat node list together with their parent;
        // an alternative that fails is rolled back by truncating the list. The first dead
        // end is kept as the tree reported when the dispute is lost.
        class DisputeBuilder
        {
        public:
            DisputeBuilder(const Framework& framework, const SupportTable& supports, const dung::Semantics semantics, const int max_depth)
                : _framework(framework)
                , _supports(supports)
                , _semantics(semantics)
                , _max_depth(static_cast<size_t>(max_depth))
            {
                const auto& contraries = framework.contraries();
                for (size_t i = 0; i < contraries.size(); ++i)
                {
                    _rank.emplace(contraries[i].first, i);
                }
            }

            DisputeTree run(const std::vector<Atom>& goals, const AssumptionSet& support)
            {
                const size_t root = append(Move::Proponent, utils::concatenate(goals, std::string(", ")), support, {}, no_parent, 0);

                const bool won = _semantics == dung::Semantics::Grounded
                                   ? defend(root, {})
                                   : propose(root, {}, {}, {});

                DisputeTree tree;
                tree._won = won;

                if (!won && _captured)
                {
                    _nodes   = std::move(_witness_nodes);
                    _parents = std::move(_witness_parents);
                }

                for (size_t i = 1; i < _nodes.size(); ++i)
                {
                    _nodes[_parents[i]].children.push_back(i);
                }

                if (won)
                {
                    for (const DisputeNode& n : _nodes)
                    {
                        if (n.move != Move::Proponent) continue;
                        tree._defence = utils::unite(tree._defence, n.assumptions);
                        if (!n.target.empty()) insert(tree._culprits, n.target);
                    }
                }
                else
                {
                    tree._defence = support;
                }

                tree._nodes = std::move(_nodes);
                snapshot(goals, tree);
                return tree;
            }

            bool   truncated() const { return _truncated; }
            size_t moves() const { return _moves; }

        private:
            // move waiting on the agenda of an admissible search
            struct Pending
            {
                Move          move{Move::Opponent};
                Atom          claim;
                AssumptionSet assumptions;
                Atom          target;
                size_t        parent{no_parent};
                size_t        depth{0};
            };

            using Agenda = std::vector<Pending>; // back is next

            const std::vector<AssumptionSet>& supports(const Atom& atom) const
            {
                static const std::vector<AssumptionSet> none;
                auto it = _supports.find(atom);
                return it == _supports.end() ? none : it->second;
            }

            // assumptions in the order their contraries were registered, the ones
            // without contrary last
            std::vector<Atom> by_contrary(const AssumptionSet& assumptions) const
            {
                std::vector<Atom> ordered(assumptions.begin(), assumptions.end());
                std::stable_sort(ordered.begin(), ordered.end(), [this](const Atom& a, const Atom& b)
                                 { return rank(a) < rank(b); });
                return ordered;
            }

            size_t rank(const Atom& assumption) const
            {
                auto it = _rank.find(assumption);
                return it == _rank.end() ? _rank.size() : it->second;
            }

            size_t append(const Move move, const Atom& claim, const AssumptionSet& assumptions, const Atom& target, const size_t parent, const size_t depth)
            {
                DisputeNode n;
                n.move        = move;
                n.claim       = claim;
                n.assumptions = assumptions;
                n.target      = target;
                n.depth       = depth;
                n.status      = move == Move::Proponent ? Status::Won : Status::Unanswered;

                _nodes.push_back(std::move(n));
                _parents.push_back(parent);
                return _nodes.size() - 1;
            }

            void rollback(const size_t size)
            {
                _nodes.resize(size);
                _parents.resize(size);
            }

            // keeps the first dead end, with every move above it marked as lost
            void capture(const size_t failed)
            {
                if (_captured) return;
                _captured = true;

                _witness_nodes   = _nodes;
                _witness_parents = _parents;
                for (size_t i = failed; i != 0;)
                {
                    i                         = _witness_parents[i];
                    _witness_nodes[i].status = _witness_nodes[i].move == Move::Proponent ? Status::Failed : Status::Unanswered;
                }
            }

            bool truncate(const size_t index)
            {
                _nodes[index].status = Status::Truncated;
                _truncated           = true;
                capture(index);
                return false;
            }

            // Grounded: every attack on every assumption gets its own counter-attack.
            // `branch` holds the assumptions under defence above this move.
            bool defend(const size_t pro, const AssumptionSet& branch)
            {
                ++_moves;
                if (_nodes[pro].depth > _max_depth) return truncate(pro);

                const AssumptionSet assumptions = _nodes[pro].assumptions;
                const size_t        depth       = _nodes[pro].depth;

                for (const Atom& x : by_contrary(assumptions))
                {
                    const std::optional<Atom> c = _framework.contrary(x);
                    if (!c || supports(*c).empty()) continue;

                    if (contains(branch, x))
                    {
                        _nodes[pro].status = Status::Failed;
                        capture(pro);
                        return false;
                    }

                    AssumptionSet below = branch;
                    insert(below, x);

                    for (const AssumptionSet& t : supports(*c))
                    {
                        const size_t opp = append(Move::Opponent, *c, t, x, pro, depth + 1);
                        if (!counter(opp, below))
                        {
                            _nodes[pro].status = Status::Failed;
                            return false;
                        }
                    }
                }

                _nodes[pro].status = Status::Won;
                return true;
            }

            bool counter(const size_t opp, const AssumptionSet& branch)
            {
                ++_moves;
                if (_nodes[opp].depth > _max_depth) return truncate(opp);

                const AssumptionSet attack = _nodes[opp].assumptions;
                const size_t        depth  = _nodes[opp].depth;

                for (const Atom& y : attack)
                {
                    const std::optional<Atom> c = _framework.contrary(y);
                    if (!c) continue;

                    for (const AssumptionSet& s : supports(*c))
                    {
                        if (contains(s, y)) continue;

                        const size_t mark = _nodes.size();
                        const size_t pro  = append(Move::Proponent, *c, s, y, opp, depth + 1);
                        if (defend(pro, branch))
                        {
                            _nodes[opp].status = Status::Countered;
                            return true;
                        }
                        rollback(mark);
                    }
                }

                _nodes[opp].status = Status::Unanswered;
                capture(opp);
                return false;
            }

            // Admissible: takes the next move off the agenda. The agenda carries every
            // opponent move still to be answered, so a failure anywhere below revises the
            // choices made for earlier moves.
            bool search(Agenda agenda, const AssumptionSet& defence, const AssumptionSet& culprits)
            {
                if (agenda.empty()) return true;

                Pending next = std::move(agenda.back());
                agenda.pop_back();

                const size_t mark  = _nodes.size();
                const size_t index = append(next.move, next.claim, next.assumptions, next.target, next.parent, next.depth);

                const bool won = next.move == Move::Proponent
                                   ? propose(index, std::move(agenda), defence, culprits)
                                   : oppose(index, std::move(agenda), defence, culprits);
                if (!won) rollback(mark);
                return won;
            }

            bool propose(const size_t pro, Agenda agenda, AssumptionSet defence, const AssumptionSet& culprits)
            {
                ++_moves;
                if (_nodes[pro].depth > _max_depth) return truncate(pro);

                const AssumptionSet assumptions = _nodes[pro].assumptions;
                const size_t        depth       = _nodes[pro].depth;

                if (utils::intersects(assumptions, culprits))
                {
                    _nodes[pro].status = Status::Failed;
                    capture(pro);
                    return false;
                }

                std::vector<Pending> attacks;
                for (const Atom& x : by_contrary(assumptions))
                {
                    if (contains(defence, x)) continue;
                    insert(defence, x);

                    const std::optional<Atom> c = _framework.contrary(x);
                    if (!c) continue;

                    for (const AssumptionSet& t : supports(*c))
                    {
                        attacks.push_back(Pending{Move::Opponent, *c, t, x, pro, depth + 1});
                    }
                }
                agenda.insert(agenda.end(), attacks.rbegin(), attacks.rend());

                return search(std::move(agenda), defence, culprits);
            }

            bool oppose(const size_t opp, const Agenda& agenda, const AssumptionSet& defence, const AssumptionSet& culprits)
            {
                ++_moves;
                const AssumptionSet attack = _nodes[opp].assumptions;

                if (utils::intersects(attack, culprits))
                {
                    _nodes[opp].status = Status::Defeated;
                    return search(agenda, defence, culprits);
                }

                if (_nodes[opp].depth > _max_depth) return truncate(opp);
                const size_t depth = _nodes[opp].depth;

                for (const Atom& y : attack)
                {
                    if (contains(defence, y)) continue;

                    const std::optional<Atom> c = _framework.contrary(y);
                    if (!c) continue;

                    for (const AssumptionSet& s : supports(*c))
                    {
                        if (contains(s, y) || utils::intersects(s, culprits)) continue;

                        AssumptionSet trial = culprits;
                        insert(trial, y);

                        Agenda continued = agenda;
                        continued.push_back(Pending{Move::Proponent, *c, s, y, opp, depth + 1});

                        const size_t mark  = _nodes.size();
                        _nodes[opp].status = Status::Countered;
                        if (search(std::move(continued), defence, trial)) return true;
                        rollback(mark);
                    }
                }

                _nodes[opp].status = Status::Unanswered;
                capture(opp);
                return false;
            }

            void snapshot(const std::vector<Atom>& goals, DisputeTree& tree) const
            {
                AssumptionSet     assumptions;
                std::vector<Atom> claims(goals.begin(), goals.end());

                for (const DisputeNode& n : tree._nodes)
                {
                    assumptions = utils::unite(assumptions, n.assumptions);
                    if (!n.target.empty()) insert(assumptions, n.target);
                    if (&n != &tree._nodes.front()) claims.push_back(n.claim);
                }

                for (const auto& [a, c] : _framework.contraries())
                {
                    if (contains(assumptions, a)) tree._contraries.emplace_back(a, c);
                }

                // rules reachable from the claims, in registration order
                const std::vector<Rule>&           rules = _framework.rules();
                std::vector<bool>                  used(rules.size(), false);
                ankerl::unordered_dense::set<Atom> visited;

                while (!claims.empty())
                {
                    Atom atom = std::move(claims.back());
                    claims.pop_back();
                    if (!visited.insert(atom).second) continue;

                    for (size_t i = 0; i < rules.size(); ++i)
                    {
                        if (used[i] || rules[i].head != atom) continue;
                        used[i] = true;
                        claims.insert(claims.end(), rules[i].body.begin(), rules[i].body.end());
                    }
                }

                for (size_t i = 0; i < rules.size(); ++i)
                {
                    if (used[i]) tree._rules.push_back(rules[i]);
                }

                tree._assumptions = std::move(assumptions);
            }

            const Framework&                           _framework;
            const SupportTable&                        _supports;
            const dung::Semantics                      _semantics;
            const size_t                               _max_depth;
            ankerl::unordered_dense::map<Atom, size_t> _rank;

            std::vector<DisputeNode> _nodes;
            std::vector<size_t>      _parents;
            std::vector<DisputeNode> _witness_nodes;
            std::vector<size_t>      _witness_parents;
            bool                     _captured{false};
            bool                     _truncated{false};
            size_t                   _moves{0};
        };
    }
}

DisputeResult agora::aba::dispute_trees(const Framework& framework, const std::vector<Atom>& goals, const dung::Semantics semantics, const int max_depth, ThreadPool* pool)
{
    if (semantics == dung::Semantics::Stable)
    {
        throw configuration_error("Dispute trees are not available for stable semantics", "semantics");
    }

    if (max_depth < 0)
    {
        throw configuration_error("dispute_max_depth must not be negative", "dispute_max_depth");
    }

    if (goals.empty())
    {
        throw structural_error("dispute_trees: no goals given");
    }

    framework.validate();

    SupportTable supports;
    for (const Atom& g : goals)
    {
        supports.emplace(g, framework.derive(g));
    }
    for (const auto& [a, c] : framework.contraries())
    {
        if (supports.find(c) == supports.end()) supports.emplace(c, framework.derive(c));
    }

    // candidate root supports: one minimal support per goal, combined
    std::vector<AssumptionSet> candidates{AssumptionSet{}};
    for (const Atom& g : goals)
    {
        std::vector<AssumptionSet> combined;
        for (const AssumptionSet& p : candidates)
        {
            for (const AssumptionSet& s : supports[g])
            {
                combined.push_back(utils::unite(p, s));
            }
        }
        utils::minimize(combined);
        candidates = std::move(combined);
    }

    DisputeResult result;
    result.goals     = goals;
    result.semantics = semantics;

    std::vector<std::optional<DisputeTree>> trees(candidates.size());
    std::vector<char>                       truncated(candidates.size(), 0); // one byte per task, written concurrently
    std::vector<size_t>                     moves(candidates.size(), 0);

    auto search = [&](const size_t i)
    {
        DisputeBuilder builder(framework, supports, semantics, max_depth);
        trees[i]     = builder.run(goals, candidates[i]);
        truncated[i] = builder.truncated() ? 1 : 0;
        moves[i]     = builder.moves();
    };

    if (pool && pool->count() > 1 && candidates.size() > 1)
    {
        for (size_t i = 0; i < candidates.size(); ++i)
        {
            pool->enqueue([&search, i]
                          { search(i); });
        }
        pool->wait();
    }
    else
    {
        for (size_t i = 0; i < candidates.size(); ++i) search(i);
    }

    bool any_truncated = false;
    for (size_t i = 0; i < candidates.size(); ++i)
    {
        result.accepted = result.accepted || trees[i]->won();
        any_truncated   = any_truncated || truncated[i] != 0;
        result.moves += moves[i];
        result.trees.push_back(std::move(*trees[i]));
    }

    result.converged = result.accepted || !any_truncated;
    return result;
}
