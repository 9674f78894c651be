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

#include "reasoner.hpp"
#include "errors.hpp"
#include "stopwatch.hpp"
#include "thread_pool.hpp"
#include "utils.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/tokenizer.hpp>

#include <algorithm>
#include <iomanip>
#include <iostream> // For std::clog
#include <sstream>

using namespace agora;
using namespace agora::reasoning;

namespace
{
    std::string fixed(const double value)
    {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(4) << value;
        return oss.str();
    }

    std::string plural(const size_t n, const std::string& word)
    {
        return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
    }
}

std::string agora::reasoning::to_string(const Task task)
{
    switch (task)
    {
    case Task::Extensions:
        return "extensions";
    case Task::Labelings:
        return "labelings";
    case Task::BundleExtensions:
        return "bundle-extensions";
    case Task::Acceptance:
        return "acceptance";
    case Task::AbaSolve:
        return "aba-solve";
    case Task::Derive:
        return "derive";
    case Task::Dispute:
        return "dispute";
    case Task::Credibility:
        return "credibility";
    case Task::Diagnostics:
        return "diagnostics";
    }
    return "extensions";
}

Task agora::reasoning::parse_task(const std::string& name)
{
    std::string n = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
    boost::replace_all(n, "_", "-");

    static const std::map<std::string, Task> tasks{
        {"extensions", Task::Extensions},
        {"labelings", Task::Labelings},
        {"bundle-extensions", Task::BundleExtensions},
        {"bundles", Task::BundleExtensions},
        {"acceptance", Task::Acceptance},
        {"aba-solve", Task::AbaSolve},
        {"aba", Task::AbaSolve},
        {"derive", Task::Derive},
        {"dispute", Task::Dispute},
        {"credibility", Task::Credibility},
        {"diagnostics", Task::Diagnostics}};

    auto it = tasks.find(n);
    if (it == tasks.end())
    {
        throw configuration_error("Unknown task '" + name + "'", "task");
    }
    return it->second;
}

Reasoner::Reasoner(const graph::Graph& graph, Config config, Print print)
    : _graph(graph)
    , _config(std::move(config))
    , _print(std::move(print))
{
    _config.validate();
}

aba::Framework Reasoner::new_framework() const
{
    return aba::Framework(_config.allow_circular_rules);
}

const aba::Framework& Reasoner::framework() const
{
    if (!_framework)
    {
        throw configuration_error("No ABA framework has been attached to the reasoner", "framework");
    }
    return *_framework;
}

std::unique_ptr<ThreadPool> Reasoner::pool() const
{
    if (_config.threads < 2) return nullptr;
    return std::make_unique<ThreadPool>(static_cast<size_t>(_config.threads));
}

void Reasoner::print(const std::string& message, const bool important) const
{
    if (_print) _print(message, important);
}

void Reasoner::log(const std::string& message) const
{
    if (_config.verbose) std::clog << message << std::endl;
}

DungResult Reasoner::evaluate(const dung::ArgumentationFramework& af) const
{
    StopWatch watch;
    auto      workers = pool();

    DungResult result;
    result.semantics  = _config.semantics;
    result.extensions = af.extensions(_config.semantics, workers.get());

    for (const dung::Extension& e : result.extensions)
    {
        dung::Labeling labeling = af.labeling_from_extension(e);

        std::map<std::string, ArgumentExplanation> explanation;
        for (const auto& [argument, label] : labeling)
        {
            ArgumentExplanation x;
            x.label     = label;
            x.attackers = af.attackers_of(argument);

            for (const std::string& attacker : x.attackers)
            {
                if (std::binary_search(e.begin(), e.end(), attacker)) x.attacked_by_members.push_back(attacker);

                for (const std::string& defender : af.attackers_of(attacker))
                {
                    if (std::binary_search(e.begin(), e.end(), defender)) x.defenders.push_back(defender);
                }
            }
            utils::canonicalize(x.defenders);

            explanation.emplace(argument, std::move(x));
        }

        result.labelings.push_back(std::move(labeling));
        result.explanations.push_back(std::move(explanation));
    }

    log("Computed " + plural(result.extensions.size(), dung::to_string(_config.semantics) + " extension") + " over " + plural(af.count(), "argument") + " in " + watch.format() + ".");
    return result;
}

DungResult Reasoner::extensions() const
{
    return evaluate(dung::ArgumentationFramework::from_graph(_graph));
}

std::vector<dung::Labeling> Reasoner::labelings() const
{
    return extensions().labelings;
}

BundleResult Reasoner::bundle_extensions() const
{
    BundleResult result;
    result.projection = bundles::project(_graph, _config.bundle_aggregation);
    result.extensions = evaluate(dung::ArgumentationFramework::from_bundles(result.projection));
    return result;
}

AcceptanceResult Reasoner::acceptance(const std::string& argument) const
{
    const auto af = dung::ArgumentationFramework::from_graph(_graph);
    if (!af.has_argument(argument))
    {
        throw structural_error("Unknown argument '" + argument + "'", argument);
    }

    auto workers = pool();

    AcceptanceResult result;
    result.argument       = argument;
    result.semantics      = _config.semantics;
    result.skeptical      = af.skeptical_acceptance(argument, _config.semantics, workers.get());
    result.credulous      = af.credulous_acceptance(argument, _config.semantics, workers.get());
    result.grounded_label = af.labeling_from_extension(af.grounded_extension()).at(argument);
    return result;
}

aba::Solution Reasoner::aba_solve() const
{
    StopWatch watch;
    auto      workers  = pool();
    aba::Solution result = framework().solve(_config.semantics, workers.get());

    log("ABA: " + plural(result.extensions.size(), dung::to_string(_config.semantics) + " extension") + " in " + watch.format() + ".");
    return result;
}

std::vector<aba::AssumptionSet> Reasoner::derive(const aba::Atom& atom) const
{
    return framework().derive(atom);
}

aba::DisputeResult Reasoner::dispute(const std::vector<aba::Atom>& goals) const
{
    StopWatch watch;
    auto      workers = pool();
    aba::DisputeResult result = aba::dispute_trees(framework(), goals, _config.semantics, _config.dispute_max_depth, workers.get());

    log("Dispute for " + utils::format_set(goals) + ": " + plural(result.trees.size(), "tree") + ", " + std::to_string(result.moves) + " moves in " + watch.format() + ".");

    if (!result.converged)
    {
        print("Dispute search for " + utils::format_set(goals) + " reached dispute_max_depth = " + std::to_string(_config.dispute_max_depth) + " without a decision.", true);
    }
    return result;
}

credibility::Result Reasoner::propagate() const
{
    StopWatch                  watch;
    const credibility::Propagator propagator(_graph, _config.credibility_parameters());
    credibility::Result        result = propagator.run();

    log("Credibility propagation: " + plural(static_cast<size_t>(result.iterations), "iteration") + ", last delta " + fixed(result.delta) + ", " + watch.format() + ".");

    if (!result.converged)
    {
        print("Credibility propagation stopped after " + plural(static_cast<size_t>(result.iterations), "iteration") + " without converging.", true);
    }
    return result;
}

diagnostics::Report Reasoner::diagnose() const
{
    return diagnostics::diagnose(_graph);
}

Outcome Reasoner::run(const Task task, const Query& query) const
{
    StopWatch watch;
    Outcome   outcome;
    outcome.task = task;

    auto require_goals = [&]()
    {
        if (query.goals.empty())
        {
            throw configuration_error("Task " + to_string(task) + " needs at least one goal", "goals");
        }
    };

    switch (task)
    {
    case Task::Extensions:
    case Task::Labelings:
        outcome.extensions = extensions();
        outcome.summary    = plural(outcome.extensions->extensions.size(), dung::to_string(_config.semantics) + (task == Task::Labelings ? " labeling" : " extension"));
        break;

    case Task::BundleExtensions:
        outcome.bundle_extensions = bundle_extensions();
        outcome.summary           = plural(outcome.bundle_extensions->extensions.extensions.size(), dung::to_string(_config.semantics) + " extension")
                        + " over " + plural(outcome.bundle_extensions->projection.bundles.size(), "bundle");
        break;

    case Task::Acceptance:
        if (query.argument.empty())
        {
            throw configuration_error("Task acceptance needs an argument", "argument");
        }
        outcome.acceptance = acceptance(query.argument);
        outcome.summary    = query.argument + ": skeptical " + (outcome.acceptance->skeptical ? "yes" : "no") + ", credulous " + (outcome.acceptance->credulous ? "yes" : "no");
        break;

    case Task::AbaSolve:
        outcome.solution = aba_solve();
        outcome.summary  = plural(outcome.solution->extensions.size(), dung::to_string(_config.semantics) + " extension");
        break;

    case Task::Derive:
        require_goals();
        outcome.derivations = derive(query.goals.front());
        outcome.summary     = query.goals.front() + ": " + plural(outcome.derivations.size(), "minimal support");
        break;

    case Task::Dispute:
        require_goals();
        outcome.dispute = dispute(query.goals);
        outcome.summary = utils::format_set(query.goals) + (outcome.dispute->accepted ? " accepted" : " not accepted");
        if (!outcome.dispute->converged) outcome.summary += " (depth bound reached)";
        break;

    case Task::Credibility:
        outcome.scores  = propagate();
        outcome.summary = std::string(outcome.scores->converged ? "converged" : "not converged") + " after " + plural(static_cast<size_t>(outcome.scores->iterations), "iteration");
        break;

    case Task::Diagnostics:
        outcome.report  = diagnose();
        outcome.summary = plural(outcome.report->node_count, "unit") + ", " + plural(outcome.report->relation_count, "relation") + ", " + plural(outcome.report->cycle_count(), "cycle");
        break;
    }

    watch.stop();
    outcome.milliseconds = watch.milliseconds();
    log("Task " + to_string(task) + " complete in " + watch.format() + ": " + outcome.summary + ".");
    return outcome;
}

std::vector<Outcome> Reasoner::run(const std::vector<Task>& tasks, const Query& query) const
{
    std::vector<Outcome> outcomes;
    outcomes.reserve(tasks.size());
    for (Task task : tasks)
    {
        outcomes.push_back(run(task, query));
    }
    return outcomes;
}

std::vector<std::string> Reasoner::explain(const Outcome& outcome) const
{
    std::vector<std::string> lines{to_string(outcome.task) + ": " + outcome.summary};

    auto explain_dung = [&](const DungResult& r)
    {
        for (size_t i = 0; i < r.extensions.size(); ++i)
        {
            lines.push_back("extension " + utils::format_set(r.extensions[i]));
            for (const auto& [argument, x] : r.explanations[i])
            {
                std::string line = "  " + argument + ": " + dung::to_string(x.label);
                if (!x.attacked_by_members.empty()) line += ", attacked by " + utils::format_set(x.attacked_by_members);
                if (x.label == dung::Label::In && !x.defenders.empty()) line += ", defended by " + utils::format_set(x.defenders);
                lines.push_back(line);
            }
        }
    };

    if (outcome.extensions) explain_dung(*outcome.extensions);

    if (outcome.bundle_extensions)
    {
        for (const auto& b : outcome.bundle_extensions->projection.bundles)
        {
            lines.push_back("bundle " + b.id + " = " + utils::format_set(b.units));
        }
        for (const auto& e : outcome.bundle_extensions->projection.cross_edges)
        {
            lines.push_back("  " + e.src + " -> " + e.dst + ": " + fixed(e.weight) + " (" + graph::to_string(e.kind) + ")");
        }
        explain_dung(outcome.bundle_extensions->extensions);
    }

    if (outcome.acceptance)
    {
        lines.push_back("grounded label of " + outcome.acceptance->argument + ": " + dung::to_string(outcome.acceptance->grounded_label));
    }

    if (outcome.solution)
    {
        for (size_t i = 0; i < outcome.solution->extensions.size(); ++i)
        {
            lines.push_back("assumptions " + utils::format_set(outcome.solution->assumptions[i]) + " accept " + utils::format_set(outcome.solution->claims[i]));
        }
    }

    for (const aba::AssumptionSet& s : outcome.derivations)
    {
        lines.push_back("  " + utils::format_set(s));
    }

    if (outcome.dispute)
    {
        if (const aba::DisputeTree* tree = outcome.dispute->winning())
        {
            lines.push_back("defence " + utils::format_set(tree->defence()) + ", culprits " + utils::format_set(tree->culprits()));
        }
        for (const aba::DisputeTree& tree : outcome.dispute->trees)
        {
            std::string text = tree.format();
            boost::char_separator<char> newline("\n");
            boost::tokenizer<boost::char_separator<char>> tok(text, newline);
            lines.insert(lines.end(), tok.begin(), tok.end());
        }
    }

    if (outcome.scores)
    {
        for (const auto& [unit, score] : outcome.scores->scores)
        {
            const credibility::Breakdown& b = outcome.scores->breakdown.at(unit);
            if (b.fixed)
            {
                lines.push_back(unit + ": " + fixed(score) + " (axiom)");
                continue;
            }

            lines.push_back(unit + ": " + fixed(score) + " (evidence " + fixed(b.evidence_term) + ", propagated " + fixed(b.propagated_term) + ")");
            for (const credibility::Contribution& c : b.contributions)
            {
                lines.push_back("  " + graph::to_string(c.kind) + " from " + c.src + ": " + (c.open ? fixed(c.value) : "gate closed"));
            }
        }

        for (const credibility::Fragility& f : outcome.scores->fragility)
        {
            lines.push_back("gate to " + f.dst + " (" + graph::to_string(f.gate_mode) + "): " + fixed(f.gate_score) + ", critical " + utils::format_set(f.critical_warrants));
        }
    }

    if (outcome.report)
    {
        for (const utils::IdList& cycle : outcome.report->cycles)
        {
            lines.push_back("cycle " + utils::concatenate(cycle, std::string(" -> ")));
        }
        lines.insert(lines.end(), outcome.report->warnings.begin(), outcome.report->warnings.end());
    }

    return lines;
}
