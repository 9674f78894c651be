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

#include "aba.hpp"
#include "bundles.hpp"
#include "config.hpp"
#include "credibility.hpp"
#include "diagnostics.hpp"
#include "dispute.hpp"
#include "dung.hpp"
#include "graph.hpp"

#include <agora_export.h>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agora
{
    class ThreadPool;

    namespace reasoning
    {
        enum class Task
        {
            Extensions,
            Labelings,
            BundleExtensions,
            Acceptance,
            AbaSolve,
            Derive,
            Dispute,
            Credibility,
            Diagnostics
        };

        std::string AGORA_EXPORT to_string(Task task);

        // Maps a task name ("extensions", "bundle-extensions", ...) to its Task. Unknown
        // names raise configuration_error.
        Task AGORA_EXPORT parse_task(const std::string& name);

        // Why an argument got its label in one extension.
        struct ArgumentExplanation
        {
            dung::Label              label{dung::Label::Undec};
            std::vector<std::string> attackers;          // all attackers
            std::vector<std::string> attacked_by_members; // attackers inside the extension
            std::vector<std::string> defenders;          // extension members attacking one of its attackers
        };

        struct DungResult
        {
            dung::Semantics              semantics{dung::Semantics::Grounded};
            std::vector<dung::Extension> extensions;
            std::vector<dung::Labeling>  labelings; // one per extension, same order
            std::vector<std::map<std::string, ArgumentExplanation>> explanations;
        };

        struct BundleResult
        {
            bundles::BundleGraph projection;
            DungResult           extensions;
        };

        struct AcceptanceResult
        {
            std::string     argument;
            dung::Semantics semantics{dung::Semantics::Grounded};
            bool            skeptical{false};
            bool            credulous{false};
            dung::Label     grounded_label{dung::Label::Undec};
        };

        // Inputs of the tasks that need more than the graph.
        struct Query
        {
            std::string              argument; // Acceptance
            std::vector<std::string> goals;    // Derive (first goal) and Dispute
        };

        struct Outcome
        {
            Task                               task{Task::Extensions};
            std::optional<DungResult>          extensions;
            std::optional<BundleResult>        bundle_extensions;
            std::optional<AcceptanceResult>    acceptance;
            std::optional<aba::Solution>       solution;
            std::vector<aba::AssumptionSet>    derivations;
            std::optional<aba::DisputeResult>  dispute;
            std::optional<credibility::Result> scores;
            std::optional<diagnostics::Report> report;
            std::string                        summary; // one line
            double                             milliseconds{0};
        };

        // Entry point to the reasoning engines: one typed method per task family, plus
        // run() which dispatches task enums. The Reasoner holds references to the graph
        // and (optionally) an ABA framework, both of which must outlive it, and a copy of
        // the configuration. It keeps no results between calls.
        //
        // Every method validates the configuration first and throws configuration_error
        // or structural_error before any computation starts.
        class AGORA_EXPORT Reasoner
        {
        public:
            using Print = std::function<void(const std::string&, bool)>;

            explicit Reasoner(const graph::Graph& graph, Config config = {}, Print print = {});

            const Config& config() const { return _config; }
            void          set_framework(const aba::Framework* framework) { _framework = framework; }

            // empty framework honoring allow_circular_rules
            aba::Framework new_framework() const;

            DungResult                  extensions() const;
            std::vector<dung::Labeling> labelings() const;
            BundleResult                bundle_extensions() const;
            AcceptanceResult            acceptance(const std::string& argument) const;

            aba::Solution                   aba_solve() const;
            std::vector<aba::AssumptionSet> derive(const aba::Atom& atom) const;
            aba::DisputeResult              dispute(const std::vector<aba::Atom>& goals) const;

            credibility::Result propagate() const;
            diagnostics::Report diagnose() const;

            Outcome              run(Task task, const Query& query = {}) const;
            std::vector<Outcome> run(const std::vector<Task>& tasks, const Query& query = {}) const;

            // human readable lines for an outcome
            std::vector<std::string> explain(const Outcome& outcome) const;

        private:
            const aba::Framework&       framework() const;
            std::unique_ptr<ThreadPool> pool() const;
            DungResult                  evaluate(const dung::ArgumentationFramework& af) const;
            void                        print(const std::string& message, bool important) const;
            void                        log(const std::string& message) const;

            const graph::Graph&   _graph;
            Config                _config;
            Print                 _print;
            const aba::Framework* _framework{nullptr};
        };
    }
}
