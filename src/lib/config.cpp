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

#include "config.hpp"
#include "errors.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/tokenizer.hpp>

#include <sstream>
#include <stdexcept>

using namespace agora;
using boost::escaped_list_separator;
using boost::tokenizer;

namespace
{
    template <typename T>
    T number(const std::string& key, const std::string& value)
    {
        try
        {
            return boost::lexical_cast<T>(value);
        }
        catch (const boost::bad_lexical_cast&)
        {
            throw configuration_error("Option " + key + ": '" + value + "' is not a valid number", key);
        }
    }

    bool flag(const std::string& key, const std::string& value)
    {
        const std::string v = boost::algorithm::to_lower_copy(value);
        if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
        if (v == "false" || v == "0" || v == "no" || v == "off") return false;
        throw configuration_error("Option " + key + ": '" + value + "' is not a boolean", key);
    }
}

Config Config::parse(const std::string& text)
{
    Config config;

    tokenizer<escaped_list_separator<char>> tok(text, escaped_list_separator<char>("\\", ";\n", "\""));
    try
    {
        for (std::string entry : tok)
        {
            boost::trim(entry);
            if (entry.empty()) continue;

            const auto eq = entry.find('=');
            if (eq == std::string::npos)
            {
                throw configuration_error("Expected key=value, got '" + entry + "'", entry);
            }

            config.set(entry.substr(0, eq), entry.substr(eq + 1));
        }
    }
    catch (const boost::escaped_list_error& e)
    {
        throw configuration_error(std::string("Malformed option list: ") + e.what(), {});
    }

    config.validate();
    return config;
}

void Config::set(const std::string& key, const std::string& value)
{
    std::string k = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(key));
    boost::replace_all(k, "-", "_");
    const std::string v = boost::algorithm::trim_copy(value);

    try
    {
        if (k == "semantics")
            semantics = dung::parse_semantics(v);
        else if (k == "bundle_aggregation")
            bundle_aggregation = bundles::parse_aggregation(v);
        else if (k == "gate_threshold")
            gate_threshold = number<double>(k, v);
        else if (k == "max_iterations")
            max_iterations = number<int>(k, v);
        else if (k == "convergence_epsilon")
            convergence_epsilon = number<double>(k, v);
        else if (k == "dispute_max_depth")
            dispute_max_depth = number<int>(k, v);
        else if (k == "lambda")
            lambda = number<double>(k, v);
        else if (k == "evidence_min")
            evidence_min = number<double>(k, v);
        else if (k == "evidence_max")
            evidence_max = number<double>(k, v);
        else if (k == "threads")
            threads = number<int>(k, v);
        else if (k == "allow_circular_rules")
            allow_circular_rules = flag(k, v);
        else if (k == "record_history")
            record_history = flag(k, v);
        else if (k == "verbose")
            verbose = flag(k, v);
        else
            throw configuration_error("Unknown option '" + key + "'", k);
    }
    catch (const std::invalid_argument& e)
    {
        throw configuration_error("Option " + k + ": " + e.what(), k);
    }
}

void Config::validate() const
{
    if (max_iterations < 0)
    {
        throw configuration_error("max_iterations must not be negative, got " + std::to_string(max_iterations), "max_iterations");
    }
    if (dispute_max_depth < 0)
    {
        throw configuration_error("dispute_max_depth must not be negative, got " + std::to_string(dispute_max_depth), "dispute_max_depth");
    }
    if (!(convergence_epsilon > 0))
    {
        throw configuration_error("convergence_epsilon must be positive", "convergence_epsilon");
    }
    if (!(gate_threshold >= 0 && gate_threshold <= 1))
    {
        throw configuration_error("gate_threshold must lie in [0, 1]", "gate_threshold");
    }
    if (!(evidence_min >= 0 && evidence_min <= 1))
    {
        throw configuration_error("evidence_min must lie in [0, 1]", "evidence_min");
    }
    if (!(evidence_max >= 0 && evidence_max <= 1))
    {
        throw configuration_error("evidence_max must lie in [0, 1]", "evidence_max");
    }
    if (evidence_min > evidence_max)
    {
        throw configuration_error("evidence_min must not exceed evidence_max", "evidence_min");
    }
    if (threads < 1)
    {
        throw configuration_error("threads must be at least 1", "threads");
    }
}

credibility::Parameters Config::credibility_parameters() const
{
    credibility::Parameters p;
    p.lambda              = lambda;
    p.gate_threshold      = gate_threshold;
    p.max_iterations      = max_iterations;
    p.convergence_epsilon = convergence_epsilon;
    p.evidence_min        = evidence_min;
    p.evidence_max        = evidence_max;
    p.record_history      = record_history;
    return p;
}

std::string Config::to_string() const
{
    std::ostringstream s;
    s << "semantics=" << dung::to_string(semantics)
      << "; bundle_aggregation=" << bundles::to_string(bundle_aggregation)
      << "; gate_threshold=" << gate_threshold
      << "; max_iterations=" << max_iterations
      << "; convergence_epsilon=" << convergence_epsilon
      << "; dispute_max_depth=" << dispute_max_depth
      << "; lambda=" << lambda
      << "; evidence_min=" << evidence_min
      << "; evidence_max=" << evidence_max
      << "; threads=" << threads
      << "; allow_circular_rules=" << (allow_circular_rules ? "true" : "false")
      << "; record_history=" << (record_history ? "true" : "false")
      << "; verbose=" << (verbose ? "true" : "false");
    return s.str();
}
