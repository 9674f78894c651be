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

#include "graph_types.hpp"

#include <boost/algorithm/string.hpp>

#include <stdexcept>

using namespace agora::graph;

namespace
{
    std::string normalize(const std::string& name)
    {
        return boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
    }
}

std::string agora::graph::to_string(const UnitType type)
{
    switch (type)
    {
    case UnitType::Fact:
        return "fact";
    case UnitType::Value:
        return "value";
    case UnitType::Policy:
        return "policy";
    case UnitType::Other:
        return "other";
    }
    return "other";
}

std::string agora::graph::to_string(const UnitRole role)
{
    return role == UnitRole::Warrant ? "warrant" : "claim";
}

std::string agora::graph::to_string(const RelationKind kind)
{
    switch (kind)
    {
    case RelationKind::Support:
        return "support";
    case RelationKind::Attack:
        return "attack";
    case RelationKind::Undercut:
        return "undercut";
    case RelationKind::Rebut:
        return "rebut";
    }
    return "attack";
}

std::string agora::graph::to_string(const GateMode mode)
{
    return mode == GateMode::And ? "AND" : "OR";
}

std::string agora::graph::to_string(const Stance stance)
{
    switch (stance)
    {
    case Stance::Supports:
        return "supports";
    case Stance::Attacks:
        return "attacks";
    case Stance::Neutral:
        return "neutral";
    }
    return "neutral";
}

UnitType agora::graph::parse_unit_type(const std::string& name)
{
    const std::string n = normalize(name);
    if (n == "fact") return UnitType::Fact;
    if (n == "value") return UnitType::Value;
    if (n == "policy") return UnitType::Policy;
    if (n == "other") return UnitType::Other;
    throw std::invalid_argument("Unknown unit type '" + name + "'");
}

RelationKind agora::graph::parse_relation_kind(const std::string& name)
{
    const std::string n = normalize(name);
    if (n == "support") return RelationKind::Support;
    if (n == "attack") return RelationKind::Attack;
    if (n == "undercut") return RelationKind::Undercut;
    if (n == "rebut") return RelationKind::Rebut;
    throw std::invalid_argument("Unknown relation kind '" + name + "'");
}

GateMode agora::graph::parse_gate_mode(const std::string& name)
{
    const std::string n = normalize(name);
    if (n == "and") return GateMode::And;
    if (n == "or") return GateMode::Or;
    throw std::invalid_argument("Unknown gate mode '" + name + "'");
}

Stance agora::graph::parse_stance(const std::string& name)
{
    const std::string n = normalize(name);
    if (n == "supports") return Stance::Supports;
    if (n == "attacks") return Stance::Attacks;
    if (n == "neutral") return Stance::Neutral;
    throw std::invalid_argument("Unknown evidence stance '" + name + "'");
}
