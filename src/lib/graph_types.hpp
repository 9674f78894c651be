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

#include <agora_export.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace agora
{
    namespace graph
    {
        // dense index of a unit inside a frozen Graph
        using Node     = uint32_t;
        using NodeList = std::vector<Node>;

        constexpr Node no_node = std::numeric_limits<Node>::max();

        enum class UnitType
        {
            Fact,
            Value,
            Policy,
            Other
        };

        enum class UnitRole
        {
            Claim,
            Warrant
        };

        enum class RelationKind
        {
            Support,
            Attack,
            Undercut,
            Rebut
        };

        enum class GateMode
        {
            And,
            Or
        };

        enum class Stance
        {
            Supports,
            Attacks,
            Neutral
        };

        // attack, undercut and rebut contribute attack edges, support never does
        inline bool is_attack(const RelationKind kind)
        {
            return kind != RelationKind::Support;
        }

        std::string AGORA_EXPORT to_string(UnitType type);
        std::string AGORA_EXPORT to_string(UnitRole role);
        std::string AGORA_EXPORT to_string(RelationKind kind);
        std::string AGORA_EXPORT to_string(GateMode mode);
        std::string AGORA_EXPORT to_string(Stance stance);

        // case-insensitive, throws std::invalid_argument for unknown names
        UnitType AGORA_EXPORT     parse_unit_type(const std::string& name);
        RelationKind AGORA_EXPORT parse_relation_kind(const std::string& name);
        GateMode AGORA_EXPORT     parse_gate_mode(const std::string& name);
        Stance AGORA_EXPORT       parse_stance(const std::string& name);
    }
}
