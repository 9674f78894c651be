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

#include "bundles.hpp"
#include "credibility.hpp"
#include "dung.hpp"

#include <agora_export.h>

#include <string>

namespace agora
{
    // Options recognized by the reasoning core. Every field has a usable default;
    // validate() is called by the Reasoner before any computation starts.
    struct AGORA_EXPORT Config
    {
        dung::Semantics      semantics{dung::Semantics::Grounded};
        bundles::Aggregation bundle_aggregation{bundles::Aggregation::SumClamp};
        double               gate_threshold{0.5};
        int                  max_iterations{100};
        double               convergence_epsilon{1e-6};
        int                  dispute_max_depth{32};

        double lambda{0.5};
        double evidence_min{0};
        double evidence_max{1};
        int    threads{1}; // 1 runs every search inline
        bool   allow_circular_rules{false};
        bool   record_history{false};
        bool   verbose{false}; // progress and timing on std::clog

        // "key=value; key=value", values may be quoted. Throws configuration_error.
        static Config parse(const std::string& text);

        // Accepts '-' in place of '_' in keys. Throws configuration_error for unknown
        // keys and unparsable values; ranges are checked by validate().
        void set(const std::string& key, const std::string& value);

        void validate() const;

        credibility::Parameters credibility_parameters() const;

        std::string to_string() const;
    };
}
