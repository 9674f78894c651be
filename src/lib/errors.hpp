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

#include <stdexcept>
#include <string>

namespace agora
{
    // Raised when the graph or an ABA framework violates referential
    // integrity (dangling ids, duplicate ids, axioms without score, ...).
    class AGORA_EXPORT structural_error final : public std::runtime_error
    {
    public:
        explicit structural_error(const std::string& message, std::string id = {})
            : std::runtime_error(message)
            , _id(std::move(id))
        {
        }

        // the offending unit, argument or atom id (may be empty)
        const std::string& get_id() const
        {
            return _id;
        }

    private:
        std::string _id;
    };

    // Raised before any computation starts if an option value is invalid.
    class AGORA_EXPORT configuration_error final : public std::runtime_error
    {
    public:
        configuration_error(const std::string& message, std::string option)
            : std::runtime_error(message)
            , _option(std::move(option))
        {
        }

        const std::string& get_option() const
        {
            return _option;
        }

    private:
        std::string _option;
    };
}
