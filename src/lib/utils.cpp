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

#include "utils.hpp"

#include <iterator>

namespace agora
{
    namespace utils
    {
        IdList unite(const IdList& a, const IdList& b)
        {
            IdList result;
            result.reserve(a.size() + b.size());
            std::set_union(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(result));
            return result;
        }

        std::string format_set(const IdList& ids)
        {
            return "{" + concatenate(ids, std::string(", ")) + "}";
        }

        void minimize(std::vector<IdList>& sets)
        {
            for (IdList& s : sets)
            {
                canonicalize(s);
            }

            // smaller sets first, so that a kept set is never a superset of a later one
            std::sort(sets.begin(), sets.end(), [](const IdList& a, const IdList& b)
                      { return a.size() != b.size() ? a.size() < b.size() : a < b; });

            std::vector<IdList> kept;
            for (IdList& candidate : sets)
            {
                bool redundant = std::any_of(kept.begin(), kept.end(), [&](const IdList& k)
                                             { return is_subset(k, candidate); });
                if (!redundant)
                {
                    kept.push_back(std::move(candidate));
                }
            }

            std::sort(kept.begin(), kept.end());
            sets = std::move(kept);
        }
    }
}
