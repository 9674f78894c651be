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

#include <algorithm>
#include <string>
#include <vector>

namespace agora
{
    namespace utils
    {
        using IdList = std::vector<std::string>;

        template <typename T>
        static std::basic_string<T> concatenate(const std::vector<std::basic_string<T>>& list, const std::basic_string<T>& separator)
        {
            std::basic_string<T> connected;
            for (const std::basic_string<T>& t : list)
            {
                if (!connected.empty()) connected += separator;
                connected += t;
            }
            return connected;
        }

        // sorts ascending and removes duplicates
        inline void canonicalize(IdList& ids)
        {
            std::sort(ids.begin(), ids.end());
            ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
        }

        // both arguments must be canonical
        inline bool is_subset(const IdList& subset, const IdList& superset)
        {
            return std::includes(superset.begin(), superset.end(), subset.begin(), subset.end());
        }

        // both arguments must be canonical
        inline bool intersects(const IdList& a, const IdList& b)
        {
            auto i = a.begin();
            auto j = b.begin();
            while (i != a.end() && j != b.end())
            {
                if (*i < *j)
                    ++i;
                else if (*j < *i)
                    ++j;
                else
                    return true;
            }
            return false;
        }

        IdList AGORA_EXPORT      unite(const IdList& a, const IdList& b);
        std::string AGORA_EXPORT format_set(const IdList& ids);

        // removes every set that is a proper superset of (or equal to) another,
        // and orders the remaining sets lexicographically
        void AGORA_EXPORT minimize(std::vector<IdList>& sets);
    }
}
