/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include "dictstore_error.h"

namespace dictstore {

    const char* errorKindToString(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::UNSUPPORTED_VERSION: return "unsupported-version";
            case ErrorKind::CORRUPTION: return "corruption";
            case ErrorKind::IO: return "io";
        }
        return "unknown";
    }

    std::string DictionaryError::causeMessage() const {
        if (!cause_) {
            return std::string();
        }
        try {
            std::rethrow_exception(cause_);
        } catch (const std::exception& e) {
            return e.what();
        } catch (...) {
            return "non-standard exception";
        }
    }

} // namespace dictstore
