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

#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace dictstore {

    enum class ErrorKind {
        UNSUPPORTED_VERSION,   // format version outside the range this engine reads
        CORRUPTION,            // structural mismatch, bad sentinel, undecodable section
        IO                     // the file itself could not be opened, mapped or written
    };

    const char* errorKindToString(ErrorKind kind);

    /**
     * The one error type surfaced by the storage engine for data and file
     * faults. Bounds violations (programming errors) are reported as
     * std::out_of_range and misuse of the build API as std::logic_error.
     *
     * When a fault is re-signaled at the dictionary boundary the original
     * exception is kept as cause().
     */
    class DictionaryError : public std::runtime_error {
    public:
        DictionaryError(ErrorKind kind, const std::string& msg,
                        std::exception_ptr cause = nullptr)
            : std::runtime_error(msg), kind_(kind), cause_(cause) {}

        ErrorKind kind() const noexcept { return kind_; }
        std::exception_ptr cause() const noexcept { return cause_; }

        // what() of the cause, or empty when there is none
        std::string causeMessage() const;

    private:
        ErrorKind kind_;
        std::exception_ptr cause_;
    };

    inline DictionaryError corruption(const std::string& msg) {
        return DictionaryError(ErrorKind::CORRUPTION, msg);
    }

    inline DictionaryError ioError(const std::string& msg) {
        return DictionaryError(ErrorKind::IO, msg);
    }

} // namespace dictstore
