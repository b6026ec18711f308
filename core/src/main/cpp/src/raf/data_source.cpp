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

#include "data_source.h"
#include "../dictstore_error.h"
#include "../util/log.h"

#include <cstring>

namespace dictstore {
namespace raf {

std::shared_ptr<MappedFileSource> MappedFileSource::open(const std::string& path, bool populate) {
    MappedRegion region;
    FSResult res = PlatformFS::map_readonly(path, populate ? AccessPattern::Sequential : AccessPattern::Random,
                                            &region);
    if (!res.ok) {
        throw ioError("Cannot map " + path + ": " + std::strerror(res.err));
    }
    // an empty file keeps a null region and fails later as truncated

    trace() << "mapped " << path << " (" << region.size << " bytes)";
    return std::shared_ptr<MappedFileSource>(new MappedFileSource(path, region));
}

MappedFileSource::~MappedFileSource() {
    FSResult res = PlatformFS::unmap(region_);
    if (!res.ok) {
        error() << "Failed to unmap " << path_ << ": " << errnoWithDescription(res.err);
    }
}

} // namespace raf
} // namespace dictstore
