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

#include "platform_fs.h"

#include <unistd.h>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <cerrno>
#include <filesystem>

namespace dictstore {
    namespace raf {

        FSResult PlatformFS::map_readonly(const std::string& path, AccessPattern pattern,
                                          MappedRegion* out) {
            int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
            if (fd < 0) {
                return {false, errno};
            }

            // size from the descriptor, not the path, so a concurrent
            // replace of path cannot change it under us
            struct stat st{};
            if (::fstat(fd, &st) != 0) {
                int e = errno;
                ::close(fd);
                return {false, e};
            }
            if (!S_ISREG(st.st_mode)) {
                ::close(fd);
                return {false, S_ISDIR(st.st_mode) ? EISDIR : EINVAL};
            }

            out->file_handle = fd;
            out->size = static_cast<size_t>(st.st_size);
            out->addr = nullptr;
            if (out->size == 0) {
                // mmap rejects empty lengths
                return {true, 0};
            }

            int flags = MAP_PRIVATE;
#ifdef MAP_POPULATE
            if (pattern == AccessPattern::Sequential) {
                flags |= MAP_POPULATE;
            }
#endif
            void* addr = ::mmap(nullptr, out->size, PROT_READ, flags, fd, 0);
            if (addr == MAP_FAILED) {
                int e = errno;
                ::close(fd);
                out->file_handle = -1;
                out->size = 0;
                return {false, e};
            }
            out->addr = addr;

            // advice is best effort
            ::madvise(addr, out->size, pattern == AccessPattern::Random ? MADV_RANDOM : MADV_WILLNEED);
            return {true, 0};
        }

        FSResult PlatformFS::unmap(const MappedRegion& r) {
            int rc = r.addr ? ::munmap(r.addr, r.size) : 0;
            int ec = (rc == 0) ? 0 : errno;
            if (r.file_handle >= 0 && ::close((int)r.file_handle) != 0 && ec == 0) {
                ec = errno;
            }
            return { ec == 0, ec };
        }

        FSResult PlatformFS::flush_file(intptr_t file_handle) {
            int rc = ::fdatasync((int)file_handle);
            return { rc == 0, rc == 0 ? 0 : errno };
        }

        FSResult PlatformFS::fsync_directory(const std::string& dir_path) {
            int fd = ::open(dir_path.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
            if (fd < 0) {
                return {false, errno};
            }

            int rc = ::fsync(fd);
            int saved_errno = errno;
            ::close(fd);

            return {rc == 0, rc == 0 ? 0 : saved_errno};
        }

        FSResult PlatformFS::atomic_replace(const std::string& src, const std::string& dst) {
            if (::rename(src.c_str(), dst.c_str()) != 0) {
                return {false, errno};
            }

            std::string parent_dir = std::filesystem::path(dst).parent_path().string();
            return fsync_directory(parent_dir.empty() ? "." : parent_dir);
        }

    } // namespace raf
} // namespace dictstore
