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

/*
 * dict_info: prints a summary of dictionary files.
 *
 *   dict_info [--log-level L] [--log-dir D] [--cache-size N] [--dump] FILE|DIR...
 *
 * Directories are scanned for dictionaries and report only the readable
 * ones. Exits non-zero if a file named on the command line fails to open.
 */

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "../src/config.h"
#include "../src/dictstore_error.h"
#include "../src/engine/dictionary.h"
#include "../src/engine/dictionary_info.h"
#include "../src/util/log.h"
#include "../src/util/logmanager.h"

using namespace dictstore;
using namespace std;

static void usage(const char* argv0) {
    cerr << "usage: " << argv0
         << " [--log-level L] [--log-dir D] [--cache-size N] [--dump] FILE|DIR...\n";
}

int main(int argc, char** argv) {
    initLoggingFromEnv();

    OpenOptions options;
    string logDir;
    bool dump = false;
    vector<string> targets;

    for (int i = 1; i < argc; ++i) {
        string arg = argv[i];
        if ((arg == "--log-level" || arg == "--log-dir" || arg == "--cache-size") && i + 1 >= argc) {
            usage(argv[0]);
            return 2;
        }
        if (arg == "--log-level") {
            if (!setLogLevelFromString(argv[++i])) {
                cerr << "unknown log level " << argv[i] << "\n";
                return 2;
            }
        } else if (arg == "--log-dir") {
            logDir = argv[++i];
        } else if (arg == "--cache-size") {
            char* end = nullptr;
            unsigned long long n = strtoull(argv[++i], &end, 10);
            if (*end != '\0' || n < cache::kMinCacheSize || n > cache::kMaxCacheSize) {
                cerr << "cache size must be between " << cache::kMinCacheSize << " and "
                     << cache::kMaxCacheSize << "\n";
                return 2;
            }
            options.cache_size = static_cast<size_t>(n);
        } else if (arg == "--dump") {
            dump = true;
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else {
            targets.push_back(arg);
        }
    }
    if (targets.empty()) {
        usage(argv[0]);
        return 2;
    }

    unique_ptr<LogManager> logManager;
    if (!logDir.empty()) {
        try {
            logManager.reset(new LogManager(logDir));
        } catch (const exception& e) {
            cerr << e.what() << "\n";
            return 1;
        }
    }

    int failures = 0;
    for (const string& target : targets) {
        std::error_code ec;
        if (filesystem::is_directory(target, ec)) {
            for (const DictionaryInfo& info : scanDirectory(target)) {
                cout << info;
            }
            continue;
        }

        try {
            unique_ptr<Dictionary> dict = Dictionary::open(target, options);
            if (dump) {
                dict->print(cout);
            } else {
                DictionaryInfo info = dict->getDictionaryInfo();
                info.uncompressedFilename = filesystem::path(target).filename().string();
                info.uncompressedBytes = static_cast<int64_t>(filesystem::file_size(target, ec));
                cout << info;
            }
        } catch (const DictionaryError& e) {
            error() << target << " [" << errorKindToString(e.kind()) << "]: " << e.what();
            cerr << target << ": " << e.what() << "\n";
            ++failures;
        }
    }
    return failures == 0 ? 0 : 1;
}
