/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "objup.h"
#include "objup_sweep.h"
#include "s3/aws_s3_object_store.h"

#define DEFAULT_POLL_INTERVAL_MS 500
#define PROGRESS_WIDTH 50

// Parse size strings like "8M" or "1G"
uint64_t
parse_size(const char *size_str) {
    char *end;
    uint64_t size = strtoull(size_str, &end, 10);
    if (end == size_str) {
        return 0;
    }

    if (*end) {
        switch (toupper(*end)) {
        case 'K':
            size *= 1024;
            break;
        case 'M':
            size *= 1024 * 1024;
            break;
        case 'G':
            size *= 1024ULL * 1024 * 1024;
            break;
        default:
            return 0;
        }
    }
    return size;
}

void
print_usage(const char *program_name) {
    std::cerr << "Usage: " << program_name << " [options] <file> <key>\n"
              << "Options:\n"
              << "  -u, --bucket NAME       Target bucket (default: $AWS_DEFAULT_BUCKET)\n"
              << "  -e, --endpoint URL      Endpoint override for S3-compatible stores\n"
              << "  -s, --part-size SIZE    Part size, K, M or G suffix allowed (default: "
              << objupConfig::kDefaultPartSize / OBJUP_MIB << "M)\n"
              << "  -c, --concurrency N     Parts in flight (default: "
              << objupConfig::kDefaultMaxConcurrentParts << ")\n"
              << "  -t, --content-type T    Content-Type of the object\n"
              << "  -m, --meta KEY=VALUE    User metadata, can be repeated\n"
              << "  -r, --resume ID         Resume an interrupted multipart upload\n"
              << "  -S, --sweep SECONDS     Before uploading, abort incomplete uploads under\n"
              << "                          the key's directory older than SECONDS\n"
              << "  -h, --help              Show this help message\n"
              << "Configuration is also read from OBJUP_* environment variables.\n";
}

void
print_progress(const objupProgress &progress) {
    const double ratio = progress.bytesTotal ?
        static_cast<double>(progress.bytesCompleted) / progress.bytesTotal :
        1.0;
    const int filled = static_cast<int>(ratio * PROGRESS_WIDTH);
    std::cout << "\r[" << std::string(filled, '=') << std::string(PROGRESS_WIDTH - filled, ' ')
              << "] " << std::fixed << std::setprecision(1) << ratio * 100 << "% ("
              << progress.partsCompleted << "/" << progress.partsTotal << " parts, "
              << objupEnumStrings::sessionStateStr(progress.state) << ")" << std::flush;
}

int
main(int argc, char *argv[]) {
    objup_b_params_t params;
    objupUploadOptions options;
    std::string resume_id;
    long sweep_seconds = -1;
    objupConfig cfg;

    try {
        cfg = objupConfig::fromEnv();
    }
    catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    int opt;
    static struct option long_options[] = {{"bucket", required_argument, 0, 'u'},
                                           {"endpoint", required_argument, 0, 'e'},
                                           {"part-size", required_argument, 0, 's'},
                                           {"concurrency", required_argument, 0, 'c'},
                                           {"content-type", required_argument, 0, 't'},
                                           {"meta", required_argument, 0, 'm'},
                                           {"resume", required_argument, 0, 'r'},
                                           {"sweep", required_argument, 0, 'S'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    while ((opt = getopt_long(argc, argv, "u:e:s:c:t:m:r:S:h", long_options, NULL)) != -1) {
        switch (opt) {
        case 'u':
            params["bucket"] = optarg;
            break;
        case 'e':
            params["endpoint_override"] = optarg;
            break;
        case 's':
            cfg.partSize = parse_size(optarg);
            if (cfg.partSize == 0) {
                std::cerr << "Error: Invalid part size format\n";
                return 1;
            }
            break;
        case 'c': {
            const int concurrency = atoi(optarg);
            if (concurrency <= 0) {
                std::cerr << "Error: Concurrency must be positive\n";
                return 1;
            }
            cfg.maxConcurrentParts = concurrency;
            break;
        }
        case 't':
            options.contentType = optarg;
            break;
        case 'm': {
            const std::string entry(optarg);
            const auto eq = entry.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Error: Metadata must be given as KEY=VALUE\n";
                return 1;
            }
            options.metadata[entry.substr(0, eq)] = entry.substr(eq + 1);
            break;
        }
        case 'r':
            resume_id = optarg;
            break;
        case 'S':
            sweep_seconds = atol(optarg);
            if (sweep_seconds < 0) {
                std::cerr << "Error: Sweep age must not be negative\n";
                return 1;
            }
            break;
        case 'h':
            print_usage(argv[0]);
            return 0;
        default:
            print_usage(argv[0]);
            return 1;
        }
    }

    if (argc - optind != 2) {
        print_usage(argv[0]);
        return 1;
    }
    const std::string path = argv[optind];
    const std::string key = argv[optind + 1];

    std::shared_ptr<awsS3ObjectStore> store;
    std::shared_ptr<const objupDataSource> source;
    std::unique_ptr<objupTransferCoordinator> coordinator;
    try {
        store = std::make_shared<awsS3ObjectStore>(params, cfg);
        source = std::make_shared<objupFileSource>(path);
        coordinator = std::make_unique<objupTransferCoordinator>(store, cfg);
    }
    catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (sweep_seconds >= 0) {
        const auto slash = key.rfind('/');
        const std::string prefix = slash == std::string::npos ? "" : key.substr(0, slash + 1);
        objupSweepReport report;
        const objup_status_t status = objupSweepIncompleteUploads(
            *store, prefix, std::chrono::seconds(sweep_seconds), report);
        std::cout << "Sweep of '" << prefix << "': " << report.aborted.size() << " aborted ("
                  << report.partsDropped << " parts, " << report.bytesDropped << " bytes), "
                  << report.failed.size() << " failed, " << report.skipped << " skipped: "
                  << objupEnumStrings::statusStr(status) << std::endl;
    }

    objupUploadRequest request;
    request.key = key;
    request.source = source;
    request.sizeHint = source->size();
    request.options = options;
    request.resumeUploadId = resume_id;

    objup_handle_t handle;
    objup_status_t status = coordinator->submit(request, handle);
    if (status != OBJUP_SUCCESS) {
        std::cerr << "Error: cannot start upload: " << objupEnumStrings::statusStr(status) << "\n";
        return 1;
    }

    std::cout << "Uploading " << path << " (" << source->size() << " bytes) to s3://"
              << store->getBucket() << "/" << key << std::endl;

    objupProgress progress;
    while (coordinator->progress(handle, progress) == OBJUP_SUCCESS) {
        print_progress(progress);
        if (objupIsTerminal(progress.state)) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(DEFAULT_POLL_INTERVAL_MS));
    }
    std::cout << std::endl;

    objupUploadOutcome outcome;
    status = coordinator->await(handle, outcome);
    std::cout << outcome.message << std::endl;
    if (status != OBJUP_SUCCESS) {
        std::cerr << "Upload failed: " << objupEnumStrings::statusStr(status) << " ("
                  << objupEnumStrings::errorCategoryStr(objupCategoryOf(status)) << ")\n";
        if (!outcome.uploadId.empty() &&
            (status == OBJUP_ERR_PARTIAL_UPLOAD || outcome.remoteAbortFailed)) {
            std::cerr << "Parts remain stored under upload " << outcome.uploadId
                      << ", resume with --resume or clean up with --sweep\n";
        }
        return 1;
    }

    std::cout << "Stored version " << outcome.objectVersion << std::endl;
    return 0;
}
