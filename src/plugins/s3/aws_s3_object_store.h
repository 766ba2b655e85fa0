/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
#ifndef OBJUP_S3_AWS_S3_OBJECT_STORE_H
#define OBJUP_S3_AWS_S3_OBJECT_STORE_H

#include <memory>
#include <string>

#include <aws/s3/S3Client.h>

#include "objup_types.h"
#include "objup_params.h"
#include "store/object_store.h"
#include "aws_sdk_instance.h"

/**
 * iObjectStore over the AWS SDK S3 client, for AWS and S3-compatible endpoints.
 *
 * Recognized parameters, with their environment fallback:
 *   bucket (AWS_DEFAULT_BUCKET), region (AWS_DEFAULT_REGION),
 *   endpoint_override (AWS_ENDPOINT_OVERRIDE), scheme (http|https),
 *   use_virtual_addressing (bool), access_key, secret_key, session_token.
 * Without access_key/secret_key the default credentials chain of the SDK is used.
 *
 * The SDK retry strategy is disabled, retrying is left to the upload engine.
 */
class awsS3ObjectStore : public iObjectStore {
public:
    /**
     * Throws std::invalid_argument when no bucket is configured or the credentials are
     * incomplete.
     */
    awsS3ObjectStore(const objup_b_params_t &params, const objupConfig &cfg = objupConfig());
    ~awsS3ObjectStore() override;

    objup_status_t
    initiateMultipartUpload(const std::string &key,
                            const objupObjectAttributes &attributes,
                            std::string &upload_id) override;

    objup_status_t
    uploadPart(const objupSessionRef &ref,
               uint32_t part_number,
               std::string_view body,
               std::string &etag) override;

    objup_status_t
    completeMultipartUpload(const objupSessionRef &ref,
                            const std::vector<objupPartResult> &parts,
                            std::string &object_version) override;

    objup_status_t
    abortMultipartUpload(const objupSessionRef &ref) override;

    objup_status_t
    putObject(const std::string &key,
              const objupObjectAttributes &attributes,
              std::string_view body,
              std::string &etag) override;

    objup_status_t
    listParts(const objupSessionRef &ref, std::vector<objupRemotePart> &parts) override;

    objup_status_t
    listMultipartUploads(const std::string &prefix,
                         std::vector<objupRemoteUpload> &uploads) override;

    const std::string &
    getBucket() const {
        return bucketName_;
    }

private:
    std::shared_ptr<awsSdkInstance> sdk_;
    std::unique_ptr<Aws::S3::S3Client> s3Client_;
    std::string bucketName_;
};

#endif // OBJUP_S3_AWS_S3_OBJECT_STORE_H
