/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "aws_s3_object_store.h"

#include <optional>
#include <stdexcept>

#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/http/Scheme.h>
#include <aws/core/utils/stream/PreallocatedStreamBuf.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/ListMultipartUploadsRequest.h>
#include <aws/s3/model/ListPartsRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>
#include <absl/strings/str_format.h>

#include "common/config.h"
#include "common/objup_log.h"
#include "retry_policy.h"

namespace {

constexpr char kAllocTag[] = "objupS3";

std::optional<std::string>
getParam(const objup_b_params_t &params, const std::string &name, const char *env = nullptr) {
    auto it = params.find(name);
    if (it != params.end() && !it->second.empty()) {
        return it->second;
    }
    if (env) {
        return objup::config::getenvOptional(env);
    }
    return std::nullopt;
}

bool
getBoolParam(const objup_b_params_t &params, const std::string &name, bool fallback) {
    const auto value = getParam(params, name);
    if (!value) {
        return fallback;
    }
    return objup::config::convertTraits<bool>::convert(*value);
}

Aws::Client::ClientConfiguration
makeClientConfig(const objup_b_params_t &params, const objupConfig &cfg) {
    Aws::Client::ClientConfiguration config;

    if (auto region = getParam(params, "region", "AWS_DEFAULT_REGION")) {
        config.region = Aws::String(*region);
    }
    if (auto endpoint = getParam(params, "endpoint_override", "AWS_ENDPOINT_OVERRIDE")) {
        config.endpointOverride = Aws::String(*endpoint);
    }
    const auto scheme = getParam(params, "scheme");
    if (scheme && *scheme != "http" && *scheme != "https") {
        throw std::invalid_argument("scheme must be http or https, got " + *scheme);
    }
    config.scheme = (scheme && *scheme == "http") ? Aws::Http::Scheme::HTTP :
                                                     Aws::Http::Scheme::HTTPS;

    config.connectTimeoutMs = static_cast<long>(cfg.connectTimeout.count());
    config.requestTimeoutMs = static_cast<long>(cfg.readTimeout.count());

    // The part uploader owns the retry policy
    config.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(kAllocTag, 0);
    return config;
}

Aws::IOStream *
bodyStream(Aws::Utils::Stream::PreallocatedStreamBuf &buf) {
    return Aws::New<Aws::IOStream>(kAllocTag, &buf);
}

template<typename Outcome>
objup_status_t
toStatus(const Outcome &outcome, std::string_view operation, std::string_view key) {
    if (outcome.IsSuccess()) {
        return OBJUP_SUCCESS;
    }

    const auto &error = outcome.GetError();
    const bool network_error =
        error.GetResponseCode() == Aws::Http::HttpResponseCode::REQUEST_NOT_MADE;
    const int http_code = static_cast<int>(error.GetResponseCode());
    const objup_status_t status =
        objupClassifyRemoteError(http_code, error.GetExceptionName(), network_error);

    const std::string message = absl::StrFormat("%s of %s failed - %s: %s (HTTP %d)",
                                                operation,
                                                key,
                                                error.GetExceptionName().c_str(),
                                                error.GetMessage().c_str(),
                                                http_code);
    if (status == OBJUP_ERR_REMOTE_TRANSIENT) {
        OBJUP_WARN << message;
    } else {
        OBJUP_ERROR << message;
    }
    return status;
}

template<typename Request>
void
applyAttributes(Request &request, const objupObjectAttributes &attributes) {
    if (!attributes.contentType.empty()) {
        request.SetContentType(Aws::String(attributes.contentType));
    }
    if (!attributes.cacheControl.empty()) {
        request.SetCacheControl(Aws::String(attributes.cacheControl));
    }
    for (const auto &entry : attributes.metadata) {
        request.AddMetadata(Aws::String(entry.first), Aws::String(entry.second));
    }
}

} // namespace

awsS3ObjectStore::awsS3ObjectStore(const objup_b_params_t &params, const objupConfig &cfg)
    : sdk_(awsSdkInstance::acquire()) {
    auto bucket = getParam(params, "bucket", "AWS_DEFAULT_BUCKET");
    if (!bucket) {
        throw std::invalid_argument("S3 bucket not configured, set the bucket parameter or "
                                    "AWS_DEFAULT_BUCKET");
    }
    bucketName_ = *bucket;

    const auto config = makeClientConfig(params, cfg);
    const bool virtual_addressing = getBoolParam(params, "use_virtual_addressing", true);
    const auto policy = Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never;

    const auto access_key = getParam(params, "access_key");
    const auto secret_key = getParam(params, "secret_key");
    if (access_key.has_value() != secret_key.has_value()) {
        throw std::invalid_argument("Both access_key and secret_key are needed");
    }

    if (access_key) {
        const Aws::Auth::AWSCredentials credentials(Aws::String(*access_key),
                                                    Aws::String(*secret_key),
                                                    Aws::String(getParam(params, "session_token")
                                                                    .value_or(std::string())));
        s3Client_ = std::make_unique<Aws::S3::S3Client>(
            credentials, config, policy, virtual_addressing);
    } else {
        s3Client_ = std::make_unique<Aws::S3::S3Client>(config, policy, virtual_addressing);
    }

    OBJUP_DEBUG << absl::StrFormat("S3 store for bucket %s, endpoint '%s'",
                                   bucketName_,
                                   config.endpointOverride.c_str());
}

awsS3ObjectStore::~awsS3ObjectStore() = default;

objup_status_t
awsS3ObjectStore::initiateMultipartUpload(const std::string &key,
                                          const objupObjectAttributes &attributes,
                                          std::string &upload_id) {
    Aws::S3::Model::CreateMultipartUploadRequest request;
    request.WithBucket(Aws::String(bucketName_)).WithKey(Aws::String(key));
    applyAttributes(request, attributes);

    auto outcome = s3Client_->CreateMultipartUpload(request);
    const objup_status_t status = toStatus(outcome, "CreateMultipartUpload", key);
    if (status != OBJUP_SUCCESS) {
        return status;
    }
    upload_id = outcome.GetResult().GetUploadId();
    return OBJUP_SUCCESS;
}

objup_status_t
awsS3ObjectStore::uploadPart(const objupSessionRef &ref,
                             uint32_t part_number,
                             std::string_view body,
                             std::string &etag) {
    // The SDK only reads the body, the buffer is not modified
    Aws::Utils::Stream::PreallocatedStreamBuf buf(
        reinterpret_cast<unsigned char *>(const_cast<char *>(body.data())), body.size());
    std::shared_ptr<Aws::IOStream> stream(bodyStream(buf),
                                          [](Aws::IOStream *s) { Aws::Delete(s); });

    Aws::S3::Model::UploadPartRequest request;
    request.WithBucket(Aws::String(bucketName_))
        .WithKey(Aws::String(ref.key))
        .WithUploadId(Aws::String(ref.uploadId))
        .WithPartNumber(static_cast<int>(part_number));
    request.SetBody(stream);
    request.SetContentLength(static_cast<long long>(body.size()));

    auto outcome = s3Client_->UploadPart(request);
    const objup_status_t status =
        toStatus(outcome, absl::StrFormat("UploadPart %d", part_number), ref.key);
    if (status != OBJUP_SUCCESS) {
        return status;
    }
    etag = outcome.GetResult().GetETag();
    return OBJUP_SUCCESS;
}

objup_status_t
awsS3ObjectStore::completeMultipartUpload(const objupSessionRef &ref,
                                          const std::vector<objupPartResult> &parts,
                                          std::string &object_version) {
    Aws::S3::Model::CompletedMultipartUpload completed;
    for (const auto &part : parts) {
        Aws::S3::Model::CompletedPart completed_part;
        completed_part.SetPartNumber(static_cast<int>(part.partNumber));
        completed_part.SetETag(Aws::String(part.eTag));
        completed.AddParts(std::move(completed_part));
    }

    Aws::S3::Model::CompleteMultipartUploadRequest request;
    request.WithBucket(Aws::String(bucketName_))
        .WithKey(Aws::String(ref.key))
        .WithUploadId(Aws::String(ref.uploadId))
        .WithMultipartUpload(std::move(completed));

    auto outcome = s3Client_->CompleteMultipartUpload(request);
    const objup_status_t status = toStatus(outcome, "CompleteMultipartUpload", ref.key);
    if (status != OBJUP_SUCCESS) {
        return status;
    }

    const auto &result = outcome.GetResult();
    object_version = result.GetVersionId().empty() ? result.GetETag() : result.GetVersionId();
    return OBJUP_SUCCESS;
}

objup_status_t
awsS3ObjectStore::abortMultipartUpload(const objupSessionRef &ref) {
    Aws::S3::Model::AbortMultipartUploadRequest request;
    request.WithBucket(Aws::String(bucketName_))
        .WithKey(Aws::String(ref.key))
        .WithUploadId(Aws::String(ref.uploadId));

    return toStatus(s3Client_->AbortMultipartUpload(request), "AbortMultipartUpload", ref.key);
}

objup_status_t
awsS3ObjectStore::putObject(const std::string &key,
                            const objupObjectAttributes &attributes,
                            std::string_view body,
                            std::string &etag) {
    Aws::Utils::Stream::PreallocatedStreamBuf buf(
        reinterpret_cast<unsigned char *>(const_cast<char *>(body.data())), body.size());
    std::shared_ptr<Aws::IOStream> stream(bodyStream(buf),
                                          [](Aws::IOStream *s) { Aws::Delete(s); });

    Aws::S3::Model::PutObjectRequest request;
    request.WithBucket(Aws::String(bucketName_)).WithKey(Aws::String(key));
    applyAttributes(request, attributes);
    request.SetBody(stream);
    request.SetContentLength(static_cast<long long>(body.size()));

    auto outcome = s3Client_->PutObject(request);
    const objup_status_t status = toStatus(outcome, "PutObject", key);
    if (status != OBJUP_SUCCESS) {
        return status;
    }
    etag = outcome.GetResult().GetETag();
    return OBJUP_SUCCESS;
}

objup_status_t
awsS3ObjectStore::listParts(const objupSessionRef &ref, std::vector<objupRemotePart> &parts) {
    Aws::S3::Model::ListPartsRequest request;
    request.WithBucket(Aws::String(bucketName_))
        .WithKey(Aws::String(ref.key))
        .WithUploadId(Aws::String(ref.uploadId));

    for (;;) {
        auto outcome = s3Client_->ListParts(request);
        const objup_status_t status = toStatus(outcome, "ListParts", ref.key);
        if (status != OBJUP_SUCCESS) {
            return status;
        }

        const auto &result = outcome.GetResult();
        for (const auto &part : result.GetParts()) {
            parts.push_back({static_cast<uint32_t>(part.GetPartNumber()),
                             std::string(part.GetETag()),
                             static_cast<uint64_t>(part.GetSize())});
        }
        if (!result.GetIsTruncated()) {
            return OBJUP_SUCCESS;
        }
        request.SetPartNumberMarker(result.GetNextPartNumberMarker());
    }
}

objup_status_t
awsS3ObjectStore::listMultipartUploads(const std::string &prefix,
                                       std::vector<objupRemoteUpload> &uploads) {
    Aws::S3::Model::ListMultipartUploadsRequest request;
    request.WithBucket(Aws::String(bucketName_));
    if (!prefix.empty()) {
        request.SetPrefix(Aws::String(prefix));
    }

    for (;;) {
        auto outcome = s3Client_->ListMultipartUploads(request);
        const objup_status_t status = toStatus(outcome, "ListMultipartUploads", prefix);
        if (status != OBJUP_SUCCESS) {
            return status;
        }

        const auto &result = outcome.GetResult();
        for (const auto &upload : result.GetUploads()) {
            uploads.push_back({std::string(upload.GetKey()),
                               std::string(upload.GetUploadId()),
                               static_cast<int64_t>(upload.GetInitiated().Millis())});
        }
        if (!result.GetIsTruncated()) {
            return OBJUP_SUCCESS;
        }
        request.SetKeyMarker(result.GetNextKeyMarker());
        request.SetUploadIdMarker(result.GetNextUploadIdMarker());
    }
}
