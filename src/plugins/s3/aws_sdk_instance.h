/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
#ifndef OBJUP_S3_AWS_SDK_INSTANCE_H
#define OBJUP_S3_AWS_SDK_INSTANCE_H

#include <memory>

#include <aws/core/Aws.h>

/**
 * Keeps the AWS SDK initialized while at least one store holds a reference.
 * Aws::InitAPI runs when the first reference is taken, Aws::ShutdownAPI when the last
 * one is dropped.
 */
class awsSdkInstance {
public:
    [[nodiscard]] static std::shared_ptr<awsSdkInstance>
    acquire();

    ~awsSdkInstance();

    awsSdkInstance(const awsSdkInstance &) = delete;
    awsSdkInstance &
    operator=(const awsSdkInstance &) = delete;

private:
    awsSdkInstance();

    Aws::SDKOptions options_;
};

#endif // OBJUP_S3_AWS_SDK_INSTANCE_H
