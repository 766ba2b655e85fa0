/*
 * SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "aws_sdk_instance.h"

#include <mutex>

#include "common/objup_log.h"

awsSdkInstance::awsSdkInstance() {
    Aws::InitAPI(options_);
    OBJUP_DEBUG << "AWS SDK initialized";
}

awsSdkInstance::~awsSdkInstance() {
    Aws::ShutdownAPI(options_);
    OBJUP_DEBUG << "AWS SDK shut down";
}

std::shared_ptr<awsSdkInstance>
awsSdkInstance::acquire() {
    static std::mutex mutex;
    static std::weak_ptr<awsSdkInstance> current;

    std::lock_guard<std::mutex> lock(mutex);
    auto instance = current.lock();
    if (!instance) {
        instance = std::shared_ptr<awsSdkInstance>(new awsSdkInstance());
        current = instance;
    }
    return instance;
}
