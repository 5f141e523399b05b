/*
 * Copyright (C) 2026 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <usbgadget/udc.h>

#include <dirent.h>

#include <algorithm>
#include <memory>

#include <android-base/logging.h>

using android::base::ErrnoError;
using android::base::Error;
using android::base::Result;

namespace usbgadget {

Result<std::vector<std::string>> ListUsbControllers(const std::string& class_dir) {
    std::unique_ptr<DIR, decltype(&closedir)> dir(opendir(class_dir.c_str()), closedir);
    if (!dir) {
        return ErrnoError() << "opendir(" << class_dir << ") failed";
    }

    std::vector<std::string> controllers;
    dirent* dp;
    while ((dp = readdir(dir.get())) != nullptr) {
        if (dp->d_name[0] == '.') continue;
        controllers.emplace_back(dp->d_name);
    }
    std::sort(controllers.begin(), controllers.end());
    return controllers;
}

Result<std::string> FindUsbController(const std::string& class_dir) {
    auto controllers = ListUsbControllers(class_dir);
    if (!controllers.ok()) {
        return controllers.error();
    }
    if (controllers->empty()) {
        return Error() << "No USB device controller in " << class_dir;
    }
    if (controllers->size() > 1) {
        LOG(INFO) << "Found " << controllers->size() << " controllers, using "
                  << controllers->front();
    }
    return controllers->front();
}

}  // namespace usbgadget
