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

#pragma once

#include <string>
#include <vector>

#include <android-base/result.h>

namespace usbgadget {

// USB device controllers registered under |class_dir| (normally /sys/class/udc), sorted.
android::base::Result<std::vector<std::string>> ListUsbControllers(const std::string& class_dir);

// The first controller of ListUsbControllers(). Fails if there is none.
android::base::Result<std::string> FindUsbController(const std::string& class_dir);

}  // namespace usbgadget
