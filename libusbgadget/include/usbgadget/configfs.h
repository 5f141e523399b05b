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

// Directory-and-attribute view of a configfs mount. All paths are relative to the
// mount point, e.g. "usb_gadget/g1/idVendor".
class ConfigFs {
  public:
    virtual ~ConfigFs() {}

    virtual bool IsMounted() = 0;
    // Mounts configfs unless it is already mounted at the mount point.
    virtual android::base::Result<void> EnsureMounted() = 0;
    virtual android::base::Result<void> Unmount() = 0;

    // True for directories, attributes and links alike.
    virtual bool Exists(const std::string& path) = 0;
    virtual android::base::Result<void> MakeDir(const std::string& path) = 0;
    virtual android::base::Result<void> RemoveDir(const std::string& path) = 0;

    // Writes |value| as is; nothing is appended.
    virtual android::base::Result<void> WriteAttribute(const std::string& path,
                                                       const std::string& value) = 0;
    virtual android::base::Result<std::string> ReadAttribute(const std::string& path) = 0;

    // Creates |link| pointing at the directory |target|.
    virtual android::base::Result<void> Link(const std::string& target,
                                             const std::string& link) = 0;
    virtual android::base::Result<void> Unlink(const std::string& link) = 0;
    // Names of the symbolic links directly inside |dir|, sorted.
    virtual android::base::Result<std::vector<std::string>> ListLinks(const std::string& dir) = 0;
};

// ConfigFs backed by the kernel.
class KernelConfigFs : public ConfigFs {
  public:
    explicit KernelConfigFs(const std::string& mount_point,
                            const std::string& mounts_file = "/proc/mounts");

    bool IsMounted() override;
    android::base::Result<void> EnsureMounted() override;
    android::base::Result<void> Unmount() override;

    bool Exists(const std::string& path) override;
    android::base::Result<void> MakeDir(const std::string& path) override;
    android::base::Result<void> RemoveDir(const std::string& path) override;

    android::base::Result<void> WriteAttribute(const std::string& path,
                                               const std::string& value) override;
    android::base::Result<std::string> ReadAttribute(const std::string& path) override;

    android::base::Result<void> Link(const std::string& target, const std::string& link) override;
    android::base::Result<void> Unlink(const std::string& link) override;
    android::base::Result<std::vector<std::string>> ListLinks(const std::string& dir) override;

    const std::string& mount_point() const { return mount_point_; }

  private:
    std::string FullPath(const std::string& path) const;

    std::string mount_point_;
    std::string mounts_file_;
};

}  // namespace usbgadget
