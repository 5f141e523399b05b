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

#include <map>
#include <string>
#include <vector>

#include <usbgadget/configfs.h>

namespace usbgadget {

// In-memory stand-in for a configfs mount with libcomposite registered. Like the
// kernel it populates new gadget, configuration, string and function directories
// with their default attributes and groups, refuses to create what exists, to link
// to what does not, and to remove directories still holding user created entries.
class FakeConfigFs : public ConfigFs {
  public:
    enum class Op { kMount, kUnmount, kMkdir, kRmdir, kWrite, kLink, kUnlink };

    struct Mutation {
        Op op;
        std::string path;
        std::string value;
    };

    bool IsMounted() override { return mounted_; }
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

    // Every later mutation of |path| fails with |error|.
    void FailOn(const std::string& path, int error) { failures_[path] = error; }
    // Mounting without libcomposite leaves out usb_gadget/.
    void set_gadget_subsystem(bool present) { gadget_subsystem_ = present; }

    bool IsDir(const std::string& path) const;
    bool IsLink(const std::string& path) const;
    // Contents of an attribute, or the target of a link.
    std::string Value(const std::string& path) const;

    const std::vector<Mutation>& mutations() const { return mutations_; }
    void ClearMutations() { mutations_.clear(); }

  private:
    struct Node {
        enum Type { kDir, kAttribute, kLink } type;
        std::string value;
        // Created by the kernel along with its parent; rmdir of the parent removes it.
        bool kernel_default;
    };

    android::base::Result<void> CheckFailure(const std::string& path);
    void AddDefault(const std::string& path, Node::Type type);
    void PopulateDefaults(const std::string& path);
    std::vector<std::string> Children(const std::string& path) const;
    bool ParentIsDir(const std::string& path) const;

    bool mounted_ = false;
    bool gadget_subsystem_ = true;
    std::map<std::string, Node> nodes_;
    std::map<std::string, int> failures_;
    std::vector<Mutation> mutations_;
};

}  // namespace usbgadget
