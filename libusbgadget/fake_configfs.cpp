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

#include "fake_configfs.h"

#include <errno.h>

#include <android-base/strings.h>

using android::base::ErrnoError;
using android::base::Result;

namespace usbgadget {

namespace {

std::string ParentOf(const std::string& path) {
    auto slash = path.rfind('/');
    return slash == std::string::npos ? "" : path.substr(0, slash);
}

std::string BaseOf(const std::string& path) {
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

}  // namespace

Result<void> FakeConfigFs::CheckFailure(const std::string& path) {
    auto failure = failures_.find(path);
    if (failure != failures_.end()) {
        errno = failure->second;
        return ErrnoError() << "injected failure on " << path;
    }
    return {};
}

Result<void> FakeConfigFs::EnsureMounted() {
    if (mounted_) return {};
    if (auto result = CheckFailure(""); !result.ok()) return result;
    mounted_ = true;
    mutations_.push_back({Op::kMount, "", ""});
    if (gadget_subsystem_) {
        AddDefault("usb_gadget", Node::kDir);
    }
    return {};
}

Result<void> FakeConfigFs::Unmount() {
    if (!mounted_) {
        errno = EINVAL;
        return ErrnoError() << "umount() failed";
    }
    if (Exists("usb_gadget") && !Children("usb_gadget").empty()) {
        errno = EBUSY;
        return ErrnoError() << "umount() failed";
    }
    mounted_ = false;
    nodes_.clear();
    mutations_.push_back({Op::kUnmount, "", ""});
    return {};
}

bool FakeConfigFs::Exists(const std::string& path) {
    return mounted_ && (path.empty() || nodes_.count(path) > 0);
}

bool FakeConfigFs::IsDir(const std::string& path) const {
    auto it = nodes_.find(path);
    return it != nodes_.end() && it->second.type == Node::kDir;
}

bool FakeConfigFs::IsLink(const std::string& path) const {
    auto it = nodes_.find(path);
    return it != nodes_.end() && it->second.type == Node::kLink;
}

std::string FakeConfigFs::Value(const std::string& path) const {
    auto it = nodes_.find(path);
    return it == nodes_.end() ? "" : it->second.value;
}

bool FakeConfigFs::ParentIsDir(const std::string& path) const {
    auto parent = ParentOf(path);
    return mounted_ && (parent.empty() || IsDir(parent));
}

std::vector<std::string> FakeConfigFs::Children(const std::string& path) const {
    std::vector<std::string> children;
    const std::string prefix = path + "/";
    for (const auto& [name, node] : nodes_) {
        if (!android::base::StartsWith(name, prefix)) continue;
        if (name.find('/', prefix.size()) != std::string::npos) continue;
        children.emplace_back(name);
    }
    return children;
}

void FakeConfigFs::AddDefault(const std::string& path, Node::Type type) {
    nodes_[path] = Node{type, "", true};
}

void FakeConfigFs::PopulateDefaults(const std::string& path) {
    const std::string parent = ParentOf(path);
    const std::string parent_name = BaseOf(parent);
    std::vector<std::string> attributes;
    std::vector<std::string> groups;

    if (parent == "usb_gadget") {
        groups = {"configs", "functions", "strings", "os_desc"};
        attributes = {"UDC",           "idVendor",        "idProduct",       "bcdDevice",
                      "bcdUSB",        "bDeviceClass",    "bDeviceSubClass", "bDeviceProtocol",
                      "bMaxPacketSize0", "max_speed"};
    } else if (parent_name == "configs") {
        groups = {"strings"};
        attributes = {"MaxPower", "bmAttributes"};
    } else if (parent_name == "strings") {
        if (BaseOf(ParentOf(ParentOf(parent))) == "configs") {
            attributes = {"configuration"};
        } else {
            attributes = {"serialnumber", "manufacturer", "product"};
        }
    } else if (parent_name == "functions") {
        const std::string name = BaseOf(path);
        const std::string type = name.substr(0, name.find('.'));
        if (type == "mass_storage") {
            groups = {"lun.0"};
            attributes = {"stall", "lun.0/file", "lun.0/ro", "lun.0/removable", "lun.0/cdrom",
                          "lun.0/nofua"};
        } else if (type == "hid") {
            attributes = {"protocol", "subclass", "report_length", "report_desc", "dev",
                          "no_out_endpoint"};
        } else if (type == "ecm") {
            attributes = {"dev_addr", "host_addr", "ifname", "qmult"};
        }
    }

    for (const auto& group : groups) {
        AddDefault(path + "/" + group, Node::kDir);
    }
    for (const auto& attribute : attributes) {
        AddDefault(path + "/" + attribute, Node::kAttribute);
    }
}

Result<void> FakeConfigFs::MakeDir(const std::string& path) {
    if (auto result = CheckFailure(path); !result.ok()) return result;
    if (Exists(path)) {
        errno = EEXIST;
        return ErrnoError() << "mkdir(" << path << ") failed";
    }
    if (!ParentIsDir(path)) {
        errno = ENOENT;
        return ErrnoError() << "mkdir(" << path << ") failed";
    }
    nodes_[path] = Node{Node::kDir, "", false};
    PopulateDefaults(path);
    mutations_.push_back({Op::kMkdir, path, ""});
    return {};
}

Result<void> FakeConfigFs::RemoveDir(const std::string& path) {
    if (auto result = CheckFailure(path); !result.ok()) return result;
    if (!IsDir(path)) {
        errno = IsLink(path) ? ENOTDIR : ENOENT;
        return ErrnoError() << "rmdir(" << path << ") failed";
    }
    if (nodes_[path].kernel_default) {
        errno = EPERM;
        return ErrnoError() << "rmdir(" << path << ") failed";
    }

    // Only what the kernel created along with |path| goes away with it.
    const std::string prefix = path + "/";
    for (const auto& [name, node] : nodes_) {
        if (android::base::StartsWith(name, prefix) && !node.kernel_default) {
            errno = ENOTEMPTY;
            return ErrnoError() << "rmdir(" << path << ") failed";
        }
    }
    for (auto it = nodes_.begin(); it != nodes_.end();) {
        if (android::base::StartsWith(it->first, prefix)) {
            it = nodes_.erase(it);
        } else {
            ++it;
        }
    }
    nodes_.erase(path);
    mutations_.push_back({Op::kRmdir, path, ""});
    return {};
}

Result<void> FakeConfigFs::WriteAttribute(const std::string& path, const std::string& value) {
    if (auto result = CheckFailure(path); !result.ok()) return result;
    auto it = nodes_.find(path);
    if (!mounted_ || it == nodes_.end()) {
        errno = ENOENT;
        return ErrnoError() << "open(" << path << ") failed";
    }
    if (it->second.type != Node::kAttribute) {
        errno = EISDIR;
        return ErrnoError() << "open(" << path << ") failed";
    }
    it->second.value = value;
    mutations_.push_back({Op::kWrite, path, value});
    return {};
}

Result<std::string> FakeConfigFs::ReadAttribute(const std::string& path) {
    auto it = nodes_.find(path);
    if (!mounted_ || it == nodes_.end() || it->second.type != Node::kAttribute) {
        errno = ENOENT;
        return ErrnoError() << "open(" << path << ") failed";
    }
    return it->second.value;
}

Result<void> FakeConfigFs::Link(const std::string& target, const std::string& link) {
    if (auto result = CheckFailure(link); !result.ok()) return result;
    if (!IsDir(target) || !ParentIsDir(link)) {
        errno = ENOENT;
        return ErrnoError() << "symlink(" << target << ", " << link << ") failed";
    }
    if (Exists(link)) {
        errno = EEXIST;
        return ErrnoError() << "symlink(" << target << ", " << link << ") failed";
    }
    nodes_[link] = Node{Node::kLink, target, false};
    mutations_.push_back({Op::kLink, link, target});
    return {};
}

Result<void> FakeConfigFs::Unlink(const std::string& link) {
    if (auto result = CheckFailure(link); !result.ok()) return result;
    if (!IsLink(link)) {
        errno = ENOENT;
        return ErrnoError() << "unlink(" << link << ") failed";
    }
    nodes_.erase(link);
    mutations_.push_back({Op::kUnlink, link, ""});
    return {};
}

Result<std::vector<std::string>> FakeConfigFs::ListLinks(const std::string& dir) {
    if (!IsDir(dir)) {
        errno = ENOENT;
        return ErrnoError() << "opendir(" << dir << ") failed";
    }
    std::vector<std::string> links;
    for (const auto& child : Children(dir)) {
        if (IsLink(child)) links.emplace_back(BaseOf(child));
    }
    return links;
}

}  // namespace usbgadget
