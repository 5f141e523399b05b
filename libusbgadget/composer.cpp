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

#include <usbgadget/composer.h>

#include <errno.h>

#include <android-base/logging.h>
#include <android-base/stringprintf.h>
#include <android-base/strings.h>
#include <modprobe/modprobe.h>

#include <usbgadget/udc.h>

using android::base::Error;
using android::base::Result;
using android::base::StringPrintf;

namespace usbgadget {

std::ostream& operator<<(std::ostream& os, GadgetState state) {
    switch (state) {
        case GadgetState::kUnconfigured:
            return os << "unconfigured";
        case GadgetState::kModuleLoaded:
            return os << "module-loaded";
        case GadgetState::kNodesCreated:
            return os << "nodes-created";
        case GadgetState::kFunctionsLinked:
            return os << "functions-linked";
        case GadgetState::kBound:
            return os << "bound";
    }
    return os << "unknown";
}

GadgetComposer::GadgetComposer(const GadgetConfig& config, ConfigFs* configfs,
                               Modprobe* modprobe)
    : config_(config), configfs_(configfs), modprobe_(modprobe) {}

std::string GadgetComposer::GadgetPath(const std::string& node) const {
    std::string path = "usb_gadget/" + config_.gadget_name;
    if (!node.empty()) path += "/" + node;
    return path;
}

std::string GadgetComposer::ConfigPath(const std::string& node) const {
    std::string path = "configs/" + config_.config_name;
    if (!node.empty()) path += "/" + node;
    return GadgetPath(path);
}

std::string GadgetComposer::FunctionPath(const std::string& instance) const {
    return GadgetPath("functions/" + instance);
}

std::vector<std::string> GadgetComposer::FunctionInstances() const {
    return {config_.mass_storage.instance, config_.hid.instance, config_.ethernet.instance};
}

Result<void> GadgetComposer::CheckState(GadgetState expected, const char* operation) const {
    if (state_ != expected) {
        return Error() << operation << " needs a gadget in state " << expected
                       << ", it is " << state_;
    }
    return {};
}

Result<void> GadgetComposer::Write(const std::string& path, const std::string& value) {
    LOG(VERBOSE) << "write " << path << " (" << value.size() << " bytes)";
    return configfs_->WriteAttribute(path, value);
}

Result<void> GadgetComposer::MakeDir(const std::string& path) {
    LOG(VERBOSE) << "mkdir " << path;
    return configfs_->MakeDir(path);
}

Result<void> GadgetComposer::RemoveDirIfPresent(const std::string& path) {
    if (!configfs_->Exists(path)) return {};
    LOG(VERBOSE) << "rmdir " << path;
    return configfs_->RemoveDir(path);
}

Result<void> GadgetComposer::Compose(const std::string& backing_file) {
    if (state_ == GadgetState::kBound) {
        return Error(EEXIST) << "Unable to create gadget " << config_.gadget_name
                             << ", it is bound to " << bound_udc_;
    }
    if (state_ == GadgetState::kUnconfigured) {
        if (auto result = LoadModule(); !result.ok()) return result;
    }
    if (state_ == GadgetState::kModuleLoaded) {
        if (auto result = CreateNodes(); !result.ok()) return result;
    }
    if (state_ == GadgetState::kNodesCreated) {
        if (auto result = LinkFunctions(backing_file); !result.ok()) return result;
    }
    if (state_ == GadgetState::kFunctionsLinked) {
        if (auto result = Bind(); !result.ok()) return result;
    }
    return {};
}

Result<void> GadgetComposer::LoadModule() {
    if (auto result = CheckState(GadgetState::kUnconfigured, "LoadModule"); !result.ok()) {
        return result;
    }

    const std::string& module = config_.kernel_module;
    if (modprobe_->IsBuiltin(module)) {
        LOG(VERBOSE) << module << " is built into the kernel";
    } else if (modprobe_->IsLoaded(module)) {
        LOG(VERBOSE) << module << " is already loaded";
    } else if (!modprobe_->LoadWithAliases(module, true)) {
        return Error() << "Unable to load kernel module " << module;
    }

    LOG(INFO) << "Start configfs";
    if (auto result = configfs_->EnsureMounted(); !result.ok()) {
        return Error() << "Unable to mount configfs: " << result.error();
    }
    if (!configfs_->Exists("usb_gadget")) {
        return Error() << "configfs has no usb_gadget directory, " << module
                       << " did not register";
    }

    state_ = GadgetState::kModuleLoaded;
    return {};
}

Result<void> GadgetComposer::CreateNodes() {
    if (auto result = CheckState(GadgetState::kModuleLoaded, "CreateNodes"); !result.ok()) {
        return result;
    }

    LOG(INFO) << "Make basic configuration directories";
    if (auto result = MakeDir(GadgetPath()); !result.ok()) {
        return Error() << "Unable to create gadget " << config_.gadget_name << ": "
                       << result.error();
    }
    for (const auto& dir : {GadgetPath("strings/" + config_.language), ConfigPath(),
                            ConfigPath("strings/" + config_.language)}) {
        if (auto result = MakeDir(dir); !result.ok()) return result;
    }

    LOG(INFO) << "Make directories for gadget functions";
    for (const auto& instance : FunctionInstances()) {
        if (auto result = MakeDir(FunctionPath(instance)); !result.ok()) return result;
    }

    LOG(INFO) << "Configure the gadget";
    const std::string strings = "strings/" + config_.language + "/";
    const std::vector<std::pair<std::string, std::string>> attributes = {
            {GadgetPath("idVendor"), StringPrintf("0x%04x", config_.id_vendor)},
            {GadgetPath("idProduct"), StringPrintf("0x%04x", config_.id_product)},
            {GadgetPath(strings + "serialnumber"), config_.serial_number},
            {GadgetPath(strings + "manufacturer"), config_.manufacturer},
            {GadgetPath(strings + "product"), config_.product},
            {ConfigPath("MaxPower"), std::to_string(config_.max_power_ma)},
            {ConfigPath(strings + "configuration"), config_.config_label},
    };
    for (const auto& [path, value] : attributes) {
        if (auto result = Write(path, value); !result.ok()) return result;
    }

    state_ = GadgetState::kNodesCreated;
    return {};
}

Result<void> GadgetComposer::LinkFunctions(const std::string& backing_file) {
    if (auto result = CheckState(GadgetState::kNodesCreated, "LinkFunctions"); !result.ok()) {
        return result;
    }

    LOG(INFO) << "Configure mass storage";
    const std::string& mass_storage = config_.mass_storage.instance;
    const std::string image = ResolveBackingFile(config_, backing_file);
    if (auto result = Write(FunctionPath(mass_storage) + "/lun.0/file", image); !result.ok()) {
        return Error() << "Unable to export " << image << ": " << result.error();
    }
    if (auto result = configfs_->Link(FunctionPath(mass_storage), ConfigPath(mass_storage));
        !result.ok()) {
        return result;
    }

    LOG(INFO) << "Configure HID keyboard";
    const HidFunction& hid = config_.hid;
    const std::vector<std::pair<std::string, std::string>> hid_attributes = {
            {"protocol", std::to_string(hid.protocol)},
            {"subclass", std::to_string(hid.subclass)},
            {"report_length", std::to_string(hid.report_length)},
            {"report_desc", hid.report_desc},
    };
    for (const auto& [name, value] : hid_attributes) {
        if (auto result = Write(FunctionPath(hid.instance) + "/" + name, value); !result.ok()) {
            return result;
        }
    }
    if (auto result = configfs_->Link(FunctionPath(hid.instance), ConfigPath(hid.instance));
        !result.ok()) {
        return result;
    }

    LOG(INFO) << "Configure USB ethernet";
    const std::string& ethernet = config_.ethernet.instance;
    if (auto result = configfs_->Link(FunctionPath(ethernet), ConfigPath(ethernet));
        !result.ok()) {
        return result;
    }

    state_ = GadgetState::kFunctionsLinked;
    return {};
}

Result<void> GadgetComposer::Bind() {
    if (auto result = CheckState(GadgetState::kFunctionsLinked, "Bind"); !result.ok()) {
        return result;
    }

    std::string udc = config_.udc;
    if (udc.empty()) {
        auto found = FindUsbController(config_.udc_class_dir);
        if (!found.ok()) {
            return Error() << "Unable to pick a controller: " << found.error();
        }
        udc = *found;
    }

    LOG(INFO) << "Start gadget on " << udc;
    if (auto result = Write(GadgetPath("UDC"), udc); !result.ok()) {
        return Error() << "Unable to bind to " << udc << ": " << result.error();
    }

    bound_udc_ = udc;
    state_ = GadgetState::kBound;
    return {};
}

Result<GadgetState> GadgetComposer::DetectState() {
    bound_udc_.clear();
    if (!configfs_->IsMounted() || !configfs_->Exists("usb_gadget")) {
        state_ = GadgetState::kUnconfigured;
        return state_;
    }
    if (!configfs_->Exists(GadgetPath())) {
        state_ = GadgetState::kModuleLoaded;
        return state_;
    }

    auto udc = configfs_->ReadAttribute(GadgetPath("UDC"));
    if (!udc.ok()) {
        return Error() << "Unable to read controller binding: " << udc.error();
    }
    bound_udc_ = android::base::Trim(*udc);
    if (!bound_udc_.empty()) {
        state_ = GadgetState::kBound;
        return state_;
    }

    state_ = GadgetState::kNodesCreated;
    if (configfs_->Exists(ConfigPath())) {
        auto links = configfs_->ListLinks(ConfigPath());
        if (!links.ok()) {
            return Error() << "Unable to list configuration: " << links.error();
        }
        if (!links->empty()) state_ = GadgetState::kFunctionsLinked;
    }
    return state_;
}

Result<void> GadgetComposer::Teardown(GadgetState target) {
    if (auto detected = DetectState(); !detected.ok()) {
        return detected.error();
    }
    LOG(INFO) << "Tearing down gadget " << config_.gadget_name << " from " << state_ << " to "
              << target;

    if (state_ == GadgetState::kBound && target < state_) {
        if (auto result = Unbind(); !result.ok()) return result;
        state_ = GadgetState::kFunctionsLinked;
    }
    if (state_ == GadgetState::kFunctionsLinked && target < state_) {
        if (auto result = UnlinkFunctions(); !result.ok()) return result;
        state_ = GadgetState::kNodesCreated;
    }
    if (state_ == GadgetState::kNodesCreated && target < state_) {
        if (auto result = RemoveNodes(); !result.ok()) return result;
        state_ = GadgetState::kModuleLoaded;
    }
    if (state_ == GadgetState::kModuleLoaded && target < state_) {
        if (auto result = UnloadModule(); !result.ok()) return result;
        state_ = GadgetState::kUnconfigured;
    }
    return {};
}

Result<void> GadgetComposer::Unbind() {
    LOG(INFO) << "Unbind gadget from " << bound_udc_;
    // A zero length write never reaches the attribute, the newline is stripped by
    // the kernel and leaves an empty name behind.
    if (auto result = Write(GadgetPath("UDC"), "\n"); !result.ok()) {
        return Error() << "Unable to unbind from " << bound_udc_ << ": " << result.error();
    }
    bound_udc_.clear();
    return {};
}

Result<void> GadgetComposer::UnlinkFunctions() {
    auto links = configfs_->ListLinks(ConfigPath());
    if (!links.ok()) {
        return links.error();
    }
    for (const auto& link : *links) {
        LOG(INFO) << "Unlink function " << link;
        if (auto result = configfs_->Unlink(ConfigPath(link)); !result.ok()) return result;
    }
    return {};
}

Result<void> GadgetComposer::RemoveNodes() {
    LOG(INFO) << "Remove gadget directories";
    std::vector<std::string> dirs = {ConfigPath("strings/" + config_.language), ConfigPath()};
    for (const auto& instance : FunctionInstances()) {
        dirs.emplace_back(FunctionPath(instance));
    }
    dirs.emplace_back(GadgetPath("strings/" + config_.language));
    dirs.emplace_back(GadgetPath());

    for (const auto& dir : dirs) {
        if (auto result = RemoveDirIfPresent(dir); !result.ok()) return result;
    }
    return {};
}

Result<void> GadgetComposer::UnloadModule() {
    // Function modules the kernel loaded for the gadget hold libcomposite; Remove()
    // takes them out first.
    const std::string& module = config_.kernel_module;
    if (!modprobe_->IsBuiltin(module) && modprobe_->IsLoaded(module)) {
        if (!modprobe_->Remove(module)) {
            return Error() << "Unable to remove kernel module " << module;
        }
    }

    if (configfs_->IsMounted()) {
        if (auto result = configfs_->Unmount(); !result.ok()) {
            return Error() << "Unable to unmount configfs: " << result.error();
        }
    }
    return {};
}

}  // namespace usbgadget
