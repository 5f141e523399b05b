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

#include <usbgadget/gadget_config.h>

#include <errno.h>
#include <sys/utsname.h>

#include <functional>
#include <map>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/parseint.h>
#include <android-base/strings.h>

using android::base::ErrnoError;
using android::base::Error;
using android::base::ParseUint;
using android::base::Result;

namespace usbgadget {

namespace {

// clang-format off
const uint8_t kKeyboardReportDesc[] = {
    0x05, 0x01, 0x09, 0x06, 0xa1, 0x01, 0x05, 0x07,
    0x19, 0xe0, 0x29, 0xe7, 0x15, 0x00, 0x25, 0x01,
    0x75, 0x01, 0x95, 0x08, 0x81, 0x02, 0x95, 0x01,
    0x75, 0x08, 0x81, 0x03, 0x95, 0x05, 0x75, 0x01,
    0x05, 0x08, 0x19, 0x01, 0x29, 0x05, 0x91, 0x02,
    0x95, 0x01, 0x75, 0x03, 0x91, 0x03, 0x95, 0x06,
    0x75, 0x08, 0x15, 0x00, 0x25, 0x65, 0x05, 0x07,
    0x19, 0x00, 0x29, 0x65, 0x81, 0x00, 0xc0,
};
// clang-format on

using KeyHandler = std::function<Result<void>(const std::string&, GadgetConfig*)>;

template <typename T>
KeyHandler UintHandler(T GadgetConfig::*field) {
    return [field](const std::string& value, GadgetConfig* config) -> Result<void> {
        if (!ParseUint(value, &(config->*field))) {
            return Error() << "invalid number '" << value << "'";
        }
        return {};
    };
}

KeyHandler StringHandler(std::string GadgetConfig::*field) {
    return [field](const std::string& value, GadgetConfig* config) -> Result<void> {
        config->*field = value;
        return {};
    };
}

Result<std::string> ParseHexBytes(const std::string& value) {
    std::string bytes;
    for (const auto& token : android::base::Split(value, " \t")) {
        if (token.empty()) continue;
        uint8_t byte;
        auto hex = android::base::StartsWith(token, "0x") ? token : "0x" + token;
        if (!ParseUint(hex, &byte)) {
            return Error() << "invalid byte '" << token << "'";
        }
        bytes.push_back(static_cast<char>(byte));
    }
    return bytes;
}

const std::map<std::string, KeyHandler>& KeyHandlers() {
    // clang-format off
    static const std::map<std::string, KeyHandler> handlers = {
        {"mount_point",    StringHandler(&GadgetConfig::mount_point)},
        {"gadget",         StringHandler(&GadgetConfig::gadget_name)},
        {"module",         StringHandler(&GadgetConfig::kernel_module)},
        {"udc",            StringHandler(&GadgetConfig::udc)},
        {"udc_class_dir",  StringHandler(&GadgetConfig::udc_class_dir)},
        {"id_vendor",      UintHandler(&GadgetConfig::id_vendor)},
        {"id_product",     UintHandler(&GadgetConfig::id_product)},
        {"serial_number",  StringHandler(&GadgetConfig::serial_number)},
        {"manufacturer",   StringHandler(&GadgetConfig::manufacturer)},
        {"product",        StringHandler(&GadgetConfig::product)},
        {"configuration",  StringHandler(&GadgetConfig::config_label)},
        {"max_power",      UintHandler(&GadgetConfig::max_power_ma)},
        {"module_dir", [](const std::string& value, GadgetConfig* config) -> Result<void> {
            config->module_dirs.emplace_back(value);
            return {};
        }},
        {"backing_file", [](const std::string& value, GadgetConfig* config) -> Result<void> {
            config->mass_storage.backing_file = value;
            return {};
        }},
        {"mass_storage_instance", [](const std::string& value, GadgetConfig* config) -> Result<void> {
            config->mass_storage.instance = value;
            return {};
        }},
        {"hid_instance", [](const std::string& value, GadgetConfig* config) -> Result<void> {
            config->hid.instance = value;
            return {};
        }},
        {"hid_protocol", [](const std::string& value, GadgetConfig* config) -> Result<void> {
            if (!ParseUint(value, &config->hid.protocol)) {
                return Error() << "invalid number '" << value << "'";
            }
            return {};
        }},
        {"hid_subclass", [](const std::string& value, GadgetConfig* config) -> Result<void> {
            if (!ParseUint(value, &config->hid.subclass)) {
                return Error() << "invalid number '" << value << "'";
            }
            return {};
        }},
        {"hid_report_length", [](const std::string& value, GadgetConfig* config) -> Result<void> {
            if (!ParseUint(value, &config->hid.report_length)) {
                return Error() << "invalid number '" << value << "'";
            }
            return {};
        }},
        {"hid_report_desc", [](const std::string& value, GadgetConfig* config) -> Result<void> {
            auto bytes = ParseHexBytes(value);
            if (!bytes.ok()) return bytes.error();
            config->hid.report_desc = std::move(*bytes);
            return {};
        }},
        {"ethernet_instance", [](const std::string& value, GadgetConfig* config) -> Result<void> {
            config->ethernet.instance = value;
            return {};
        }},
    };
    // clang-format on
    return handlers;
}

}  // namespace

std::string KeyboardReportDescriptor() {
    return std::string(reinterpret_cast<const char*>(kKeyboardReportDesc),
                       sizeof(kKeyboardReportDesc));
}

Result<void> ParseGadgetConfig(const std::string& contents, GadgetConfig* config) {
    const auto& handlers = KeyHandlers();
    int line_number = 0;
    for (const auto& raw_line : android::base::Split(contents, "\n")) {
        line_number++;
        auto line = android::base::Trim(raw_line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // The value is the rest of the line, so paths and strings keep their spacing.
        auto separator = line.find_first_of(" \t");
        const std::string key = line.substr(0, separator);
        const std::string value =
                separator == std::string::npos ? "" : android::base::Trim(line.substr(separator));
        if (value.empty()) {
            return Error() << "line " << line_number << ": '" << key << "' needs a value";
        }

        auto handler = handlers.find(key);
        if (handler == handlers.end()) {
            return Error() << "line " << line_number << ": unknown key '" << key << "'";
        }
        if (auto result = handler->second(value, config); !result.ok()) {
            return Error() << "line " << line_number << ": " << key << ": " << result.error();
        }
    }
    return {};
}

Result<void> ReadGadgetConfig(const std::string& path, bool optional, GadgetConfig* config) {
    std::string contents;
    if (!android::base::ReadFileToString(path, &contents)) {
        if (optional && errno == ENOENT) {
            LOG(VERBOSE) << "No " << path << ", using built-in defaults";
            return {};
        }
        return ErrnoError() << "Unable to read " << path;
    }
    if (auto result = ParseGadgetConfig(contents, config); !result.ok()) {
        return Error() << path << ": " << result.error();
    }
    return {};
}

std::string ResolveBackingFile(const GadgetConfig& config, const std::string& requested) {
    if (requested.empty()) {
        return config.mass_storage.backing_file;
    }
    return requested;
}

Result<std::string> KernelModuleDir() {
    struct utsname uts;
    if (uname(&uts) != 0) {
        return ErrnoError() << "uname() failed";
    }
    return std::string("/lib/modules/") + uts.release;
}

}  // namespace usbgadget
