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

#include <stdint.h>

#include <string>
#include <vector>

#include <android-base/result.h>

namespace usbgadget {

static constexpr char kDefaultConfigFile[] = "/etc/usb_gadget.conf";
static constexpr char kDefaultBackingFile[] = "/root/support_image/support.img";

// Boot protocol keyboard: 8 modifier bits, a reserved byte, 5 LEDs and six key codes.
std::string KeyboardReportDescriptor();

struct MassStorageFunction {
    // Function directory name under functions/, "<type>.<instance>".
    std::string instance = "mass_storage.0";
    // Image exported as LUN 0 when no path is given on the command line.
    std::string backing_file = kDefaultBackingFile;
};

struct HidFunction {
    std::string instance = "hid.usb0";
    unsigned int protocol = 1;
    unsigned int subclass = 1;
    // Bytes per input report.
    unsigned int report_length = 8;
    // Raw report descriptor, written to report_desc byte for byte.
    std::string report_desc = KeyboardReportDescriptor();
};

struct EthernetFunction {
    std::string instance = "ecm.usb0";
};

struct GadgetConfig {
    // Where configfs is (or gets) mounted.
    std::string mount_point = "/config";
    // Directory name under usb_gadget/.
    std::string gadget_name = "gadget";
    std::string kernel_module = "libcomposite";
    // Module directories holding modules.dep; empty means /lib/modules/<release>.
    std::vector<std::string> module_dirs;

    // Controller to bind to; empty means the first one found in udc_class_dir.
    std::string udc;
    std::string udc_class_dir = "/sys/class/udc";

    uint16_t id_vendor = 0x8086;
    uint16_t id_product = 0xbeef;
    std::string serial_number = "1.0";
    std::string manufacturer = "Hailo";
    std::string product = "Keyboard, mass storage and usb ethernet gadget";

    std::string config_name = "c.1";
    std::string config_label = "Config 1";
    // bMaxPower in mA.
    unsigned int max_power_ma = 120;

    // USB language id of the string descriptors.
    std::string language = "0x409";

    MassStorageFunction mass_storage;
    HidFunction hid;
    EthernetFunction ethernet;
};

// Applies the "key value..." lines of |contents| on top of |config|.
android::base::Result<void> ParseGadgetConfig(const std::string& contents, GadgetConfig* config);

// Reads and parses |path|. When |optional| is set a missing file leaves |config| untouched.
android::base::Result<void> ReadGadgetConfig(const std::string& path, bool optional,
                                             GadgetConfig* config);

// The backing file for the mass storage LUN: |requested| unless it is empty.
std::string ResolveBackingFile(const GadgetConfig& config, const std::string& requested);

// /lib/modules/<release> of the running kernel.
android::base::Result<std::string> KernelModuleDir();

}  // namespace usbgadget
