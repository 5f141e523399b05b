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
#include <string.h>

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace usbgadget {

TEST(GadgetConfig, Defaults) {
    GadgetConfig config;
    EXPECT_EQ("/config", config.mount_point);
    EXPECT_EQ("gadget", config.gadget_name);
    EXPECT_EQ("libcomposite", config.kernel_module);
    EXPECT_TRUE(config.udc.empty());
    EXPECT_EQ(0x8086, config.id_vendor);
    EXPECT_EQ(0xbeef, config.id_product);
    EXPECT_EQ("1.0", config.serial_number);
    EXPECT_EQ("Hailo", config.manufacturer);
    EXPECT_EQ("Config 1", config.config_label);
    EXPECT_EQ(120u, config.max_power_ma);
    EXPECT_EQ("mass_storage.0", config.mass_storage.instance);
    EXPECT_EQ("/root/support_image/support.img", config.mass_storage.backing_file);
    EXPECT_EQ("hid.usb0", config.hid.instance);
    EXPECT_EQ(1u, config.hid.protocol);
    EXPECT_EQ(1u, config.hid.subclass);
    EXPECT_EQ(8u, config.hid.report_length);
    EXPECT_EQ("ecm.usb0", config.ethernet.instance);
}

TEST(GadgetConfig, KeyboardReportDescriptor) {
    auto desc = KeyboardReportDescriptor();
    ASSERT_EQ(63u, desc.size());
    // Usage Page (Generic Desktop), Usage (Keyboard) ... End Collection
    EXPECT_EQ('\x05', desc[0]);
    EXPECT_EQ('\x01', desc[1]);
    EXPECT_EQ('\x09', desc[2]);
    EXPECT_EQ('\x06', desc[3]);
    EXPECT_EQ('\xc0', desc.back());
    // The descriptor carries zero bytes that must survive.
    EXPECT_NE(std::string::npos, desc.find('\0'));
}

TEST(GadgetConfig, ParseOverridesDefaults) {
    const std::string contents = R"(
# Linux Foundation multifunction composite gadget
udc            musb-hdrc.0
id_vendor      0x1d6b
id_product     260
manufacturer   Linux Foundation
product        Multifunction   Composite Gadget
max_power      500
backing_file   /media/usb  images/lun0.img
module_dir     /lib/modules/extra
module_dir     /vendor/lib/modules
hid_report_length 4
hid_report_desc 05 01 09  06 0xa1	01 c0
)";
    GadgetConfig config;
    auto result = ParseGadgetConfig(contents, &config);
    ASSERT_TRUE(result.ok()) << result.error();

    EXPECT_EQ("musb-hdrc.0", config.udc);
    EXPECT_EQ(0x1d6b, config.id_vendor);
    EXPECT_EQ(260, config.id_product);
    EXPECT_EQ("Linux Foundation", config.manufacturer);
    EXPECT_EQ("Multifunction   Composite Gadget", config.product);
    EXPECT_EQ(500u, config.max_power_ma);
    EXPECT_EQ("/media/usb  images/lun0.img", config.mass_storage.backing_file);
    EXPECT_THAT(config.module_dirs, ElementsAre("/lib/modules/extra", "/vendor/lib/modules"));
    EXPECT_EQ(4u, config.hid.report_length);
    EXPECT_EQ(std::string("\x05\x01\x09\x06\xa1\x01\xc0", 7), config.hid.report_desc);

    // Untouched keys keep their defaults.
    EXPECT_EQ("1.0", config.serial_number);
    EXPECT_EQ("hid.usb0", config.hid.instance);
}

TEST(GadgetConfig, ParseErrors) {
    struct {
        std::string contents;
        std::string error;
    } cases[] = {
            {"udc musb-hdrc.0\nbogus 1\n", "line 2: unknown key 'bogus'"},
            {"udc\n", "line 1: 'udc' needs a value"},
            {"udc   \t\n", "line 1: 'udc' needs a value"},
            {"id_vendor 0x10000\n", "line 1: id_vendor: invalid number '0x10000'"},
            {"max_power lots\n", "line 1: max_power: invalid number 'lots'"},
            {"\n\nhid_report_desc 05 zz\n", "line 3: hid_report_desc: invalid byte 'zz'"},
            {"hid_report_desc 05 100\n", "invalid byte '100'"},
    };

    for (const auto& test_case : cases) {
        GadgetConfig config;
        auto result = ParseGadgetConfig(test_case.contents, &config);
        ASSERT_FALSE(result.ok()) << test_case.contents;
        EXPECT_THAT(result.error().message(), HasSubstr(test_case.error)) << test_case.contents;
    }
}

TEST(GadgetConfig, ReadMissingFile) {
    TemporaryDir dir;
    const std::string path = std::string(dir.path) + "/usb_gadget.conf";

    GadgetConfig config;
    config.udc = "dummy_udc.0";
    auto result = ReadGadgetConfig(path, true, &config);
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ("dummy_udc.0", config.udc);

    result = ReadGadgetConfig(path, false, &config);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(ENOENT, result.error().code());
    EXPECT_THAT(result.error().message(), HasSubstr(path));
}

TEST(GadgetConfig, ReadFile) {
    TemporaryFile tf;
    ASSERT_TRUE(android::base::WriteStringToFile("gadget g1\nserial_number 0123456789\n",
                                                 tf.path));
    GadgetConfig config;
    auto result = ReadGadgetConfig(tf.path, false, &config);
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ("g1", config.gadget_name);
    EXPECT_EQ("0123456789", config.serial_number);

    ASSERT_TRUE(android::base::WriteStringToFile("gadget g1\nmax_power\n", tf.path));
    result = ReadGadgetConfig(tf.path, true, &config);
    ASSERT_FALSE(result.ok());
    EXPECT_THAT(result.error().message(), HasSubstr(std::string(tf.path) + ": line 2"));
}

TEST(GadgetConfig, ResolveBackingFile) {
    GadgetConfig config;
    EXPECT_EQ("/root/support_image/support.img", ResolveBackingFile(config, ""));
    EXPECT_EQ("/mnt/img/store.img", ResolveBackingFile(config, "/mnt/img/store.img"));

    config.mass_storage.backing_file = "/data/lun0.img";
    EXPECT_EQ("/data/lun0.img", ResolveBackingFile(config, ""));
    EXPECT_EQ("/mnt/img/store.img", ResolveBackingFile(config, "/mnt/img/store.img"));
}

TEST(GadgetConfig, KernelModuleDir) {
    auto dir = KernelModuleDir();
    ASSERT_TRUE(dir.ok()) << dir.error();
    EXPECT_THAT(*dir, HasSubstr("/lib/modules/"));
    EXPECT_GT(dir->size(), strlen("/lib/modules/"));
}

}  // namespace usbgadget
