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

#include <errno.h>
#include <sys/stat.h>
#include <unistd.h>

#include <memory>
#include <sstream>
#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <modprobe/modprobe.h>

#include <usbgadget/composer.h>

#include "fake_configfs.h"
#include "libmodprobe_test.h"

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::SizeIs;

namespace usbgadget {

static constexpr char kGadget[] = "usb_gadget/gadget";
static constexpr char kConfig[] = "usb_gadget/gadget/configs/c.1";
static constexpr char kUdc[] = "usb_gadget/gadget/UDC";
static constexpr char kLunFile[] = "usb_gadget/gadget/functions/mass_storage.0/lun.0/file";

class GadgetComposerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        module_dir_ = module_tmp_.path;
        ASSERT_TRUE(android::base::WriteStringToFile(
                "kernel/fs/configfs/configfs.ko:\n"
                "kernel/drivers/usb/gadget/libcomposite.ko: kernel/fs/configfs/configfs.ko\n",
                module_dir_ + "/modules.dep"));
        test_modules = {module_dir_ + "/kernel/fs/configfs/configfs.ko",
                        module_dir_ + "/kernel/drivers/usb/gadget/libcomposite.ko"};
        modules_loaded.clear();

        config_.module_dirs = {module_dir_};
        config_.udc = "musb-hdrc.0";
        modprobe_ = std::make_unique<Modprobe>(config_.module_dirs);
    }

    GadgetComposer MakeComposer() { return GadgetComposer(config_, &configfs_, modprobe_.get()); }

    std::string Config(const std::string& node) { return std::string(kConfig) + "/" + node; }

    TemporaryDir module_tmp_;
    std::string module_dir_;
    GadgetConfig config_;
    FakeConfigFs configfs_;
    std::unique_ptr<Modprobe> modprobe_;
};

TEST_F(GadgetComposerTest, ComposeBuildsGadgetTree) {
    auto composer = MakeComposer();
    auto result = composer.Compose("/mnt/img/store.img");
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ(GadgetState::kBound, composer.state());
    EXPECT_EQ("musb-hdrc.0", composer.bound_udc());

    EXPECT_EQ("/mnt/img/store.img", configfs_.Value(kLunFile));
    EXPECT_EQ("1", configfs_.Value("usb_gadget/gadget/functions/hid.usb0/protocol"));
    EXPECT_EQ("1", configfs_.Value("usb_gadget/gadget/functions/hid.usb0/subclass"));
    EXPECT_EQ("8", configfs_.Value("usb_gadget/gadget/functions/hid.usb0/report_length"));
    EXPECT_EQ(KeyboardReportDescriptor(),
              configfs_.Value("usb_gadget/gadget/functions/hid.usb0/report_desc"));
    EXPECT_EQ("musb-hdrc.0", configfs_.Value(kUdc));

    EXPECT_EQ("0x8086", configfs_.Value("usb_gadget/gadget/idVendor"));
    EXPECT_EQ("0xbeef", configfs_.Value("usb_gadget/gadget/idProduct"));
    EXPECT_EQ("1.0", configfs_.Value("usb_gadget/gadget/strings/0x409/serialnumber"));
    EXPECT_EQ("Hailo", configfs_.Value("usb_gadget/gadget/strings/0x409/manufacturer"));
    EXPECT_EQ("Keyboard, mass storage and usb ethernet gadget",
              configfs_.Value("usb_gadget/gadget/strings/0x409/product"));
    EXPECT_EQ("120", configfs_.Value(Config("MaxPower")));
    EXPECT_EQ("Config 1", configfs_.Value(Config("strings/0x409/configuration")));

    EXPECT_TRUE(configfs_.IsLink(Config("mass_storage.0")));
    EXPECT_EQ("usb_gadget/gadget/functions/mass_storage.0",
              configfs_.Value(Config("mass_storage.0")));
    EXPECT_TRUE(configfs_.IsLink(Config("hid.usb0")));
    EXPECT_TRUE(configfs_.IsLink(Config("ecm.usb0")));
}

TEST_F(GadgetComposerTest, DefaultBackingFile) {
    auto composer = MakeComposer();
    auto result = composer.Compose();
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ("/root/support_image/support.img", configfs_.Value(kLunFile));
}

TEST_F(GadgetComposerTest, ConfiguredBackingFileIsDefault) {
    config_.mass_storage.backing_file = "/data/usb/lun0.img";
    auto composer = MakeComposer();
    auto result = composer.Compose("");
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ("/data/usb/lun0.img", configfs_.Value(kLunFile));
}

TEST_F(GadgetComposerTest, BackingFileWrittenVerbatim) {
    for (const std::string path : {"/mnt/img/store.img", "/media/my images/disk 1.img",
                                   "relative/image.bin", "/dev/mmcblk0p3"}) {
        FakeConfigFs configfs;
        GadgetComposer composer(config_, &configfs, modprobe_.get());
        auto result = composer.Compose(path);
        ASSERT_TRUE(result.ok()) << path << ": " << result.error();
        EXPECT_EQ(path, configfs.Value(kLunFile));
    }
}

TEST_F(GadgetComposerTest, BindIsLastWrite) {
    auto composer = MakeComposer();
    auto result = composer.Compose();
    ASSERT_TRUE(result.ok()) << result.error();

    const auto& mutations = configfs_.mutations();
    ASSERT_FALSE(mutations.empty());
    EXPECT_EQ(FakeConfigFs::Op::kWrite, mutations.back().op);
    EXPECT_EQ(kUdc, mutations.back().path);
    EXPECT_EQ("musb-hdrc.0", mutations.back().value);

    int udc_writes = 0;
    for (const auto& mutation : mutations) {
        if (mutation.path == kUdc) udc_writes++;
    }
    EXPECT_EQ(1, udc_writes);
}

TEST_F(GadgetComposerTest, LinksAppearOnlyWhenLinking) {
    auto composer = MakeComposer();
    ASSERT_TRUE(composer.LoadModule().ok());
    ASSERT_TRUE(composer.CreateNodes().ok());
    EXPECT_EQ(GadgetState::kNodesCreated, composer.state());

    auto links = configfs_.ListLinks(kConfig);
    ASSERT_TRUE(links.ok()) << links.error();
    EXPECT_THAT(*links, IsEmpty());

    ASSERT_TRUE(composer.LinkFunctions().ok());
    links = configfs_.ListLinks(kConfig);
    ASSERT_TRUE(links.ok()) << links.error();
    EXPECT_THAT(*links, ElementsAre("ecm.usb0", "hid.usb0", "mass_storage.0"));
    EXPECT_EQ("", configfs_.Value(kUdc));
}

TEST_F(GadgetComposerTest, RecomposingFailsAtNodeCreation) {
    auto first = MakeComposer();
    ASSERT_TRUE(first.Compose().ok());
    configfs_.ClearMutations();

    auto second = MakeComposer();
    auto result = second.Compose("/mnt/img/other.img");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(EEXIST, static_cast<int>(result.error().code()));
    EXPECT_THAT(result.error().message(), HasSubstr("Unable to create gadget"));
    EXPECT_EQ(GadgetState::kModuleLoaded, second.state());

    // Nothing of the first gadget was touched.
    EXPECT_THAT(configfs_.mutations(), IsEmpty());
    EXPECT_EQ("/root/support_image/support.img", configfs_.Value(kLunFile));
}

TEST_F(GadgetComposerTest, ComposingTwiceFailsAtNodeCreation) {
    auto composer = MakeComposer();
    ASSERT_TRUE(composer.Compose().ok());
    configfs_.ClearMutations();

    auto result = composer.Compose("/mnt/img/other.img");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(EEXIST, static_cast<int>(result.error().code()));
    EXPECT_THAT(result.error().message(), HasSubstr("Unable to create gadget"));
    EXPECT_EQ(GadgetState::kBound, composer.state());
    EXPECT_THAT(configfs_.mutations(), IsEmpty());
    EXPECT_EQ("/root/support_image/support.img", configfs_.Value(kLunFile));
}

TEST_F(GadgetComposerTest, LoadsModuleWithDependencies) {
    auto composer = MakeComposer();
    ASSERT_TRUE(composer.LoadModule().ok());
    EXPECT_THAT(modules_loaded,
                ElementsAre(module_dir_ + "/kernel/fs/configfs/configfs.ko",
                            module_dir_ + "/kernel/drivers/usb/gadget/libcomposite.ko"));
    EXPECT_TRUE(configfs_.IsMounted());

    // Already loaded and mounted: nothing to do the second time.
    auto again = MakeComposer();
    ASSERT_TRUE(again.LoadModule().ok());
    EXPECT_EQ(2u, modules_loaded.size());
    EXPECT_EQ(1u, configfs_.mutations().size());
}

TEST_F(GadgetComposerTest, BuiltinModuleIsNotLoaded) {
    ASSERT_TRUE(android::base::WriteStringToFile("kernel/drivers/usb/gadget/libcomposite.ko\n",
                                                 module_dir_ + "/modules.builtin"));
    test_modules.clear();
    modprobe_ = std::make_unique<Modprobe>(config_.module_dirs);

    auto composer = MakeComposer();
    auto result = composer.Compose();
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_THAT(modules_loaded, IsEmpty());
}

TEST_F(GadgetComposerTest, ModuleLoadFailureIsFatal) {
    test_modules.clear();
    auto composer = MakeComposer();
    auto result = composer.Compose();
    ASSERT_FALSE(result.ok());
    EXPECT_THAT(result.error().message(), HasSubstr("libcomposite"));
    EXPECT_EQ(GadgetState::kUnconfigured, composer.state());
    EXPECT_FALSE(configfs_.IsMounted());
    EXPECT_THAT(configfs_.mutations(), IsEmpty());
}

TEST_F(GadgetComposerTest, MountFailureIsFatal) {
    configfs_.FailOn("", EPERM);
    auto composer = MakeComposer();
    auto result = composer.Compose();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(EPERM, static_cast<int>(result.error().code()));
    EXPECT_EQ(GadgetState::kUnconfigured, composer.state());
}

TEST_F(GadgetComposerTest, MissingGadgetSubsystemIsFatal) {
    configfs_.set_gadget_subsystem(false);
    auto composer = MakeComposer();
    auto result = composer.Compose();
    ASSERT_FALSE(result.ok());
    EXPECT_THAT(result.error().message(), HasSubstr("usb_gadget"));
    EXPECT_EQ(GadgetState::kUnconfigured, composer.state());
}

TEST_F(GadgetComposerTest, FailedWriteStopsComposition) {
    configfs_.FailOn("usb_gadget/gadget/functions/hid.usb0/protocol", EIO);
    auto composer = MakeComposer();
    auto result = composer.Compose();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(EIO, static_cast<int>(result.error().code()));
    EXPECT_EQ(GadgetState::kNodesCreated, composer.state());

    EXPECT_TRUE(configfs_.IsLink(Config("mass_storage.0")));
    EXPECT_FALSE(configfs_.Exists(Config("hid.usb0")));
    EXPECT_FALSE(configfs_.Exists(Config("ecm.usb0")));
    EXPECT_EQ("", configfs_.Value(kUdc));
}

TEST_F(GadgetComposerTest, StepsOutOfOrderAreRejected) {
    auto composer = MakeComposer();
    EXPECT_FALSE(composer.Bind().ok());
    EXPECT_FALSE(composer.LinkFunctions().ok());
    EXPECT_FALSE(composer.CreateNodes().ok());
    EXPECT_THAT(configfs_.mutations(), IsEmpty());

    ASSERT_TRUE(composer.LoadModule().ok());
    EXPECT_FALSE(composer.LoadModule().ok());
    EXPECT_FALSE(composer.Bind().ok());
    EXPECT_EQ(GadgetState::kModuleLoaded, composer.state());
}

TEST_F(GadgetComposerTest, DiscoversController) {
    TemporaryDir udc_dir;
    ASSERT_EQ(0, mkdir((std::string(udc_dir.path) + "/musb-hdrc.1").c_str(), 0755));
    ASSERT_EQ(0, mkdir((std::string(udc_dir.path) + "/musb-hdrc.0").c_str(), 0755));
    config_.udc.clear();
    config_.udc_class_dir = udc_dir.path;

    auto composer = MakeComposer();
    auto result = composer.Compose();
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ("musb-hdrc.0", configfs_.Value(kUdc));
    EXPECT_EQ("musb-hdrc.0", composer.bound_udc());
}

TEST_F(GadgetComposerTest, NoControllerLeavesGadgetUnbound) {
    TemporaryDir udc_dir;
    config_.udc.clear();
    config_.udc_class_dir = udc_dir.path;

    auto composer = MakeComposer();
    auto result = composer.Compose();
    ASSERT_FALSE(result.ok());
    EXPECT_THAT(result.error().message(), HasSubstr("No USB device controller"));
    EXPECT_EQ(GadgetState::kFunctionsLinked, composer.state());
    EXPECT_EQ("", configfs_.Value(kUdc));
}

TEST_F(GadgetComposerTest, CustomIdentity) {
    config_.id_vendor = 0x1d6b;
    config_.id_product = 0x104;
    config_.manufacturer = "Linux Foundation";
    config_.max_power_ma = 500;

    auto composer = MakeComposer();
    ASSERT_TRUE(composer.Compose().ok());
    EXPECT_EQ("0x1d6b", configfs_.Value("usb_gadget/gadget/idVendor"));
    EXPECT_EQ("0x0104", configfs_.Value("usb_gadget/gadget/idProduct"));
    EXPECT_EQ("Linux Foundation", configfs_.Value("usb_gadget/gadget/strings/0x409/manufacturer"));
    EXPECT_EQ("500", configfs_.Value(Config("MaxPower")));
}

TEST_F(GadgetComposerTest, DetectState) {
    auto detector = MakeComposer();
    auto state = detector.DetectState();
    ASSERT_TRUE(state.ok());
    EXPECT_EQ(GadgetState::kUnconfigured, *state);

    auto composer = MakeComposer();
    ASSERT_TRUE(composer.LoadModule().ok());
    state = detector.DetectState();
    ASSERT_TRUE(state.ok());
    EXPECT_EQ(GadgetState::kModuleLoaded, *state);

    ASSERT_TRUE(composer.CreateNodes().ok());
    state = detector.DetectState();
    ASSERT_TRUE(state.ok());
    EXPECT_EQ(GadgetState::kNodesCreated, *state);

    ASSERT_TRUE(composer.LinkFunctions().ok());
    state = detector.DetectState();
    ASSERT_TRUE(state.ok());
    EXPECT_EQ(GadgetState::kFunctionsLinked, *state);

    ASSERT_TRUE(composer.Bind().ok());
    state = detector.DetectState();
    ASSERT_TRUE(state.ok());
    EXPECT_EQ(GadgetState::kBound, *state);
    EXPECT_EQ("musb-hdrc.0", detector.bound_udc());
}

TEST_F(GadgetComposerTest, TeardownAllowsRecomposing) {
    auto composer = MakeComposer();
    ASSERT_TRUE(composer.Compose().ok());

    auto result = composer.Teardown();
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ(GadgetState::kModuleLoaded, composer.state());
    EXPECT_FALSE(configfs_.Exists(kGadget));
    EXPECT_TRUE(configfs_.IsMounted());

    auto again = MakeComposer();
    result = again.Compose("/mnt/img/store.img");
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ("/mnt/img/store.img", configfs_.Value(kLunFile));
}

TEST_F(GadgetComposerTest, TeardownReversesInOrder) {
    auto composer = MakeComposer();
    ASSERT_TRUE(composer.Compose().ok());
    configfs_.ClearMutations();

    // A different process sees what the first one built.
    auto other = MakeComposer();
    ASSERT_TRUE(other.Teardown().ok());

    const auto& mutations = configfs_.mutations();
    ASSERT_EQ(11u, mutations.size());
    EXPECT_EQ(FakeConfigFs::Op::kWrite, mutations[0].op);
    EXPECT_EQ(kUdc, mutations[0].path);
    EXPECT_EQ("\n", mutations[0].value);
    for (size_t i = 1; i <= 3; i++) {
        EXPECT_EQ(FakeConfigFs::Op::kUnlink, mutations[i].op) << i;
    }
    for (size_t i = 4; i < mutations.size(); i++) {
        EXPECT_EQ(FakeConfigFs::Op::kRmdir, mutations[i].op) << i;
    }
    EXPECT_EQ(Config("strings/0x409"), mutations[4].path);
    EXPECT_EQ(kConfig, mutations[5].path);
    EXPECT_EQ(kGadget, mutations.back().path);
}

TEST_F(GadgetComposerTest, TeardownStopsAtTarget) {
    auto composer = MakeComposer();
    ASSERT_TRUE(composer.Compose().ok());

    ASSERT_TRUE(composer.Teardown(GadgetState::kNodesCreated).ok());
    EXPECT_EQ(GadgetState::kNodesCreated, composer.state());
    EXPECT_TRUE(composer.bound_udc().empty());
    EXPECT_TRUE(configfs_.IsDir("usb_gadget/gadget/functions/hid.usb0"));
    auto links = configfs_.ListLinks(kConfig);
    ASSERT_TRUE(links.ok());
    EXPECT_THAT(*links, IsEmpty());

    // Going back up from there is allowed.
    ASSERT_TRUE(composer.LinkFunctions("/mnt/img/store.img").ok());
    ASSERT_TRUE(composer.Bind().ok());
    EXPECT_EQ("musb-hdrc.0", configfs_.Value(kUdc));
}

TEST_F(GadgetComposerTest, TeardownRemovesPartialTree) {
    configfs_.FailOn(Config("hid.usb0"), EIO);
    auto composer = MakeComposer();
    ASSERT_FALSE(composer.Compose().ok());
    EXPECT_EQ(GadgetState::kNodesCreated, composer.state());

    auto cleaner = MakeComposer();
    auto result = cleaner.Teardown();
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_FALSE(configfs_.Exists(kGadget));
    EXPECT_EQ(GadgetState::kModuleLoaded, cleaner.state());
}

TEST_F(GadgetComposerTest, TeardownFailureIsReported) {
    auto composer = MakeComposer();
    ASSERT_TRUE(composer.Compose().ok());
    configfs_.FailOn(Config("hid.usb0"), EBUSY);

    auto result = composer.Teardown();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(EBUSY, static_cast<int>(result.error().code()));
    EXPECT_EQ(GadgetState::kFunctionsLinked, composer.state());
    EXPECT_TRUE(configfs_.Exists(kGadget));
}

TEST_F(GadgetComposerTest, FullTeardownUnloadsModule) {
    auto composer = MakeComposer();
    ASSERT_TRUE(composer.Compose().ok());

    auto result = composer.Teardown(GadgetState::kUnconfigured);
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ(GadgetState::kUnconfigured, composer.state());
    EXPECT_FALSE(configfs_.IsMounted());
    EXPECT_THAT(modules_loaded, ElementsAre(module_dir_ + "/kernel/fs/configfs/configfs.ko"));
}

TEST_F(GadgetComposerTest, FullTeardownRemovesFunctionModules) {
    ASSERT_TRUE(android::base::WriteStringToFile(
            "kernel/fs/configfs/configfs.ko:\n"
            "kernel/drivers/usb/gadget/libcomposite.ko: kernel/fs/configfs/configfs.ko\n"
            "kernel/drivers/usb/gadget/function/usb_f_mass_storage.ko: "
            "kernel/drivers/usb/gadget/libcomposite.ko kernel/fs/configfs/configfs.ko\n"
            "kernel/drivers/usb/gadget/function/usb_f_hid.ko: "
            "kernel/drivers/usb/gadget/libcomposite.ko kernel/fs/configfs/configfs.ko\n"
            "kernel/drivers/usb/gadget/function/u_ether.ko: "
            "kernel/drivers/usb/gadget/libcomposite.ko kernel/fs/configfs/configfs.ko\n"
            "kernel/drivers/usb/gadget/function/usb_f_ecm.ko: "
            "kernel/drivers/usb/gadget/function/u_ether.ko "
            "kernel/drivers/usb/gadget/libcomposite.ko kernel/fs/configfs/configfs.ko\n",
            module_dir_ + "/modules.dep"));
    modprobe_ = std::make_unique<Modprobe>(config_.module_dirs);

    auto composer = MakeComposer();
    ASSERT_TRUE(composer.Compose().ok());
    // Creating the function directories makes the kernel load these.
    for (const auto& module : {"usb_f_mass_storage", "usb_f_hid", "u_ether", "usb_f_ecm"}) {
        modules_loaded.emplace_back(module_dir_ + "/kernel/drivers/usb/gadget/function/" +
                                    module + ".ko");
    }
    EXPECT_THAT(modprobe_->GetHolders("libcomposite"), SizeIs(4));

    auto result = composer.Teardown(GadgetState::kUnconfigured);
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ(GadgetState::kUnconfigured, composer.state());
    EXPECT_FALSE(configfs_.IsMounted());
    EXPECT_THAT(modules_loaded, ElementsAre(module_dir_ + "/kernel/fs/configfs/configfs.ko"));
}

TEST(GadgetState, Names) {
    std::stringstream ss;
    ss << GadgetState::kUnconfigured << " " << GadgetState::kFunctionsLinked << " "
       << GadgetState::kBound;
    EXPECT_EQ("unconfigured functions-linked bound", ss.str());
}

}  // namespace usbgadget
