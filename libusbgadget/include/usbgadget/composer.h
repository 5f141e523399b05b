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

#include <ostream>
#include <string>
#include <vector>

#include <android-base/result.h>

#include <usbgadget/configfs.h>
#include <usbgadget/gadget_config.h>

class Modprobe;

namespace usbgadget {

// Progress of a gadget through composition. Each state is reached from the one
// before it only; Teardown() walks back down.
enum class GadgetState {
    kUnconfigured,
    // libcomposite is available and configfs is mounted.
    kModuleLoaded,
    // Gadget, configuration, string and function directories exist and carry
    // their attributes.
    kNodesCreated,
    // Every function is linked into the configuration.
    kFunctionsLinked,
    // A controller is bound; the host can enumerate the gadget.
    kBound,
};

std::ostream& operator<<(std::ostream& os, GadgetState state);

// Builds a mass storage + HID keyboard + ECM ethernet composite gadget in configfs.
//
// Composition is not re-entrant: creating the gadget directory fails if a previous
// run left it behind, and the tree has to be torn down before composing again.
class GadgetComposer {
  public:
    // |configfs| and |modprobe| must outlive the composer.
    GadgetComposer(const GadgetConfig& config, ConfigFs* configfs, Modprobe* modprobe);

    // Runs every transition from the current state up to kBound, stopping at the
    // first failure. |backing_file| overrides the configured LUN image if non-empty.
    android::base::Result<void> Compose(const std::string& backing_file = "");

    // kUnconfigured -> kModuleLoaded
    android::base::Result<void> LoadModule();
    // kModuleLoaded -> kNodesCreated
    android::base::Result<void> CreateNodes();
    // kNodesCreated -> kFunctionsLinked
    android::base::Result<void> LinkFunctions(const std::string& backing_file = "");
    // kFunctionsLinked -> kBound
    android::base::Result<void> Bind();

    // Reverses transitions, most recent first, until |target| is reached. The starting
    // point is read back from configfs, so a tree left by another process or a failed
    // run can be removed.
    android::base::Result<void> Teardown(GadgetState target = GadgetState::kModuleLoaded);

    // Derives the state from what is present in configfs and adopts it.
    android::base::Result<GadgetState> DetectState();

    GadgetState state() const { return state_; }
    // Controller the gadget is bound to, empty unless kBound.
    const std::string& bound_udc() const { return bound_udc_; }

    // Paths relative to the configfs mount point.
    std::string GadgetPath(const std::string& node = "") const;
    std::string ConfigPath(const std::string& node = "") const;
    std::string FunctionPath(const std::string& instance) const;

  private:
    android::base::Result<void> CheckState(GadgetState expected, const char* operation) const;
    android::base::Result<void> Write(const std::string& path, const std::string& value);
    android::base::Result<void> MakeDir(const std::string& path);
    android::base::Result<void> RemoveDirIfPresent(const std::string& path);
    std::vector<std::string> FunctionInstances() const;

    android::base::Result<void> Unbind();
    android::base::Result<void> UnlinkFunctions();
    android::base::Result<void> RemoveNodes();
    android::base::Result<void> UnloadModule();

    GadgetConfig config_;
    ConfigFs* configfs_;
    Modprobe* modprobe_;
    GadgetState state_ = GadgetState::kUnconfigured;
    std::string bound_udc_;
};

}  // namespace usbgadget
