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

#include <getopt.h>
#include <stdlib.h>

#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/strings.h>
#include <modprobe/modprobe.h>

#include <usbgadget/composer.h>
#include <usbgadget/configfs.h>
#include <usbgadget/gadget_config.h>

using usbgadget::GadgetComposer;
using usbgadget::GadgetConfig;
using usbgadget::GadgetState;
using usbgadget::kDefaultBackingFile;
using usbgadget::kDefaultConfigFile;
using usbgadget::KernelConfigFs;
using usbgadget::KernelModuleDir;
using usbgadget::ReadGadgetConfig;

namespace {

enum usb_gadget_mode {
    ComposeMode,
    TeardownMode,
    StatusMode,
};

void print_usage(void) {
    LOG(INFO) << "Usage:";
    LOG(INFO);
    LOG(INFO) << "  usb_gadget [options] [BACKING_FILE]";
    LOG(INFO) << "  usb_gadget [options] -t [-U]";
    LOG(INFO) << "  usb_gadget [options] -S";
    LOG(INFO);
    LOG(INFO) << "Compose a mass storage, HID keyboard and ethernet gadget and bind it.";
    LOG(INFO) << "BACKING_FILE is exported as the mass storage LUN, default "
              << kDefaultBackingFile << ".";
    LOG(INFO);
    LOG(INFO) << "Options:";
    LOG(INFO) << "  -c, --config=FILE: Read settings from FILE instead of " << kDefaultConfigFile;
    LOG(INFO) << "  -d, --dirname=DIR: Load modules from DIR, option may be used multiple times";
    LOG(INFO) << "  -h, --help: Print this help";
    LOG(INFO) << "  -S, --status: Print the state of the gadget";
    LOG(INFO) << "  -s, --syslog: print to syslog also";
    LOG(INFO) << "  -t, --teardown: Unbind and remove the gadget";
    LOG(INFO) << "  -U, --unload: With -t, also unmount configfs and remove the kernel module";
    LOG(INFO) << "  -u, --udc=NAME: Bind to controller NAME instead of the first one found";
    LOG(INFO) << "  -q, --quiet: disable messages";
    LOG(INFO) << "  -v, --verbose: enable more messages, even more with a second -v";
    LOG(INFO);
}

#define check_mode()                                   \
    if (mode != ComposeMode) {                         \
        LOG(ERROR) << "multiple mode flags specified"; \
        print_usage();                                 \
        return EXIT_FAILURE;                           \
    }

auto use_syslog = false;

void MyLogger(android::base::LogId id, android::base::LogSeverity severity, const char* tag,
              const char* file, unsigned int line, const char* message) {
    android::base::StdioLogger(id, severity, tag, file, line, message);
    if (use_syslog && message[0]) {
        android::base::KernelLogger(id, severity, tag, file, line, message);
    }
}

}  // anonymous namespace

int main(int argc, char** argv) {
    android::base::InitLogging(argv, MyLogger);
    android::base::SetMinimumLogSeverity(android::base::INFO);

    std::string config_file = kDefaultConfigFile;
    bool config_optional = true;
    std::vector<std::string> mod_dirs;
    std::string udc;
    std::string backing_file;
    usb_gadget_mode mode = ComposeMode;
    bool unload = false;

    int opt;
    int option_index = 0;
    // clang-format off
    static struct option long_options[] = {
        { "config",   required_argument, 0, 'c' },
        { "dirname",  required_argument, 0, 'd' },
        { "help",     no_argument,       0, 'h' },
        { "quiet",    no_argument,       0, 'q' },
        { "status",   no_argument,       0, 'S' },
        { "syslog",   no_argument,       0, 's' },
        { "teardown", no_argument,       0, 't' },
        { "unload",   no_argument,       0, 'U' },
        { "udc",      required_argument, 0, 'u' },
        { "verbose",  no_argument,       0, 'v' },
        { 0,          0,                 0, 0   },
    };
    // clang-format on
    while ((opt = getopt_long(argc, argv, "c:d:hqSstUu:v", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                config_file = optarg;
                config_optional = false;
                break;
            case 'd':
                mod_dirs.emplace_back(optarg);
                break;
            case 'h':
                android::base::SetMinimumLogSeverity(android::base::INFO);
                print_usage();
                return EXIT_SUCCESS;
            case 'q':
                android::base::SetMinimumLogSeverity(android::base::WARNING);
                break;
            case 'S':
                check_mode();
                mode = StatusMode;
                break;
            case 's':
                use_syslog = true;
                break;
            case 't':
                check_mode();
                mode = TeardownMode;
                break;
            case 'U':
                unload = true;
                break;
            case 'u':
                udc = optarg;
                break;
            case 'v':
                if (android::base::GetMinimumLogSeverity() <= android::base::DEBUG) {
                    android::base::SetMinimumLogSeverity(android::base::VERBOSE);
                } else {
                    android::base::SetMinimumLogSeverity(android::base::DEBUG);
                }
                break;
            default:
                LOG(ERROR) << "Unrecognized option: " << opt;
                print_usage();
                return EXIT_FAILURE;
        }
    }

    if (optind < argc) {
        if (mode != ComposeMode) {
            LOG(ERROR) << "A backing file is only used when composing the gadget.";
            print_usage();
            return EXIT_FAILURE;
        }
        backing_file = argv[optind++];
    }
    if (optind < argc) {
        LOG(ERROR) << "Unexpected argument: " << argv[optind];
        print_usage();
        return EXIT_FAILURE;
    }
    if (unload && mode != TeardownMode) {
        LOG(ERROR) << "-U needs -t";
        print_usage();
        return EXIT_FAILURE;
    }

    GadgetConfig config;
    if (auto result = ReadGadgetConfig(config_file, config_optional, &config); !result.ok()) {
        LOG(ERROR) << result.error();
        return EXIT_FAILURE;
    }
    if (!udc.empty()) {
        config.udc = udc;
    }
    if (!mod_dirs.empty()) {
        config.module_dirs = mod_dirs;
    }
    if (config.module_dirs.empty()) {
        auto dir = KernelModuleDir();
        if (!dir.ok()) {
            LOG(ERROR) << dir.error();
            return EXIT_FAILURE;
        }
        config.module_dirs.emplace_back(*dir);
    }

    LOG(DEBUG) << "mode is " << mode;
    LOG(DEBUG) << "mod_dirs is: " << android::base::Join(config.module_dirs, " ");
    LOG(DEBUG) << "udc is: " << (config.udc.empty() ? "<first found>" : config.udc);

    KernelConfigFs configfs(config.mount_point);
    Modprobe m(config.module_dirs);
    GadgetComposer composer(config, &configfs, &m);

    switch (mode) {
        case ComposeMode:
            if (auto result = composer.Compose(backing_file); !result.ok()) {
                LOG(ERROR) << "Failed to compose gadget " << config.gadget_name << " ("
                           << composer.state() << "): " << result.error();
                return EXIT_FAILURE;
            }
            LOG(INFO) << "Gadget " << config.gadget_name << " bound to " << composer.bound_udc();
            break;
        case TeardownMode: {
            auto target = unload ? GadgetState::kUnconfigured : GadgetState::kModuleLoaded;
            if (auto result = composer.Teardown(target); !result.ok()) {
                LOG(ERROR) << "Failed to tear down gadget " << config.gadget_name << " ("
                           << composer.state() << "): " << result.error();
                return EXIT_FAILURE;
            }
            break;
        }
        case StatusMode: {
            auto state = composer.DetectState();
            if (!state.ok()) {
                LOG(ERROR) << state.error();
                return EXIT_FAILURE;
            }
            if (*state == GadgetState::kBound) {
                LOG(INFO) << config.gadget_name << ": " << *state << " to "
                          << composer.bound_udc();
            } else {
                LOG(INFO) << config.gadget_name << ": " << *state;
            }
            break;
        }
        default:
            LOG(ERROR) << "Bad mode";
            return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
