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

#include <usbgadget/configfs.h>

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <memory>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/strings.h>
#include <android-base/unique_fd.h>

using android::base::ErrnoError;
using android::base::Error;
using android::base::Result;
using android::base::unique_fd;

namespace usbgadget {

namespace {

Result<void> MkdirRecursive(const std::string& path, mode_t mode) {
    std::string::size_type slash = 0;
    while ((slash = path.find('/', slash + 1)) != std::string::npos) {
        auto directory = path.substr(0, slash);
        struct stat info;
        if (stat(directory.c_str(), &info) != 0 && mkdir(directory.c_str(), mode) != 0 &&
            errno != EEXIST) {
            return ErrnoError() << "mkdir(" << directory << ") failed";
        }
    }
    if (mkdir(path.c_str(), mode) != 0 && errno != EEXIST) {
        return ErrnoError() << "mkdir(" << path << ") failed";
    }
    return {};
}

}  // namespace

KernelConfigFs::KernelConfigFs(const std::string& mount_point, const std::string& mounts_file)
    : mount_point_(mount_point), mounts_file_(mounts_file) {
    // "/config/" and "/config" name the same mount
    while (mount_point_.size() > 1 && android::base::EndsWith(mount_point_, "/")) {
        mount_point_.pop_back();
    }
}

std::string KernelConfigFs::FullPath(const std::string& path) const {
    if (path.empty()) return mount_point_;
    return mount_point_ + "/" + path;
}

bool KernelConfigFs::IsMounted() {
    std::string mounts;
    if (!android::base::ReadFileToString(mounts_file_, &mounts)) {
        PLOG(ERROR) << "Unable to read " << mounts_file_;
        return false;
    }

    // <source> <mount point> <type> <options> <dump> <pass>
    for (const auto& line : android::base::Split(mounts, "\n")) {
        auto fields = android::base::Split(line, " ");
        if (fields.size() < 3) continue;
        if (fields[1] == mount_point_ && fields[2] == "configfs") {
            return true;
        }
    }
    return false;
}

Result<void> KernelConfigFs::EnsureMounted() {
    if (IsMounted()) {
        LOG(VERBOSE) << "configfs already mounted at " << mount_point_;
        return {};
    }
    if (auto result = MkdirRecursive(mount_point_, 0755); !result.ok()) {
        return result.error();
    }
    if (mount("none", mount_point_.c_str(), "configfs", 0, nullptr) != 0) {
        return ErrnoError() << "mount(configfs, " << mount_point_ << ") failed";
    }
    LOG(INFO) << "Mounted configfs at " << mount_point_;
    return {};
}

Result<void> KernelConfigFs::Unmount() {
    if (umount(mount_point_.c_str()) != 0) {
        return ErrnoError() << "umount(" << mount_point_ << ") failed";
    }
    return {};
}

bool KernelConfigFs::Exists(const std::string& path) {
    struct stat info;
    return lstat(FullPath(path).c_str(), &info) == 0;
}

Result<void> KernelConfigFs::MakeDir(const std::string& path) {
    if (mkdir(FullPath(path).c_str(), 0755) != 0) {
        return ErrnoError() << "mkdir(" << FullPath(path) << ") failed";
    }
    return {};
}

Result<void> KernelConfigFs::RemoveDir(const std::string& path) {
    if (rmdir(FullPath(path).c_str()) != 0) {
        return ErrnoError() << "rmdir(" << FullPath(path) << ") failed";
    }
    return {};
}

Result<void> KernelConfigFs::WriteAttribute(const std::string& path, const std::string& value) {
    // configfs hands each write() to the attribute's store() on its own, so the
    // value has to go out in a single call. Attributes exist once their group
    // does; a missing one is a misspelled name.
    auto full_path = FullPath(path);
    unique_fd fd(TEMP_FAILURE_RETRY(open(full_path.c_str(), O_WRONLY | O_NOFOLLOW | O_CLOEXEC)));
    if (fd == -1) {
        return ErrnoError() << "open(" << full_path << ") failed";
    }
    ssize_t written = TEMP_FAILURE_RETRY(write(fd.get(), value.data(), value.size()));
    if (written == -1) {
        return ErrnoError() << "Unable to write '" << full_path << "'";
    }
    if (static_cast<size_t>(written) != value.size()) {
        return Error() << "Short write to '" << full_path << "': " << written << " of "
                       << value.size() << " bytes";
    }
    return {};
}

Result<std::string> KernelConfigFs::ReadAttribute(const std::string& path) {
    auto full_path = FullPath(path);
    unique_fd fd(TEMP_FAILURE_RETRY(open(full_path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC)));
    if (fd == -1) {
        return ErrnoError() << "open(" << full_path << ") failed";
    }
    std::string content;
    if (!android::base::ReadFdToString(fd, &content)) {
        return ErrnoError() << "Unable to read '" << full_path << "'";
    }
    return content;
}

Result<void> KernelConfigFs::Link(const std::string& target, const std::string& link) {
    if (symlink(FullPath(target).c_str(), FullPath(link).c_str()) != 0) {
        return ErrnoError() << "symlink(" << FullPath(target) << ", " << FullPath(link)
                            << ") failed";
    }
    return {};
}

Result<void> KernelConfigFs::Unlink(const std::string& link) {
    if (unlink(FullPath(link).c_str()) != 0) {
        return ErrnoError() << "unlink(" << FullPath(link) << ") failed";
    }
    return {};
}

Result<std::vector<std::string>> KernelConfigFs::ListLinks(const std::string& dir) {
    auto full_path = FullPath(dir);
    std::unique_ptr<DIR, decltype(&closedir)> d(opendir(full_path.c_str()), closedir);
    if (!d) {
        return ErrnoError() << "opendir(" << full_path << ") failed";
    }

    std::vector<std::string> links;
    dirent* dp;
    while ((dp = readdir(d.get())) != nullptr) {
        if (dp->d_name[0] == '.') continue;
        struct stat info;
        auto entry = full_path + "/" + dp->d_name;
        if (lstat(entry.c_str(), &info) != 0) {
            return ErrnoError() << "lstat(" << entry << ") failed";
        }
        if (S_ISLNK(info.st_mode)) {
            links.emplace_back(dp->d_name);
        }
    }
    std::sort(links.begin(), links.end());
    return links;
}

}  // namespace usbgadget
