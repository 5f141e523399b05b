/*
 * Copyright (C) 2018 The Android Open Source Project
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

#include <functional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Loads kernel modules described by the depmod output files (modules.dep,
// modules.alias, modules.softdep, modules.options, modules.builtin) found in
// one or more module directories.
class Modprobe {
  public:
    explicit Modprobe(const std::vector<std::string>& base_paths);

    // Loads |module_name| and everything it depends on. With |strict| set, failing to
    // load any module the name resolves to is an error.
    bool LoadWithAliases(const std::string& module_name, bool strict,
                         const std::string& parameters = "");
    // Unloads |module_name| after the loaded modules using it. Its own dependencies
    // are left in place.
    bool Remove(const std::string& module_name);

    // True if the running kernel already has |module_name| loaded.
    bool IsLoaded(const std::string& module_name);
    // True if |module_name| is compiled into the kernel and cannot be loaded or removed.
    bool IsBuiltin(const std::string& module_name);

    std::vector<std::string> GetDependencies(const std::string& module);
    // Loaded modules that use |module_name|, from the "used by" column of /proc/modules.
    std::vector<std::string> GetHolders(const std::string& module_name);

  private:
    std::string MakeCanonical(const std::string& module_path);
    bool InsmodWithDeps(const std::string& module_name, const std::string& parameters);
    bool Insmod(const std::string& path_name, const std::string& parameters);
    bool Rmmod(const std::string& module_name);
    bool ModuleExists(const std::string& module_name);
    std::string ReadLoadedModules();

    bool ParseDepCallback(const std::string& base_path, const std::vector<std::string>& args);
    bool ParseAliasCallback(const std::vector<std::string>& args);
    bool ParseSoftdepCallback(const std::vector<std::string>& args);
    bool ParseOptionsCallback(const std::vector<std::string>& args);
    bool ParseBuiltinCallback(const std::vector<std::string>& args);
    void ParseCfg(const std::string& cfg, std::function<bool(const std::vector<std::string>&)> f);

    std::vector<std::pair<std::string, std::string>> module_aliases_;
    std::unordered_map<std::string, std::vector<std::string>> module_deps_;
    std::vector<std::pair<std::string, std::string>> module_pre_softdep_;
    std::vector<std::pair<std::string, std::string>> module_post_softdep_;
    std::unordered_map<std::string, std::string> module_options_;
    std::set<std::string> module_builtin_;
    std::unordered_set<std::string> module_loaded_;
};
