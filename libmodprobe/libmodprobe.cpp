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

#include <modprobe/modprobe.h>

#include <fnmatch.h>

#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/strings.h>

std::string Modprobe::MakeCanonical(const std::string& module_path) {
    auto start = module_path.find_last_of('/');
    if (start == std::string::npos) {
        start = 0;
    } else {
        start += 1;
    }
    auto end = module_path.size();
    if (android::base::EndsWith(module_path, ".ko")) {
        end -= 3;
    }
    if ((end - start) <= 1) {
        LOG(ERROR) << "malformed module name: " << module_path;
        return "";
    }
    std::string module_name = module_path.substr(start, end - start);
    // module names can have '-', but their file names will have '_'
    std::replace(module_name.begin(), module_name.end(), '-', '_');
    return module_name;
}

bool Modprobe::ParseDepCallback(const std::string& base_path,
                                const std::vector<std::string>& args) {
    auto pos = args[0].find(':');
    if (pos == std::string::npos) {
        LOG(ERROR) << "dependency lines must start with name followed by ':'";
        return false;
    }

    auto resolve = [&base_path](const std::string& path) {
        return path[0] == '/' ? path : base_path + "/" + path;
    };

    // The module itself comes first, followed by what it needs loaded beforehand.
    std::vector<std::string> deps;
    deps.emplace_back(resolve(args[0].substr(0, pos)));
    for (auto arg = args.begin() + 1; arg != args.end(); ++arg) {
        if (arg->empty()) continue;
        deps.emplace_back(resolve(*arg));
    }

    std::string canonical_name = MakeCanonical(args[0].substr(0, pos));
    if (canonical_name.empty()) {
        return false;
    }
    module_deps_[canonical_name] = std::move(deps);
    return true;
}

bool Modprobe::ParseAliasCallback(const std::vector<std::string>& args) {
    if (args[0] != "alias") {
        LOG(ERROR) << "non-alias line encountered in modules.alias, found " << args[0];
        return false;
    }
    if (args.size() != 3) {
        LOG(ERROR) << "alias lines in modules.alias must have 3 entries, not " << args.size();
        return false;
    }
    module_aliases_.emplace_back(args[1], args[2]);
    return true;
}

bool Modprobe::ParseSoftdepCallback(const std::vector<std::string>& args) {
    if (args[0] != "softdep") {
        LOG(ERROR) << "non-softdep line encountered in modules.softdep, found " << args[0];
        return false;
    }
    if (args.size() < 4) {
        LOG(ERROR) << "softdep lines in modules.softdep must have at least 4 entries";
        return false;
    }

    const std::string& module = args[1];
    std::string state;
    for (auto it = args.begin() + 2; it != args.end(); ++it) {
        if (*it == "pre:" || *it == "post:") {
            state = *it;
            continue;
        }
        if (state.empty()) {
            LOG(ERROR) << "malformed modules.softdep at token " << *it;
            return false;
        }
        if (state == "pre:") {
            module_pre_softdep_.emplace_back(module, *it);
        } else {
            module_post_softdep_.emplace_back(module, *it);
        }
    }
    return true;
}

bool Modprobe::ParseOptionsCallback(const std::vector<std::string>& args) {
    if (args[0] != "options") {
        LOG(ERROR) << "non-options line encountered in modules.options";
        return false;
    }
    if (args.size() < 2) {
        LOG(ERROR) << "lines in modules.options must have at least 2 entries, not " << args.size();
        return false;
    }

    const std::string canonical_name = MakeCanonical(args[1]);
    if (canonical_name.empty()) {
        return false;
    }
    std::vector<std::string> options(args.begin() + 2, args.end());
    auto [unused, inserted] =
            module_options_.emplace(canonical_name, android::base::Join(options, " "));
    if (!inserted) {
        LOG(ERROR) << "multiple options lines present for module " << args[1];
        return false;
    }
    return true;
}

bool Modprobe::ParseBuiltinCallback(const std::vector<std::string>& args) {
    const std::string canonical_name = MakeCanonical(args[0]);
    if (canonical_name.empty()) {
        return false;
    }
    module_builtin_.emplace(canonical_name);
    return true;
}

void Modprobe::ParseCfg(const std::string& cfg,
                        std::function<bool(const std::vector<std::string>&)> f) {
    std::string cfg_contents;
    if (!android::base::ReadFileToString(cfg, &cfg_contents, false)) {
        LOG(VERBOSE) << "Skipping missing " << cfg;
        return;
    }

    int line_number = 0;
    for (const auto& line : android::base::Split(cfg_contents, "\n")) {
        line_number++;
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const std::vector<std::string> args = android::base::Split(line, " ");
        if (!f(args)) {
            LOG(WARNING) << cfg << ":" << line_number << ": ignoring line";
        }
    }
}

Modprobe::Modprobe(const std::vector<std::string>& base_paths) {
    using namespace std::placeholders;

    for (const auto& base_path : base_paths) {
        ParseCfg(base_path + "/modules.alias",
                 std::bind(&Modprobe::ParseAliasCallback, this, _1));
        ParseCfg(base_path + "/modules.dep",
                 std::bind(&Modprobe::ParseDepCallback, this, base_path, _1));
        ParseCfg(base_path + "/modules.softdep",
                 std::bind(&Modprobe::ParseSoftdepCallback, this, _1));
        ParseCfg(base_path + "/modules.options",
                 std::bind(&Modprobe::ParseOptionsCallback, this, _1));
        ParseCfg(base_path + "/modules.builtin",
                 std::bind(&Modprobe::ParseBuiltinCallback, this, _1));
    }
}

std::vector<std::string> Modprobe::GetDependencies(const std::string& module) {
    auto it = module_deps_.find(module);
    if (it == module_deps_.end()) {
        return {};
    }
    return it->second;
}

bool Modprobe::InsmodWithDeps(const std::string& module_name, const std::string& parameters) {
    if (module_name.empty()) {
        LOG(ERROR) << "Need valid module name, given: " << module_name;
        return false;
    }

    auto dependencies = GetDependencies(module_name);
    if (dependencies.empty()) {
        LOG(ERROR) << "Module " << module_name << " not in dependency file";
        return false;
    }

    // modules.dep lists the deepest dependency last
    for (auto dep = dependencies.rbegin(); dep != dependencies.rend() - 1; ++dep) {
        LOG(VERBOSE) << "Loading hard dep for '" << module_name << "': " << *dep;
        if (!LoadWithAliases(*dep, true)) {
            return false;
        }
    }

    for (const auto& [module, softdep] : module_pre_softdep_) {
        if (module_name != module) continue;
        LOG(VERBOSE) << "Loading soft pre-dep for '" << module << "': " << softdep;
        if (!LoadWithAliases(softdep, false)) {
            LOG(WARNING) << "Soft pre-dep " << softdep << " of " << module << " not loaded";
        }
    }

    if (!Insmod(dependencies[0], parameters)) {
        return false;
    }

    for (const auto& [module, softdep] : module_post_softdep_) {
        if (module_name != module) continue;
        LOG(VERBOSE) << "Loading soft post-dep for '" << module << "': " << softdep;
        if (!LoadWithAliases(softdep, false)) {
            LOG(WARNING) << "Soft post-dep " << softdep << " of " << module << " not loaded";
        }
    }

    return true;
}

bool Modprobe::LoadWithAliases(const std::string& module_name, bool strict,
                               const std::string& parameters) {
    auto canonical_name = MakeCanonical(module_name);
    if (canonical_name.empty()) {
        return false;
    }
    if (module_loaded_.count(canonical_name) || IsBuiltin(canonical_name)) {
        return true;
    }

    std::set<std::string> modules_to_load = {canonical_name};
    bool module_loaded = false;

    // several modules may alias themselves to the requested name
    for (const auto& [alias, aliased_module] : module_aliases_) {
        if (fnmatch(alias.c_str(), module_name.c_str(), 0) != 0) continue;
        LOG(VERBOSE) << "Found alias for '" << module_name << "': '" << aliased_module << "'";
        if (module_loaded_.count(MakeCanonical(aliased_module))) continue;
        modules_to_load.emplace(aliased_module);
    }

    for (const auto& module : modules_to_load) {
        if (!ModuleExists(module)) continue;
        if (InsmodWithDeps(module, parameters)) module_loaded = true;
    }

    if (strict && !module_loaded) {
        LOG(ERROR) << "LoadWithAliases was unable to load " << module_name
                   << ", tried: " << android::base::Join(modules_to_load, ", ");
        return false;
    }
    return true;
}

bool Modprobe::Remove(const std::string& module_name) {
    auto canonical_name = MakeCanonical(module_name);
    if (IsBuiltin(canonical_name)) {
        LOG(ERROR) << "Module " << canonical_name << " is builtin";
        return false;
    }
    for (const auto& holder : GetHolders(canonical_name)) {
        // Gone already if it was using an earlier holder as well.
        if (!IsLoaded(holder)) continue;
        LOG(VERBOSE) << "Removing " << holder << ", it uses " << canonical_name;
        if (!Remove(holder)) {
            LOG(ERROR) << "Module " << canonical_name << " is in use by " << holder;
            return false;
        }
    }
    return Rmmod(canonical_name);
}

std::vector<std::string> Modprobe::GetHolders(const std::string& module_name) {
    auto canonical_name = MakeCanonical(module_name);
    std::vector<std::string> holders;
    // /proc/modules: "<name> <size> <refcount> <users> <state> <address>", with
    // <users> as "a,b," or "-"
    for (const auto& line : android::base::Split(ReadLoadedModules(), "\n")) {
        auto fields = android::base::Split(line, " ");
        if (fields.size() < 4 || fields[0] != canonical_name) continue;
        for (const auto& user : android::base::Split(fields[3], ",")) {
            if (user.empty() || user == "-" || user[0] == '[') continue;
            holders.emplace_back(user);
        }
        break;
    }
    return holders;
}

bool Modprobe::IsLoaded(const std::string& module_name) {
    auto canonical_name = MakeCanonical(module_name);
    if (module_loaded_.count(canonical_name)) {
        return true;
    }

    // /proc/modules: "<name> <size> <refcount> <users> <state> <address>"
    for (const auto& line : android::base::Split(ReadLoadedModules(), "\n")) {
        auto fields = android::base::Split(line, " ");
        if (fields[0] == canonical_name) {
            module_loaded_.emplace(canonical_name);
            return true;
        }
    }
    return false;
}

bool Modprobe::IsBuiltin(const std::string& module_name) {
    return module_builtin_.count(MakeCanonical(module_name)) > 0;
}
