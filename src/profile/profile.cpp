// ==============================================================================
// profile.cpp - Rule Profile: разбор, компиляция, реестр
// ==============================================================================

#include "logveil/profile.hpp"

#include "logveil/platform.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <yaml-cpp/yaml.h>

namespace logveil::profile {

namespace fs = std::filesystem;

// ============================================================================
// Error formatting
// ============================================================================

std::string Error::format() const {
    std::ostringstream oss;
    oss << "profile error";
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

// ============================================================================
// FormatHint
// ============================================================================

FormatHint parse_format_hint(std::string_view s) {
    if (s == "plaintext" || s == "text") {
        return FormatHint::Plaintext;
    }
    if (s == "json") {
        return FormatHint::Json;
    }
    if (s == "jsonl") {
        return FormatHint::Jsonl;
    }
    if (s == "yaml") {
        return FormatHint::Yaml;
    }
    throw std::invalid_argument("unknown format '" + std::string(s) +
                                "', must be: plaintext, json, jsonl or yaml");
}

const char* to_string(FormatHint hint) {
    switch (hint) {
    case FormatHint::Plaintext:
        return "plaintext";
    case FormatHint::Json:
        return "json";
    case FormatHint::Jsonl:
        return "jsonl";
    case FormatHint::Yaml:
        return "yaml";
    }
    return "plaintext";
}

// ============================================================================
// Разбор YAML
// ============================================================================

namespace {

std::string scalar(const YAML::Node& node, const char* field) {
    if (!node.IsScalar()) {
        throw std::runtime_error(std::string("field '") + field + "' must be a string");
    }
    return node.as<std::string>();
}

std::vector<std::string> string_list(const YAML::Node& node, const char* field) {
    std::vector<std::string> out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
        return out;
    }
    if (!node.IsSequence()) {
        throw std::runtime_error(std::string("field '") + field + "' must be a list of strings");
    }
    for (const auto& item : node) {
        out.push_back(scalar(item, field));
    }
    return out;
}

rule::RuleDef parse_pattern(const YAML::Node& node, std::size_t index) {
    if (!node.IsMap()) {
        throw std::runtime_error("pattern #" + std::to_string(index + 1) + " must be a mapping");
    }
    rule::RuleDef def;
    if (node["name"]) {
        def.name = scalar(node["name"], "name");
    } else if (node["id"]) {
        def.name = scalar(node["id"], "id");
    }
    if (!node["pattern"]) {
        std::string label = def.name.empty() ? "#" + std::to_string(index + 1) : "'" + def.name + "'";
        throw std::runtime_error("pattern " + label + " is missing required field 'pattern'");
    }
    def.pattern = scalar(node["pattern"], "pattern");
    if (node["replacement"]) {
        def.replacement = scalar(node["replacement"], "replacement");
    }
    if (node["enabled"]) {
        def.enabled = node["enabled"].as<bool>();
    }
    if (node["ignore_case"]) {
        def.ignore_case = node["ignore_case"].as<bool>();
    }
    if (node["description"]) {
        def.description = scalar(node["description"], "description");
    }
    return def;
}

void parse_entropy(const YAML::Node& node, entropy::EntropyConfig& cfg) {
    if (!node.IsMap()) {
        throw std::runtime_error("field 'entropy' must be a mapping");
    }
    if (node["enabled"]) {
        cfg.enabled = node["enabled"].as<bool>();
    }
    if (node["threshold"]) {
        cfg.threshold = node["threshold"].as<double>();
    }
    if (node["min_length"]) {
        long long min_length = node["min_length"].as<long long>();
        if (min_length <= 0) {
            throw std::runtime_error("entropy min_length must be positive, got " +
                                     std::to_string(min_length));
        }
        cfg.min_length = static_cast<std::size_t>(min_length);
    }
}

KeyPathDef parse_key_path(const YAML::Node& node) {
    KeyPathDef def;
    if (node.IsScalar()) {
        def.path = node.as<std::string>();
        return def;
    }
    if (!node.IsMap() || !node["path"]) {
        throw std::runtime_error("key path entry must be a string or a mapping with 'path'");
    }
    def.path = scalar(node["path"], "path");
    if (node["action"]) {
        def.action = scalar(node["action"], "action");
    }
    if (node["replacement"]) {
        def.replacement = scalar(node["replacement"], "replacement");
    }
    return def;
}

ProfileData parse_root(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw std::runtime_error("profile must be a mapping");
    }

    ProfileData data;
    if (!root["name"] || root["name"].IsNull()) {
        throw std::runtime_error("profile is missing required field 'name'");
    }
    data.name = scalar(root["name"], "name");

    if (root["description"]) {
        data.description = scalar(root["description"], "description");
    }
    if (root["version"]) {
        data.version = scalar(root["version"], "version");
    }
    if (root["format"]) {
        data.format = parse_format_hint(scalar(root["format"], "format"));
    }
    if (root["filename_patterns"]) {
        data.filename_patterns = string_list(root["filename_patterns"], "filename_patterns");
    }

    if (const YAML::Node patterns = root["patterns"]) {
        if (!patterns.IsSequence()) {
            throw std::runtime_error("field 'patterns' must be a list");
        }
        std::size_t index = 0;
        for (const auto& item : patterns) {
            data.patterns.push_back(parse_pattern(item, index++));
        }
    }

    if (root["entropy"]) {
        parse_entropy(root["entropy"], data.entropy);
    } else if (root["entropy_config"]) {
        parse_entropy(root["entropy_config"], data.entropy);
    }

    if (const YAML::Node keys = root["key_paths"]) {
        if (!keys.IsSequence()) {
            throw std::runtime_error("field 'key_paths' must be a list");
        }
        for (const auto& item : keys) {
            data.key_paths.push_back(parse_key_path(item));
        }
    }
    return data;
}

bool has_profile_extension(const fs::path& path) {
    auto ext = path.extension().string();
    return ext == ".yml" || ext == ".yaml" || ext == ".json";
}

}  // namespace

ParseResult parse_string(std::string_view text, const std::string& origin) {
    ParseResult result;
    try {
        YAML::Node root = YAML::Load(std::string(text));
        result.data = parse_root(root);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), origin};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), origin};
    }
    return result;
}

ParseResult parse_file(const fs::path& path) {
    ParseResult result;
    std::string origin = platform::path_to_utf8(path);

    if (!has_profile_extension(path)) {
        result.error = Error{"profile must have a .yml, .yaml or .json extension", origin};
        return result;
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        result.data = parse_root(root);
        result.ok = true;
    } catch (const YAML::BadFile&) {
        result.error = Error{"failed to open profile file", origin};
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), origin};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), origin};
    }
    return result;
}

// ============================================================================
// Переопределения и компиляция
// ============================================================================

void apply(ProfileData& data, const Overrides& overrides) {
    if (overrides.entropy_threshold.has_value()) {
        data.entropy.threshold = *overrides.entropy_threshold;
    }
    if (overrides.entropy_min_length.has_value()) {
        data.entropy.min_length = *overrides.entropy_min_length;
    }
    if (overrides.disable_entropy) {
        data.entropy.enabled = false;
    }
    for (const auto& key : overrides.extra_keys) {
        data.key_paths.push_back(KeyPathDef{key, "redact", std::nullopt});
    }
}

LoadResult compile(ProfileData data, const std::string& origin) {
    LoadResult result;

    if (data.name.empty()) {
        result.error = Error{"profile name must not be empty", origin};
        return result;
    }

    auto built = rule::RuleSetBuilder::create().rules(data.patterns).build();
    if (!built.ok) {
        result.error = Error{built.error, origin};
        return result;
    }

    if (auto err = entropy::validate(data.entropy)) {
        result.error = Error{*err, origin};
        return result;
    }

    std::vector<keypath::KeyPathRule> key_paths;
    key_paths.reserve(data.key_paths.size());
    for (const auto& def : data.key_paths) {
        try {
            key_paths.push_back(
                keypath::make_rule(def.path, keypath::parse_action(def.action), def.replacement));
        } catch (const std::invalid_argument& e) {
            result.error = Error{e.what(), origin};
            return result;
        }
    }

    std::shared_ptr<Profile> profile(new Profile());
    profile->data_ = std::move(data);
    profile->rules_ = std::move(built.rules);
    profile->key_paths_ = std::move(key_paths);

    result.profile = std::move(profile);
    result.ok = true;
    return result;
}

LoadResult load_file(const fs::path& path, const Overrides& overrides) {
    auto parsed = parse_file(path);
    if (!parsed.ok) {
        LoadResult result;
        result.error = std::move(parsed.error);
        return result;
    }
    apply(parsed.data, overrides);
    return compile(std::move(parsed.data), platform::path_to_utf8(path));
}

// ============================================================================
// Glob и реестр
// ============================================================================

bool glob_match(std::string_view pattern, std::string_view name) {
    auto lower = [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); };

    // Итеративный алгоритм с возвратом к последней '*'
    std::size_t p = 0;
    std::size_t n = 0;
    std::size_t star = std::string_view::npos;
    std::size_t mark = 0;
    while (n < name.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || lower(pattern[p]) == lower(name[n]))) {
            ++p;
            ++n;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = n;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            n = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

bool Profile::matches_file(std::string_view filename) const {
    return std::any_of(data_.filename_patterns.begin(), data_.filename_patterns.end(),
                       [&](const std::string& pattern) { return glob_match(pattern, filename); });
}

ProfileRegistry ProfileRegistry::with_builtins(const Overrides& overrides) {
    ProfileRegistry registry;
    for (auto& data : builtin_profiles()) {
        std::string name = data.name;
        apply(data, overrides);
        auto compiled = compile(std::move(data), "builtin:" + name);
        if (!compiled.ok) {
            throw std::runtime_error(compiled.error.format());
        }
        registry.add(std::move(compiled.profile));
    }
    return registry;
}

void ProfileRegistry::add(std::shared_ptr<const Profile> profile) {
    for (auto& existing : profiles_) {
        if (existing->name() == profile->name()) {
            existing = std::move(profile);
            return;
        }
    }
    profiles_.push_back(std::move(profile));
}

std::shared_ptr<const Profile> ProfileRegistry::find(std::string_view name) const {
    for (const auto& profile : profiles_) {
        if (profile->name() == name) {
            return profile;
        }
    }
    return nullptr;
}

std::vector<std::string> ProfileRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(profiles_.size());
    for (const auto& profile : profiles_) {
        out.push_back(profile->name());
    }
    return out;
}

std::size_t ProfileRegistry::load_directory(const fs::path& dir, std::vector<Error>& errors,
                                            const Overrides& overrides) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        errors.push_back(Error{"profiles directory does not exist", platform::path_to_utf8(dir)});
        return 0;
    }

    std::vector<fs::path> files;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && has_profile_extension(it->path())) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        errors.push_back(Error{ec.message(), platform::path_to_utf8(dir)});
    }
    std::sort(files.begin(), files.end());

    std::size_t loaded = 0;
    for (const auto& file : files) {
        auto result = load_file(file, overrides);
        if (!result.ok) {
            errors.push_back(std::move(result.error));
            continue;
        }
        add(std::move(result.profile));
        ++loaded;
    }
    return loaded;
}

std::shared_ptr<const Profile> ProfileRegistry::match_for_file(const fs::path& path) const {
    std::string filename = platform::path_to_utf8(path.filename());
    for (const auto& profile : profiles_) {
        if (profile->matches_file(filename)) {
            return profile;
        }
    }
    return find(DEFAULT_PROFILE);
}

}  // namespace logveil::profile
