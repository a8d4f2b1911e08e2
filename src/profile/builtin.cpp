// ==============================================================================
// builtin.cpp - Встроенные профили
// ==============================================================================
//
// default     - все встроенные категории правил
// nginx       - access/error журналы nginx
// docker      - JSON журналы контейнеров
// cloudtrail  - события AWS CloudTrail
// application - журналы веб-приложений (сессии, CSRF)
//
// ==============================================================================

#include "logveil/profile.hpp"

namespace logveil::profile {

namespace {

rule::RuleDef make_def(std::string name, std::string pattern, std::string replacement,
                       std::string description, bool ignore_case = false) {
    rule::RuleDef def;
    def.name = std::move(name);
    def.pattern = std::move(pattern);
    def.replacement = std::move(replacement);
    def.ignore_case = ignore_case;
    def.description = std::move(description);
    return def;
}

entropy::EntropyConfig entropy_config(double threshold, std::size_t min_length) {
    entropy::EntropyConfig cfg;
    cfg.threshold = threshold;
    cfg.min_length = min_length;
    return cfg;
}

ProfileData default_profile() {
    ProfileData data;
    data.name = DEFAULT_PROFILE;
    data.description = "Common secrets and personal data in any text log";
    data.version = "1.0";
    data.patterns = rule::builtin_rules();
    data.entropy = entropy_config(entropy::DEFAULT_THRESHOLD, entropy::DEFAULT_MIN_LENGTH);
    return data;
}

ProfileData nginx_profile() {
    ProfileData data;
    data.name = "nginx";
    data.description = "nginx access and error logs";
    data.version = "1.0";
    data.filename_patterns = {"*.access.log", "*.error.log", "*nginx*.log"};
    data.patterns.push_back(make_def("ip_address", R"(\b(?:[0-9]{1,3}\.){3}[0-9]{1,3}\b)",
                                     "[REDACTED_IP]", "client address"));
    data.patterns.push_back(make_def("email", R"("[^"\s]*@[^"\s]*")", "\"[REDACTED_EMAIL]\"",
                                     "quoted email (remote user, referer)"));
    data.patterns.push_back(make_def("password", R"(\b(password|pwd)=[^\s&]+)",
                                     R"(\1=[REDACTED])", "password in query string", true));
    data.entropy = entropy_config(4.5, 16);
    return data;
}

ProfileData docker_profile() {
    ProfileData data;
    data.name = "docker";
    data.description = "Docker container JSON logs";
    data.version = "1.0";
    data.format = FormatHint::Json;
    data.filename_patterns = {"*docker*.log", "container-*.log"};
    data.patterns.push_back(make_def("base64_token", R"(\b[A-Za-z0-9+/]{40,}={0,2})",
                                     "[REDACTED_TOKEN]", "long base64 blob"));
    data.patterns.push_back(make_def("api_key", R"(\b(api[_-]?key|token|secret)[\s=:]+[^\s,}]+)",
                                     R"(\1=[REDACTED])", "key=value credentials", true));
    data.key_paths = {
        KeyPathDef{"env.*.password", "redact", std::nullopt},
        KeyPathDef{"env.*.secret", "redact", std::nullopt},
        KeyPathDef{"config.database.password", "redact", std::nullopt},
        KeyPathDef{"labels.*.token", "redact", std::nullopt},
    };
    data.entropy = entropy_config(4.2, 12);
    return data;
}

ProfileData cloudtrail_profile() {
    ProfileData data;
    data.name = "cloudtrail";
    data.description = "AWS CloudTrail events";
    data.version = "1.0";
    data.format = FormatHint::Json;
    data.filename_patterns = {"*cloudtrail*.json", "*cloudtrail*.log"};
    data.patterns.push_back(make_def("aws_access_key", R"(\b(?:AKIA|ASIA)[0-9A-Z]{16}\b)",
                                     "[REDACTED_AWS_ACCESS_KEY]", "AWS access key id"));
    data.patterns.push_back(make_def("aws_account", R"(\b(arn:aws:[^:\s]+:[^:\s]*:)[0-9]{12}:)",
                                     "$1[REDACTED_ACCOUNT]:", "account id inside an ARN"));
    data.key_paths = {
        KeyPathDef{"userIdentity.accessKeyId", "redact", std::nullopt},
        KeyPathDef{"responseElements.*.accessKeyId", "redact", std::nullopt},
        KeyPathDef{"requestParameters.*.password", "redact", std::nullopt},
        KeyPathDef{"sourceIPAddress", "redact", std::string("[REDACTED_IP]")},
    };
    data.entropy = entropy_config(4.0, 20);
    return data;
}

ProfileData application_profile() {
    ProfileData data;
    data.name = "application";
    data.description = "Web application logs";
    data.version = "1.0";
    data.filename_patterns = {"*.application.log", "production.log", "*.rails.log"};
    data.patterns.push_back(make_def("session_id",
                                     R"(\b(session[_-]?id|sessionid)[\s=:]+[^\s,}]+)",
                                     R"(\1=[REDACTED_SESSION])", "session identifiers", true));
    data.patterns.push_back(make_def("csrf_token",
                                     R"(\b(csrf[_-]?token|authenticity_token)[\s=:]+[^\s,}]+)",
                                     R"(\1=[REDACTED_TOKEN])", "CSRF tokens", true));
    data.patterns.push_back(make_def("email", R"(\b[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}\b)",
                                     "[REDACTED_EMAIL]", "email address"));
    data.entropy = entropy_config(4.2, 12);
    return data;
}

}  // namespace

std::vector<ProfileData> builtin_profiles() {
    std::vector<ProfileData> out;
    out.push_back(default_profile());
    out.push_back(nginx_profile());
    out.push_back(docker_profile());
    out.push_back(cloudtrail_profile());
    out.push_back(application_profile());
    return out;
}

}  // namespace logveil::profile
