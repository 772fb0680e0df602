#include "host_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <vector>

namespace autobridge {

namespace {

const log4cplus::tstring kPrefix = LOG4CPLUS_TEXT("autobridge.");

std::string trim(const std::string& value) {
    auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) {
            comma = value.size();
        }
        std::string item = trim(value.substr(start, comma - start));
        if (!item.empty()) {
            items.push_back(item);
        }
        start = comma + 1;
    }
    return items;
}

std::optional<std::string> lookup(const log4cplus::helpers::Properties& properties, const char* key) {
    log4cplus::tstring name = kPrefix + LOG4CPLUS_C_STR_TO_TSTRING(key);
    if (!properties.exists(name)) {
        return std::nullopt;
    }
    return trim(LOG4CPLUS_TSTRING_TO_STRING(properties.getProperty(name)));
}

bool parse_bool(const std::string& key, const std::string& value) {
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "true" || lowered == "yes" || lowered == "1") {
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "0") {
        return false;
    }
    throw ConfigError("autobridge." + key + ": expected true or false, got '" + value + "'");
}

unsigned long parse_positive(const std::string& key, const std::string& value) {
    unsigned long count = 0;
    bool digits_only = !value.empty() && value.find_first_not_of("0123456789") == std::string::npos;
    if (digits_only) {
        try {
            count = std::stoul(value);
        } catch (const std::out_of_range&) {
            count = 0;
        }
    }
    if (count == 0) {
        throw ConfigError("autobridge." + key + ": expected a positive integer, got '" + value + "'");
    }
    return count;
}

OperationSet parse_operations(const std::string& value) {
    if (value == "remote") {
        return remote_default_allowlist();
    }
    if (value == "all") {
        return full_allowlist();
    }

    OperationSet operations;
    for (const auto& name : split_list(value)) {
        auto operation = from_wire<Operation>(name);
        if (!operation) {
            throw ConfigError("autobridge.operations: unknown operation '" + name + "'");
        }
        operations.insert(*operation);
    }
    return operations;
}

} // namespace

HostConfig parse_host_config(const log4cplus::helpers::Properties& properties) {
    HostConfig config;

    if (auto socket = lookup(properties, "socket")) {
        if (socket->empty()) {
            throw ConfigError("autobridge.socket: path is empty");
        }
        config.socket_path = *socket;
    }

    if (auto kind = lookup(properties, "host_kind")) {
        auto host_kind = from_wire<HostKind>(*kind);
        if (!host_kind) {
            throw ConfigError("autobridge.host_kind: unknown host kind '" + *kind + "'");
        }
        config.router.host_kind = *host_kind;
    }

    if (auto workers = lookup(properties, "workers")) {
        config.workers = parse_positive("workers", *workers);
    }

    if (auto timeout = lookup(properties, "request_timeout_ms")) {
        config.request_timeout = std::chrono::milliseconds(parse_positive("request_timeout_ms", *timeout));
    }

    if (auto bundles = lookup(properties, "allow.bundles")) {
        auto items = split_list(*bundles);
        config.router.allowed_bundles = std::set<std::string>(items.begin(), items.end());
    }

    if (auto teams = lookup(properties, "allow.teams")) {
        auto items = split_list(*teams);
        config.router.allowed_teams = std::set<std::string>(items.begin(), items.end());
    }

    if (auto operations = lookup(properties, "operations")) {
        config.router.allowed_operations = parse_operations(*operations);
    }

    if (auto same_user = lookup(properties, "require_same_user")) {
        config.router.require_same_user = parse_bool("require_same_user", *same_user);
    }

    return config;
}

HostConfig load_host_config(const std::string& path) {
    std::ifstream readable(path);
    if (!readable) {
        throw ConfigError("cannot read host config " + path);
    }
    log4cplus::helpers::Properties properties(LOG4CPLUS_STRING_TO_TSTRING(path));
    return parse_host_config(properties);
}

} // namespace autobridge
