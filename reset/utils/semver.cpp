/*
 * SPDX-FileCopyrightText: (c) 2024 Tenstorrent Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tt_reset/utils/semver.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>
#include <vector>

namespace tt::reset {

static std::string trim(const std::string& str) {
    auto begin = std::find_if_not(str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

static bool is_number(const std::string& str) {
    return !str.empty() && std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isdigit(c); });
}

// "rc.3", "rc3" and "rc.3.whatever" carry a release candidate number; nothing else does.
static uint64_t parse_release_candidate(const std::string& suffix) {
    static const std::regex rc_pattern(R"(rc\.?(\d+)(\..*)?)");
    std::smatch match;
    if (std::regex_match(suffix, match, rc_pattern)) {
        return std::stoull(match[1].str());
    }
    return 0;
}

SemVer SemVer::parse_components(const std::string& version_str, size_t max_components) {
    std::string version = trim(version_str);
    if (version.empty()) {
        throw std::invalid_argument("Version string cannot be empty");
    }

    std::string core = version;
    std::string pre_release_suffix;

    size_t build_pos = core.find('+');
    if (build_pos != std::string::npos) {
        core = core.substr(0, build_pos);
    }
    size_t suffix_pos = core.find('-');
    if (suffix_pos != std::string::npos) {
        pre_release_suffix = core.substr(suffix_pos + 1);
        core = core.substr(0, suffix_pos);
    }
    if (core.empty()) {
        throw std::invalid_argument(fmt::format("Invalid version format: '{}'", version_str));
    }

    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t dot = core.find('.', start);
        parts.push_back(core.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }

    if (parts.size() > max_components ||
        std::any_of(parts.begin(), parts.end(), [](const std::string& p) { return p.empty(); })) {
        throw std::invalid_argument(fmt::format("Invalid version format: '{}'", version_str));
    }

    std::vector<uint64_t> numbers;
    for (const auto& part : parts) {
        if (!is_number(part)) {
            throw std::invalid_argument(fmt::format("Version parts must be integers: '{}'", version_str));
        }
        try {
            numbers.push_back(std::stoull(part));
        } catch (const std::out_of_range&) {
            throw std::invalid_argument(fmt::format("Version part out of range: '{}'", version_str));
        }
    }
    numbers.resize(4, 0);

    uint64_t pre_release = numbers[3];
    if (!pre_release_suffix.empty()) {
        pre_release = parse_release_candidate(pre_release_suffix);
    }
    return SemVer(numbers[0], numbers[1], numbers[2], pre_release);
}

SemVer SemVer::parse(const std::string& version_str) { return parse_components(version_str, 3); }

SemVer SemVer::from_firmware_string(const std::string& version_str) { return parse_components(version_str, 4); }

}  // namespace tt::reset
