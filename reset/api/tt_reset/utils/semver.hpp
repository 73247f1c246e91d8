/*
 * SPDX-FileCopyrightText: (c) 2024 Tenstorrent Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <ostream>
#include <string>
#include <tuple>

namespace tt::reset {

/**
 * Based on Semantic Versioning 2.0.0 (https://semver.org/) but more permissive.
 * TT-KMD reports version strings that are technically not semver compliant ("1.29", "1.28-bh2").
 * Anything after the first '-' or '+' is a suffix; an "rc.N" or "rcN" suffix is kept as the release candidate
 * number, everything else in the suffix is dropped.
 */
class SemVer {
public:
    uint64_t major;
    uint64_t minor;
    uint64_t patch;
    uint64_t pre_release;

    constexpr SemVer() : major(0), minor(0), patch(0), pre_release(0) {}

    constexpr SemVer(uint64_t major, uint64_t minor, uint64_t patch, uint64_t pre_release = 0) :
        major(major), minor(minor), patch(patch), pre_release(pre_release) {}

    // Throws std::invalid_argument if version_str is not a version.
    explicit SemVer(const std::string& version_str) : SemVer(parse(version_str)) {}

    /*
     * Firmware versions reported by the KMD have up to four components, "major.minor.patch.build".
     * The fourth component is kept as pre_release, the same way the firmware bundle tag packs it.
     */
    static SemVer from_firmware_string(const std::string& version_str);

    // Strict parser for driver version strings. Accepts one to three numeric components plus an optional suffix.
    static SemVer parse(const std::string& version_str);

    std::string to_string() const {
        return pre_release ? fmt::format("{}.{}.{}-rc.{}", major, minor, patch, pre_release)
                           : fmt::format("{}.{}.{}", major, minor, patch);
    }

    // Comparison ignoring release candidate numbers.
    bool is_at_least(const SemVer& other) const {
        return std::tie(major, minor, patch) >= std::tie(other.major, other.minor, other.patch);
    }

    bool operator<(const SemVer& other) const noexcept {
        // A release is newer than any of its release candidates.
        uint64_t pr1 = (pre_release == 0) ? UINT64_MAX : pre_release;
        uint64_t pr2 = (other.pre_release == 0) ? UINT64_MAX : other.pre_release;
        return std::tie(major, minor, patch, pr1) < std::tie(other.major, other.minor, other.patch, pr2);
    }

    bool operator>(const SemVer& other) const { return other < *this; }

    bool operator==(const SemVer& other) const {
        return std::tie(major, minor, patch, pre_release) ==
               std::tie(other.major, other.minor, other.patch, other.pre_release);
    }

    bool operator!=(const SemVer& other) const { return !(*this == other); }

    bool operator<=(const SemVer& other) const { return !(other < *this); }

    bool operator>=(const SemVer& other) const { return !(*this < other); }

private:
    static SemVer parse_components(const std::string& version_str, size_t max_components);
};

inline std::ostream& operator<<(std::ostream& out, const SemVer& version) { return out << version.to_string(); }

}  // namespace tt::reset

namespace fmt {
template <>
struct formatter<tt::reset::SemVer> : formatter<std::string> {
    template <typename Context>
    auto format(tt::reset::SemVer const& version, Context& ctx) const {
        return formatter<std::string>::format(version.to_string(), ctx);
    }
};
}  // namespace fmt
