// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <fmt/core.h>
#include <fmt/format.h>

#include <functional>
#include <ostream>
#include <string>

namespace tt::reset {

/**
 * Stable identifier of a physical chip slot: the PCI address of the chip in domain:bus:device.function form,
 * e.g. "0000:04:00.0". Unlike /dev/tenstorrent/<n> interface ids it survives re-enumeration after a reset.
 */
class DeviceId {
public:
    // Throws std::invalid_argument if pci_bdf is not a well formed PCI address.
    explicit DeviceId(std::string pci_bdf);

    static bool is_valid_bdf(const std::string& pci_bdf);

    const std::string& str() const { return pci_bdf_; }

    bool operator==(const DeviceId& other) const { return pci_bdf_ == other.pci_bdf_; }

    bool operator!=(const DeviceId& other) const { return pci_bdf_ != other.pci_bdf_; }

    bool operator<(const DeviceId& other) const { return pci_bdf_ < other.pci_bdf_; }

private:
    std::string pci_bdf_;
};

inline std::ostream& operator<<(std::ostream& out, const DeviceId& device_id) { return out << device_id.str(); }

}  // namespace tt::reset

template <>
struct std::hash<tt::reset::DeviceId> {
    std::size_t operator()(const tt::reset::DeviceId& device_id) const noexcept {
        return std::hash<std::string>{}(device_id.str());
    }
};

namespace fmt {
template <>
struct formatter<tt::reset::DeviceId> : formatter<std::string> {
    template <typename Context>
    auto format(tt::reset::DeviceId const& device_id, Context& ctx) const {
        return formatter<std::string>::format(device_id.str(), ctx);
    }
};
}  // namespace fmt
