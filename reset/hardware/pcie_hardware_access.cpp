/*
 * SPDX-FileCopyrightText: (c) 2025 Tenstorrent Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tt_reset/hardware/pcie_hardware_access.hpp"

#include <fcntl.h>
#include <glob.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include "ioctl.h"
#include "logger.hpp"
#include "tt_reset/config/reset_config.hpp"
#include "tt_reset/hardware/mobo_client.hpp"
#include "tt_reset/utils/exceptions.hpp"
#include "tt_reset/utils/kmd_versions.hpp"
#include "tt_reset/utils/timeouts.hpp"
#include "utils.hpp"

namespace tt::reset {

namespace {

constexpr uint16_t TT_PCI_VENDOR_ID = 0x1e52;
constexpr uint32_t HANG_READ_VALUE = 0xFFFFFFFF;

// Flags of TENSTORRENT_IOCTL_RESET_DEVICE.
enum class ResetFlag : uint32_t {
    RESTORE_STATE = 0,
    RESET_PCIE_LINK = 1,
    CONFIG_WRITE = 2,
    USER_RESET = 3,
    ASIC_RESET = 4,
    ASIC_DMC_RESET = 5,
    POST_RESET = 6,
};

namespace wormhole {
// BAR0 window mapped by the driver: 3 MB starting 509 MB into BAR0, covering the ARC APB peripherals.
constexpr size_t BAR0_SIZE = 3 * (1 << 20);
constexpr size_t BAR0_MAPPING_OFFSET = 509 * (1 << 20);

constexpr uint32_t ARC_APB_BAR0_XBAR_OFFSET_START = 0x1FF00000;
constexpr uint32_t ARC_RESET_UNIT_OFFSET = 0x30000;
constexpr uint32_t ARC_RESET_SCRATCH_OFFSET = ARC_RESET_UNIT_OFFSET + 0x60;
constexpr uint32_t ARC_RESET_SCRATCH_RES0_OFFSET = ARC_RESET_SCRATCH_OFFSET + 0xC;
constexpr uint32_t ARC_RESET_SCRATCH_STATUS_OFFSET = ARC_RESET_SCRATCH_OFFSET + 0x14;
constexpr uint32_t ARC_RESET_SCRATCH_6_OFFSET = ARC_RESET_SCRATCH_OFFSET + 0x18;
constexpr uint32_t ARC_RESET_REFCLK_LOW_OFFSET = ARC_RESET_UNIT_OFFSET + 0xE0;
constexpr uint32_t ARC_RESET_REFCLK_HIGH_OFFSET = ARC_RESET_UNIT_OFFSET + 0xE4;
constexpr uint32_t ARC_RESET_ARC_MISC_CNTL_OFFSET = ARC_RESET_UNIT_OFFSET + 0x0100;

constexpr uint32_t ARC_MSG_COMMON_PREFIX = 0xAA00;
constexpr uint32_t MSG_TYPE_ARC_STATE3 = 0xA3 | ARC_MSG_COMMON_PREFIX;
constexpr uint32_t MSG_TYPE_TRIGGER_RESET = 0x56 | ARC_MSG_COMMON_PREFIX;
constexpr uint16_t DEFAULT_ARG_VALUE = 0xFFFF;
constexpr uint16_t M3_RESET_ARG = 3;
}  // namespace wormhole

std::string device_path(int interface_id) { return fmt::format("/dev/tenstorrent/{}", interface_id); }

std::filesystem::path class_device_dir(int interface_id) {
    return fmt::format("/sys/class/tenstorrent/tenstorrent!{}", interface_id);
}

std::optional<std::string> read_sysfs_line(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::string line;
    if (!file.is_open() || !std::getline(file, line)) {
        return std::nullopt;
    }
    line.erase(line.find_last_not_of(" \n\r\t") + 1);
    return line;
}

std::optional<uint16_t> read_sysfs_hex(const std::filesystem::path& path) {
    auto line = read_sysfs_line(path);
    if (!line.has_value()) {
        return std::nullopt;
    }
    std::istringstream iss(*line);
    uint32_t value = 0;
    if (!(iss >> std::hex >> value)) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

std::optional<uint8_t> read_config_byte(const std::string& bdf, size_t offset) {
    std::ifstream config_file(fmt::format("/sys/bus/pci/devices/{}/config", bdf), std::ios::binary);
    if (!config_file.is_open()) {
        return std::nullopt;
    }
    config_file.seekg(offset);
    uint8_t byte = 0;
    if (!config_file.read(reinterpret_cast<char*>(&byte), 1)) {
        return std::nullopt;
    }
    return byte;
}

class DeviceFile {
public:
    explicit DeviceFile(int interface_id) :
        interface_id_(interface_id), fd_(open(device_path(interface_id).c_str(), O_RDWR | O_CLOEXEC)) {
        if (fd_ == -1) {
            throw HardwareAccessError(
                fmt::format("Failed to open {}: {}", device_path(interface_id), strerror(errno)));
        }
    }

    ~DeviceFile() { close(fd_); }

    DeviceFile(const DeviceFile&) = delete;
    DeviceFile& operator=(const DeviceFile&) = delete;

    int fd() const { return fd_; }

    int interface_id() const { return interface_id_; }

private:
    int interface_id_;
    int fd_;
};

void reset_ioctl(int interface_id, ResetFlag flag) {
    DeviceFile file(interface_id);

    tenstorrent_reset_device reset_info{};
    reset_info.in.output_size_bytes = sizeof(reset_info.out);
    reset_info.in.flags = static_cast<uint32_t>(flag);
    if (ioctl(file.fd(), TENSTORRENT_IOCTL_RESET_DEVICE, &reset_info) == -1) {
        throw HardwareAccessError(fmt::format(
            "TENSTORRENT_IOCTL_RESET_DEVICE with flags {} failed on {}: {}",
            static_cast<uint32_t>(flag),
            device_path(interface_id),
            strerror(errno)));
    }
}

/**
 * Uncached mapping of the Wormhole BAR0 window holding the ARC reset unit.
 */
class Bar0Mapping {
public:
    explicit Bar0Mapping(const DeviceFile& file) {
        struct {
            tenstorrent_query_mappings query_mappings;
            tenstorrent_mapping mapping_array[8];
        } mappings;

        memset(&mappings, 0, sizeof(mappings));
        mappings.query_mappings.in.output_mapping_count = 8;

        if (ioctl(file.fd(), TENSTORRENT_IOCTL_QUERY_MAPPINGS, &mappings.query_mappings) == -1) {
            throw HardwareAccessError(fmt::format("Query mappings failed on {}", device_path(file.interface_id())));
        }

        tenstorrent_mapping bar0_uc_mapping{};
        for (const auto& mapping : mappings.mapping_array) {
            if (mapping.mapping_id == TENSTORRENT_MAPPING_RESOURCE0_UC) {
                bar0_uc_mapping = mapping;
            }
        }
        if (bar0_uc_mapping.mapping_id != TENSTORRENT_MAPPING_RESOURCE0_UC) {
            throw HardwareAccessError(fmt::format("{} has no BAR0 UC mapping", device_path(file.interface_id())));
        }

        void* bar0 = mmap(
            nullptr,
            wormhole::BAR0_SIZE,
            PROT_READ | PROT_WRITE,
            MAP_SHARED,
            file.fd(),
            bar0_uc_mapping.mapping_base + wormhole::BAR0_MAPPING_OFFSET);
        if (bar0 == MAP_FAILED) {
            throw HardwareAccessError(fmt::format("BAR0 mapping failed for {}", device_path(file.interface_id())));
        }
        base_ = static_cast<uint8_t*>(bar0);
    }

    ~Bar0Mapping() { munmap(base_, wormhole::BAR0_SIZE); }

    Bar0Mapping(const Bar0Mapping&) = delete;
    Bar0Mapping& operator=(const Bar0Mapping&) = delete;

    uint32_t read_arc_apb(uint32_t offset) const { return *register_address(offset); }

    void write_arc_apb(uint32_t offset, uint32_t value) const { *register_address(offset) = value; }

    bool is_hung() const { return read_arc_apb(wormhole::ARC_RESET_SCRATCH_6_OFFSET) == HANG_READ_VALUE; }

private:
    volatile uint32_t* register_address(uint32_t offset) const {
        return reinterpret_cast<volatile uint32_t*>(
            base_ + (wormhole::ARC_APB_BAR0_XBAR_OFFSET_START + offset - wormhole::BAR0_MAPPING_OFFSET));
    }

    uint8_t* base_ = nullptr;
};

bool wait_arc_core_start(const Bar0Mapping& bar0, std::chrono::milliseconds timeout) {
    constexpr uint32_t STATUS_NO_ACCESS = 0xFFFFFFFF;
    constexpr uint32_t STATUS_WATCHDOG_TRIGGERED = 0xDEADC0DE;
    constexpr uint32_t STATUS_INIT_DONE_1 = 0x00000001;
    constexpr uint32_t STATUS_INIT_DONE_2 = 0xFFFFDEAD;
    constexpr uint32_t STATUS_OLD_POST_CODE = 0;
    constexpr uint32_t STATUS_MESSAGE_QUEUED_MASK = 0xFFFFFF00;
    constexpr uint32_t STATUS_MESSAGE_QUEUED_VAL = 0x0000AA00;
    constexpr uint32_t STATUS_HANDLING_MESSAGE_MASK = 0xFF00FFFF;
    constexpr uint32_t STATUS_HANDLING_MESSAGE_VAL = 0xAA000000;
    constexpr uint32_t STATUS_MESSAGE_COMPLETE_MASK = 0x0000FFFF;
    constexpr uint32_t STATUS_MESSAGE_COMPLETE_MIN = 0x00000001;

    constexpr uint32_t POST_CODE_INIT_DONE = 0xC0DE0001;
    constexpr uint32_t POST_CODE_ARC_MSG_HANDLE_DONE = 0xC0DE003F;
    constexpr uint32_t POST_CODE_ARC_TIME_LAST = 0xC0DE007F;

    bool started = false;
    bool failed = false;
    utils::wait_until(
        [&]() {
            const uint32_t status = bar0.read_arc_apb(wormhole::ARC_RESET_SCRATCH_STATUS_OFFSET);
            const uint32_t post_code = bar0.read_arc_apb(wormhole::ARC_RESET_SCRATCH_OFFSET);

            switch (status) {
                case STATUS_NO_ACCESS:
                    TT_RESET_DEBUG("ARC status: no access");
                    failed = true;
                    return true;
                case STATUS_WATCHDOG_TRIGGERED:
                    TT_RESET_DEBUG("ARC status: watchdog triggered");
                    failed = true;
                    return true;
                case STATUS_INIT_DONE_1:
                case STATUS_INIT_DONE_2:
                    started = true;
                    return true;
                case STATUS_OLD_POST_CODE:
                    started = post_code == POST_CODE_INIT_DONE ||
                              (post_code >= POST_CODE_ARC_MSG_HANDLE_DONE && post_code <= POST_CODE_ARC_TIME_LAST);
                    return started;
            }

            if ((status & STATUS_MESSAGE_QUEUED_MASK) == STATUS_MESSAGE_QUEUED_VAL ||
                (status & STATUS_HANDLING_MESSAGE_MASK) == STATUS_HANDLING_MESSAGE_VAL) {
                return false;
            }
            started = (status & STATUS_MESSAGE_COMPLETE_MASK) > STATUS_MESSAGE_COMPLETE_MIN;
            return started;
        },
        timeout,
        std::chrono::milliseconds(1));
    return started && !failed;
}

uint32_t send_arc_message(
    const Bar0Mapping& bar0,
    const DeviceId& device_id,
    uint32_t msg_code,
    uint16_t arg0,
    uint16_t arg1,
    std::chrono::milliseconds timeout = timeout::ARC_MESSAGE_TIMEOUT) {
    const uint32_t fw_arg = static_cast<uint32_t>(arg0) | (static_cast<uint32_t>(arg1) << 16);
    bar0.write_arc_apb(wormhole::ARC_RESET_SCRATCH_RES0_OFFSET, fw_arg);
    bar0.write_arc_apb(wormhole::ARC_RESET_SCRATCH_STATUS_OFFSET, msg_code);

    const uint32_t misc = bar0.read_arc_apb(wormhole::ARC_RESET_ARC_MISC_CNTL_OFFSET);
    if (misc & (1 << 16)) {
        throw HardwareAccessError(fmt::format("Triggering the ARC firmware interrupt failed on {}", device_id));
    }
    bar0.write_arc_apb(wormhole::ARC_RESET_ARC_MISC_CNTL_OFFSET, misc | (1 << 16));

    uint32_t status = 0;
    const bool answered = utils::wait_until(
        [&]() {
            status = bar0.read_arc_apb(wormhole::ARC_RESET_SCRATCH_STATUS_OFFSET);
            return (status & 0xffff) == (msg_code & 0xff) || status == HANG_READ_VALUE;
        },
        timeout,
        std::chrono::milliseconds(1));

    if (!answered) {
        throw ResetTimeoutError(fmt::format(
            "Timed out after waiting {} ms for ARC of {} to respond to message {:#x}",
            timeout.count(),
            device_id,
            msg_code));
    }
    if (status == HANG_READ_VALUE) {
        TT_RESET_WARN("On device {}, message code {:#x} not recognized by FW", device_id, msg_code);
        return HANG_READ_VALUE;
    }
    return (status & 0xffff0000) >> 16;
}

uint64_t read_refclk(const Bar0Mapping& bar0) {
    const uint32_t high1 = bar0.read_arc_apb(wormhole::ARC_RESET_REFCLK_HIGH_OFFSET);
    uint32_t low = bar0.read_arc_apb(wormhole::ARC_RESET_REFCLK_LOW_OFFSET);
    const uint32_t high2 = bar0.read_arc_apb(wormhole::ARC_RESET_REFCLK_HIGH_OFFSET);
    // Low word wrapped between the two reads of the high word.
    if (high2 > high1) {
        low = bar0.read_arc_apb(wormhole::ARC_RESET_REFCLK_LOW_OFFSET);
    }
    return (static_cast<uint64_t>(high2) << 32) | low;
}

std::optional<int> wait_for_bdf_to_reappear(const std::string& bdf, std::chrono::milliseconds timeout) {
    TT_RESET_DEBUG("Waiting for {} to reappear on the PCI bus", bdf);

    std::optional<int> interface_id;
    utils::wait_until(
        [&]() {
            glob_t glob_result;
            const std::string pattern = fmt::format("/sys/bus/pci/devices/{}/tenstorrent/tenstorrent!*", bdf);
            if (glob(pattern.c_str(), GLOB_NOSORT, nullptr, &glob_result) == 0 && glob_result.gl_pathc > 0) {
                const std::string filename = std::filesystem::path(glob_result.gl_pathv[0]).filename().string();
                const std::string prefix = "tenstorrent!";
                if (filename.rfind(prefix, 0) == 0) {
                    const int id = std::atoi(filename.substr(prefix.length()).c_str());
                    if (std::filesystem::exists(device_path(id))) {
                        interface_id = id;
                    }
                }
            }
            globfree(&glob_result);
            return interface_id.has_value();
        },
        timeout,
        timeout::DEVICE_REAPPEAR_POLL_INTERVAL);
    return interface_id;
}

/**
 * Keeps the device file open, and the ARC window mapped on Wormhole, for as long as the chip is in use.
 */
class PcieChipHandle : public ChipHandle {
public:
    PcieChipHandle(
        DeviceId device_id,
        ChipFamily family,
        std::shared_ptr<const ChipGenerationTracker> tracker,
        std::unique_ptr<DeviceFile> file,
        std::unique_ptr<Bar0Mapping> bar0) :
        ChipHandle(std::move(device_id), family, std::move(tracker)), bar0_(std::move(bar0)), file_(std::move(file)) {}

private:
    // Unmapped before the file is closed.
    std::unique_ptr<Bar0Mapping> bar0_;
    std::unique_ptr<DeviceFile> file_;
};

}  // namespace

std::optional<DeviceInfo> PcieHardwareAccess::read_device_info(int interface_id) {
    std::error_code ec;
    const auto pci_path = std::filesystem::canonical(class_device_dir(interface_id) / "device", ec);
    if (ec) {
        TT_RESET_DEBUG("No sysfs entry for {}: {}", device_path(interface_id), ec.message());
        return std::nullopt;
    }

    const std::string bdf = pci_path.filename().string();
    if (!DeviceId::is_valid_bdf(bdf)) {
        TT_RESET_DEBUG("{} is not a PCI device ({})", device_path(interface_id), bdf);
        return std::nullopt;
    }

    const auto vendor_id = read_sysfs_hex(pci_path / "vendor");
    const auto pci_device_id = read_sysfs_hex(pci_path / "device");
    if (!vendor_id.has_value() || *vendor_id != TT_PCI_VENDOR_ID || !pci_device_id.has_value()) {
        return std::nullopt;
    }

    const auto family = chip_family_from_pci_device_id(*pci_device_id);
    if (!family.has_value()) {
        TT_RESET_WARN("Unknown Tenstorrent PCI device id {:#x} at {}", *pci_device_id, bdf);
        return std::nullopt;
    }
    return DeviceInfo{DeviceId(bdf), *family, interface_id};
}

std::vector<DeviceInfo> PcieHardwareAccess::enumerate() {
    std::vector<DeviceInfo> devices;
    devices_.clear();

    const std::filesystem::path dev_dir = "/dev/tenstorrent";
    std::error_code ec;
    if (!std::filesystem::exists(dev_dir, ec)) {
        return devices;
    }

    const std::set<int> visible_devices = utils::get_visible_devices();
    for (const auto& entry : std::filesystem::directory_iterator(dev_dir, ec)) {
        const std::string filename = entry.path().filename().string();
        if (filename.empty() || !std::all_of(filename.begin(), filename.end(), ::isdigit)) {
            continue;
        }
        const int interface_id = std::stoi(filename);
        if (!visible_devices.empty() && visible_devices.count(interface_id) == 0) {
            continue;
        }
        if (auto info = read_device_info(interface_id); info.has_value()) {
            devices.push_back(*info);
        }
    }

    std::sort(devices.begin(), devices.end(), [](const DeviceInfo& a, const DeviceInfo& b) {
        return a.device_id < b.device_id;
    });
    for (const auto& device : devices) {
        devices_.emplace(device.device_id, device);
    }
    return devices;
}

DeviceInfo PcieHardwareAccess::lookup(const DeviceId& device_id) {
    auto it = devices_.find(device_id);
    if (it == devices_.end()) {
        enumerate();
        it = devices_.find(device_id);
    }
    if (it == devices_.end()) {
        throw HardwareAccessError(fmt::format("Device {} is not present", device_id));
    }
    return it->second;
}

std::optional<std::string> PcieHardwareAccess::read_driver_version() {
    return read_sysfs_line("/sys/module/tenstorrent/version");
}

bool PcieHardwareAccess::is_arch_agnostic_reset_supported() {
    const auto version = read_driver_version();
    if (!version.has_value()) {
        return false;
    }
    try {
        return SemVer::parse(*version).is_at_least(KMD_ARCH_AGNOSTIC_RESET);
    } catch (const std::invalid_argument& e) {
        TT_RESET_DEBUG("Unparsable driver version {}: {}", *version, e.what());
        return false;
    }
}

std::unique_ptr<ChipHandle> PcieHardwareAccess::init(const DeviceId& device_id) {
    std::optional<DeviceInfo> found;
    std::unique_ptr<DeviceFile> file;
    try {
        found = lookup(device_id);
        file = std::make_unique<DeviceFile>(found->interface_id);
    } catch (const HardwareAccessError& e) {
        throw ChipInitError(device_id, ChipInitResult::DEVICE_UNAVAILABLE, e.what());
    }
    const DeviceInfo& device = *found;

    std::unique_ptr<Bar0Mapping> bar0;
    if (device.family == ChipFamily::WORMHOLE_B0) {
        try {
            bar0 = std::make_unique<Bar0Mapping>(*file);
        } catch (const HardwareAccessError& e) {
            throw ChipInitError(device_id, ChipInitResult::ARC_MESSENGER_UNAVAILABLE, e.what());
        }
        if (bar0->is_hung()) {
            throw ChipInitError(
                device_id, ChipInitResult::HANG_READ, "Read 0xffffffff from PCIe: you should reset the board.");
        }
        if (!wait_arc_core_start(*bar0, timeout::ARC_STARTUP_TIMEOUT)) {
            throw ChipInitError(device_id, ChipInitResult::ARC_STARTUP_FAILED, "ARC core did not start");
        }
    }

    TT_RESET_DEBUG("Initialized {} ({}) at {}", device_id, device.family, device_path(device.interface_id));
    return std::make_unique<PcieChipHandle>(device_id, device.family, generations(), std::move(file), std::move(bar0));
}

void PcieHardwareAccess::do_reset(const DeviceId& device_id, ResetMode mode) {
    const DeviceInfo device = lookup(device_id);
    TT_RESET_DEBUG(
        "Issuing {} reset on {} ({})", reset_mode_to_str(mode), device_id, device_path(device.interface_id));

    switch (mode) {
        case ResetMode::TENSIX:
            throw HardwareAccessError(fmt::format(
                "Tensix reset of {} ({}) is not supported by the kernel driver", device_id, device.family));
        case ResetMode::LINK:
            reset_ioctl(device.interface_id, ResetFlag::RESET_PCIE_LINK);
            pending_finish_.insert(device_id);
            return;
        case ResetMode::ASIC:
        case ResetMode::ASIC_M3:
            break;
    }

    if (is_arch_agnostic_reset_supported()) {
        reset_ioctl(
            device.interface_id, mode == ResetMode::ASIC_M3 ? ResetFlag::ASIC_DMC_RESET : ResetFlag::ASIC_RESET);
        pending_finish_.insert(device_id);
        return;
    }

    switch (device.family) {
        case ChipFamily::WORMHOLE_B0:
            reset_wormhole_legacy(device, mode);
            break;
        case ChipFamily::BLACKHOLE:
            if (mode == ResetMode::ASIC_M3) {
                TT_RESET_WARN(
                    "M3 reset needs driver {} or newer, doing an ASIC reset of {}",
                    KMD_ARCH_AGNOSTIC_RESET,
                    device_id);
            }
            reset_blackhole_legacy(device);
            break;
        case ChipFamily::GRAYSKULL:
            throw HardwareAccessError(
                fmt::format("ASIC reset is not supported on {} ({})", device_id, device.family));
    }
    pending_finish_.insert(device_id);
}

void PcieHardwareAccess::reset_wormhole_legacy(const DeviceInfo& device, ResetMode mode) {
    DeviceFile file(device.interface_id);
    Bar0Mapping bar0(file);

    if (!wait_arc_core_start(bar0, timeout::ARC_STARTUP_TIMEOUT)) {
        throw HardwareAccessError(fmt::format("Reset failed for {}: ARC core init failed", device.device_id));
    }

    send_arc_message(
        bar0,
        device.device_id,
        wormhole::MSG_TYPE_ARC_STATE3,
        wormhole::DEFAULT_ARG_VALUE,
        wormhole::DEFAULT_ARG_VALUE);
    std::this_thread::sleep_for(timeout::ARC_STATE3_PROPAGATION_WAIT);
    send_arc_message(
        bar0,
        device.device_id,
        wormhole::MSG_TYPE_TRIGGER_RESET,
        mode == ResetMode::ASIC_M3 ? wormhole::M3_RESET_ARG : wormhole::DEFAULT_ARG_VALUE,
        wormhole::DEFAULT_ARG_VALUE);
}

void PcieHardwareAccess::reset_blackhole_legacy(const DeviceInfo& device) {
    reset_ioctl(device.interface_id, ResetFlag::CONFIG_WRITE);

    // The chip sets bit 1 of the PCI command register once the config space reset went through.
    const bool reset_bit_set = utils::wait_until(
        [&]() {
            auto command_byte = read_config_byte(device.device_id.str(), 4);
            return command_byte.has_value() && ((*command_byte >> 1) & 1);
        },
        timeout::BH_CONFIG_RESET_TIMEOUT,
        std::chrono::milliseconds(10));

    if (!reset_bit_set) {
        throw ResetTimeoutError(fmt::format(
            "Config space reset not completed for {} after {} ms",
            device.device_id,
            timeout::BH_CONFIG_RESET_TIMEOUT.count()));
    }
}

void PcieHardwareAccess::finish_reset(const DeviceId& device_id) {
    if (pending_finish_.count(device_id) == 0) {
        TT_RESET_DEBUG("No reset of {} to complete", device_id);
        return;
    }
    DeviceInfo& device = devices_.at(device_id);

    if (is_arch_agnostic_reset_supported()) {
        auto interface_id = wait_for_bdf_to_reappear(device_id.str(), timeout::DEVICE_REAPPEAR_TIMEOUT);
        if (!interface_id.has_value()) {
            throw ResetTimeoutError(fmt::format("Timeout waiting for {} to reappear on the PCI bus", device_id));
        }
        device.interface_id = *interface_id;
        reset_ioctl(device.interface_id, ResetFlag::POST_RESET);
    } else {
        reset_ioctl(device.interface_id, ResetFlag::RESTORE_STATE);
    }
    pending_finish_.erase(device_id);
}

RawTelemetry PcieHardwareAccess::read_telemetry(const DeviceId& device_id) {
    const DeviceInfo device = lookup(device_id);
    const auto sysfs_dir = class_device_dir(device.interface_id);

    RawTelemetry telemetry;
    telemetry.arc_fw_version = read_sysfs_line(sysfs_dir / "tt_arc_fw_ver").value_or("");
    telemetry.eth_fw_version = read_sysfs_line(sysfs_dir / "tt_eth_fw_ver").value_or("");

    if (device.family == ChipFamily::WORMHOLE_B0) {
        DeviceFile file(device.interface_id);
        Bar0Mapping bar0(file);
        telemetry.refclk = read_refclk(bar0);
    }
    return telemetry;
}

void PcieHardwareAccess::powercycle_modules(const GalaxyBoard& board) { MoboClient(board.mobo).powercycle(board); }

}  // namespace tt::reset
