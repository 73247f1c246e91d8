// SPDX-FileCopyrightText: © 2025 Tenstorrent Inc.
//
// SPDX-License-Identifier: Apache-2.0

#include "tt_reset/config/reset_config_store.hpp"

#include <fmt/format.h>

#include <unistd.h>

#include <algorithm>
#include <array>
#include <boost/interprocess/exceptions.hpp>
#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>

#include "logger.hpp"
#include "tt_reset/utils/exceptions.hpp"
#include "utils.hpp"

using json = nlohmann::json;

namespace tt::reset {

namespace {

// Tenstorrent PCI vendor id, names the tool state directory.
constexpr const char* VENDOR_DIR = "1e52";
constexpr const char* CONFIG_FILE_NAME = "reset_config.json";

// Top level keys of the positional layout older tools wrote.
constexpr std::array<const char*, 7> LEGACY_KEYS = {
    "gs_tensix_reset",
    "wh_link_reset",
    "wh_mobo_reset",
    "re_init_devices",
    "disable_serial_report",
    "disable_sw_version_report",
    "time",
};

[[noreturn]] void malformed(const std::string& message) { throw MalformedConfigError(message); }

std::string type_name(const json& value) { return std::string(value.type_name()); }

void check_keys(const json& object, const std::set<std::string>& allowed, const std::string& where) {
    for (const auto& [key, _] : object.items()) {
        if (allowed.find(key) == allowed.end()) {
            malformed(fmt::format("Unknown key '{}' in {}", key, where));
        }
    }
}

const json& require(const json& object, const std::string& key, const std::string& where) {
    auto it = object.find(key);
    if (it == object.end()) {
        malformed(fmt::format("Missing key '{}' in {}", key, where));
    }
    return *it;
}

std::string as_string(const json& value, const std::string& where) {
    if (!value.is_string()) {
        malformed(fmt::format("{} must be a string, got {}", where, type_name(value)));
    }
    return value.get<std::string>();
}

bool as_bool(const json& value, const std::string& where) {
    if (!value.is_boolean()) {
        malformed(fmt::format("{} must be a boolean, got {}", where, type_name(value)));
    }
    return value.get<bool>();
}

DeviceId as_device_id(const std::string& bdf, const std::string& where) {
    if (!DeviceId::is_valid_bdf(bdf)) {
        malformed(fmt::format("{}: '{}' is not a PCI address", where, bdf));
    }
    return DeviceId(bdf);
}

std::vector<std::string> as_string_list(const json& value, const std::string& where) {
    if (!value.is_array()) {
        malformed(fmt::format("{} must be an array, got {}", where, type_name(value)));
    }
    std::vector<std::string> list;
    for (const auto& element : value) {
        list.push_back(as_string(element, where + " element"));
    }
    return list;
}

FeatureFlags parse_features(const json& value, const std::string& where) {
    if (!value.is_object()) {
        malformed(fmt::format("{} must be an object, got {}", where, type_name(value)));
    }
    check_keys(value, {"report_sw_version", "report_serial"}, where);
    FeatureFlags features;
    if (value.contains("report_sw_version")) {
        features.report_sw_version = as_bool(value.at("report_sw_version"), where + ".report_sw_version");
    }
    if (value.contains("report_serial")) {
        features.report_serial = as_bool(value.at("report_serial"), where + ".report_serial");
    }
    return features;
}

DeviceConfig parse_device(const json& value, const std::string& where) {
    if (!value.is_object()) {
        malformed(fmt::format("{} must be an object, got {}", where, type_name(value)));
    }
    check_keys(value, {"chip_family", "role", "last_successful_reset", "features"}, where);

    DeviceConfig device;

    std::string family_str = as_string(require(value, "chip_family", where), where + ".chip_family");
    auto family = chip_family_from_str(family_str);
    if (!family.has_value()) {
        malformed(fmt::format("{}.chip_family: unknown chip family '{}'", where, family_str));
    }
    device.family = *family;

    std::string role_str = as_string(require(value, "role", where), where + ".role");
    auto role = board_role_from_str(role_str);
    if (!role.has_value()) {
        malformed(fmt::format("{}.role: unknown board role '{}'", where, role_str));
    }
    device.role = *role;

    if (value.contains("last_successful_reset") && !value.at("last_successful_reset").is_null()) {
        device.last_successful_reset =
            as_string(value.at("last_successful_reset"), where + ".last_successful_reset");
    }

    if (value.contains("features")) {
        device.features = parse_features(value.at("features"), where + ".features");
    }
    return device;
}

GalaxyBoard parse_galaxy_board(const json& value, const std::string& where) {
    if (!value.is_object()) {
        malformed(fmt::format("{} must be an object, got {}", where, type_name(value)));
    }
    check_keys(value, {"mobo", "nb_host_devices", "credo", "disabled_ports"}, where);

    GalaxyBoard board;
    board.mobo = as_string(require(value, "mobo", where), where + ".mobo");
    if (board.mobo.empty()) {
        malformed(fmt::format("{}.mobo must not be empty", where));
    }
    if (value.contains("nb_host_devices")) {
        for (const auto& bdf : as_string_list(value.at("nb_host_devices"), where + ".nb_host_devices")) {
            board.nb_host_devices.push_back(as_device_id(bdf, where + ".nb_host_devices"));
        }
    }
    if (value.contains("credo")) {
        board.credo_ports = as_string_list(value.at("credo"), where + ".credo");
    }
    if (value.contains("disabled_ports")) {
        board.disabled_ports = as_string_list(value.at("disabled_ports"), where + ".disabled_ports");
    }
    return board;
}

json to_json(const DeviceConfig& device) {
    return json{
        {"chip_family", chip_family_to_str(device.family)},
        {"role", board_role_to_str(device.role)},
        {"last_successful_reset",
         device.last_successful_reset.has_value() ? json(*device.last_successful_reset) : json(nullptr)},
        {"features",
         {{"report_sw_version", device.features.report_sw_version},
          {"report_serial", device.features.report_serial}}},
    };
}

json to_json(const GalaxyBoard& board) {
    json nb_hosts = json::array();
    for (const auto& device_id : board.nb_host_devices) {
        nb_hosts.push_back(device_id.str());
    }
    return json{
        {"mobo", board.mobo},
        {"nb_host_devices", nb_hosts},
        {"credo", board.credo_ports},
        {"disabled_ports", board.disabled_ports},
    };
}

}  // namespace

std::string board_role_to_str(BoardRole role) {
    switch (role) {
        case BoardRole::STANDALONE:
            return "standalone";
        case BoardRole::NB_HOST:
            return "nb_host";
        case BoardRole::GALAXY_MEMBER:
            return "galaxy_member";
    }
    return "standalone";
}

std::optional<BoardRole> board_role_from_str(const std::string& role_str) {
    if (role_str == "standalone") {
        return BoardRole::STANDALONE;
    } else if (role_str == "nb_host") {
        return BoardRole::NB_HOST;
    } else if (role_str == "galaxy_member") {
        return BoardRole::GALAXY_MEMBER;
    }
    return std::nullopt;
}

ResetConfigStore::ResetConfigStore(std::filesystem::path path) : path_(std::move(path)) {}

std::filesystem::path ResetConfigStore::default_path() {
    return utils::get_user_config_dir() / "tenstorrent" / VENDOR_DIR / CONFIG_FILE_NAME;
}

ResetConfig ResetConfigStore::parse(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        malformed(fmt::format("Reset config is not valid JSON: {}", e.what()));
    }

    if (!root.is_object()) {
        malformed(fmt::format("Reset config must be a JSON object, got {}", type_name(root)));
    }

    for (const char* legacy_key : LEGACY_KEYS) {
        if (root.contains(legacy_key)) {
            malformed(fmt::format(
                "Reset config uses the legacy positional layout (found '{}'); regenerate it with --generate-config",
                legacy_key));
        }
    }
    check_keys(root, {"version", "host_name", "devices", "galaxy_boards"}, "reset config");

    ResetConfig config;

    const json& version = require(root, "version", "reset config");
    if (!version.is_number_integer()) {
        malformed(fmt::format("version must be an integer, got {}", type_name(version)));
    }
    const std::int64_t file_version = version.get<std::int64_t>();
    if (file_version != ResetConfig::CURRENT_VERSION) {
        malformed(fmt::format(
            "Unsupported reset config version {}, expected {}", version.dump(), ResetConfig::CURRENT_VERSION));
    }
    config.version = static_cast<int>(file_version);

    if (root.contains("host_name")) {
        config.host_name = as_string(root.at("host_name"), "host_name");
    }

    if (root.contains("devices")) {
        const json& devices = root.at("devices");
        if (!devices.is_object()) {
            malformed(fmt::format("devices must be an object keyed by PCI address, got {}", type_name(devices)));
        }
        for (const auto& [bdf, device] : devices.items()) {
            std::string where = fmt::format("devices[{}]", bdf);
            config.devices.emplace(as_device_id(bdf, "devices"), parse_device(device, where));
        }
    }

    if (root.contains("galaxy_boards")) {
        const json& boards = root.at("galaxy_boards");
        if (!boards.is_array()) {
            malformed(fmt::format("galaxy_boards must be an array, got {}", type_name(boards)));
        }
        for (size_t i = 0; i < boards.size(); i++) {
            config.galaxy_boards.push_back(parse_galaxy_board(boards[i], fmt::format("galaxy_boards[{}]", i)));
        }
    }

    return config;
}

std::string ResetConfigStore::serialize(const ResetConfig& config) {
    json devices = json::object();
    for (const auto& [device_id, device] : config.devices) {
        devices[device_id.str()] = to_json(device);
    }

    json boards = json::array();
    for (const auto& board : config.galaxy_boards) {
        boards.push_back(to_json(board));
    }

    json root = {
        {"version", config.version},
        {"host_name", config.host_name},
        {"devices", devices},
        {"galaxy_boards", boards},
    };
    return root.dump(4) + "\n";
}

ResetConfig ResetConfigStore::load() const {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw std::runtime_error(
                fmt::format("Failed to create config directory {}: {}", path_.parent_path().string(), ec.message()));
        }
    }

    if (!std::filesystem::exists(path_)) {
        TT_RESET_DEBUG("No reset config at {}, starting from an empty one.", path_.string());
        ResetConfig config;
        config.host_name = utils::get_host_name();
        return config;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("Failed to open reset config {}", path_.string()));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return parse(buffer.str());
    } catch (const MalformedConfigError& e) {
        throw MalformedConfigError(fmt::format("{}: {}", path_.string(), e.what()));
    }
}

void ResetConfigStore::save(const ResetConfig& config) const {
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path());
    }

    std::filesystem::path temp_path = path_;
    temp_path += fmt::format(".tmp.{}", getpid());

    {
        std::ofstream file(temp_path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error(fmt::format("Failed to open {} for writing", temp_path.string()));
        }
        file << serialize(config);
        file.flush();
        if (!file) {
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            throw std::runtime_error(fmt::format("Failed to write reset config to {}", temp_path.string()));
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path_, ec);
    if (ec) {
        std::error_code remove_ec;
        std::filesystem::remove(temp_path, remove_ec);
        throw std::runtime_error(
            fmt::format("Failed to move reset config into place at {}: {}", path_.string(), ec.message()));
    }
    TT_RESET_DEBUG("Saved reset config with {} device(s) to {}", config.devices.size(), path_.string());
}

// File locks do not exclude threads of the same process.
static std::mutex& config_mutex(const std::filesystem::path& path) {
    static std::mutex registry_mutex;
    static std::map<std::string, std::unique_ptr<std::mutex>> registry;

    std::lock_guard<std::mutex> lock(registry_mutex);
    auto& mutex = registry[std::filesystem::absolute(path).lexically_normal().string()];
    if (!mutex) {
        mutex = std::make_unique<std::mutex>();
    }
    return *mutex;
}

static boost::interprocess::file_lock open_config_lock(const std::filesystem::path& lock_path) {
    if (lock_path.has_parent_path()) {
        std::filesystem::create_directories(lock_path.parent_path());
    }
    std::ofstream(lock_path, std::ios::app).close();
    try {
        return boost::interprocess::file_lock(lock_path.c_str());
    } catch (const boost::interprocess::interprocess_exception& e) {
        throw std::runtime_error(fmt::format("Failed to open config lock {}: {}", lock_path.string(), e.what()));
    }
}

ResetConfig ResetConfigStore::update(const std::function<void(ResetConfig&)>& modify) const {
    std::filesystem::path lock_path = path_;
    lock_path += ".lock";

    std::lock_guard<std::mutex> thread_lock(config_mutex(path_));
    boost::interprocess::file_lock file_lock = open_config_lock(lock_path);
    boost::interprocess::scoped_lock<boost::interprocess::file_lock> process_lock(file_lock);
    TT_RESET_TRACE("Locked {}", lock_path.string());

    ResetConfig config = load();
    modify(config);
    save(config);
    return config;
}

ResetConfig ResetConfigStore::generate(const std::vector<DeviceInfo>& devices) const {
    ResetConfig config;
    config.host_name = utils::get_host_name();
    for (const auto& device : devices) {
        DeviceConfig device_config;
        device_config.family = device.family;
        config.devices.emplace(device.device_id, device_config);
    }
    save(config);
    TT_RESET_INFO("Generated reset config for {} device(s) at {}", devices.size(), path_.string());
    return config;
}

std::string ResetConfigStore::format_timestamp(std::chrono::system_clock::time_point time_point) {
    std::time_t time = std::chrono::system_clock::to_time_t(time_point);
    std::tm utc{};
    gmtime_r(&time, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer);
}

}  // namespace tt::reset
