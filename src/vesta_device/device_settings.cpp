/**
 * @file device_settings.cpp
 * @brief DeviceSettings JSON 解析
 */

#include <vesta_device/device_settings.hpp>
#include <vesta_device/log.hpp>

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace vesta_device {

namespace {

std::string ReadFileToString(const std::string& path) {
    std::ifstream f(path);
    if (!f) return {};
    std::ostringstream oss;
    oss << f.rdbuf();
    return oss.str();
}

void SetError(std::string* error, const std::string& msg) {
    if (error) *error = msg;
}

void ReadCapacity(const nlohmann::json& heaps, const char* key, std::uint32_t& out) {
    if (heaps.contains(key)) out = heaps.at(key).get<std::uint32_t>();
}

}  // namespace

bool ParseDeviceSettings(const std::string& json, DeviceSettings& out, std::string* error) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const nlohmann::json::exception& e) {
        SetError(error, std::string("settings parse error: ") + e.what());
        return false;
    }
    if (!j.is_object()) {
        SetError(error, "settings root must be an object");
        return false;
    }

    DeviceSettings settings;
    try {
        if (j.contains("log_level")) {
            const std::string name = j.at("log_level").get<std::string>();
            settings.logLevel = spdlog::level::from_str(name);
            // from_str 对未知名称返回 off，只接受显式的 "off"
            if (settings.logLevel == spdlog::level::off && name != "off") {
                SetError(error, "unknown log_level: " + name);
                return false;
            }
        }
        if (j.contains("descriptor_heaps")) {
            const nlohmann::json& heaps = j.at("descriptor_heaps");
            ReadCapacity(heaps, "rtv", settings.descriptorHeaps.renderTargets);
            ReadCapacity(heaps, "dsv", settings.descriptorHeaps.depthStencils);
            ReadCapacity(heaps, "cbv_srv_uav", settings.descriptorHeaps.shaderResources);
            ReadCapacity(heaps, "sampler", settings.descriptorHeaps.samplers);
        }
        if (j.contains("opengl")) {
            const nlohmann::json& gl = j.at("opengl");
            if (gl.contains("debug_output")) settings.glDebugOutput = gl.at("debug_output").get<bool>();
        }
    } catch (const nlohmann::json::exception& e) {
        SetError(error, std::string("settings type error: ") + e.what());
        return false;
    }

    out = settings;
    return true;
}

bool LoadDeviceSettings(const std::string& path, DeviceSettings& out, std::string* error) {
    std::string content = ReadFileToString(path);
    if (content.empty()) {
        SetError(error, "cannot read settings file: " + path);
        return false;
    }
    return ParseDeviceSettings(content, out, error);
}

void ApplyLogSettings(const DeviceSettings& settings) {
    GetLogger()->set_level(settings.logLevel);
}

}  // namespace vesta_device
