/**
 * @file test_device_settings.cpp
 * @brief DeviceSettings JSON 解析单元测试
 *
 * 覆盖：缺省键取默认值；完整文件解析；语法错误、类型错误与未知日志级别返回 false 且不修改输出；
 * 从文件加载；ApplyLogSettings 修改共享 logger 级别。
 */

#include <vesta_device/device_settings.hpp>
#include <vesta_device/log.hpp>

#include "counting_sink.hpp"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>

using namespace vesta_device;

static void TestDefaults() {
    DeviceSettings s;
    s.glDebugOutput = true;
    assert(ParseDeviceSettings("{}", s));
    assert(s.logLevel == spdlog::level::warn);
    assert(s.descriptorHeaps.renderTargets == 256);
    assert(s.descriptorHeaps.depthStencils == 64);
    assert(s.descriptorHeaps.shaderResources == 4096);
    assert(s.descriptorHeaps.samplers == 256);
    assert(!s.glDebugOutput);
}

static void TestFullDocument() {
    const std::string json = R"({
        "log_level": "debug",
        "descriptor_heaps": { "rtv": 32, "dsv": 8, "cbv_srv_uav": 1024, "sampler": 16 },
        "opengl": { "debug_output": true }
    })";
    DeviceSettings s;
    std::string error;
    assert(ParseDeviceSettings(json, s, &error));
    assert(error.empty());
    assert(s.logLevel == spdlog::level::debug);
    assert(s.descriptorHeaps.renderTargets == 32);
    assert(s.descriptorHeaps.depthStencils == 8);
    assert(s.descriptorHeaps.shaderResources == 1024);
    assert(s.descriptorHeaps.samplers == 16);
    assert(s.glDebugOutput);

    // 部分键
    DeviceSettings partial;
    assert(ParseDeviceSettings(R"({"descriptor_heaps": {"sampler": 2}, "log_level": "off"})", partial));
    assert(partial.descriptorHeaps.samplers == 2);
    assert(partial.descriptorHeaps.renderTargets == 256);
    assert(partial.logLevel == spdlog::level::off);
}

static void TestErrorsLeaveOutputUntouched() {
    DeviceSettings s;
    s.descriptorHeaps.samplers = 7;
    std::string error;

    assert(!ParseDeviceSettings("{ not json", s, &error));
    assert(error.find("parse error") != std::string::npos);

    error.clear();
    assert(!ParseDeviceSettings(R"({"descriptor_heaps": {"rtv": "many"}})", s, &error));
    assert(error.find("type error") != std::string::npos);

    error.clear();
    assert(!ParseDeviceSettings(R"({"log_level": "loud"})", s, &error));
    assert(error.find("loud") != std::string::npos);

    assert(!ParseDeviceSettings("[1, 2]", s, &error));
    assert(!ParseDeviceSettings(R"({"opengl": {"debug_output": 3}})", s));
    assert(s.descriptorHeaps.samplers == 7);
}

static void TestLoadFromFile() {
    const std::string path = "vesta_test_device_settings.json";
    {
        std::ofstream f(path);
        f << R"({"log_level": "error", "descriptor_heaps": {"dsv": 4}})";
    }
    DeviceSettings s;
    std::string error;
    assert(LoadDeviceSettings(path, s, &error));
    assert(s.logLevel == spdlog::level::err);
    assert(s.descriptorHeaps.depthStencils == 4);
    std::remove(path.c_str());

    assert(!LoadDeviceSettings("does/not/exist.json", s, &error));
    assert(error.find("cannot read") != std::string::npos);
}

static void TestApplyLogSettings() {
    vesta_test::ScopedCountingLogger log;
    DeviceSettings s;
    s.logLevel = spdlog::level::err;
    ApplyLogSettings(s);
    assert(GetLogger()->level() == spdlog::level::err);
    GetLogger()->warn("dropped");
    GetLogger()->error("kept");
    assert(log.Warnings() == 0);
    assert(log.Errors() == 1);
    assert(log.LastMessage() == "kept");
}

int main() {
    TestDefaults();
    TestFullDocument();
    TestErrorsLeaveOutputUntouched();
    TestLoadFromFile();
    TestApplyLogSettings();
    return 0;
}
