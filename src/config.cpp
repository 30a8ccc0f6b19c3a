/*
 * snapmx - Device Screenshot Matrix Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "snapmx/config.hpp"
#include "snapmx/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace snapmx {

namespace {

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

[[noreturn]] void invalid(const std::string& message) {
    throw std::invalid_argument(message);
}

std::string requireString(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || !j[key].is_string() || j[key].get<std::string>().empty()) {
        invalid(where + ": missing required string '" + key + "'");
    }
    return j[key].get<std::string>();
}

std::optional<std::string> optionalString(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return std::nullopt;
}

std::optional<int> optionalInt(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_number_integer()) return j[key].get<int>();
    return std::nullopt;
}

void timeoutMs(const json& j, const char* key, int& out) {
    if (!j.contains(key)) {
        return;
    }
    const auto& v = j[key];
    if (!v.is_number_integer()) {
        invalid(std::string("timeouts.") + key + ": expected an integer");
    }
    auto ms = v.get<std::int64_t>();
    if (ms < 0 || ms > defaults::kMaxTimeoutMs) {
        invalid(std::string("timeouts.") + key + ": must be between 0 and " +
                std::to_string(defaults::kMaxTimeoutMs));
    }
    out = static_cast<int>(ms);
}

Selector parseSelector(const json& j, const std::string& where) {
    if (!j.is_object()) {
        invalid(where + ": selector must be an object");
    }
    Selector sel;
    sel.accessibilityId = optionalString(j, "accessibility_id");
    sel.iosClassChain = optionalString(j, "ios_class_chain");
    sel.androidUiautomator = optionalString(j, "android_uiautomator");
    sel.xpath = optionalString(j, "xpath");
    sel.id = optionalString(j, "id");
    if (sel.empty()) {
        invalid(where + ": selector needs at least one locator");
    }
    return sel;
}

std::vector<Selector> parseSelectorList(const json& j, const std::string& where) {
    std::vector<Selector> out;
    if (!j.is_array()) {
        invalid(where + ": expected an array of selectors");
    }
    for (std::size_t i = 0; i < j.size(); ++i) {
        out.push_back(parseSelector(j[i], where + "[" + std::to_string(i) + "]"));
    }
    return out;
}

Action parseAction(const json& j, const std::string& where) {
    if (!j.is_object() || j.size() != 1) {
        invalid(where + ": action must have exactly one of tap, wait, wait_for, capture");
    }
    Action action;
    if (j.contains("tap")) {
        action.type = ActionType::Tap;
        action.selector = parseSelector(j["tap"], where + ".tap");
    } else if (j.contains("wait")) {
        action.type = ActionType::Wait;
        const auto& w = j["wait"];
        if (w.contains("seconds") && w["seconds"].is_number()) {
            action.seconds = w["seconds"].get<double>();
        }
        if (!(action.seconds >= 0 && action.seconds <= defaults::kMaxWaitSeconds)) {
            invalid(where + ".wait: seconds must be between 0 and " +
                    std::to_string(static_cast<int>(defaults::kMaxWaitSeconds)));
        }
    } else if (j.contains("wait_for")) {
        action.type = ActionType::WaitFor;
        const auto& w = j["wait_for"];
        if (!w.contains("selector")) {
            invalid(where + ".wait_for: missing selector");
        }
        action.selector = parseSelector(w["selector"], where + ".wait_for.selector");
        action.timeoutSeconds = optionalInt(w, "timeout");
        if (action.timeoutSeconds &&
            (*action.timeoutSeconds < 0 || *action.timeoutSeconds > defaults::kMaxTimeoutMs / 1000)) {
            invalid(where + ".wait_for: timeout must be between 0 and " +
                    std::to_string(defaults::kMaxTimeoutMs / 1000) + " seconds");
        }
    } else if (j.contains("capture")) {
        action.type = ActionType::Capture;
        action.name = requireString(j["capture"], "name", where + ".capture");
    } else {
        invalid(where + ": unknown action '" + j.begin().key() + "'");
    }
    return action;
}

ScreenshotPlan parsePlan(const json& j, const std::string& where) {
    ScreenshotPlan plan;
    plan.name = requireString(j, "name", where);
    if (auto text = optionalString(j, "orientation")) {
        auto orientation = parseOrientation(*text);
        if (!orientation) {
            invalid(where + ": unknown orientation '" + *text + "'");
        }
        plan.orientation = *orientation;
    }
    if (!j.contains("actions") || !j["actions"].is_array()) {
        invalid(where + ": missing actions array");
    }
    const auto& actions = j["actions"];
    for (std::size_t i = 0; i < actions.size(); ++i) {
        plan.actions.push_back(parseAction(actions[i], where + ".actions[" + std::to_string(i) + "]"));
    }
    if (j.contains("assert") && j["assert"].is_object()) {
        const auto& a = j["assert"];
        if (a.contains("ios")) plan.assertIos = parseSelector(a["ios"], where + ".assert.ios");
        if (a.contains("android")) plan.assertAndroid = parseSelector(a["android"], where + ".assert.android");
    }
    if (j.contains("dismissors") && j["dismissors"].is_object()) {
        const auto& d = j["dismissors"];
        if (d.contains("ios")) plan.dismissorsIos = parseSelectorList(d["ios"], where + ".dismissors.ios");
        if (d.contains("android")) plan.dismissorsAndroid = parseSelectorList(d["android"], where + ".dismissors.android");
    }
    return plan;
}

std::optional<Dimensions> parseDimensions(const json& j, const char* key, const std::string& where) {
    if (!j.contains(key)) return std::nullopt;
    const auto& d = j[key];
    if (!d.is_array() || d.size() != 2 || !d[0].is_number_integer() || !d[1].is_number_integer()) {
        invalid(where + "." + key + ": expected [width, height]");
    }
    return Dimensions{d[0].get<int>(), d[1].get<int>()};
}

std::map<std::string, DeviceSize> parseSizes(const json& j, const std::string& where) {
    std::map<std::string, DeviceSize> sizes;
    for (auto it = j.begin(); it != j.end(); ++it) {
        DeviceSize size;
        size.portrait = parseDimensions(it.value(), "portrait", where + "." + it.key());
        size.landscape = parseDimensions(it.value(), "landscape", where + "." + it.key());
        sizes[it.key()] = size;
    }
    return sizes;
}

std::map<std::string, std::string> parseExtra(const json& j, const std::set<std::string>& typedKeys) {
    std::map<std::string, std::string> extra;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (typedKeys.count(it.key())) continue;
        extra[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
    }
    return extra;
}

void parseDevices(const json& j, Config& cfg) {
    if (!j.contains("devices") || !j["devices"].is_object()) {
        invalid("missing devices object");
    }
    const auto& devices = j["devices"];
    if (devices.contains("ios") && devices["ios"].is_array()) {
        for (std::size_t i = 0; i < devices["ios"].size(); ++i) {
            const auto& d = devices["ios"][i];
            std::string where = "devices.ios[" + std::to_string(i) + "]";
            IosDevice dev;
            dev.name = requireString(d, "name", where);
            dev.udid = optionalString(d, "udid");
            dev.folder = requireString(d, "folder", where);
            dev.platformVersion = requireString(d, "platform_version", where);
            cfg.iosDevices.push_back(dev);
        }
    }
    if (devices.contains("android") && devices["android"].is_array()) {
        for (std::size_t i = 0; i < devices["android"].size(); ++i) {
            const auto& d = devices["android"][i];
            std::string where = "devices.android[" + std::to_string(i) + "]";
            AndroidDevice dev;
            dev.name = requireString(d, "name", where);
            dev.avd = requireString(d, "avd", where);
            dev.folder = requireString(d, "folder", where);
            dev.platformVersion = requireString(d, "platform_version", where);
            cfg.androidDevices.push_back(dev);
        }
    }

    std::set<std::string> folders;
    for (const auto& d : cfg.iosDevices) {
        if (!folders.insert(d.folder).second) invalid("duplicate device folder: " + d.folder);
    }
    for (const auto& d : cfg.androidDevices) {
        if (!folders.insert(d.folder).second) invalid("duplicate device folder: " + d.folder);
    }
}

Config parseDocument(const json& j) {
    if (!j.is_object()) {
        invalid("configuration root must be an object");
    }
    Config cfg;
    parseDevices(j, cfg);

    if (!j.contains("languages") || !j["languages"].is_array()) {
        invalid("missing languages array");
    }
    for (const auto& lang : j["languages"]) {
        cfg.languages.push_back(lang.get<std::string>());
    }

    if (j.contains("locale_mapping") && j["locale_mapping"].is_object()) {
        for (auto it = j["locale_mapping"].begin(); it != j["locale_mapping"].end(); ++it) {
            std::string where = "locale_mapping." + it.key();
            cfg.localeMapping[it.key()] = LocaleMapping{
                requireString(it.value(), "ios", where),
                requireString(it.value(), "android", where)};
        }
    }

    if (!j.contains("screenshots") || !j["screenshots"].is_array()) {
        invalid("missing screenshots array");
    }
    for (std::size_t i = 0; i < j["screenshots"].size(); ++i) {
        cfg.screenshots.push_back(parsePlan(j["screenshots"][i], "screenshots[" + std::to_string(i) + "]"));
    }

    if (j.contains("build_config") && j["build_config"].is_object()) {
        const auto& b = j["build_config"];
        if (b.contains("ios")) {
            cfg.build.ios.artifactGlob = optionalString(b["ios"], "artifact_glob");
            cfg.build.ios.package = optionalString(b["ios"], "package");
        }
        if (b.contains("android")) {
            cfg.build.android.artifactGlob = optionalString(b["android"], "artifact_glob");
            cfg.build.android.package = optionalString(b["android"], "package");
        }
    }

    if (j.contains("ports") && j["ports"].is_object()) {
        const auto& p = j["ports"];
        if (p.contains("base_port")) cfg.ports.basePort = p["base_port"].get<int>();
        if (p.contains("port_offset")) cfg.ports.portOffset = p["port_offset"].get<int>();
    }

    if (j.contains("timeouts") && j["timeouts"].is_object()) {
        const auto& t = j["timeouts"];
        timeoutMs(t, "element_ms", cfg.timeouts.elementMs);
        timeoutMs(t, "dismissor_ms", cfg.timeouts.dismissorMs);
        timeoutMs(t, "dismiss_delay_ms", cfg.timeouts.dismissDelayMs);
        timeoutMs(t, "settle_ms", cfg.timeouts.settleMs);
        timeoutMs(t, "device_operation_ms", cfg.timeouts.deviceOperationMs);
    }

    if (j.contains("app_reset") && j["app_reset"].is_object()) {
        if (auto policy = optionalString(j["app_reset"], "policy")) {
            auto parsed = parseResetPolicy(*policy);
            if (!parsed) invalid("app_reset.policy: unknown policy '" + *policy + "'");
            cfg.appReset = *parsed;
        }
    }

    if (j.contains("failure_artifacts") && j["failure_artifacts"].is_object()) {
        const auto& f = j["failure_artifacts"];
        if (f.contains("save_page_source")) cfg.failureArtifacts.savePageSource = f["save_page_source"].get<bool>();
        if (f.contains("save_screenshot")) cfg.failureArtifacts.saveScreenshot = f["save_screenshot"].get<bool>();
        if (f.contains("save_device_logs")) cfg.failureArtifacts.saveDeviceLogs = f["save_device_logs"].get<bool>();
        cfg.failureArtifacts.artifactsDir = optionalString(f, "artifacts_dir");
    }

    if (j.contains("status_bar") && j["status_bar"].is_object()) {
        const auto& s = j["status_bar"];
        if (s.contains("ios") && s["ios"].is_object()) {
            IosStatusBar bar;
            bar.time = optionalString(s["ios"], "time");
            bar.wifiBars = optionalInt(s["ios"], "wifi_bars");
            bar.cellularBars = optionalInt(s["ios"], "cellular_bars");
            bar.batteryState = optionalString(s["ios"], "battery_state");
            cfg.statusBar.ios = bar;
        }
        if (s.contains("android") && s["android"].is_object()) {
            AndroidStatusBar bar;
            if (s["android"].contains("demo_mode")) bar.demoMode = s["android"]["demo_mode"].get<bool>();
            bar.clock = optionalString(s["android"], "clock");
            bar.battery = optionalInt(s["android"], "battery");
            bar.wifi = optionalString(s["android"], "wifi");
            bar.notifications = optionalString(s["android"], "notifications");
            cfg.statusBar.android = bar;
        }
    }

    if (j.contains("validation") && j["validation"].is_object()) {
        const auto& v = j["validation"];
        ValidationConfig validation;
        if (v.contains("enforce_image_size")) validation.enforceImageSize = v["enforce_image_size"].get<bool>();
        if (v.contains("expected_sizes") && v["expected_sizes"].is_object()) {
            const auto& e = v["expected_sizes"];
            if (e.contains("ios")) validation.expectedIos = parseSizes(e["ios"], "validation.expected_sizes.ios");
            if (e.contains("android")) validation.expectedAndroid = parseSizes(e["android"], "validation.expected_sizes.android");
        }
        cfg.validation = validation;
    }

    if (j.contains("capabilities") && j["capabilities"].is_object()) {
        const auto& c = j["capabilities"];
        if (c.contains("ios") && c["ios"].is_object()) {
            cfg.capabilities.ios.automationName = optionalString(c["ios"], "automation_name");
            cfg.capabilities.ios.wdaLaunchTimeoutMs = optionalInt(c["ios"], "wda_launch_timeout_ms");
            cfg.capabilities.ios.extra = parseExtra(c["ios"], {"automation_name", "wda_launch_timeout_ms"});
        }
        if (c.contains("android") && c["android"].is_object()) {
            cfg.capabilities.android.automationName = optionalString(c["android"], "automation_name");
            cfg.capabilities.android.appActivity = optionalString(c["android"], "app_activity");
            cfg.capabilities.android.adbExecTimeoutMs = optionalInt(c["android"], "adb_exec_timeout_ms");
            cfg.capabilities.android.extra = parseExtra(c["android"],
                {"automation_name", "app_activity", "adb_exec_timeout_ms"});
        }
    }

    if (j.contains("dismissors") && j["dismissors"].is_object()) {
        const auto& d = j["dismissors"];
        if (d.contains("ios")) cfg.globalDismissorsIos = parseSelectorList(d["ios"], "dismissors.ios");
        if (d.contains("android")) cfg.globalDismissorsAndroid = parseSelectorList(d["android"], "dismissors.android");
    }

    return cfg;
}

}

std::string Selector::describe() const {
    std::ostringstream ss;
    const char* sep = "";
    auto add = [&](const char* label, const std::optional<std::string>& value) {
        if (value) {
            ss << sep << label << "=" << *value;
            sep = ", ";
        }
    };
    add("accessibility_id", accessibilityId);
    add("ios_class_chain", iosClassChain);
    add("android_uiautomator", androidUiautomator);
    add("xpath", xpath);
    add("id", id);
    return ss.str();
}

std::optional<AppResetPolicy> parseResetPolicy(const std::string& text) noexcept {
    std::string value = toLowerCopy(text);
    if (value == "never") return AppResetPolicy::Never;
    if (value == "on_language_change") return AppResetPolicy::ClearOnLanguageChange;
    if (value == "always") return AppResetPolicy::AlwaysReinstall;
    return std::nullopt;
}

std::optional<Orientation> parseOrientation(const std::string& text) noexcept {
    std::string value = toLowerCopy(text);
    if (value == "portrait") return Orientation::Portrait;
    if (value == "landscape") return Orientation::Landscape;
    return std::nullopt;
}

ConfigResult parseConfig(const std::string& text) {
    try {
        json j = json::parse(text);
        return {true, parseDocument(j), ConfigErrorCode::None, ""};
    } catch (const json::parse_error& e) {
        return {false, {}, ConfigErrorCode::ParseError, std::string("Invalid JSON: ") + e.what()};
    } catch (const json::exception& e) {
        return {false, {}, ConfigErrorCode::InvalidValue, std::string("Invalid value: ") + e.what()};
    } catch (const std::invalid_argument& e) {
        return {false, {}, ConfigErrorCode::InvalidValue, e.what()};
    }
}

ConfigResult loadConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        LOG_ERROR("Cannot open configuration: " + path.string());
        return {false, {}, ConfigErrorCode::IoError, "Cannot open configuration file: " + path.string()};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parseConfig(buffer.str());
    if (result) {
        LOG_DEBUG("Loaded configuration from " + path.string() + ": " +
                  std::to_string(result.config.iosDevices.size()) + " iOS devices, " +
                  std::to_string(result.config.androidDevices.size()) + " Android devices, " +
                  std::to_string(result.config.languages.size()) + " languages");
    } else {
        LOG_ERROR("Configuration error in " + path.string() + ": " + result.message);
    }
    return result;
}

std::vector<std::string> checkConfig(const Config& config) {
    std::vector<std::string> issues;
    if (config.iosDevices.empty() && config.androidDevices.empty()) {
        issues.push_back("no devices configured");
    }
    if (config.languages.empty()) {
        issues.push_back("languages is empty");
    }
    if (config.screenshots.empty()) {
        issues.push_back("screenshots is empty");
    }
    for (const auto& lang : config.languages) {
        if (config.localeMapping.find(lang) == config.localeMapping.end()) {
            issues.push_back("missing locale mapping for language '" + lang + "'");
        }
    }
    return issues;
}

std::string describeConfig(const Config& config) {
    std::ostringstream ss;
    ss << "iOS devices:      " << config.iosDevices.size() << "\n";
    ss << "Android devices:  " << config.androidDevices.size() << "\n";
    ss << "Languages:        " << config.languages.size();
    if (!config.languages.empty()) {
        ss << " (";
        for (std::size_t i = 0; i < config.languages.size(); ++i) {
            ss << (i ? ", " : "") << config.languages[i];
        }
        ss << ")";
    }
    ss << "\n";
    ss << "Screenshots:      " << config.screenshots.size() << "\n";
    return ss.str();
}

}
