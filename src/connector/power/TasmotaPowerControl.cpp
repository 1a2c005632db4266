//
// Created by Andrea on 19/10/2025.
//

#include "connector/power/TasmotaPowerControl.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "logger/Logger.hpp"

namespace connector::power {
    namespace {
        // curl_easy_escape without a handle is allowed since 7.82; keep one around for older libcurl
        std::string escape(CURL *curl, const std::string &value) {
            char *escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
            if (!escaped) return value;
            std::string result(escaped);
            curl_free(escaped);
            return result;
        }
    }

    TasmotaPowerControl::TasmotaPowerControl(long timeoutSeconds) : timeoutSeconds_(timeoutSeconds) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    }

    TasmotaPowerControl::~TasmotaPowerControl() {
        curl_global_cleanup();
    }

    std::string TasmotaPowerControl::commandUrl(const core::model::SmartPlugRecord &plug, const std::string &command) {
        CURL *curl = curl_easy_init();
        std::string url = "http://" + plug.address + "/cm?";
        if (plug.username && !plug.username->empty()) {
            url += "user=" + escape(curl, *plug.username) + "&password=" + escape(curl, plug.password.value_or("")) +
                    "&";
        }
        url += "cmnd=" + escape(curl, command);
        if (curl) curl_easy_cleanup(curl);
        return url;
    }

    std::optional<std::string> TasmotaPowerControl::parsePowerState(const std::string &body) {
        const auto json = nlohmann::json::parse(body, nullptr, false);
        if (json.is_discarded() || !json.is_object()) return std::nullopt;

        for (const char *key: {"POWER", "POWER1"}) {
            if (json.contains(key) && json[key].is_string()) {
                const auto state = json[key].get<std::string>();
                if (state == "ON" || state == "OFF") return state;
            }
        }
        return std::nullopt;
    }

    core::device::PlugStatus TasmotaPowerControl::getStatus(const core::model::SmartPlugRecord &plug) {
        core::device::PlugStatus status;
        const auto body = sendCommand(plug, "Power");
        if (!body) return status;

        const auto state = parsePowerState(*body);
        if (!state) {
            Logger::logWarning("[TasmotaPowerControl] Unexpected status reply from " + plug.name + ": " + *body);
            return status;
        }

        status.reachable = true;
        status.state = *state;
        return status;
    }

    bool TasmotaPowerControl::turnOn(const core::model::SmartPlugRecord &plug) {
        const auto body = sendCommand(plug, "Power On");
        const bool switched = body && parsePowerState(*body) == std::optional<std::string>("ON");
        if (switched) {
            Logger::logInfo("[TasmotaPowerControl] " + plug.name + " switched on");
        }
        return switched;
    }

    bool TasmotaPowerControl::turnOff(const core::model::SmartPlugRecord &plug) {
        const auto body = sendCommand(plug, "Power Off");
        const bool switched = body && parsePowerState(*body) == std::optional<std::string>("OFF");
        if (switched) {
            Logger::logInfo("[TasmotaPowerControl] " + plug.name + " switched off");
        }
        return switched;
    }

    std::optional<std::string> TasmotaPowerControl::sendCommand(const core::model::SmartPlugRecord &plug,
                                                                const std::string &command) {
        CURL *curl = curl_easy_init();
        if (!curl) {
            Logger::logError("[TasmotaPowerControl] Failed to initialize CURL");
            return std::nullopt;
        }

        const std::string url = commandUrl(plug, command);
        std::string body;

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeoutSeconds_);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, "FleetDispatch/1.0");

        const CURLcode res = curl_easy_perform(curl);
        long responseCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &responseCode);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            Logger::logWarning("[TasmotaPowerControl] " + plug.name + " (" + plug.address + ") unreachable: " +
                               std::string(curl_easy_strerror(res)));
            return std::nullopt;
        }
        if (responseCode != 200) {
            Logger::logWarning("[TasmotaPowerControl] " + plug.name + " answered HTTP " +
                               std::to_string(responseCode) + " to '" + command + "'");
            return std::nullopt;
        }
        return body;
    }

    size_t TasmotaPowerControl::writeCallback(void *contents, size_t size, size_t nmemb, void *userp) {
        auto *body = static_cast<std::string *>(userp);
        const size_t totalSize = size * nmemb;
        body->append(static_cast<char *>(contents), totalSize);
        return totalSize;
    }
}
