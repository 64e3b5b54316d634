#include "core/types.h"

#include <chrono>
#include <random>

namespace easel {

namespace {

std::mt19937_64& rng() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

}

const std::string& working_directory(const WorkspaceSession& session) {
    return std::visit([](const auto& s) -> const std::string& { return s.path; }, session);
}

WorkspaceSession with_path(const WorkspaceSession& session, const std::string& path) {
    if (const auto* wsl = std::get_if<WslSession>(&session)) {
        return WslSession{wsl->distribution, path};
    }
    return LocalSession{path};
}

bool is_wsl(const WorkspaceSession& session) {
    return std::holds_alternative<WslSession>(session);
}

void to_json(nlohmann::json& j, const WorkspaceSession& session) {
    j = nlohmann::json::object();
    if (const auto* wsl = std::get_if<WslSession>(&session)) {
        j["Wsl"] = {{"distribution", wsl->distribution}, {"working_directory", wsl->path}};
    } else {
        j["Local"] = std::get<LocalSession>(session).path;
    }
}

void from_json(const nlohmann::json& j, WorkspaceSession& session) {
    if (j.contains("Wsl") && j["Wsl"].is_object()) {
        const auto& w = j["Wsl"];
        session = WslSession{w.value("distribution", std::string{}), w.value("working_directory", std::string{})};
    } else if (j.contains("Local") && j["Local"].is_string()) {
        session = LocalSession{j["Local"].get<std::string>()};
    } else {
        session = LocalSession{};
    }
}

std::string generate_id() {
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(rng());
    uint64_t lo = dist(rng());

    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (int i = 15; i >= 0; --i) {
        out.push_back(hex[(hi >> (i * 4)) & 0xF]);
        if (i == 8 || i == 4) out.push_back('-');
    }
    out.push_back('-');
    for (int i = 15; i >= 0; --i) {
        out.push_back(hex[(lo >> (i * 4)) & 0xF]);
        if (i == 12) out.push_back('-');
    }
    return out;
}

std::string random_suffix(size_t length) {
    static const char* alphabet = "abcdefghijklmnopqrstuvwxyz0123456789";
    std::uniform_int_distribution<int> dist(0, 35);
    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        out.push_back(alphabet[dist(rng())]);
    }
    return out;
}

int64_t now_millis() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

}
