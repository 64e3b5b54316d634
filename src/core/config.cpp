#include "core/config.h"
#include "core/logging.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>

namespace easel {

namespace {

constexpr int MIN_ROWS = 24;
constexpr int MIN_COLS = 80;

}

EaselConfig EaselConfig::from_toml(const toml::table& tbl) {
    EaselConfig cfg;

    if (auto driver_tbl = tbl["driver"].as_table()) {
        auto& d = cfg.driver;
        if (auto v = (*driver_tbl)["executable"].value<std::string>()) d.executable = *v;
        if (auto v = (*driver_tbl)["rows"].value<int64_t>()) d.rows = std::max(MIN_ROWS, static_cast<int>(*v));
        if (auto v = (*driver_tbl)["cols"].value<int64_t>()) d.cols = std::max(MIN_COLS, static_cast<int>(*v));
        if (auto v = (*driver_tbl)["warmup_ms"].value<int64_t>()) d.warmup_ms = static_cast<int>(*v);
        if (auto v = (*driver_tbl)["probe_delay_ms"].value<int64_t>()) d.probe_delay_ms = static_cast<int>(*v);
        if (auto v = (*driver_tbl)["pwd_delay_ms"].value<int64_t>()) d.pwd_delay_ms = static_cast<int>(*v);
        if (auto v = (*driver_tbl)["settle_ms"].value<int64_t>()) d.settle_ms = static_cast<int>(*v);
        if (auto v = (*driver_tbl)["completion_grace_ms"].value<int64_t>()) d.completion_grace_ms = static_cast<int>(*v);

        if (auto cues_tbl = (*driver_tbl)["cues"].as_table()) {
            auto& c = d.cues;
            if (auto v = (*cues_tbl)["confirm"].value<std::string>()) c.confirm = *v;
            if (auto v = (*cues_tbl)["trust_question"].value<std::string>()) c.trust_question = *v;
            if (auto v = (*cues_tbl)["dont_ask_again"].value<std::string>()) c.dont_ask_again = *v;
            if (auto v = (*cues_tbl)["empty_prompt"].value<std::string>()) c.empty_prompt = *v;
            if (auto v = (*cues_tbl)["try_hint"].value<std::string>()) c.try_hint = *v;
            if (auto v = (*cues_tbl)["prompt_marker"].value<std::string>()) c.prompt_marker = *v;
            if (auto v = (*cues_tbl)["processing"].value<std::string>()) c.processing = *v;
        }
    }

    if (auto agent_tbl = tbl["agent"].as_table()) {
        if (auto v = (*agent_tbl)["max_attempts"].value<int64_t>()) cfg.agent.max_attempts = std::max(1, static_cast<int>(*v));
        if (auto v = (*agent_tbl)["attempt_timeout_minutes"].value<int64_t>()) cfg.agent.attempt_timeout_minutes = std::max(1, static_cast<int>(*v));
    }

    if (auto logging_tbl = tbl["logging"].as_table()) {
        if (auto v = (*logging_tbl)["level"].value<std::string>()) cfg.logging.level = *v;
        if (auto v = (*logging_tbl)["file"].value<std::string>()) cfg.logging.file = *v;
    }

    return cfg;
}

toml::table EaselConfig::to_toml() const {
    toml::table cues_tbl;
    cues_tbl.insert_or_assign("confirm", driver.cues.confirm);
    cues_tbl.insert_or_assign("trust_question", driver.cues.trust_question);
    cues_tbl.insert_or_assign("dont_ask_again", driver.cues.dont_ask_again);
    cues_tbl.insert_or_assign("empty_prompt", driver.cues.empty_prompt);
    cues_tbl.insert_or_assign("try_hint", driver.cues.try_hint);
    cues_tbl.insert_or_assign("prompt_marker", driver.cues.prompt_marker);
    cues_tbl.insert_or_assign("processing", driver.cues.processing);

    toml::table driver_tbl;
    driver_tbl.insert_or_assign("executable", driver.executable);
    driver_tbl.insert_or_assign("rows", driver.rows);
    driver_tbl.insert_or_assign("cols", driver.cols);
    driver_tbl.insert_or_assign("warmup_ms", driver.warmup_ms);
    driver_tbl.insert_or_assign("probe_delay_ms", driver.probe_delay_ms);
    driver_tbl.insert_or_assign("pwd_delay_ms", driver.pwd_delay_ms);
    driver_tbl.insert_or_assign("settle_ms", driver.settle_ms);
    driver_tbl.insert_or_assign("completion_grace_ms", driver.completion_grace_ms);
    driver_tbl.insert_or_assign("cues", std::move(cues_tbl));

    toml::table agent_tbl;
    agent_tbl.insert_or_assign("max_attempts", agent.max_attempts);
    agent_tbl.insert_or_assign("attempt_timeout_minutes", agent.attempt_timeout_minutes);

    toml::table logging_tbl;
    logging_tbl.insert_or_assign("level", logging.level);
    logging_tbl.insert_or_assign("file", logging.file);

    toml::table tbl;
    tbl.insert_or_assign("driver", std::move(driver_tbl));
    tbl.insert_or_assign("agent", std::move(agent_tbl));
    tbl.insert_or_assign("logging", std::move(logging_tbl));
    return tbl;
}

EaselConfig EaselConfig::load(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return EaselConfig{};
    }

    try {
        return from_toml(toml::parse_file(path));
    } catch (const toml::parse_error& e) {
        log::get("config")->warn("Ignoring malformed config {}: {}", path, e.description());
        return EaselConfig{};
    }
}

std::string EaselConfig::default_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/easel/config.toml";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/easel/config.toml";
}

}
