#include <meshdest/core/log.h>

#include <array>
#include <memory>
#include <mutex>
#include <string>

namespace meshdest::log {
namespace {

struct LevelName {
    std::string_view name;
    chlog::level level;
};

constexpr std::array<LevelName, 8> kLevels{{
    {"trace", chlog::level::trace},
    {"debug", chlog::level::debug},
    {"info", chlog::level::info},
    {"warn", chlog::level::warn},
    {"warning", chlog::level::warn},
    {"error", chlog::level::error},
    {"critical", chlog::level::critical},
    {"off", chlog::level::off},
}};

std::once_flag g_once;
std::unique_ptr<chlog::logger> g_logger;

void CreateLogger() {
    chlog::logger_config cfg;
    cfg.name = "meshdest";
    cfg.level = chlog::level::info;
    cfg.pattern = "[{date} {time}.{ms}][{lvl}][meshdest][tid={tid}] {msg}";
    // Watch and resolver threads log from many places; keep lines ordered.
    cfg.async.enabled = false;
    cfg.parallel_sinks = false;

    g_logger = std::make_unique<chlog::logger>(std::move(cfg));
    g_logger->add_sink(std::make_shared<chlog::console_sink>(chlog::console_sink::style::color));
}

} // namespace

Result<chlog::level> ParseLevel(std::string_view name) {
    for (const auto& entry : kLevels) {
        if (entry.name == name) {
            return entry.level;
        }
    }
    return Status(StatusCode::invalid_argument, "unknown log level \"" + std::string(name) + "\"");
}

void Init(std::string_view level) {
    std::call_once(g_once, CreateLogger);

    auto parsed = ParseLevel(level);
    if (!parsed.ok()) {
        g_logger->set_level(chlog::level::info);
        g_logger->warn("{}; using info", parsed.status().message());
        return;
    }
    g_logger->set_level(parsed.value());
}

chlog::logger& Get() {
    std::call_once(g_once, CreateLogger);
    return *g_logger;
}

} // namespace meshdest::log
