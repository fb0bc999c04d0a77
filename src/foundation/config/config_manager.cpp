#include "lineup/foundation/config_manager.hpp"

#include "lineup/foundation/logger.hpp"

namespace lineup::foundation {

LineupResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
    } catch (const YAML::BadFile&) {
        return LineupResult<void>::err(
            LineupError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return LineupResult<void>::err(
            LineupError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }

    LogContext ctx;
    ctx.extra["path"] = path.string();
    ctx.extra["keys"] = std::to_string(entries_.size());
    Logger::instance().logWithContext(LogLevel::Info, LogCategory::Config,
                                      "Configuration loaded", ctx);
    return LineupResult<void>::ok();
}

LineupResult<void> ConfigManager::loadFromString(std::string_view document) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::Load(std::string(document));
        entries_.clear();
        flatten("", root);
        return LineupResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return LineupResult<void>::err(
            LineupError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::size_t ConfigManager::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace lineup::foundation
