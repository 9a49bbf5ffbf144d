#pragma once

#include "ztredact/config.h"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace spdlog { class logger; }

namespace ztredact {

class Gazetteer;

// The only writer to the persistent log. Every message is scrubbed before it
// reaches the sink: registered raw values become their placeholders, then the
// pattern rules, the contextual triggers and the shared gazetteer are applied
// to whatever is left. The sink is created here and never handed out, so
// there is no unscrubbed path to it.
class SecureLogger {
public:
    enum class Level { DEBUG, INFO, WARN, ERROR };

    // Unregisters its values on destruction. Move-only.
    class ScrubScope {
    public:
        ScrubScope() = default;
        ScrubScope(ScrubScope &&other) noexcept;
        ScrubScope& operator=(ScrubScope &&other) noexcept;
        ScrubScope(const ScrubScope&) = delete;
        ScrubScope& operator=(const ScrubScope&) = delete;
        ~ScrubScope();

        size_t size() const { return raw_values_.size(); }

    private:
        friend class SecureLogger;
        ScrubScope(SecureLogger *owner, std::vector<std::string> raw_values)
            : owner_(owner), raw_values_(std::move(raw_values)) {}
        void release();

        SecureLogger *owner_ = nullptr;
        std::vector<std::string> raw_values_;
    };

    explicit SecureLogger(const LogConfig &cfg);
    ~SecureLogger();

    SecureLogger(const SecureLogger&) = delete;
    SecureLogger& operator=(const SecureLogger&) = delete;
    SecureLogger(SecureLogger&&) = delete;
    SecureLogger& operator=(SecureLogger&&) = delete;

    void log(Level level, const std::string &component, const std::string &message);
    void debug(const std::string &component, const std::string &message) { log(Level::DEBUG, component, message); }
    void info(const std::string &component, const std::string &message) { log(Level::INFO, component, message); }
    void warn(const std::string &component, const std::string &message) { log(Level::WARN, component, message); }
    void error(const std::string &component, const std::string &message) { log(Level::ERROR, component, message); }
    void flush();

    // Registers raw value -> placeholder pairs for the lifetime of the scope.
    ScrubScope register_values(const std::vector<std::pair<std::string, std::string>> &raw_to_placeholder);

    // Gazetteer entries are scrubbed from every message, with or without a scope.
    void set_gazetteer(std::shared_ptr<const Gazetteer> gazetteer);

    std::string scrub(const std::string &message) const;

    static Level parse_level(const std::string &s);

private:
    void unregister(const std::vector<std::string> &raw_values);

    std::shared_ptr<spdlog::logger> sink_;
    mutable std::mutex mu_;
    struct Registered { std::string placeholder; int refs = 0; };
    std::map<std::string, Registered> values_;
    std::shared_ptr<const Gazetteer> gazetteer_;
};

} // namespace ztredact
