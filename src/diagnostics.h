// diagnostics.h - Channel for non-fatal problems found while parsing
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace tagstyle {

struct Diagnostic {
    std::string message;
    size_t source_index = 0; // offset in the markup passed to render()
    std::string position;    // same offset as reported to humans
};

// Collects warnings for one or more render calls. Each warning is also passed
// to the optional handler and logged to the optional logger.
//
//   Diagnostics diagnostics(spdlog::default_logger());
//   beautifier.render("a > b", diagnostics); // logs "Un-escaped '>' character at position 2"
class Diagnostics {
public:
    using Handler = std::function<void(const Diagnostic&)>;

    Diagnostics() = default;
    explicit Diagnostics(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

    void set_handler(Handler handler) { handler_ = std::move(handler); }

    void warn(std::string message, size_t source_index, std::string position) {
        warnings_.push_back({std::move(message), source_index, std::move(position)});
        const Diagnostic& diagnostic = warnings_.back();

        if (logger_) {
            logger_->warn("{} at position {}", diagnostic.message, diagnostic.position);
        }
        if (handler_) {
            handler_(diagnostic);
        }
    }

    // Debug-level trace, only reaches the logger
    template <typename... Args>
    void trace(spdlog::format_string_t<Args...> format, Args&&... args) const {
        if (logger_) {
            logger_->debug(format, std::forward<Args>(args)...);
        }
    }

    const std::vector<Diagnostic>& warnings() const { return warnings_; }
    bool empty() const { return warnings_.empty(); }
    void clear() { warnings_.clear(); }

private:
    std::shared_ptr<spdlog::logger> logger_;
    Handler handler_;
    std::vector<Diagnostic> warnings_;
};

} // namespace tagstyle
