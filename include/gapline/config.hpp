#pragma once

#include <gapline/lang/trivia.hpp>
#include <gapline/log.hpp>
#include <gapline/result.hpp>
#include <string>

namespace gapline {

// Host-supplied settings, parsed from TOML text. Reading the file is the
// host's job.
struct Config {
    log::Level log_level = log::Warn;
    DirectiveTable directives;

    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool if_set = false;
    bool elif_set = false;
    bool else_set = false;
    bool endif_set = false;

    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    // Applies the log level to the process-wide logger
    void apply() const;
};

} // namespace gapline
