#include <gapline/config.hpp>
#include <toml++/toml.hpp>

namespace gapline {

static Status read_spellings(const toml::table& section, const char* key,
                             std::vector<std::string>& out, bool& set) {
    const toml::node* node = section.get(key);
    if (!node) return ok_status();

    const toml::array* arr = node->as_array();
    if (!arr) {
        return GapError{GapError::Config,
            std::string("directives.") + key + " must be an array of strings"};
    }

    std::vector<std::string> spellings;
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s || s->empty()) {
            return GapError{GapError::Config,
                std::string("directives.") + key + " contains a non-string or empty entry",
                "write spellings with their sigil, e.g. \"`ifdef\" or \"#if\""};
        }
        spellings.push_back(*s);
    }
    out = std::move(spellings);
    set = true;
    return ok_status();
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return GapError{GapError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::level_from_name(*v);
            if (!lvl) {
                return GapError{GapError::Config,
                    "unknown log level '" + *v + "'",
                    "use one of: trace, debug, info, warn, error"};
            }
            cfg.log_level = *lvl;
            cfg.log_level_set = true;
        }
    }

    // [directives] section
    if (auto dirs = doc["directives"].as_table()) {
        GAPLINE_TRY(read_spellings(*dirs, "if", cfg.directives.if_spellings, cfg.if_set));
        GAPLINE_TRY(read_spellings(*dirs, "elif", cfg.directives.elif_spellings, cfg.elif_set));
        GAPLINE_TRY(read_spellings(*dirs, "else", cfg.directives.else_spellings, cfg.else_set));
        GAPLINE_TRY(read_spellings(*dirs, "endif", cfg.directives.endif_spellings, cfg.endif_set));
    }

    log::debug("config: log level %s, %zu if / %zu elif / %zu else / %zu endif spellings",
               log::level_name(cfg.log_level),
               cfg.directives.if_spellings.size(), cfg.directives.elif_spellings.size(),
               cfg.directives.else_spellings.size(), cfg.directives.endif_spellings.size());

    return Result<Config>::ok(std::move(cfg));
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.if_set) {
        directives.if_spellings = other.directives.if_spellings;
        if_set = true;
    }
    if (other.elif_set) {
        directives.elif_spellings = other.directives.elif_spellings;
        elif_set = true;
    }
    if (other.else_set) {
        directives.else_spellings = other.directives.else_spellings;
        else_set = true;
    }
    if (other.endif_set) {
        directives.endif_spellings = other.directives.endif_spellings;
        endif_set = true;
    }
}

void Config::apply() const {
    log::set_level(log_level);
}

} // namespace gapline
