#include "config.hpp"
#include "lib.hpp"

namespace migrator {

namespace {

    std::string required_string(const jval& j, const char* key) {
        if (!jhlp::has(j, key) || !j.FindMember(key)->value.IsString()) {
            THROW_AS(ConfigError, "config: '%s' is required and must be a string", key);
        }
        std::string v = j.FindMember(key)->value.GetString();
        if (v.empty()) THROW_AS(ConfigError, "config: '%s' must not be empty", key);
        return v;
    }

    std::string optional_string(const jval& j, const char* key, const std::string& fallback) {
        if (!jhlp::has(j, key)) return fallback;
        if (!j.FindMember(key)->value.IsString()) {
            THROW_AS(ConfigError, "config: '%s' must be a string", key);
        }
        return j.FindMember(key)->value.GetString();
    }
}

Dialect dialect_from_string(const std::string& name) {
    if (name == "sqlite"  ) return Dialect::SQLite  ;
    if (name == "postgres") return Dialect::Postgres;
    THROW_AS(ConfigError, "config: unknown dialect '%s' (expected sqlite or postgres)", name.c_str());
}

MigratorConfig MigratorConfig::from_json(const jval& j) {
    if (!j.IsObject()) THROW_AS(ConfigError, "config: top level must be a JSON object");

    MigratorConfig cfg;
    cfg.migrations_dir   = required_string(j, CFG_MIGRATIONS_DIR);
    cfg.dsn              = required_string(j, CFG_DSN);
    cfg.dialect          = dialect_from_string(optional_string(j, CFG_DIALECT, "sqlite"));
    cfg.log_table.table  = optional_string(j, CFG_LOG_TABLE, cfg.log_table.table);
    cfg.log_table.schema = optional_string(j, CFG_DATABASE, "");
    cfg.log_level        = optional_string(j, CFG_LOG_LEVEL, cfg.log_level);

    std::string output = optional_string(j, CFG_OUTPUT, "text");
    if (output == "text") cfg.output = OutputFormat::Text;
    else if (output == "json") cfg.output = OutputFormat::Json;
    else THROW_AS(ConfigError, "config: unknown output '%s' (expected text or json)", output.c_str());

    if (cfg.log_table.table.empty()) THROW_AS(ConfigError, "config: '%s' must not be empty", CFG_LOG_TABLE);
    return cfg;
}

MigratorConfig MigratorConfig::from_string(const std::string& text) {
    jdoc doc;
    if (!jhlp::parse_str(text, doc)) THROW_AS(ConfigError, "config: malformed JSON");
    return from_json(doc);
}

MigratorConfig MigratorConfig::from_file(const std::string& path) {
    jdoc doc;
    if (!jhlp::parse_file(path, doc)) THROW_AS(ConfigError, "config: cannot load '%s'", path.c_str());
    return from_json(doc);
}

} // namespace migrator
