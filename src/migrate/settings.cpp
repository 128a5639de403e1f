#include "stevedore/migrate/settings.hpp"

#include "stevedore/error.hpp"

namespace stevedore::migrate {

RunSettings RunSettings::from_config(const Config& config) {
    RunSettings s;
    s.workers = config.get<int>("pool.workers", s.workers);
    s.policy.retries = config.get<int>("pool.retries", s.policy.retries);
    s.policy.timeout = std::chrono::milliseconds(
        config.get<std::int64_t>("pool.timeout_ms", s.policy.timeout.count()));
    s.policy.timeout_step = std::chrono::milliseconds(
        config.get<std::int64_t>("pool.timeout_step_ms", s.policy.timeout_step.count()));
    s.policy.max_escalations = config.get<int>("pool.max_escalations", s.policy.max_escalations);
    s.batch_size = config.get<std::int64_t>("copy.batch_size", s.batch_size);
    s.progress_interval = std::chrono::milliseconds(
        config.get<std::int64_t>("pool.progress_interval_ms", s.progress_interval.count()));

    if (s.workers < 1) throw ConfigError("pool.workers must be at least 1");
    if (s.policy.retries < 0) throw ConfigError("pool.retries must not be negative");
    if (s.policy.timeout.count() < 0) throw ConfigError("pool.timeout_ms must not be negative");
    if (s.policy.timeout_step.count() <= 0) throw ConfigError("pool.timeout_step_ms must be positive");
    if (s.policy.max_escalations < 0) throw ConfigError("pool.max_escalations must not be negative");
    if (s.batch_size < 1) throw ConfigError("copy.batch_size must be at least 1");
    if (s.progress_interval.count() <= 0) throw ConfigError("pool.progress_interval_ms must be positive");
    return s;
}

db::PartitionSchema schema_from_config(const Config& config) {
    auto required = [&config](const std::string& key) {
        std::string value = config.get<std::string>(key);
        if (value.empty()) {
            throw ConfigError("missing required key " + key, "schema_from_config",
                              "set it in the file passed with --config");
        }
        return value;
    };

    db::PartitionSchema schema;
    schema.parent = required("schema.parent");
    schema.partition_key = required("schema.partition_key");
    schema.source_prefix = config.get<std::string>("schema.source_prefix");
    schema.copy_key = config.get<std::string>("schema.copy_key", schema.partition_key);
    schema.columns = config.get_list("schema.columns", ';');
    schema.primary_key = config.get_list("schema.primary_key");
    schema.not_null = config.get_list("schema.not_null");

    for (const auto& suffix : config.get_list("schema.indexes")) {
        schema.indexes.push_back({suffix, required("schema.index." + suffix)});
    }

    try {
        schema.validate();
    } catch (const InvalidArgumentError& e) {
        throw ConfigError(e.what(), "schema_from_config");
    }
    return schema;
}

} // namespace stevedore::migrate
