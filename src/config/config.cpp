/**
 * @file config.cpp
 * @brief implementation of the YAML run config loader with bougie validation uwu
 *
 * this translation unit backs config.hpp with the full YAML parsing pipeline.
 * it leans on yaml-cpp, wraps everything in std::expected, and emits error
 * breadcrumbs so humans can fix typos without doom scrolling logs.
 */
#include "ckw/config/config.hpp"

#include <cstdlib>
#include <format>
#include <yaml-cpp/yaml.h>

namespace ckw::config
{
namespace
{

[[nodiscard]] auto make_config_error(std::string message, std::vector<std::string> ctx) -> ConfigResult
{
    Error err{};
    err.kind    = ErrorKind::ConfigInvalid;
    err.message = std::move(message);
    err.context = std::move(ctx);
    return std::unexpected(std::move(err));
}

[[nodiscard]] auto index_crumb(std::size_t i) -> std::string
{
    return std::format("[{}]", i);
}

[[nodiscard]] auto node_to_string_vec(const YAML::Node &node, std::vector<std::string> ctx)
    -> std::expected<std::vector<std::string>, Error>
{
    std::vector<std::string> items;
    if (!node || node.IsNull())
    {
        return items;
    }
    if (!node.IsSequence())
    {
        return std::unexpected(Error{ErrorKind::ConfigInvalid, "expected sequence for string list", std::move(ctx)});
    }
    items.reserve(node.size());
    for (std::size_t i = 0; i < node.size(); ++i)
    {
        try
        {
            items.emplace_back(node[i].as<std::string>());
        }
        catch (const YAML::Exception &ex)
        {
            auto child_ctx = ctx;
            child_ctx.emplace_back(index_crumb(i));
            return std::unexpected(Error{ErrorKind::ConfigInvalid, ex.what(), std::move(child_ctx)});
        }
        if (items.back().empty())
        {
            auto child_ctx = ctx;
            child_ctx.emplace_back(index_crumb(i));
            return std::unexpected(Error{ErrorKind::ConfigInvalid, "list entries must not be empty", std::move(child_ctx)});
        }
    }
    return items;
}

/**
 * @brief reads an optional scalar, keeping the default when the key is absent
 */
template <typename T>
[[nodiscard]] auto read_optional(const YAML::Node &parent, const char *key, T &out, std::vector<std::string> ctx)
    -> std::expected<void, Error>
{
    const auto node = parent[key];
    if (!node || node.IsNull())
    {
        return {};
    }
    try
    {
        out = node.as<T>();
    }
    catch (const YAML::Exception &ex)
    {
        ctx.emplace_back(key);
        return std::unexpected(Error{ErrorKind::ConfigInvalid, ex.what(), std::move(ctx)});
    }
    return {};
}

[[nodiscard]] auto parse_server(const YAML::Node &node, ServerSettings &server) -> std::expected<void, Error>
{
    if (!node || !node.IsMap())
    {
        return std::unexpected(Error{ErrorKind::ConfigInvalid, "missing 'server' section", {"server"}});
    }
    try
    {
        server.url     = node["url"].as<std::string>();
        server.org     = node["org"].as<std::string>();
        server.project = node["project"].as<std::string>();
    }
    catch (const YAML::Exception &ex)
    {
        return std::unexpected(Error{ErrorKind::ConfigInvalid, ex.what(), {"server"}});
    }
    if (!server.url.starts_with("http://") && !server.url.starts_with("https://"))
    {
        return std::unexpected(
            Error{ErrorKind::ConfigInvalid, "server.url must start with http:// or https://", {"server", "url"}});
    }
    if (server.org.empty())
    {
        return std::unexpected(Error{ErrorKind::ConfigInvalid, "server.org must not be empty", {"server", "org"}});
    }
    if (server.project.empty())
    {
        return std::unexpected(
            Error{ErrorKind::ConfigInvalid, "server.project must not be empty", {"server", "project"}});
    }
    if (auto r = read_optional(node, "auth_token", server.auth_token, {"server"}); !r)
    {
        return r;
    }
    if (auto r = read_optional(node, "auth_token_env", server.auth_token_env, {"server"}); !r)
    {
        return r;
    }
    std::uint32_t timeout_s = static_cast<std::uint32_t>(server.request_timeout.count());
    if (auto r = read_optional(node, "timeout_s", timeout_s, {"server"}); !r)
    {
        return r;
    }
    if (timeout_s == 0U)
    {
        return std::unexpected(Error{ErrorKind::ConfigInvalid, "server.timeout_s must be >= 1", {"server", "timeout_s"}});
    }
    server.request_timeout = std::chrono::seconds{timeout_s};
    return {};
}

[[nodiscard]] auto parse_filters(const YAML::Node &node, FilterSettings &filters) -> std::expected<void, Error>
{
    if (!node || node.IsNull())
    {
        return {};
    }
    if (!node.IsMap())
    {
        return std::unexpected(Error{ErrorKind::ConfigInvalid, "filters must be a map", {"filters"}});
    }
    auto extensions = node_to_string_vec(node["extensions"], {"filters", "extensions"});
    if (!extensions)
    {
        return std::unexpected(extensions.error());
    }
    for (auto &ext : *extensions)
    {
        if (ext.starts_with('.'))
        {
            ext.erase(0, 1);
        }
    }
    filters.extensions = std::move(*extensions);

    auto globs = node_to_string_vec(node["globs"], {"filters", "globs"});
    if (!globs)
    {
        return std::unexpected(globs.error());
    }
    filters.path_globs = std::move(*globs);

    auto formats = node_to_string_vec(node["formats"], {"filters", "formats"});
    if (!formats)
    {
        return std::unexpected(formats.error());
    }
    for (std::size_t i = 0; i < formats->size(); ++i)
    {
        const auto &fmt = (*formats)[i];
        if (fmt != "elf" && fmt != "macho" && fmt != "breakpad")
        {
            return std::unexpected(Error{ErrorKind::ConfigInvalid, "filters.formats must be subset of {elf,macho,breakpad}",
                                         {"filters", "formats", index_crumb(i)}});
        }
    }
    filters.formats = std::move(*formats);

    auto ids = node_to_string_vec(node["ids"], {"filters", "ids"});
    if (!ids)
    {
        return std::unexpected(ids.error());
    }
    filters.ids = std::move(*ids);

    if (auto r = read_optional(node, "include_archives", filters.include_archives, {"filters"}); !r)
    {
        return r;
    }
    if (auto r = read_optional(node, "max_file_size", filters.max_file_size, {"filters"}); !r)
    {
        return r;
    }
    if (filters.max_file_size == 0U)
    {
        return std::unexpected(
            Error{ErrorKind::ConfigInvalid, "filters.max_file_size must be > 0", {"filters", "max_file_size"}});
    }
    return {};
}

[[nodiscard]] auto parse_collect(const YAML::Node &node, CollectSettings &collect) -> std::expected<void, Error>
{
    if (!node || node.IsNull())
    {
        return {};
    }
    if (!node.IsMap())
    {
        return std::unexpected(Error{ErrorKind::ConfigInvalid, "collect must be a map", {"collect"}});
    }
    std::string dedup = "first_seen";
    if (auto r = read_optional(node, "dedup", dedup, {"collect"}); !r)
    {
        return r;
    }
    if (dedup == "first_seen")
    {
        collect.dedup = DedupPolicy::FirstSeen;
    }
    else if (dedup == "largest")
    {
        collect.dedup = DedupPolicy::Largest;
    }
    else
    {
        return std::unexpected(
            Error{ErrorKind::ConfigInvalid, "collect.dedup must be first_seen or largest", {"collect", "dedup"}});
    }
    return {};
}

[[nodiscard]] auto parse_backoff(const YAML::Node &node, BackoffSettings &backoff) -> std::expected<void, Error>
{
    if (!node || node.IsNull())
    {
        return {};
    }
    if (!node.IsMap())
    {
        return std::unexpected(Error{ErrorKind::ConfigInvalid, "upload.backoff must be a map", {"upload", "backoff"}});
    }
    std::uint32_t initial_ms = static_cast<std::uint32_t>(backoff.initial.count());
    std::uint32_t max_ms     = static_cast<std::uint32_t>(backoff.max.count());
    const std::vector<std::string> ctx{"upload", "backoff"};
    if (auto r = read_optional(node, "initial_ms", initial_ms, ctx); !r)
    {
        return r;
    }
    if (auto r = read_optional(node, "max_ms", max_ms, ctx); !r)
    {
        return r;
    }
    if (auto r = read_optional(node, "multiplier", backoff.multiplier, ctx); !r)
    {
        return r;
    }
    if (auto r = read_optional(node, "jitter", backoff.jitter, ctx); !r)
    {
        return r;
    }
    if (auto r = read_optional(node, "quota_factor", backoff.quota_factor, ctx); !r)
    {
        return r;
    }
    if (max_ms < initial_ms)
    {
        return std::unexpected(
            Error{ErrorKind::ConfigInvalid, "upload.backoff.max_ms must be >= initial_ms", {"upload", "backoff", "max_ms"}});
    }
    if (backoff.multiplier < 1.0)
    {
        return std::unexpected(
            Error{ErrorKind::ConfigInvalid, "upload.backoff.multiplier must be >= 1", {"upload", "backoff", "multiplier"}});
    }
    if (backoff.jitter < 0.0 || backoff.jitter > 1.0)
    {
        return std::unexpected(
            Error{ErrorKind::ConfigInvalid, "upload.backoff.jitter must be [0,1]", {"upload", "backoff", "jitter"}});
    }
    if (backoff.quota_factor < 1.0)
    {
        return std::unexpected(Error{ErrorKind::ConfigInvalid, "upload.backoff.quota_factor must be >= 1",
                                     {"upload", "backoff", "quota_factor"}});
    }
    backoff.initial = std::chrono::milliseconds{initial_ms};
    backoff.max     = std::chrono::milliseconds{max_ms};
    return {};
}

[[nodiscard]] auto parse_upload(const YAML::Node &node, UploadSettings &upload) -> std::expected<void, Error>
{
    if (!node || node.IsNull())
    {
        return {};
    }
    if (!node.IsMap())
    {
        return std::unexpected(Error{ErrorKind::ConfigInvalid, "upload must be a map", {"upload"}});
    }
    if (auto r = read_optional(node, "concurrency", upload.concurrency, {"upload"}); !r)
    {
        return r;
    }
    if (auto r = read_optional(node, "compression", upload.compression, {"upload"}); !r)
    {
        return r;
    }
    if (auto r = read_optional(node, "max_attempts", upload.max_attempts, {"upload"}); !r)
    {
        return r;
    }
    if (upload.concurrency == 0U || upload.concurrency > 64U)
    {
        return std::unexpected(
            Error{ErrorKind::ConfigInvalid, "upload.concurrency must be [1,64]", {"upload", "concurrency"}});
    }
    if (upload.max_attempts == 0U || upload.max_attempts > 20U)
    {
        return std::unexpected(
            Error{ErrorKind::ConfigInvalid, "upload.max_attempts must be [1,20]", {"upload", "max_attempts"}});
    }
    return parse_backoff(node["backoff"], upload.backoff);
}

[[nodiscard]] auto parse_assembly(const YAML::Node &node, AssemblySettings &assembly) -> std::expected<void, Error>
{
    if (!node || node.IsNull())
    {
        return {};
    }
    if (!node.IsMap())
    {
        return std::unexpected(Error{ErrorKind::ConfigInvalid, "assembly must be a map", {"assembly"}});
    }
    std::uint32_t poll_ms    = static_cast<std::uint32_t>(assembly.poll_interval.count());
    std::uint32_t max_wait_s = static_cast<std::uint32_t>(assembly.max_wait.count());
    if (auto r = read_optional(node, "wait", assembly.wait, {"assembly"}); !r)
    {
        return r;
    }
    if (auto r = read_optional(node, "poll_interval_ms", poll_ms, {"assembly"}); !r)
    {
        return r;
    }
    if (auto r = read_optional(node, "max_wait_s", max_wait_s, {"assembly"}); !r)
    {
        return r;
    }
    if (auto r = read_optional(node, "missing_chunk_rounds", assembly.missing_chunk_rounds, {"assembly"}); !r)
    {
        return r;
    }
    if (auto r = read_optional(node, "timeouts_are_failures", assembly.timeouts_are_failures, {"assembly"}); !r)
    {
        return r;
    }
    if (poll_ms == 0U)
    {
        return std::unexpected(
            Error{ErrorKind::ConfigInvalid, "assembly.poll_interval_ms must be >= 1", {"assembly", "poll_interval_ms"}});
    }
    if (assembly.missing_chunk_rounds == 0U || assembly.missing_chunk_rounds > 5U)
    {
        return std::unexpected(Error{ErrorKind::ConfigInvalid, "assembly.missing_chunk_rounds must be [1,5]",
                                     {"assembly", "missing_chunk_rounds"}});
    }
    assembly.poll_interval = std::chrono::milliseconds{poll_ms};
    assembly.max_wait      = std::chrono::seconds{max_wait_s};
    return {};
}

} // namespace

auto load_config_from_file(const std::filesystem::path &path) -> ConfigResult
{
    try
    {
        const auto node = YAML::LoadFile(path.string());
        return parse_config_node(node);
    }
    catch (const YAML::BadFile &ex)
    {
        return make_config_error(std::format("unable to open config file: {}", ex.what()), {path.string()});
    }
    catch (const YAML::Exception &ex)
    {
        return make_config_error(std::format("YAML parse error: {}", ex.what()), {path.string()});
    }
}

auto load_config_from_string(std::string_view yaml_text) -> ConfigResult
{
    try
    {
        const auto node = YAML::Load(std::string{yaml_text});
        return parse_config_node(node);
    }
    catch (const YAML::Exception &ex)
    {
        return make_config_error(std::format("YAML parse error: {}", ex.what()), {});
    }
}

auto parse_config_node(const YAML::Node &root) -> ConfigResult
{
    if (!root || !root.IsMap())
    {
        return make_config_error("config root must be a mapping", {});
    }

    RunConfig cfg{};

    // server
    if (auto r = parse_server(root["server"], cfg.server); !r)
    {
        return std::unexpected(r.error());
    }

    // sources
    const auto sources_node = root["sources"];
    if (!sources_node || !sources_node.IsSequence() || sources_node.size() == 0U)
    {
        return make_config_error("sources must be a non-empty sequence", {"sources"});
    }
    auto sources = node_to_string_vec(sources_node, {"sources"});
    if (!sources)
    {
        return std::unexpected(sources.error());
    }
    cfg.sources.reserve(sources->size());
    for (const auto &source : *sources)
    {
        cfg.sources.emplace_back(source);
    }

    if (auto r = parse_filters(root["filters"], cfg.filters); !r)
    {
        return std::unexpected(r.error());
    }
    if (auto r = parse_collect(root["collect"], cfg.collect); !r)
    {
        return std::unexpected(r.error());
    }
    if (auto r = parse_upload(root["upload"], cfg.upload); !r)
    {
        return std::unexpected(r.error());
    }
    if (auto r = parse_assembly(root["assembly"], cfg.assembly); !r)
    {
        return std::unexpected(r.error());
    }

    // logging
    const auto logging_node = root["logging"];
    if (logging_node && logging_node.IsMap())
    {
        std::string level = "info";
        if (auto r = read_optional(logging_node, "level", level, {"logging"}); !r)
        {
            return std::unexpected(r.error());
        }
        const auto parsed = log::parse_level(level);
        if (!parsed)
        {
            return make_config_error("logging.level must be debug|info|warn|error", {"logging", "level"});
        }
        cfg.logging.level = *parsed;
    }

    return cfg;
}

auto resolve_auth_token(const ServerSettings &server) -> std::string
{
    if (!server.auth_token.empty())
    {
        return server.auth_token;
    }
    if (server.auth_token_env.empty())
    {
        return {};
    }
    const char *value = std::getenv(server.auth_token_env.c_str());
    return value != nullptr ? std::string{value} : std::string{};
}

} // namespace ckw::config
