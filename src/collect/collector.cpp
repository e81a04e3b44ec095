/**
 * @file collector.cpp
 * @brief deterministic source walk, archive descent, filtering and dedup
 */
#include "ckw/collect/collector.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>

#include "ckw/collect/zip_archive.hpp"
#include "ckw/common/log.hpp"

namespace ckw::collect
{
namespace
{

namespace fs = std::filesystem;

constexpr std::string_view kComponent = "collect";

[[nodiscard]] auto lowercase(std::string_view text) -> std::string
{
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

[[nodiscard]] auto read_file(const fs::path &path) -> std::expected<std::vector<std::byte>, Error>
{
    std::ifstream stream{path, std::ios::binary | std::ios::ate};
    if (!stream)
    {
        return std::unexpected(make_error(ErrorKind::IoError, "failed to open file", {path.string()}));
    }
    const auto size = stream.tellg();
    if (size < 0)
    {
        return std::unexpected(make_error(ErrorKind::IoError, "failed to size file", {path.string()}));
    }
    std::vector<std::byte> buffer(static_cast<std::size_t>(size));
    stream.seekg(0);
    stream.read(reinterpret_cast<char *>(buffer.data()), size);
    if (stream.gcount() != size)
    {
        return std::unexpected(make_error(ErrorKind::IoError, "short read", {path.string()}));
    }
    return buffer;
}

[[nodiscard]] auto has_zip_signature(const fs::path &path) -> bool
{
    std::ifstream          stream{path, std::ios::binary};
    std::array<std::byte, 4> head{};
    stream.read(reinterpret_cast<char *>(head.data()), static_cast<std::streamsize>(head.size()));
    return stream.gcount() == static_cast<std::streamsize>(head.size()) && ZipArchive::looks_like_zip(head);
}

/**
 * @brief mutable walk state shared by every candidate of one collection
 */
class Collection
{
public:
    Collection(const config::FilterSettings &filters, config::DedupPolicy policy, const Introspector &introspector)
        : filters_{filters}, policy_{policy}, introspector_{introspector}
    {
    }

    void walk(const fs::path &root)
    {
        std::error_code ec;
        const auto      status = fs::status(root, ec);
        if (ec || !fs::exists(status))
        {
            diagnose(root.string(), make_error(ErrorKind::IoError, "source does not exist"));
            return;
        }

        if (fs::is_regular_file(status))
        {
            // a root archive is always opened, the user pointed straight at it
            if (is_archive(root, true))
            {
                walk_archive(root, root.filename().string());
                return;
            }
            visit_file(root, root.filename().generic_string());
            return;
        }

        if (!fs::is_directory(status))
        {
            diagnose(root.string(), make_error(ErrorKind::IoError, "source is neither a file nor a directory"));
            return;
        }

        std::vector<fs::path> files;
        fs::recursive_directory_iterator iter{root, fs::directory_options::skip_permission_denied, ec};
        if (ec)
        {
            diagnose(root.string(),
                     make_error(ErrorKind::IoError, std::format("cannot list directory: {}", ec.message())));
            return;
        }
        const fs::recursive_directory_iterator end;
        while (iter != end)
        {
            std::error_code file_ec;
            if (iter->is_regular_file(file_ec))
            {
                files.push_back(iter->path());
            }
            iter.increment(ec);
            if (ec)
            {
                diagnose(root.string(),
                         make_error(ErrorKind::IoError, std::format("directory walk failed: {}", ec.message())));
                break;
            }
        }
        std::sort(files.begin(), files.end());

        for (const auto &file : files)
        {
            const auto relative = file.lexically_relative(root).generic_string();
            if (filters_.include_archives && is_archive(file, false))
            {
                walk_archive(file, relative);
                continue;
            }
            visit_file(file, relative);
        }
    }

    [[nodiscard]] auto finish() && -> CollectionResult
    {
        for (std::size_t i = 0; i < result_.artifacts.size(); ++i)
        {
            result_.artifacts[i].id = i;
        }
        return std::move(result_);
    }

private:
    [[nodiscard]] auto is_archive(const fs::path &path, bool root) const -> bool
    {
        if (lowercase(path.extension().string()) == ".zip")
        {
            return true;
        }
        return (root || filters_.include_archives) && has_zip_signature(path);
    }

    void diagnose(std::string location, Error error)
    {
        log::warn(kComponent, std::format("skipping {}: {}", location, describe(error)));
        result_.diagnostics.push_back(CollectDiagnostic{std::move(location), std::move(error)});
    }

    void visit_file(const fs::path &path, const std::string &relative)
    {
        ++result_.candidates_seen;
        if (!passes_path_filters(relative, filters_))
        {
            ++result_.unrecognized;
            return;
        }

        std::error_code ec;
        const auto      size = fs::file_size(path, ec);
        if (ec)
        {
            diagnose(path.string(), make_error(ErrorKind::IoError, std::format("cannot stat file: {}", ec.message())));
            return;
        }
        if (size > filters_.max_file_size)
        {
            diagnose(path.string(), make_error(ErrorKind::ArtifactTooLarge,
                                               std::format("{} bytes exceeds max_file_size {}", size,
                                                           filters_.max_file_size)));
            return;
        }

        auto bytes = read_file(path);
        if (!bytes)
        {
            diagnose(path.string(), bytes.error());
            return;
        }

        ArtifactReloader reload = [path]() { return read_file(path); };
        consider(path.string(), path, {}, std::move(*bytes), std::move(reload));
    }

    void walk_archive(const fs::path &path, const std::string &relative)
    {
        auto archive = ZipArchive::open(path);
        if (!archive)
        {
            diagnose(path.string(), archive.error());
            return;
        }

        log::debug(kComponent,
                   std::format("descending into {} ({} entries)", relative, archive->entries().size()));
        for (const auto &entry : archive->entries())
        {
            if (entry.is_directory())
            {
                continue;
            }
            ++result_.candidates_seen;
            const auto location = std::format("{}!{}", path.string(), entry.name);
            if (!passes_path_filters(entry.name, filters_))
            {
                ++result_.unrecognized;
                continue;
            }
            if (entry.uncompressed_size > filters_.max_file_size)
            {
                diagnose(location, make_error(ErrorKind::ArtifactTooLarge,
                                              std::format("{} bytes exceeds max_file_size {}",
                                                          entry.uncompressed_size, filters_.max_file_size)));
                continue;
            }

            auto bytes = archive->read(entry);
            if (!bytes)
            {
                diagnose(location, bytes.error());
                continue;
            }

            ArtifactReloader reload = [path, name = entry.name]() -> std::expected<std::vector<std::byte>, Error>
            {
                auto reopened = ZipArchive::open(path);
                if (!reopened)
                {
                    return std::unexpected(reopened.error());
                }
                return reopened->read(name);
            };
            consider(location, path, entry.name, std::move(*bytes), std::move(reload));
        }
    }

    [[nodiscard]] auto passes_identity_filters(const FormatInfo &info) const -> bool
    {
        if (!filters_.formats.empty() &&
            std::find(filters_.formats.begin(), filters_.formats.end(), info.format) == filters_.formats.end())
        {
            return false;
        }
        if (filters_.ids.empty())
        {
            return true;
        }
        return std::any_of(info.identifiers.begin(), info.identifiers.end(),
                           [&](const std::string &id)
                           {
                               const auto wanted = lowercase(id);
                               return std::any_of(filters_.ids.begin(), filters_.ids.end(),
                                                  [&](const std::string &allowed)
                                                  { return lowercase(allowed) == wanted; });
                           });
    }

    void consider(std::string name, const fs::path &source, std::string entry, std::vector<std::byte> bytes,
                  ArtifactReloader reload)
    {
        auto info = introspector_(bytes, name);
        if (!info || !passes_identity_filters(*info))
        {
            ++result_.unrecognized;
            return;
        }

        Artifact artifact;
        artifact.name          = std::move(name);
        artifact.source        = source;
        artifact.archive_entry = std::move(entry);
        artifact.size          = bytes.size();
        artifact.format        = std::move(*info);
        artifact.bytes         = std::make_shared<const std::vector<std::byte>>(std::move(bytes));
        artifact.reload        = std::move(reload);

        std::optional<std::size_t> existing;
        for (const auto &id : artifact.format.identifiers)
        {
            const auto found = claimed_.find(lowercase(id));
            if (found != claimed_.end())
            {
                existing = found->second;
                break;
            }
        }

        if (!existing)
        {
            const auto index = result_.artifacts.size();
            claim(artifact.format, index);
            log::debug(kComponent, std::format("found {} artifact {}", artifact.format.format, artifact.name));
            result_.artifacts.push_back(std::move(artifact));
            return;
        }

        ++result_.duplicates;
        auto &kept = result_.artifacts[*existing];
        if (policy_ == config::DedupPolicy::Largest && artifact.size > kept.size)
        {
            log::debug(kComponent, std::format("{} replaces smaller duplicate {}", artifact.name, kept.name));
            artifact.aliases = std::move(kept.aliases);
            artifact.aliases.push_back(kept.name);
            claim(artifact.format, *existing);
            kept = std::move(artifact);
            return;
        }
        log::debug(kComponent, std::format("{} collapsed into {}", artifact.name, kept.name));
        kept.aliases.push_back(artifact.name);
        claim(artifact.format, *existing);
    }

    void claim(const FormatInfo &info, std::size_t index)
    {
        for (const auto &id : info.identifiers)
        {
            claimed_.emplace(lowercase(id), index);
        }
    }

    const config::FilterSettings                &filters_;
    config::DedupPolicy                          policy_{config::DedupPolicy::FirstSeen};
    const Introspector                          &introspector_;
    CollectionResult                             result_{};
    std::unordered_map<std::string, std::size_t> claimed_{};
};

} // namespace

auto passes_path_filters(const std::string &relative, const config::FilterSettings &filters) -> bool
{
    const fs::path path{relative};
    if (!filters.extensions.empty())
    {
        auto extension = lowercase(path.extension().string());
        if (!extension.empty())
        {
            extension.erase(0, 1);
        }
        const bool allowed = std::any_of(filters.extensions.begin(), filters.extensions.end(),
                                         [&](const std::string &ext) { return lowercase(ext) == extension; });
        if (!allowed)
        {
            return false;
        }
    }
    if (!filters.path_globs.empty())
    {
        const auto file_name = path.filename().string();
        const bool matched   = std::any_of(filters.path_globs.begin(), filters.path_globs.end(),
                                           [&](const std::string &glob)
                                           {
                                             return ::fnmatch(glob.c_str(), relative.c_str(), 0) == 0 ||
                                                    ::fnmatch(glob.c_str(), file_name.c_str(), 0) == 0;
                                         });
        if (!matched)
        {
            return false;
        }
    }
    return true;
}

auto collect_artifacts(const std::vector<std::filesystem::path> &sources, const config::FilterSettings &filters,
                       config::DedupPolicy policy, const Introspector &introspector) -> CollectionResult
{
    Collection collection{filters, policy, introspector};
    for (const auto &source : sources)
    {
        collection.walk(source);
    }
    auto result = std::move(collection).finish();
    log::info(kComponent, std::format("collected {} artifact(s) from {} candidate(s), {} duplicate(s) collapsed",
                                      result.artifacts.size(), result.candidates_seen, result.duplicates));
    return result;
}

} // namespace ckw::collect
