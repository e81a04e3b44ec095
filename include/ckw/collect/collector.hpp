/**
 * @file collector.hpp
 * @brief walks sources, recognizes artifacts, and collapses duplicates
 *
 * collection is the only stage allowed to touch arbitrary user paths, so it is
 * also the only stage that is forgiving: unreadable files, corrupt archives
 * and oversized candidates become diagnostics (logged as warnings) and the
 * walk keeps going. the result is a deduplicated, deterministically ordered
 * list of artifacts, each with its bytes loaded and a reloader attached.
 *
 * dedup: candidates sharing any identifier collapse to one artifact chosen by
 * the DedupPolicy. directory entries are visited sorted by path and archive
 * entries in central-directory order, so FirstSeen is reproducible.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "ckw/collect/artifact.hpp"
#include "ckw/collect/introspect.hpp"
#include "ckw/common/error.hpp"
#include "ckw/config/config.hpp"

namespace ckw::collect
{

/**
 * @brief one non-fatal problem met while walking
 */
struct CollectDiagnostic
{
    std::string location; ///< path or archive!entry
    Error       error;
};

struct CollectionResult
{
    std::vector<Artifact>          artifacts;           ///< ids are dense, 0..n-1
    std::vector<CollectDiagnostic> diagnostics;
    std::size_t                    candidates_seen{0U}; ///< files and entries considered
    std::size_t                    unrecognized{0U};    ///< rejected by the introspector or filters
    std::size_t                    duplicates{0U};      ///< candidates collapsed into another
};

/**
 * @brief collects artifacts from files, directories and zip archives
 *
 * ⚠️ IMPURE FUNCTION (reads the file system, logs)
 *
 * @param[in] sources roots to walk (files or directories)
 * @param[in] filters discovery filters
 * @param[in] policy dedup policy
 * @param[in] introspector format recognizer
 * @return the collected artifacts plus every diagnostic met on the way
 */
[[nodiscard]] auto collect_artifacts(const std::vector<std::filesystem::path> &sources,
                                     const config::FilterSettings &filters, config::DedupPolicy policy,
                                     const Introspector &introspector) -> CollectionResult;

/**
 * @brief true when `relative` passes the extension and glob allow-lists
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto passes_path_filters(const std::string &relative, const config::FilterSettings &filters) -> bool;

} // namespace ckw::collect
