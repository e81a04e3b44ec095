/**
 * @file artifact.hpp
 * @brief the Artifact record and its per-artifact assembly state machine uwu
 *
 * an Artifact is born in the collector, gets chunked, is read (never mutated)
 * while its chunks fly to the server, and is finalized into the upload report
 * once assembly resolves. ownership moves stage to stage, nothing here is
 * shared between threads while being written.
 *
 * AssemblyState is monotonic: once Complete or Error, every further
 * transition request is refused. MissingChunks is the only state allowed to
 * loop back to Requested (after a re-upload).
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ckw/common/checksum.hpp"
#include "ckw/common/error.hpp"

namespace ckw
{

/**
 * @brief dense per-run identity assigned by the collector (index order)
 */
using ArtifactId = std::size_t;

/**
 * @brief tagged result of format introspection
 */
struct FormatInfo
{
    std::string              format;      ///< format tag, e.g. "elf", "macho", "breakpad"
    std::vector<std::string> identifiers; ///< stable identifiers, first one is the primary
};

/**
 * @brief coarse lifecycle marker, informational only
 */
enum class ArtifactStage : std::uint8_t
{
    Discovered,
    Chunked,
    Uploading,
    Assembling,
    Finalized
};

/**
 * @brief re-reads the artifact's bytes from its source (file or archive entry)
 *
 * ⚠️ IMPURE (hits the file system every call)
 */
using ArtifactReloader = std::function<std::expected<std::vector<std::byte>, Error>()>;

/**
 * @brief one uploadable artifact plus everything the pipeline learns about it
 */
struct Artifact
{
    ArtifactId                                   id{0U};
    std::string                                  name;    ///< display name (path or archive!entry)
    std::filesystem::path                        source;  ///< file or archive on disk
    std::string                                  archive_entry; ///< entry name when source is an archive
    std::uint64_t                                size{0U};
    FormatInfo                                   format;
    std::shared_ptr<const std::vector<std::byte>> bytes;  ///< content shared with chunk views
    ArtifactReloader                             reload;  ///< one re-read when verification fails
    Checksum                                     checksum{}; ///< whole-content checksum (set by chunker)
    std::vector<Checksum>                        chunks;  ///< ordered chunk checksums (set by chunker)
    std::vector<std::string>                     aliases; ///< other paths collapsed into this one
    ArtifactStage                                stage{ArtifactStage::Discovered};
};

/**
 * @brief per-artifact assembly phases
 */
enum class AssemblyPhase : std::uint8_t
{
    Requested,
    InProgress,
    MissingChunks,
    Complete,
    Pending, ///< accepted and still processing when the run stopped watching
    Error
};

[[nodiscard]] auto to_string(AssemblyPhase phase) noexcept -> std::string_view;

/**
 * @brief phase plus its payload (missing checksums or failure reason)
 */
struct AssemblyState
{
    AssemblyPhase         phase{AssemblyPhase::Requested};
    std::vector<Checksum> missing; ///< populated only in MissingChunks
    std::optional<Error>  error;   ///< populated only in Error

    [[nodiscard]] auto is_terminal() const noexcept -> bool
    {
        return phase == AssemblyPhase::Complete || phase == AssemblyPhase::Pending || phase == AssemblyPhase::Error;
    }

    [[nodiscard]] auto is_timeout() const noexcept -> bool
    {
        return phase == AssemblyPhase::Error && error && error->kind == ErrorKind::AssemblyTimeout;
    }

    [[nodiscard]] static auto requested() -> AssemblyState;
    [[nodiscard]] static auto in_progress() -> AssemblyState;
    [[nodiscard]] static auto missing_chunks(std::vector<Checksum> checksums) -> AssemblyState;
    [[nodiscard]] static auto complete() -> AssemblyState;
    [[nodiscard]] static auto pending() -> AssemblyState;
    [[nodiscard]] static auto failed(Error reason) -> AssemblyState;
};

/**
 * @brief applies a transition while honoring monotonicity
 *
 * ✨ PURE FUNCTION ✨
 *
 * terminal states never change. MissingChunks -> Requested is the loop-back
 * edge used after a re-upload. every other target is accepted from the
 * non-terminal phases.
 *
 * @param[in,out] current state to advance
 * @param[in] next requested successor
 * @return true when the transition was applied
 */
auto transition(AssemblyState &current, AssemblyState next) -> bool;

} // namespace ckw
