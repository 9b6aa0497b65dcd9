/**
 * @file MergeCoordinator.hpp
 * @brief Turns contiguous runs of buffered results into archived transcript files.
 */

#pragma once
#include "application/ResultBuffer.hpp"
#include "domain/TranscriptionResult.hpp"
#include "infrastructure/DiskSpaceProbe.hpp"
#include "infrastructure/TranscriptWriter.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace streamscribe::application {

/**
 * @enum MergeState
 * @brief Phase of the coordinator within a tick.
 */
enum class MergeState {
    Idle,
    Scanning,
    Merging
};

/**
 * @struct MergeOptions
 * @brief Where transcripts go and where the cursor starts.
 */
struct MergeOptions {
    std::string archiveDir = "archive";
    std::int64_t firstSequence = 0;
    std::uintmax_t diskThresholdBytes = 0; ///< Zero disables the disk check.
};

/**
 * @class MergeCoordinator
 * @brief Owns the merge cursor and the list of archived transcripts.
 *
 * Each tick drains the gap-free run that starts at the cursor, joins the
 * non-blank texts with '\n' in sequence order and writes them as
 * full_<start>_to_<end>.txt. A missing sequence stalls everything after it
 * until it arrives or an operator calls skipGap(). Ticks are serialized, so
 * the cursor never moves backwards and archived ranges never overlap.
 */
class MergeCoordinator {
public:
    MergeCoordinator(ResultBuffer& buffer,
                     std::shared_ptr<infrastructure::DiskSpaceProbe> diskProbe,
                     MergeOptions options);

    /**
     * @brief Runs one Idle -> Scanning -> Merging -> Idle cycle.
     * @return The transcript written, or nullopt when nothing was mergeable.
     * @throws domain::DiskLowError if the archive volume is low on space. The
     *         drained run is put back and the cursor is unchanged.
     * @throws domain::PipelineError if the transcript file cannot be written;
     *         the run is put back as well.
     */
    std::optional<domain::ArchivedTranscript> tick();

    /**
     * @brief Merges repeatedly until a tick yields nothing.
     * @return Number of transcripts written.
     */
    size_t drainAll();

    /**
     * @brief Operator escape hatch for a permanent gap.
     *
     * Advances the cursor by one when the cursor sequence is not buffered.
     * @return True if the cursor moved.
     */
    bool skipGap();

    std::int64_t cursor() const;
    MergeState state() const { return m_state.load(); }
    std::vector<domain::ArchivedTranscript> archives() const;

    /** @brief Total fragments contained in all archived transcripts. */
    size_t archivedFragmentCount() const;

    static std::string ArchiveFileName(std::int64_t start, std::int64_t end);
    static std::string JoinTexts(const std::vector<domain::TranscriptionResult>& results);
    static const char* StateToString(MergeState state);

private:
    ResultBuffer& m_buffer;
    std::shared_ptr<infrastructure::DiskSpaceProbe> m_diskProbe;
    infrastructure::TranscriptWriter m_writer;
    MergeOptions m_options;

    mutable std::mutex m_mutex; ///< Serializes ticks and guards cursor/archives.
    std::int64_t m_cursor;
    std::vector<domain::ArchivedTranscript> m_archives;
    size_t m_archivedFragments = 0;
    std::atomic<MergeState> m_state{MergeState::Idle};
};

} // namespace streamscribe::application
