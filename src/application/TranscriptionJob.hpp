/**
 * @file TranscriptionJob.hpp
 * @brief End-to-end processing of a single fragment.
 */

#pragma once
#include "application/FailureLedger.hpp"
#include "application/ResultBuffer.hpp"
#include "domain/Fragment.hpp"
#include "domain/TranscriptionService.hpp"
#include "infrastructure/FragmentStore.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace streamscribe::application {

/**
 * @struct JobOutcome
 * @brief What happened to one fragment.
 */
struct JobOutcome {
    std::int64_t sequence = -1;
    domain::FragmentStatus status = domain::FragmentStatus::Pending;
    size_t textLength = 0;
    std::string finalPath; ///< Where the audio file ended up.
    std::string error;     ///< Failure reason, empty on success.

    bool succeeded() const { return status == domain::FragmentStatus::Succeeded; }
};

/**
 * @class TranscriptionJob
 * @brief Reads a fragment, transcribes it and routes the result.
 *
 * One instance is shared by all workers; it holds no per-fragment state.
 * Success inserts the text into the buffer and moves the audio to the
 * processed directory. Any failure moves the audio to the failed directory
 * and records it in the ledger, leaving a gap in the sequence. Nothing is
 * retried here.
 */
class TranscriptionJob {
public:
    TranscriptionJob(std::shared_ptr<domain::ModelProvider> provider,
                     ResultBuffer& buffer,
                     FailureLedger& failures,
                     const infrastructure::FragmentStore& store);

    JobOutcome run(domain::Fragment& fragment) const;

private:
    JobOutcome fail(domain::Fragment& fragment, const std::string& reason, bool duplicate = false) const;

    std::shared_ptr<domain::ModelProvider> m_provider;
    ResultBuffer& m_buffer;
    FailureLedger& m_failures;
    const infrastructure::FragmentStore& m_store;
};

} // namespace streamscribe::application
