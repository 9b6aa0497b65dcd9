/**
 * @file TranscriptionJob.cpp
 * @brief Implementation of TranscriptionJob.
 */

#include "application/TranscriptionJob.hpp"
#include "domain/PipelineErrors.hpp"
#include <iostream>

namespace streamscribe::application {

TranscriptionJob::TranscriptionJob(std::shared_ptr<domain::ModelProvider> provider,
                                   ResultBuffer& buffer,
                                   FailureLedger& failures,
                                   const infrastructure::FragmentStore& store)
    : m_provider(std::move(provider)), m_buffer(buffer), m_failures(failures), m_store(store) {}

JobOutcome TranscriptionJob::run(domain::Fragment& fragment) const {
    fragment.status = domain::FragmentStatus::InProgress;

    std::string text;
    try {
        std::string audio = m_store.readAudio(fragment.path);
        std::cout << "[TranscriptionJob] Transcribing " << fragment.filename << " (seq=" << fragment.sequence
                  << ", " << audio.size() << " bytes)" << std::endl;

        auto transcriber = m_provider->acquire();
        if (!transcriber) {
            throw domain::ModelUnavailable("model provider returned no transcriber");
        }
        text = transcriber->transcribe(audio, fragment.filename);
    } catch (const domain::ModelUnavailable& e) {
        return fail(fragment, std::string("model unavailable: ") + e.what());
    } catch (const domain::TranscriptionError& e) {
        return fail(fragment, std::string("transcription error: ") + e.what());
    } catch (const std::exception& e) {
        return fail(fragment, std::string("unexpected error: ") + e.what());
    }

    try {
        m_buffer.insert(fragment.sequence, text);
    } catch (const domain::DuplicateSequence& e) {
        std::cerr << "[TranscriptionJob] " << e.what() << " (" << fragment.filename
                  << "), keeping the first result" << std::endl;
        return fail(fragment, "duplicate sequence", true);
    }

    JobOutcome outcome;
    outcome.sequence = fragment.sequence;
    outcome.textLength = text.size();
    fragment.status = domain::FragmentStatus::Succeeded;
    outcome.status = fragment.status;

    try {
        outcome.finalPath = m_store.moveToProcessed(fragment.path);
    } catch (const std::exception& e) {
        // The text is already buffered; the file stays where it is.
        std::cerr << "[TranscriptionJob] Could not move " << fragment.filename << " to processed: " << e.what() << std::endl;
        outcome.finalPath = fragment.path;
    }

    std::cout << "[TranscriptionJob] Transcribed seq=" << fragment.sequence << " len=" << text.size() << std::endl;
    return outcome;
}

JobOutcome TranscriptionJob::fail(domain::Fragment& fragment, const std::string& reason, bool duplicate) const {
    fragment.status = domain::FragmentStatus::Failed;

    JobOutcome outcome;
    outcome.sequence = fragment.sequence;
    outcome.status = fragment.status;
    outcome.error = reason;
    outcome.finalPath = fragment.path;

    std::cerr << "[TranscriptionJob] Failed seq=" << fragment.sequence << " (" << fragment.filename << "): " << reason << std::endl;

    try {
        outcome.finalPath = m_store.moveToFailed(fragment.path);
        std::cerr << "[TranscriptionJob] Moved to failed: " << outcome.finalPath << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[TranscriptionJob] Could not move " << fragment.filename << " to failed: " << e.what() << std::endl;
    }

    if (duplicate) {
        m_failures.recordDuplicate(fragment.sequence, fragment.filename);
    } else {
        m_failures.record(fragment.sequence, fragment.filename, reason);
    }
    return outcome;
}

} // namespace streamscribe::application
