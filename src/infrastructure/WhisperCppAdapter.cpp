/**
 * @file WhisperCppAdapter.cpp
 * @brief Implementation of the WhisperCppAdapter class.
 */
#include "infrastructure/WhisperCppAdapter.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/AudioUtils.hpp"
#include "whisper.h"

#include <filesystem>
#include <iostream>
#include <thread>
#include <vector>

namespace streamscribe::infrastructure {

WhisperCppAdapter::WhisperCppAdapter(const std::string& modelPath, const std::string& language, int threads)
    : m_modelPath(modelPath)
    , m_language(language.empty() ? "auto" : language)
    , m_threads(threads)
{
    // Model is loaded on first use, so a bad path only fails the jobs that need it.
}

WhisperCppAdapter::~WhisperCppAdapter() {
    if (m_ctx) {
        whisper_free(m_ctx);
    }
}

bool WhisperCppAdapter::loadModel(std::string& errorMsg) {
    if (m_modelLoaded) return true;

    if (!std::filesystem::exists(m_modelPath)) {
        errorMsg = "Model file not found at: " + m_modelPath + ". Download a ggml model (e.g. ggml-base.bin).";
        return false;
    }

    struct whisper_context_params cparams = whisper_context_default_params();
    m_ctx = whisper_init_from_file_with_params(m_modelPath.c_str(), cparams);

    if (!m_ctx) {
        errorMsg = "Failed to initialize whisper context from " + m_modelPath;
        return false;
    }

    std::cout << "[WhisperCppAdapter] Loaded model " << m_modelPath << std::endl;
    m_modelLoaded = true;
    return true;
}

std::string WhisperCppAdapter::transcribe(const std::string& audioBytes, const std::string& sourceName) {
    std::string error;

    // Pre-process if needed
    std::string wavBytes;
    const std::string* wav = &audioBytes;
    if (!AudioUtils::IsWavData(audioBytes)) {
        if (!AudioUtils::ConvertAudioToWav(audioBytes, sourceName, wavBytes, error)) {
            throw domain::TranscriptionError(error);
        }
        wav = &wavBytes;
    }

    std::vector<float> pcmf32;
    if (!AudioUtils::DecodeWavSDL(*wav, pcmf32, error)) {
        throw domain::TranscriptionError("Error loading audio " + sourceName + ": " + error);
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    if (!loadModel(error)) {
        throw domain::ModelUnavailable(error);
    }

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_progress = false;
    wparams.print_special = false;
    wparams.print_realtime = false;
    wparams.print_timestamps = false;
    wparams.language = m_language.c_str();
    wparams.n_threads = m_threads > 0 ? m_threads : static_cast<int>(std::thread::hardware_concurrency());

    if (whisper_full(m_ctx, wparams, pcmf32.data(), static_cast<int>(pcmf32.size())) != 0) {
        throw domain::TranscriptionError("Whisper inference failed on " + sourceName);
    }

    std::string result;
    const int n_segments = whisper_full_n_segments(m_ctx);
    for (int i = 0; i < n_segments; ++i) {
        const char* text = whisper_full_get_segment_text(m_ctx, i);
        result += text;
    }

    // Segments carry a leading space
    size_t first = result.find_first_not_of(' ');
    return first == std::string::npos ? std::string() : result.substr(first);
}

} // namespace streamscribe::infrastructure
