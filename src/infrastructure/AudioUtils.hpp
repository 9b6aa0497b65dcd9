#pragma once

#include <string>
#include <vector>

namespace streamscribe::infrastructure {

/**
 * @brief Utilities for audio processing.
 */
class AudioUtils {
public:
    /**
     * @brief Executes a system command.
     */
    static int ExecCmd(const std::string& cmd);

    /** @brief True if @p bytes start with a RIFF/WAVE header. */
    static bool IsWavData(const std::string& bytes);

    /**
     * @brief Converts in-memory audio of any ffmpeg-readable format to 16kHz mono WAV.
     * @param inputBytes Source file content.
     * @param sourceName Original file name, only used in error messages.
     * @param wavBytes Populated with the converted WAV file.
     * @param error Populated on failure.
     * @return True if successful.
     */
    static bool ConvertAudioToWav(const std::string& inputBytes, const std::string& sourceName,
                                  std::string& wavBytes, std::string& error);

    /**
     * @brief Decodes a WAV file held in memory to 16kHz float32 mono (Whisper format).
     * @param wavBytes WAV file content.
     * @param pcmf32 Resulting vector of samples.
     * @param error Populated on failure.
     * @return True if successful.
     */
    static bool DecodeWavSDL(const std::string& wavBytes, std::vector<float>& pcmf32, std::string& error);
};

} // namespace streamscribe::infrastructure
