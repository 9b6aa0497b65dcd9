#include "infrastructure/AudioUtils.hpp"
#include <SDL.h>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace streamscribe::infrastructure {

namespace {

// Built only from the thread id and a counter: the path ends up in a shell command.
std::filesystem::path UniqueTempPath(const std::string& ext) {
    static std::atomic<unsigned long> counter{0};
    std::ostringstream name;
    name << "streamscribe_" << std::this_thread::get_id() << "_" << counter++ << ext;
    return std::filesystem::temp_directory_path() / name.str();
}

// Removes the temp files however the conversion ends.
struct TempFiles {
    std::vector<std::filesystem::path> paths;
    ~TempFiles() {
        for (const auto& p : paths) {
            std::error_code ec;
            std::filesystem::remove(p, ec);
        }
    }
};

} // namespace

int AudioUtils::ExecCmd(const std::string& cmd) {
    return std::system(cmd.c_str());
}

bool AudioUtils::IsWavData(const std::string& bytes) {
    return bytes.size() >= 12 && bytes.compare(0, 4, "RIFF") == 0 && bytes.compare(8, 4, "WAVE") == 0;
}

bool AudioUtils::ConvertAudioToWav(const std::string& inputBytes, const std::string& sourceName,
                                   std::string& wavBytes, std::string& error) {
    namespace fs = std::filesystem;
    TempFiles temps;
    // ffmpeg probes the container from the content, not the extension.
    const fs::path inputPath = UniqueTempPath(".in");
    const fs::path outputPath = UniqueTempPath(".wav");
    temps.paths = {inputPath, outputPath};

    {
        std::ofstream out(inputPath, std::ios::binary);
        out.write(inputBytes.data(), static_cast<std::streamsize>(inputBytes.size()));
        if (!out) {
            error = "Failed to write temp input: " + inputPath.string();
            return false;
        }
    }

    std::string cmd = "ffmpeg -y -loglevel error -i \"" + inputPath.string() + "\" -ar 16000 -ac 1 -c:a pcm_s16le \"" + outputPath.string() + "\"";

    int ret = ExecCmd(cmd);
    if (ret != 0) {
        error = "ffmpeg conversion of " + sourceName + " failed (exit " + std::to_string(ret) + "). Is ffmpeg installed?";
        return false;
    }

    std::ifstream in(outputPath, std::ios::binary);
    if (!in.is_open()) {
        error = "Converted file not found: " + outputPath.string();
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    wavBytes = buffer.str();
    return true;
}

bool AudioUtils::DecodeWavSDL(const std::string& wavBytes, std::vector<float>& pcmf32, std::string& error) {
    SDL_AudioSpec wavSpec;
    Uint32 wavLength;
    Uint8 *wavBuffer;

    SDL_RWops* rw = SDL_RWFromConstMem(wavBytes.data(), static_cast<int>(wavBytes.size()));
    if (rw == NULL) {
        error = "SDL_RWFromConstMem failed: " + std::string(SDL_GetError());
        return false;
    }

    // freesrc=1: SDL closes the RWops
    if (SDL_LoadWAV_RW(rw, 1, &wavSpec, &wavBuffer, &wavLength) == NULL) {
        error = "SDL_LoadWAV failed: " + std::string(SDL_GetError());
        return false;
    }

    SDL_AudioSpec targetSpec;
    SDL_zero(targetSpec);
    targetSpec.freq = 16000;
    targetSpec.format = AUDIO_F32SYS;
    targetSpec.channels = 1;

    SDL_AudioCVT cvt;
    if (SDL_BuildAudioCVT(&cvt, wavSpec.format, wavSpec.channels, wavSpec.freq,
                          targetSpec.format, targetSpec.channels, targetSpec.freq) < 0) {
        error = "SDL_BuildAudioCVT failed: " + std::string(SDL_GetError());
        SDL_FreeWAV(wavBuffer);
        return false;
    }

    cvt.len = wavLength;
    cvt.buf = (Uint8 *)SDL_malloc(cvt.len * cvt.len_mult);
    if (cvt.buf == NULL) {
        error = "Out of memory converting " + std::to_string(wavLength) + " bytes of audio";
        SDL_FreeWAV(wavBuffer);
        return false;
    }
    SDL_memcpy(cvt.buf, wavBuffer, wavLength);

    if (SDL_ConvertAudio(&cvt) < 0) {
        error = "SDL_ConvertAudio failed: " + std::string(SDL_GetError());
        SDL_free(cvt.buf);
        SDL_FreeWAV(wavBuffer);
        return false;
    }

    int sampleCount = cvt.len_cvt / sizeof(float);
    pcmf32.resize(sampleCount);
    SDL_memcpy(pcmf32.data(), cvt.buf, cvt.len_cvt);

    SDL_free(cvt.buf);
    SDL_FreeWAV(wavBuffer);

    return true;
}

} // namespace streamscribe::infrastructure
