#include "transcription_manager.hpp"
#include "temp_files.hpp"
#include <iostream>

namespace dictate {

TranscriptionManager::TranscriptionManager(AudioConverter& converter, TranscriptionEngine& engine, TaskQueue& queue)
    : converter_(converter)
    , engine_(engine)
    , queue_(queue) {
}

void TranscriptionManager::transcribe_async(const std::string& audio_path, const std::string& model_path,
                                            Completion completion) {
    queue_.submit([this, audio_path, model_path, completion]() {
        TranscriptionResult result = transcribe(audio_path, model_path);
        if (completion) completion(result);
    });
}

TranscriptionResult TranscriptionManager::transcribe(const std::string& audio_path, const std::string& model_path) {
    ConversionResult converted = converter_.convert_to_16k_mono_pcm(audio_path);
    if (!converted.success) {
        std::cerr << "[transcription] Conversion failed: " << error_name(converted.error) << std::endl;
        TranscriptionResult result;
        result.error = converted.error;
        return result;
    }

    TranscriptionResult result = engine_.transcribe(converted.path, model_path);
    remove_file(converted.path, "transcription");

    if (result.success) {
        std::cout << "[transcription] Transcript: " << result.text.size() << " chars" << std::endl;
    } else {
        std::cerr << "[transcription] Failed: " << error_name(result.error) << std::endl;
        if (!result.diagnostic.empty()) {
            std::cerr << result.diagnostic << std::endl;
        }
    }
    return result;
}

} // namespace dictate
