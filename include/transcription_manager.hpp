#pragma once

#include "audio_converter.hpp"
#include "transcriber.hpp"
#include "dispatcher.hpp"

#include <functional>
#include <string>

namespace dictate {

// Converts a recording and transcribes it on the background queue
class TranscriptionManager {
public:
    using Completion = std::function<void(const TranscriptionResult&)>;

    TranscriptionManager(AudioConverter& converter, TranscriptionEngine& engine, TaskQueue& queue);

    // `completion` runs on the queue's worker thread. The input recording
    // is left in place; the converted copy is removed when done.
    void transcribe_async(const std::string& audio_path, const std::string& model_path, Completion completion);

    TranscriptionResult transcribe(const std::string& audio_path, const std::string& model_path);

private:
    AudioConverter& converter_;
    TranscriptionEngine& engine_;
    TaskQueue& queue_;
};

} // namespace dictate
