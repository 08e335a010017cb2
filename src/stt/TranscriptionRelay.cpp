/**
 * TranscriptionRelay.cpp - Transcript cleanup
 */

#include "aegis/stt/TranscriptionRelay.hpp"

#include <cctype>
#include <iostream>
#include <vector>

namespace aegis::stt {

TranscriptionRelay::TranscriptionRelay(Transcriber& transcriber)
    : transcriber_(transcriber) {
}

std::string TranscriptionRelay::relay(const std::vector<float>& samples, int sample_rate) {
    std::string raw = transcriber_.transcribe(samples, sample_rate);
    std::string text = clean(raw);

    if (text.empty()) {
        std::cout << "[Transcription] Nothing understood" << std::endl;
    } else {
        std::cout << "[Transcription] \"" << text << "\"" << std::endl;
    }
    return text;
}

std::string TranscriptionRelay::clean(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());

    // Drop matched [..] and (..) spans, e.g. [BLANK_AUDIO], (wind blowing).
    // An opener without a closer is kept as text.
    std::vector<size_t> open_spans;
    for (char c : raw) {
        if (c == '[' || c == '(') {
            open_spans.push_back(out.size());
            out += c;
            continue;
        }
        if ((c == ']' || c == ')') && !open_spans.empty()) {
            out.resize(open_spans.back());
            open_spans.pop_back();
            continue;
        }
        out += c;
    }

    // Collapse whitespace runs and trim
    std::string collapsed;
    bool pending_space = false;
    for (char c : out) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !collapsed.empty();
            continue;
        }
        if (pending_space) {
            collapsed += ' ';
            pending_space = false;
        }
        collapsed += c;
    }

    // Punctuation alone (" ." for silence) counts as nothing; any UTF-8
    // multibyte sequence is content
    for (char c : collapsed) {
        auto byte = static_cast<unsigned char>(c);
        if (byte >= 0x80 || std::isalnum(byte)) {
            return collapsed;
        }
    }
    return "";
}

} // namespace aegis::stt
