#include "sentence_splitter.hpp"

#include <memory>
#include <stdexcept>

#include <unicode/unistr.h>

namespace datelang {

const std::vector<SentenceSplitterGroup>& sentence_splitter_groups() {
    static const std::vector<SentenceSplitterGroup> groups = {
        {1, "[\\.!?;\xE2\x80\xA6\\r\\n]+(?:\\s|$)*",
            "most European, Tagalog, Hebrew, Georgian, Indonesian, Vietnamese"},
        {2, "(?:[\xC2\xA1\xC2\xBF]+|[\\.!?;\xE2\x80\xA6\\r\\n]+(?:\\s|$))*", "Spanish"},
        {3, "[|!?;\\r\\n]+(?:\\s|$)*", "Hindi, Bangla"},
        {4, "[\xE3\x80\x82\xE2\x80\xA6\xE2\x80\xA5\\.!?\xEF\xBC\x9F\xEF\xBC\x81;\\r\\n]+(?:\\s|$)*",
            "Japanese, Chinese"},
        {5, "[\\r\\n]+", "Thai"},
        {6, "[\\r\\n\xD8\x9F!\\.\xE2\x80\xA6]+(?:\\s|$)*", "Arabic, Farsi"},
    };
    return groups;
}

const SentenceSplitterGroup* find_sentence_splitter(int group) {
    for (const auto& g : sentence_splitter_groups()) {
        if (g.id == group) return &g;
    }
    return nullptr;
}

std::vector<std::string> split_sentences(std::string_view text, const icu::RegexPattern& boundary) {
    icu::UnicodeString input = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));

    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexMatcher> matcher(boundary.matcher(input, status));
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("Could not create matcher: ") + u_errorName(status));
    }

    std::vector<std::string> sentences;
    auto emit = [&](int32_t from, int32_t to) {
        if (to <= from) return;
        std::string sentence;
        input.tempSubStringBetween(from, to).toUTF8String(sentence);
        sentences.push_back(std::move(sentence));
    };

    int32_t last = 0;
    while (matcher->find(status) && U_SUCCESS(status)) {
        int32_t start = matcher->start(status);
        int32_t end = matcher->end(status);
        if (end == start) continue;
        emit(last, start);
        last = end;
    }
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("Sentence split failed: ") + u_errorName(status));
    }
    emit(last, input.length());
    return sentences;
}

} // namespace datelang
