#include "excelpager/reader/SharedStringsParser.hpp"
#include "excelpager/utils/ModuleLoggers.hpp"

namespace excelpager {
namespace reader {

void SharedStringsParser::onStartElement(std::string_view name, span<const xml::XMLAttribute> /*attributes*/, int /*depth*/) {
    if (name == "si") {
        in_si_ = true;
        in_phonetic_ = false;
        current_.clear();
    } else if (name == "rPh") {
        in_phonetic_ = true;
    } else if (name == "t" && in_si_ && !in_phonetic_ && wantsCurrent()) {
        startCollectingText();
    }
}

void SharedStringsParser::onEndElement(std::string_view name, int /*depth*/) {
    if (name == "t") {
        if (state_.collecting_text) {
            current_ += getCurrentText();
            stopCollectingText();
        }
    } else if (name == "rPh") {
        in_phonetic_ = false;
    } else if (name == "si") {
        if (wantsCurrent()) {
            strings_[next_index_] = std::move(current_);
        }
        current_.clear();
        ++next_index_;
        in_si_ = false;
    } else if (name == "sst") {
        READER_DEBUG("Parsed {} shared strings, kept {}", next_index_, strings_.size());
    }
}

const std::string* SharedStringsParser::getString(uint32_t index) const {
    auto it = strings_.find(index);
    if (it != strings_.end()) {
        return &it->second;
    }
    return nullptr;
}

}} // namespace excelpager::reader
