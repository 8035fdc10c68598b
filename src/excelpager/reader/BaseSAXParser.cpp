#include "excelpager/reader/BaseSAXParser.hpp"
#include "excelpager/core/Constants.hpp"
#include "excelpager/utils/ModuleLoggers.hpp"
#include <charconv>

namespace excelpager {
namespace reader {

bool BaseSAXParser::parseXML(std::string_view xml_content) {
    state_.reset();
    if (xml_content.empty()) {
        setError("Empty XML content");
        return false;
    }

    xml::XMLStreamReader reader;
    bindCallbacks(reader);
    return finish(reader.parseFromString(xml_content), reader);
}

bool BaseSAXParser::parseStream(archive::EntryStream& stream, const core::CancellationToken* token) {
    state_.reset();

    xml::XMLStreamReader reader;
    bindCallbacks(reader);

    xml::XMLParseError result = reader.beginParsing();
    if (xml::isError(result)) {
        return finish(result, reader);
    }

    std::vector<uint8_t> buffer(core::Constants::kIOBufferSize);
    for (;;) {
        if (token && token->isCancelled()) {
            state_.cancelled = true;
            setError("Parsing of " + stream.path() + " cancelled");
            return false;
        }

        size_t bytes_read = 0;
        archive::ZipError zip_result = stream.read(buffer.data(), buffer.size(), bytes_read);
        if (archive::isError(zip_result)) {
            setError("Failed to decompress " + stream.path() + ": " + archive::toString(zip_result));
            return false;
        }
        if (bytes_read == 0) {
            break;
        }

        result = reader.feedData(reinterpret_cast<const char*>(buffer.data()), bytes_read);
        if (xml::isError(result) || state_.has_error) {
            return finish(result, reader);
        }
        if (isComplete()) {
            return true;
        }
    }

    return finish(reader.endParsing(), reader);
}

bool BaseSAXParser::finish(xml::XMLParseError result, const xml::XMLStreamReader& reader) {
    if (xml::isError(result) && !state_.has_error) {
        setError(reader.getLastErrorMessage().empty()
                     ? std::string("XML parsing failed: ") + xml::toString(result)
                     : reader.getLastErrorMessage());
    }
    return !state_.has_error;
}

void BaseSAXParser::bindCallbacks(xml::XMLStreamReader& reader) {
    reader.setTrimWhitespace(!preserveWhitespace());
    reader.setStartElementCallback([this](std::string_view name, span<const xml::XMLAttribute> attributes, int depth) {
        handleStartElement(name, attributes, depth);
    });
    reader.setEndElementCallback([this](std::string_view name, int depth) {
        handleEndElement(name, depth);
    });
    reader.setTextCallback([this](std::string_view text, int depth) {
        handleText(text, depth);
    });
}

void BaseSAXParser::handleStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) {
    state_.element_stack.emplace_back(name);
    state_.current_depth = depth;
    onStartElement(name, attributes, depth);
}

void BaseSAXParser::handleEndElement(std::string_view name, int depth) {
    if (!state_.element_stack.empty()) {
        state_.element_stack.pop_back();
    }
    state_.current_depth = depth;
    onEndElement(name, depth);
}

void BaseSAXParser::handleText(std::string_view text, int depth) {
    if (state_.collecting_text) {
        state_.current_text.append(text.data(), text.size());
    }
    onText(text, depth);
}

std::optional<int64_t> BaseSAXParser::findIntAttribute(span<const xml::XMLAttribute> attributes,
                                                       std::string_view name) {
    auto val = findAttribute(attributes, name);
    if (!val || val->empty()) {
        return std::nullopt;
    }
    int64_t result = 0;
    const char* last = val->data() + val->size();
    auto [ptr, ec] = std::from_chars(val->data(), last, result);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return result;
}

void BaseSAXParser::setError(const std::string& message) {
    if (state_.has_error) {
        return;
    }
    state_.has_error = true;
    state_.error_message = message;
    READER_DEBUG("Parser error: {}", message);
}

bool BaseSAXParser::isInElement(std::string_view element_name) const {
    for (const auto& element : state_.element_stack) {
        if (element == element_name) {
            return true;
        }
    }
    return false;
}

}} // namespace excelpager::reader
