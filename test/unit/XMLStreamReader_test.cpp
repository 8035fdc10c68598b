#include "excelpager/utils/Logger.hpp"
#include "excelpager/xml/XMLStreamReader.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace excelpager {
namespace xml {

class XMLStreamReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        reader_ = std::make_unique<XMLStreamReader>();
    }

    void TearDown() override {
        reader_.reset();
    }

    std::unique_ptr<XMLStreamReader> reader_;

    // 测试用的XML内容
    const std::string simple_xml_ = R"(<?xml version="1.0" encoding="UTF-8"?>
<root>
    <element attr="value">Text content</element>
    <empty_element/>
    <parent>
        <child>Child text</child>
        <child>Another child</child>
    </parent>
</root>)";

    const std::string workbook_xml_ = R"(<?xml version="1.0" encoding="UTF-8"?>
<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"
          xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships">
    <sheets>
        <sheet name="Sheet1" sheetId="1" r:id="rId1"/>
        <sheet name="Sheet2" sheetId="2" r:id="rId2"/>
    </sheets>
</workbook>)";
};

// 测试1: 基本解析功能
TEST_F(XMLStreamReaderTest, BasicParsing) {
    std::vector<std::string> elements;
    std::vector<std::string> texts;

    reader_->setStartElementCallback([&](std::string_view name, span<const XMLAttribute>, int) {
        elements.emplace_back(name);
    });
    reader_->setTextCallback([&](std::string_view text, int) {
        texts.emplace_back(text);
    });

    XMLParseError result = reader_->parseFromString(simple_xml_);
    EXPECT_EQ(result, XMLParseError::Ok);

    ASSERT_EQ(elements.size(), 6u);
    EXPECT_EQ(elements[0], "root");
    EXPECT_EQ(elements[1], "element");
    EXPECT_EQ(elements[5], "child");

    // 纯空白文本被裁剪掉，不回调
    ASSERT_EQ(texts.size(), 3u);
    EXPECT_EQ(texts[0], "Text content");
    EXPECT_EQ(texts[2], "Another child");
}

// 测试2: 属性解析
TEST_F(XMLStreamReaderTest, AttributeParsing) {
    std::vector<std::pair<std::string, std::string>> sheets;

    reader_->setStartElementCallback([&](std::string_view name, span<const XMLAttribute> attributes, int depth) {
        if (name != "sheet") {
            return;
        }
        EXPECT_EQ(depth, 2);
        std::string sheet_name;
        std::string rel_id;
        for (const auto& attr : attributes) {
            if (attr.name == "name") sheet_name = std::string(attr.value);
            if (attr.name == "r:id") rel_id = std::string(attr.value);
        }
        sheets.emplace_back(sheet_name, rel_id);
    });

    EXPECT_EQ(reader_->parseFromString(workbook_xml_), XMLParseError::Ok);

    ASSERT_EQ(sheets.size(), 2u);
    EXPECT_EQ(sheets[0].first, "Sheet1");
    EXPECT_EQ(sheets[0].second, "rId1");
    EXPECT_EQ(sheets[1].first, "Sheet2");
    EXPECT_EQ(sheets[1].second, "rId2");
}

// 测试3: 流式解析，元素跨越数据块边界
TEST_F(XMLStreamReaderTest, StreamParsing) {
    std::vector<std::string> elements;
    std::string text;

    reader_->setStartElementCallback([&](std::string_view name, span<const XMLAttribute>, int) {
        elements.emplace_back(name);
    });
    reader_->setTextCallback([&](std::string_view t, int) {
        text += std::string(t);
    });

    EXPECT_EQ(reader_->beginParsing(), XMLParseError::Ok);

    std::string part1 = "<?xml version=\"1.0\"?><root><element>con";
    std::string part2 = "tent</element><anot";
    std::string part3 = "her/></root>";

    EXPECT_EQ(reader_->feedData(part1.data(), part1.size()), XMLParseError::Ok);
    EXPECT_EQ(reader_->feedData(part2.data(), part2.size()), XMLParseError::Ok);
    EXPECT_EQ(reader_->feedData(part3.data(), part3.size()), XMLParseError::Ok);
    EXPECT_EQ(reader_->endParsing(), XMLParseError::Ok);

    ASSERT_EQ(elements.size(), 3u);
    EXPECT_EQ(elements[2], "another");
    EXPECT_EQ(text, "content");
}

// 测试4: 错误处理
TEST_F(XMLStreamReaderTest, ErrorHandling) {
    XMLParseError result = reader_->parseFromString("<?xml version=\"1.0\"?><root><unclosed>");
    EXPECT_TRUE(isError(result));
    EXPECT_FALSE(reader_->getLastErrorMessage().empty());

    EXPECT_EQ(reader_->parseFromString(""), XMLParseError::InvalidInput);
}

// 测试5: 回调抛出异常时停止解析
TEST_F(XMLStreamReaderTest, CallbackExceptionStopsParsing) {
    int seen = 0;
    reader_->setStartElementCallback([&](std::string_view name, span<const XMLAttribute>, int) {
        ++seen;
        if (name == "empty_element") {
            throw std::runtime_error("stop here");
        }
    });

    XMLParseError result = reader_->parseFromString(simple_xml_);
    EXPECT_EQ(result, XMLParseError::CallbackError);
    EXPECT_EQ(seen, 3);
}

// 测试6: 保留空白
TEST_F(XMLStreamReaderTest, PreserveWhitespace) {
    std::string text;
    reader_->setTrimWhitespace(false);
    reader_->setTextCallback([&](std::string_view t, int) {
        text = std::string(t);
    });

    EXPECT_EQ(reader_->parseFromString("<t>  padded  </t>"), XMLParseError::Ok);
    EXPECT_EQ(text, "  padded  ");
}

// 测试7: 较大文档
TEST_F(XMLStreamReaderTest, LargeDocumentParsing) {
    std::ostringstream large_xml;
    large_xml << "<?xml version=\"1.0\"?><root>";
    for (int i = 0; i < 1000; ++i) {
        large_xml << "<item id=\"" << i << "\">Content " << i << "</item>";
    }
    large_xml << "</root>";

    int element_count = 0;
    reader_->setStartElementCallback([&](std::string_view, span<const XMLAttribute>, int) {
        element_count++;
    });

    EXPECT_EQ(reader_->parseFromString(large_xml.str()), XMLParseError::Ok);
    EXPECT_EQ(element_count, 1001);  // root + 1000 items
}

// 测试8: UTF-8 文本
TEST_F(XMLStreamReaderTest, EncodingHandling) {
    std::vector<std::string> texts;
    reader_->setTextCallback([&](std::string_view text, int) {
        texts.emplace_back(text);
    });

    EXPECT_EQ(reader_->parseFromString("<root><text>Hello 世界</text><emoji>🚀</emoji></root>"),
              XMLParseError::Ok);
    ASSERT_EQ(texts.size(), 2u);
    EXPECT_EQ(texts[0], "Hello 世界");
    EXPECT_EQ(texts[1], "🚀");
}

}} // namespace excelpager::xml
