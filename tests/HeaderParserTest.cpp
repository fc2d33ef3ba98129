#include <gtest/gtest.h>
#include "http/HeaderParser.hpp"
#include "http/MultipartError.hpp"

using namespace formdrop;
using namespace formdrop::http;

TEST(HeaderParserTest, ParsesHeaderLinesCaseInsensitively) {
    PartHeaders headers = HeaderParser::parseHeaders(
        "CONTENT-Disposition: form-data; name=\"a\"\r\n"
        "Content-Type:   text/plain  \r\n"
        "garbage line without colon");

    ASSERT_EQ(headers.size(), 2u);
    EXPECT_EQ(headers.at("content-disposition"), "form-data; name=\"a\"");
    EXPECT_EQ(headers.at("content-type"), "text/plain");
}

TEST(HeaderParserTest, FirstOccurrenceOfRepeatedHeaderWins) {
    PartHeaders headers = HeaderParser::parseHeaders("X-A: first\r\nx-a: second");

    EXPECT_EQ(headers.at("x-a"), "first");
}

TEST(HeaderParserTest, ParamsKeepSemicolonsInsideQuotes) {
    std::string token;
    std::vector<HeaderParam> params =
        HeaderParser::parseParams("form-data; name=\"f\"; filename=\"a;b.txt\"", token);

    EXPECT_EQ(token, "form-data");
    ASSERT_EQ(params.size(), 2u);
    EXPECT_EQ(params[1].key, "filename");
    EXPECT_EQ(params[1].value, "a;b.txt");
    EXPECT_TRUE(params[1].quoted);
}

TEST(HeaderParserTest, UnquotedParamIsMarked) {
    std::string token;
    std::vector<HeaderParam> params = HeaderParser::parseParams("form-data; Name=plain", token);

    ASSERT_EQ(params.size(), 1u);
    EXPECT_EQ(params[0].key, "name");
    EXPECT_EQ(params[0].value, "plain");
    EXPECT_FALSE(params[0].quoted);
}

TEST(HeaderParserTest, QuotedValueEndsAtFirstClosingQuote) {
    std::string token;
    std::vector<HeaderParam> params =
        HeaderParser::parseParams("form-data; name=\"f\"; filename=\"a\\\"b.txt\"", token);

    ASSERT_EQ(params.size(), 2u);
    EXPECT_TRUE(params[1].quoted);
    EXPECT_EQ(params[1].value, "a\\");
}

TEST(HeaderParserTest, FilenameWithEmbeddedQuoteIsCutAtQuote) {
    Disposition d = HeaderParser::parseDisposition(
        "Content-Disposition: form-data; name=\"myFile\"; filename=\"a\\\"b.txt\"", "myFile");

    ASSERT_TRUE(d.filename.has_value());
    EXPECT_EQ(*d.filename, "a\\");
}

TEST(HeaderParserTest, DispositionWithExpectedFieldYieldsFilename) {
    Disposition d = HeaderParser::parseDisposition(
        "Content-Disposition: form-data; name=\"myFile\"; filename=\"report.pdf\"\r\n"
        "Content-Type: application/pdf",
        "myFile");

    EXPECT_EQ(d.fieldName, "myFile");
    ASSERT_TRUE(d.filename.has_value());
    EXPECT_EQ(*d.filename, "report.pdf");
}

TEST(HeaderParserTest, FieldNameComparisonIgnoresCase) {
    Disposition d = HeaderParser::parseDisposition(
        "content-disposition: FORM-DATA; name=\"MYFILE\"; filename=\"x\"", "myFile");

    ASSERT_TRUE(d.filename.has_value());
    EXPECT_EQ(*d.filename, "x");
}

TEST(HeaderParserTest, FilenameIsPercentDecoded) {
    Disposition d = HeaderParser::parseDisposition(
        "Content-Disposition: form-data; name=\"myFile\"; filename=\"a%20b%C3%A9.txt\"", "myFile");

    ASSERT_TRUE(d.filename.has_value());
    EXPECT_EQ(*d.filename, "a b\xC3\xA9.txt");
}

TEST(HeaderParserTest, OtherFieldNameHasNoFilename) {
    Disposition d = HeaderParser::parseDisposition(
        "Content-Disposition: form-data; name=\"avatar\"; filename=\"me.png\"", "myFile");

    EXPECT_EQ(d.fieldName, "avatar");
    EXPECT_FALSE(d.filename.has_value());
}

TEST(HeaderParserTest, MissingOrMalformedFilenameIsAbsent) {
    EXPECT_FALSE(HeaderParser::parseDisposition(
        "Content-Disposition: form-data; name=\"myFile\"", "myFile").filename.has_value());
    EXPECT_FALSE(HeaderParser::parseDisposition(
        "Content-Disposition: form-data; name=\"myFile\"; filename=\"\"", "myFile").filename.has_value());
    EXPECT_FALSE(HeaderParser::parseDisposition(
        "Content-Disposition: form-data; name=\"myFile\"; filename=\"open", "myFile").filename.has_value());
    EXPECT_FALSE(HeaderParser::parseDisposition(
        "Content-Disposition: form-data; filename=\"x\"; name=\"myFile\"", "myFile").filename.has_value());
    EXPECT_FALSE(HeaderParser::parseDisposition(
        "Content-Disposition: attachment; name=\"myFile\"; filename=\"x\"", "myFile").filename.has_value());
    EXPECT_FALSE(HeaderParser::parseDisposition("Content-Type: text/plain", "myFile").filename.has_value());
}

TEST(HeaderParserTest, BadEscapeInFilenameThrows) {
    try {
        HeaderParser::parseDisposition(
            "Content-Disposition: form-data; name=\"myFile\"; filename=\"100%.txt\"", "myFile");
        FAIL() << "expected MultipartError";
    } catch (const MultipartError& e) {
        EXPECT_EQ(e.code(), UploadError::InvalidFilenameEncoding);
    }
}
