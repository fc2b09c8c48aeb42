#include <gtest/gtest.h>

#include "auxon/multipart.h"

using namespace auxon;

TEST(MultipartTest, ParsesBoundary) {
    std::string boundary;
    ASSERT_TRUE(parseBoundary("multipart/form-data; boundary=----WebKitFormBoundaryx1", boundary));
    EXPECT_EQ(boundary, "----WebKitFormBoundaryx1");

    ASSERT_TRUE(parseBoundary("Multipart/Form-Data;boundary=\"quoted b\"", boundary));
    EXPECT_EQ(boundary, "quoted b");

    EXPECT_FALSE(parseBoundary("application/json", boundary));
    EXPECT_FALSE(parseBoundary("multipart/form-data", boundary));
}

TEST(MultipartTest, SplitsParts) {
    const std::string binary("RIFF\r\n--not\0data", 16);
    const std::string body =
        "--xyz\r\n"
        "Content-Disposition: form-data; name=\"note\"\r\n"
        "\r\n"
        "hello\r\n"
        "--xyz\r\n"
        "Content-Disposition: form-data; name=\"file\"; filename=\"link.wav\"\r\n"
        "Content-Type: audio/wav\r\n"
        "\r\n" + binary + "\r\n"
        "--xyz--\r\n";

    std::vector<MultipartPart> parts;
    ASSERT_TRUE(parseMultipart(body, "xyz", parts).ok());
    ASSERT_EQ(parts.size(), 2u);

    EXPECT_EQ(parts[0].name, "note");
    EXPECT_EQ(parts[0].body, "hello");
    EXPECT_TRUE(parts[0].filename.empty());

    EXPECT_EQ(parts[1].name, "file");
    EXPECT_EQ(parts[1].filename, "link.wav");
    EXPECT_EQ(parts[1].contentType, "audio/wav");
    EXPECT_EQ(std::string(parts[1].body), binary);

    const MultipartPart* file = findFilePart(parts, "file");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->filename, "link.wav");
}

TEST(MultipartTest, FallsBackToFirstFilePart) {
    const std::string body =
        "--b\r\n"
        "Content-Disposition: form-data; name=\"upload\"; filename=\"a.wav\"\r\n"
        "\r\n"
        "data\r\n"
        "--b--";

    std::vector<MultipartPart> parts;
    ASSERT_TRUE(parseMultipart(body, "b", parts).ok());
    const MultipartPart* file = findFilePart(parts, "file");
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->name, "upload");
    EXPECT_EQ(file->body, "data");

    std::vector<MultipartPart> none;
    EXPECT_EQ(findFilePart(none, "file"), nullptr);
}

TEST(MultipartTest, EmptyFilePart) {
    const std::string body =
        "--b\r\n"
        "Content-Disposition: form-data; name=\"file\"; filename=\"empty.wav\"\r\n"
        "\r\n"
        "\r\n"
        "--b--\r\n";

    std::vector<MultipartPart> parts;
    ASSERT_TRUE(parseMultipart(body, "b", parts).ok());
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_TRUE(parts[0].body.empty());
}

TEST(MultipartTest, RejectsBrokenBodies) {
    std::vector<MultipartPart> parts;
    EXPECT_EQ(parseMultipart("no boundary here", "b", parts).kind, ErrorKind::BadRequest);

    const std::string unterminated =
        "--b\r\n"
        "Content-Disposition: form-data; name=\"file\"\r\n"
        "\r\n"
        "data without end";
    EXPECT_EQ(parseMultipart(unterminated, "b", parts).kind, ErrorKind::BadRequest);

    EXPECT_EQ(parseMultipart("--b\r\nContent-Disposition: form-data", "b", parts).kind,
              ErrorKind::BadRequest);
}
