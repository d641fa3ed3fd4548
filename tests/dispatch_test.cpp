#include <gtest/gtest.h>
#include "b64url/dispatch.hpp"
#include "b64url/errors.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct Case {
    std::string raw;
    std::string encoded;
};

const std::vector<Case> CASES = {
    {"hello", "aGVsbG8"},
    {"hello\n", "aGVsbG8K"},
    {"John Doe", "Sm9obiBEb2U"},
    {"John Doe\n", "Sm9obiBEb2UK"},
    {"\xF0\x9F\x8D\xA3", "8J-Now"},
    {"\xF0\x9F\x8D\xA3\n", "8J-Nowo"},
    {"\xde\x9a\x4c\x32\x9e\x0d\x5b\xa8\x39\xed\x33\x5b\xe1\x9c\x01\xd9", "3ppMMp4NW6g57TNb4ZwB2Q"},
    {"\xde\x9a\x4c\x32\x9e\x0d\x5b\xa8\x39\xed\x33\x5b\xe1\x9c\x01\xd9\n", "3ppMMp4NW6g57TNb4ZwB2Qo"},
};

const std::vector<std::string> TRAILING_WHITESPACE = {"", " ", "  ", "   ", "\n", "\n\n", "\n\n\n"};

// Sink that refuses every write
class FailingOutputBuf : public std::streambuf {
protected:
    int_type overflow(int_type) override { return traits_type::eof(); }
    std::streamsize xsputn(const char*, std::streamsize) override { return 0; }
};

// Source whose reads fail after delivering nothing
class FailingInputBuf : public std::streambuf {
protected:
    int_type underflow() override { throw std::ios_base::failure("device error"); }
};

std::string runWith(b64url::Mode mode, const b64url::Source& source, const std::string& stdinData) {
    std::istringstream in(stdinData);
    std::ostringstream out;
    b64url::run(mode, source, in, out);
    return out.str();
}

} // namespace

class DispatchFileTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / ("b64url-dispatch-test-" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    fs::path writeFile(const std::string& name, const std::string& content) {
        fs::path path = temp_dir / name;
        std::ofstream file(path, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Failed to write file: " + path.string());
        }
        file << content;
        return path;
    }
};

// ============================================================================
// Source
// ============================================================================

TEST(SourceTest, DashIsStandardInput) {
    EXPECT_TRUE(b64url::Source::fromArgument("-").isStandardInput());
    EXPECT_EQ(b64url::Source::fromArgument("-"), b64url::Source::standardInput());
}

TEST(SourceTest, OtherArgumentsAreFiles) {
    auto source = b64url::Source::fromArgument("data.bin");
    EXPECT_EQ(source.kind(), b64url::Source::Kind::NamedFile);
    EXPECT_EQ(source.path(), "data.bin");
    EXPECT_EQ(source.describe(), "data.bin");

    EXPECT_FALSE(b64url::Source::fromArgument("--").isStandardInput());
    EXPECT_FALSE(b64url::Source::fromArgument("./-").isStandardInput());
}

TEST(SourceTest, DescribeStandardInput) {
    EXPECT_EQ(b64url::Source::standardInput().describe(), "<stdin>");
}

TEST(SourceTest, ResolveStandardInputUsesInjectedStream) {
    std::istringstream in("abc");
    auto byteSource = b64url::resolveSource(b64url::Source::standardInput(), in);
    EXPECT_EQ(&byteSource->stream(), &in);
    EXPECT_TRUE(byteSource->source().isStandardInput());
}

// ============================================================================
// Helpers
// ============================================================================

TEST(TrimTest, StripsTrailingWhitespaceRunOnly) {
    EXPECT_EQ(b64url::trimTrailingWhitespace("abc\n"), "abc");
    EXPECT_EQ(b64url::trimTrailingWhitespace("abc \t\r\n\v\f"), "abc");
    EXPECT_EQ(b64url::trimTrailingWhitespace(" a b\n"), " a b");
    EXPECT_EQ(b64url::trimTrailingWhitespace("\n\n"), "");
    EXPECT_EQ(b64url::trimTrailingWhitespace(""), "");
}

TEST(ReadAllTest, ReadsEverything) {
    std::string big(200 * 1024, 'x');
    big[12345] = '\0';
    std::istringstream in(big);
    auto data = b64url::readAll(in);
    EXPECT_EQ(std::string(data.begin(), data.end()), big);
}

TEST(ReadAllTest, EmptyStream) {
    std::istringstream in("");
    EXPECT_TRUE(b64url::readAll(in).empty());
}

TEST(ReadAllTest, ReadErrorIsIoFailure) {
    FailingInputBuf buf;
    std::istream in(&buf);
    try {
        (void)b64url::readAll(in);
        FAIL() << "expected IoFailure";
    } catch (const b64url::Error& e) {
        EXPECT_EQ(e.kind(), b64url::ErrorKind::IoFailure);
    }
}

// ============================================================================
// run(): standard input
// ============================================================================

TEST(RunTest, EncodesStandardInputWithTrailingNewline) {
    for (const auto& source : {b64url::Source::standardInput(), b64url::Source::fromArgument("-")}) {
        for (const auto& [raw, encoded] : CASES) {
            EXPECT_EQ(runWith(b64url::Mode::Encode, source, raw), encoded + "\n");
        }
    }
}

TEST(RunTest, EncodesEmptyInputAsNewline) {
    EXPECT_EQ(runWith(b64url::Mode::Encode, b64url::Source::standardInput(), ""), "\n");
}

TEST(RunTest, DecodesStandardInputWithoutTrailingNewline) {
    for (const auto& source : {b64url::Source::standardInput(), b64url::Source::fromArgument("-")}) {
        for (const auto& [raw, encoded] : CASES) {
            EXPECT_EQ(runWith(b64url::Mode::Decode, source, encoded), raw);
        }
    }
}

TEST(RunTest, DecodeIgnoresTrailingWhitespace) {
    for (const auto& ws : TRAILING_WHITESPACE) {
        for (const auto& [raw, encoded] : CASES) {
            EXPECT_EQ(runWith(b64url::Mode::Decode, b64url::Source::standardInput(), encoded + ws), raw)
                << "trailing whitespace of size " << ws.size();
        }
    }
}

TEST(RunTest, DecodeRejectsEmbeddedWhitespace) {
    std::istringstream in("aGVs\nbG8\n");
    std::ostringstream out;
    try {
        b64url::run(b64url::Mode::Decode, b64url::Source::standardInput(), in, out);
        FAIL() << "expected InvalidEncoding";
    } catch (const b64url::Error& e) {
        EXPECT_EQ(e.kind(), b64url::ErrorKind::InvalidEncoding);
    }
    EXPECT_TRUE(out.str().empty());
}

TEST(RunTest, InvalidInputWritesNothing) {
    for (const std::string input : {"a", "a\n", "a!b2", "aGVsbG8="}) {
        std::istringstream in(input);
        std::ostringstream out;
        EXPECT_THROW(b64url::run(b64url::Mode::Decode, b64url::Source::standardInput(), in, out),
                     b64url::Error);
        EXPECT_TRUE(out.str().empty()) << "input: " << input;
    }
}

TEST(RunTest, WriteFailureIsIoFailure) {
    std::istringstream in("hello");
    FailingOutputBuf buf;
    std::ostream out(&buf);
    try {
        b64url::run(b64url::Mode::Encode, b64url::Source::standardInput(), in, out);
        FAIL() << "expected IoFailure";
    } catch (const b64url::Error& e) {
        EXPECT_EQ(e.kind(), b64url::ErrorKind::IoFailure);
    }
}

TEST(RunTest, ReadFailureIsIoFailure) {
    FailingInputBuf buf;
    std::istream in(&buf);
    std::ostringstream out;
    try {
        b64url::run(b64url::Mode::Encode, b64url::Source::standardInput(), in, out);
        FAIL() << "expected IoFailure";
    } catch (const b64url::Error& e) {
        EXPECT_EQ(e.kind(), b64url::ErrorKind::IoFailure);
        EXPECT_NE(std::string(e.what()).find("<stdin>"), std::string::npos);
    }
    EXPECT_TRUE(out.str().empty());
}

// ============================================================================
// run(): named files
// ============================================================================

TEST_F(DispatchFileTest, EncodesFile) {
    int n = 0;
    for (const auto& [raw, encoded] : CASES) {
        auto path = writeFile("raw-" + std::to_string(n++), raw);
        EXPECT_EQ(runWith(b64url::Mode::Encode, b64url::Source::file(path.string()), "ignored"),
                  encoded + "\n");
    }
}

TEST_F(DispatchFileTest, DecodesFile) {
    int n = 0;
    for (const auto& [raw, encoded] : CASES) {
        auto path = writeFile("encoded-" + std::to_string(n++), encoded + "\n");
        EXPECT_EQ(runWith(b64url::Mode::Decode, b64url::Source::file(path.string()), ""), raw);
    }
}

TEST_F(DispatchFileTest, FileAndStandardInputAgree) {
    auto path = writeFile("same", "John Doe\n");
    EXPECT_EQ(runWith(b64url::Mode::Encode, b64url::Source::file(path.string()), ""),
              runWith(b64url::Mode::Encode, b64url::Source::standardInput(), "John Doe\n"));
}

TEST_F(DispatchFileTest, MissingFileIsSourceUnavailable) {
    auto path = temp_dir / "does-not-exist";
    std::istringstream in("hello");
    std::ostringstream out;
    try {
        b64url::run(b64url::Mode::Encode, b64url::Source::file(path.string()), in, out);
        FAIL() << "expected SourceUnavailable";
    } catch (const b64url::Error& e) {
        EXPECT_EQ(e.kind(), b64url::ErrorKind::SourceUnavailable);
        EXPECT_NE(std::string(e.what()).find(path.string()), std::string::npos);
    }
    EXPECT_TRUE(out.str().empty());
}

TEST_F(DispatchFileTest, ResolveOwnsFileStream) {
    auto path = writeFile("owned", "payload");
    std::istringstream in;
    auto byteSource = b64url::resolveSource(b64url::Source::file(path.string()), in);
    EXPECT_NE(&byteSource->stream(), &in);
    auto data = b64url::readAll(byteSource->stream());
    EXPECT_EQ(std::string(data.begin(), data.end()), "payload");
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
