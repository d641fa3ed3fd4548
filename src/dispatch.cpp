#include "b64url/dispatch.hpp"
#include "b64url/b64url_constants.hpp"
#include "b64url/codec.hpp"
#include "b64url/errors.hpp"
#include <array>
#include <cerrno>
#include <fstream>
#include <system_error>

namespace b64url {

namespace {

    class StandardInputSource : public ByteSource {
    public:
        StandardInputSource(const Source& source, std::istream& in)
            : source_(source), in_(in) {}

        std::istream& stream() override { return in_; }
        const Source& source() const override { return source_; }

    private:
        Source source_;
        std::istream& in_;
    };

    class FileSource : public ByteSource {
    public:
        explicit FileSource(const Source& source) : source_(source) {
            errno = 0;
            file_.open(source_.path(), std::ios::in | std::ios::binary);
            if (!file_) {
                const int err = errno;
                std::string reason = err != 0 ? std::generic_category().message(err)
                                              : "unknown error";
                throw Error(ErrorKind::SourceUnavailable,
                            "Cannot open file: " + source_.path() + ": " + reason);
            }
        }

        std::istream& stream() override { return file_; }
        const Source& source() const override { return source_; }

    private:
        Source source_;
        std::ifstream file_;
    };

    bool isAsciiWhitespace(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
    }

    void writeAll(std::ostream& output, const char* data, std::size_t size) {
        output.write(data, static_cast<std::streamsize>(size));
        output.flush();
        if (!output) {
            throw Error(ErrorKind::IoFailure, "Failed to write output");
        }
    }

}

Source Source::fromArgument(std::string_view argument) {
    if (argument == STDIN_SENTINEL) {
        return standardInput();
    }
    return file(std::string(argument));
}

std::string Source::describe() const {
    return isStandardInput() ? "<stdin>" : path_;
}

std::unique_ptr<ByteSource> resolveSource(const Source& source, std::istream& standardInput) {
    if (source.isStandardInput()) {
        return std::make_unique<StandardInputSource>(source, standardInput);
    }
    return std::make_unique<FileSource>(source);
}

std::vector<std::uint8_t> readAll(std::istream& in) {
    std::vector<std::uint8_t> buffer;
    std::array<char, 64 * 1024> chunk{};

    while (in.read(chunk.data(), static_cast<std::streamsize>(chunk.size())) || in.gcount() > 0) {
        buffer.insert(buffer.end(), chunk.data(), chunk.data() + in.gcount());
        if (!in) {
            break;
        }
    }

    if (in.bad()) {
        throw Error(ErrorKind::IoFailure, "Failed to read input");
    }
    return buffer;
}

std::string_view trimTrailingWhitespace(std::string_view text) {
    while (!text.empty() && isAsciiWhitespace(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

void run(Mode mode, const Source& source, std::istream& standardInput, std::ostream& output) {
    std::vector<std::uint8_t> input;
    {
        // File handle is released here, before any output is produced
        auto byteSource = resolveSource(source, standardInput);
        try {
            input = readAll(byteSource->stream());
        } catch (const Error& e) {
            throw Error(e.kind(), std::string(e.what()) + " from " + source.describe());
        }
    }

    if (mode == Mode::Encode) {
        std::string encoded = encode(input);
        encoded.push_back('\n');
        writeAll(output, encoded.data(), encoded.size());
        return;
    }

    std::string_view text(reinterpret_cast<const char*>(input.data()), input.size());
    auto decoded = decode(trimTrailingWhitespace(text));
    writeAll(output, reinterpret_cast<const char*>(decoded.data()), decoded.size());
}

} // namespace b64url
