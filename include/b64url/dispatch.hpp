#pragma once

#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace b64url {

/// Direction of the transformation
enum class Mode { Encode, Decode };

/// Where input bytes come from: standard input or a named file
class Source {
public:
    enum class Kind { StandardInput, NamedFile };

    /// Standard input
    static Source standardInput() { return Source(Kind::StandardInput, {}); }

    /// A file at `path`
    static Source file(std::string path) { return Source(Kind::NamedFile, std::move(path)); }

    /// Map a FILE command-line argument: "-" is standard input, anything else a path
    static Source fromArgument(std::string_view argument);

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool isStandardInput() const { return kind_ == Kind::StandardInput; }

    /// Path of a NamedFile source (empty for standard input)
    [[nodiscard]] const std::string& path() const { return path_; }

    /// Human-readable name for diagnostics: "<stdin>" or the path
    [[nodiscard]] std::string describe() const;

    bool operator==(const Source&) const = default;

private:
    Source(Kind kind, std::string path) : kind_(kind), path_(std::move(path)) {}

    Kind kind_;
    std::string path_;
};

/**
 * A resolved, readable byte stream.
 * Owns the file handle of a NamedFile source and closes it on destruction.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Stream to read the input from
    [[nodiscard]] virtual std::istream& stream() = 0;

    /// Source this stream was resolved from
    [[nodiscard]] virtual const Source& source() const = 0;
};

/// Resolve a source to a readable stream
/// @param source Source to open
/// @param standardInput Stream used for Source::standardInput() (not owned)
/// @throws b64url::Error (SourceUnavailable) if a named file cannot be opened
[[nodiscard]] std::unique_ptr<ByteSource> resolveSource(const Source& source,
                                                        std::istream& standardInput);

/// Read a stream to its end
/// @throws b64url::Error (IoFailure) if the stream reports a read error
[[nodiscard]] std::vector<std::uint8_t> readAll(std::istream& in);

/// Strip the trailing run of ASCII whitespace
[[nodiscard]] std::string_view trimTrailingWhitespace(std::string_view text);

/// Read the whole source, transform it and write the result.
///
/// Encode writes the encoded text followed by one '\n'. Decode strips the
/// trailing whitespace run of the input and writes the decoded bytes with no
/// newline. Nothing is written if resolving, reading or decoding fails.
///
/// @throws b64url::Error of kind SourceUnavailable, InvalidEncoding or IoFailure
void run(Mode mode, const Source& source, std::istream& standardInput, std::ostream& output);

} // namespace b64url
