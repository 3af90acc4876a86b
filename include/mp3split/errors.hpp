#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace mp3split {

// ─── Error Taxonomy ─────────────────────────────────────────────────────────
// Every failure is fatal to the current run; nothing is retried.

class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Input path does not exist or is not a regular file.
class InvalidInputError : public Error {
  public:
    using Error::Error;
};

// Input extension is not .mp3.
class UnsupportedFormatError : public Error {
  public:
    using Error::Error;
};

// Non-positive clip duration or sample rate.
class InvalidConfigurationError : public Error {
  public:
    using Error::Error;
};

// Base for failures raised by the audio libraries; keeps the offending
// path and the underlying cause.
class CodecError : public Error {
  public:
    CodecError(const std::string &what, std::string path, std::string cause)
        : Error(what + ": " + path + " (" + cause + ")"),
          path_(std::move(path)), cause_(std::move(cause)) {}

    const std::string &path() const { return path_; }
    const std::string &cause() const { return cause_; }

  private:
    std::string path_;
    std::string cause_;
};

class DecodeError : public CodecError {
  public:
    DecodeError(std::string path, std::string cause)
        : CodecError("Failed to decode MP3", std::move(path),
                     std::move(cause)) {}
};

class EncodeError : public CodecError {
  public:
    EncodeError(std::string path, std::string cause)
        : CodecError("Failed to write WAV", std::move(path),
                     std::move(cause)) {}
};

} // namespace mp3split
