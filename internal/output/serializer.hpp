#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/model/transcription_result.hpp"
#include "internal/output/output_format.hpp"
#include "scribe/v1.hpp"

namespace scribe::output {

/*
  Renders a transcription result into one output encoding.

  Rendering is pure and deterministic: the same result always yields the
  same bytes.
*/
class OutputSerializer {
 public:
  virtual ~OutputSerializer() = default;

  virtual OutputFormat Format() const = 0;
  virtual std::string  Render(const scribe::model::TranscriptionResult& result) const = 0;

  std::string_view Extension() const {
    return output::Extension(Format());
  }
};

class TextSerializer final : public OutputSerializer {
 public:
  explicit TextSerializer(bool include_timestamps = false) : include_timestamps_(include_timestamps) {
  }

  OutputFormat Format() const override {
    return OutputFormat::kText;
  }
  std::string Render(const scribe::model::TranscriptionResult& result) const override;

 private:
  bool include_timestamps_;
};

class SubtitleSerializer final : public OutputSerializer {
 public:
  OutputFormat Format() const override {
    return OutputFormat::kSubtitle;
  }
  std::string Render(const scribe::model::TranscriptionResult& result) const override;
};

class WebSubtitleSerializer final : public OutputSerializer {
 public:
  OutputFormat Format() const override {
    return OutputFormat::kWebSubtitle;
  }
  std::string Render(const scribe::model::TranscriptionResult& result) const override;
};

class StructuredSerializer final : public OutputSerializer {
 public:
  OutputFormat Format() const override {
    return OutputFormat::kStructured;
  }
  std::string Render(const scribe::model::TranscriptionResult& result) const override;
};

std::unique_ptr<OutputSerializer> MakeSerializer(OutputFormat format, bool include_timestamps = false);

// Full result plus derived metadata (mean confidence, segment and word counts).
scribe::v1::TranscriptDocument ToDocument(const scribe::model::TranscriptionResult& result);

std::string Trim(std::string_view value);
size_t      CountWords(std::string_view text);

} // namespace scribe::output
