#pragma once

#include <expected>
#include <string>
#include <unordered_map>
#include <utility>

namespace csmap {

/**
 * @brief Error codes for the interface mapper
 */
enum class CsmapErrorCode {
  // No error
  kSuccess = 0,

  // File system errors
  kFileNotFound,
  kFileAccessDenied,
  kFileInvalidEncoding,
  kFileWriteFailed,

  // Parser errors
  kParseFailed,

  // Configuration errors
  kConfigInvalid,

  // Command line errors
  kInvalidArguments,

  // Internal errors
  kUnknownError
};

/**
 * @brief Error value carried through std::expected at fallible boundaries
 */
class CsmapError {
 public:
  // Default constructor - no error
  CsmapError() : code_(CsmapErrorCode::kSuccess) {
  }

  // Construct from error code
  explicit CsmapError(CsmapErrorCode code)
      : code_(code), message_(GetDefaultMessage(code)) {
  }

  // Construct from error code and message
  CsmapError(CsmapErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {
  }

  [[nodiscard]] auto Ok() const -> bool {
    return code_ == CsmapErrorCode::kSuccess;
  }

  [[nodiscard]] auto Code() const -> CsmapErrorCode {
    return code_;
  }

  [[nodiscard]] auto Message() const -> const std::string& {
    return message_;
  }

  // Allow if(error) checks
  explicit operator bool() const {
    return !Ok();
  }

  static auto GetDefaultMessage(CsmapErrorCode code) -> std::string {
    static const std::unordered_map<CsmapErrorCode, std::string> kMessages = {
        {CsmapErrorCode::kSuccess, "Success"},
        {CsmapErrorCode::kFileNotFound, "File not found"},
        {CsmapErrorCode::kFileAccessDenied, "Access to file denied"},
        {CsmapErrorCode::kFileInvalidEncoding, "Invalid file encoding"},
        {CsmapErrorCode::kFileWriteFailed, "Failed to write file"},
        {CsmapErrorCode::kParseFailed, "Failed to parse file"},
        {CsmapErrorCode::kConfigInvalid, "Invalid configuration"},
        {CsmapErrorCode::kInvalidArguments, "Invalid arguments"},
        {CsmapErrorCode::kUnknownError, "Unknown error"}};

    auto it = kMessages.find(code);
    if (it != kMessages.end()) {
      return it->second;
    }
    return "Unknown error";
  }

  // Default message for the code, with details appended when present
  static auto Make(CsmapErrorCode code, const std::string& details = "")
      -> CsmapError {
    if (details.empty()) {
      return CsmapError(code);
    }
    return {code, GetDefaultMessage(code) + ": " + details};
  }

  static auto Unexpected(CsmapErrorCode code, const std::string& details = "")
      -> std::unexpected<CsmapError> {
    return std::unexpected<CsmapError>(Make(code, details));
  }

 private:
  CsmapErrorCode code_ = CsmapErrorCode::kSuccess;
  std::string message_;
};

}  // namespace csmap
