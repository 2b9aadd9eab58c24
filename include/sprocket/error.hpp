#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace sprocket {

/**
 * Error handling for the routine loader.
 *
 * Per-routine failures (parse, reconciliation, unsupported types, failing
 * statements) are caught by the routine compiler and reported as a failed
 * compile result. Connection level failures are unrecoverable and abort a batch.
 */

enum class ErrorCode {
    // Database errors
    CONNECTION_FAILED = 100,
    QUERY_FAILED = 101,
    CONNECTION_LOST = 102,
    WRONG_ROW_COUNT = 103,

    // Source errors
    PARSE_ERROR = 200,
    RECONCILIATION_ERROR = 201,
    UNSUPPORTED_TYPE = 202,

    // I/O errors
    FILE_NOT_FOUND = 300,

    // Configuration errors
    CONFIG_ERROR = 400
};

class SprocketException : public std::runtime_error {
public:
    explicit SprocketException(ErrorCode code, const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : std::runtime_error(format_message(message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(const std::string& message,
                                      const std::string& context,
                                      const std::string& suggestion) {
        std::string result = message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

// Malformed source: designation, param comments, routine header, placeholders
class ParseError : public SprocketException {
public:
    explicit ParseError(const std::string& message,
                        const std::string& context = "",
                        const std::string& suggestion = "")
        : SprocketException(ErrorCode::PARSE_ERROR, message, context, suggestion) {}
};

// Source annotations disagree with the live catalog
class ReconciliationError : public SprocketException {
public:
    explicit ReconciliationError(const std::string& message,
                                 const std::string& context = "",
                                 const std::string& suggestion = "")
        : SprocketException(ErrorCode::RECONCILIATION_ERROR, message, context, suggestion) {}
};

class UnsupportedTypeError : public SprocketException {
public:
    explicit UnsupportedTypeError(const std::string& type_name,
                                  const std::string& context = "")
        : SprocketException(ErrorCode::UNSUPPORTED_TYPE,
                            "Unsupported column type '" + type_name + "'",
                            context)
        , type_name_(type_name) {}

    const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

class DatabaseError : public SprocketException {
public:
    explicit DatabaseError(const std::string& message,
                           const std::string& context = "",
                           ErrorCode code = ErrorCode::QUERY_FAILED)
        : SprocketException(code, message, context) {}

    // Connection failures cannot be recovered from by skipping a routine.
    bool is_fatal() const noexcept {
        return code() == ErrorCode::CONNECTION_LOST || code() == ErrorCode::CONNECTION_FAILED;
    }
};

/**
 * The result set of a query did not have the expected number of rows.
 */
class ResultError : public SprocketException {
public:
    ResultError(const std::vector<int>& expected_row_count, int actual_row_count,
                const std::string& query)
        : SprocketException(ErrorCode::WRONG_ROW_COUNT,
                            compose(expected_row_count, actual_row_count, query))
        , expected_row_count_(expected_row_count)
        , actual_row_count_(actual_row_count)
        , query_(query) {}

    const std::vector<int>& expected_row_count() const noexcept { return expected_row_count_; }
    int actual_row_count() const noexcept { return actual_row_count_; }
    const std::string& query() const noexcept { return query_; }

private:
    static std::string compose(const std::vector<int>& expected, int actual,
                               const std::string& query);

    std::vector<int> expected_row_count_;
    int actual_row_count_;
    std::string query_;
};

class IOError : public SprocketException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : SprocketException(ErrorCode::FILE_NOT_FOUND, message, context, suggestion) {}
};

class ConfigError : public SprocketException {
public:
    explicit ConfigError(const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : SprocketException(ErrorCode::CONFIG_ERROR, message, context, suggestion) {}
};

// Macros for common error checking
#define SPROCKET_CHECK_PARSE(condition, message, context) \
    do { if (!(condition)) throw sprocket::ParseError(message, context); } while (0)

#define SPROCKET_THROW_PARSE(message, context) \
    throw sprocket::ParseError(message, context)

} // namespace sprocket
