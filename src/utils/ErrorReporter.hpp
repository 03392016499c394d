#pragma once

#include "../translate/TranslateError.hpp"

#include <string>
#include <vector>
#include <mutex>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging, language catalog
    Configuration,  // TOML parsing, invalid config
    Network,        // handshake, seed refresh, transport failures
    Translation     // bans, undecodable responses, rejected language pairs
};

enum class ErrorSeverity
{
    Warning, // the client keeps working, possibly degraded
    Error    // the operation that reported it gave up
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Translation;
    ErrorSeverity severity = ErrorSeverity::Warning;
    std::string user_message;
    std::string technical_details;

    // Only set for failed translation requests
    translate::TranslateError translate_error = translate::TranslateError::None;
    std::string source_iso;
    std::string target_iso;

    // "ja -> en", or empty when the report is not about a request
    std::string languagePair() const;
};

/**
 * @brief Thread-safe queue of problems worth showing to whoever drives the client
 *
 * Every report is also written to plog. The CLI prints the queue before
 * exiting; a long-running host drains it periodically.
 *
 *   ErrorReporter::ReportTranslationFailure(TranslateError::IpBanned, "en", "de", "HTTP 429");
 *   for (const auto& r : ErrorReporter::GetPendingErrors())
 *       std::cerr << r.languagePair() << ": " << r.user_message << "\n";
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    /**
     * @brief Queue a failed request under the category its error belongs to
     *
     * A failure identical to the previous one (same error, language pair and
     * details) is logged once and not queued again. TranslateError::None is ignored.
     */
    static void ReportTranslationFailure(translate::TranslateError error, const std::string& source_iso,
                                         const std::string& target_iso, const std::string& details);

    static bool HasPendingErrors();

    // Returns the queued reports and empties the queue
    static std::vector<ErrorReport> GetPendingErrors();

    // Empties the queue and forgets the last translation failure
    static void ClearErrors();

    static const char* CategoryToString(ErrorCategory category);
    static const char* SeverityToString(ErrorSeverity severity);

private:
    static void Push(ErrorReport report);

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static std::string s_last_failure;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
