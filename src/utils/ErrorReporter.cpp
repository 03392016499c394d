#include "ErrorReporter.hpp"
#include <plog/Log.h>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_error_queue;
std::string ErrorReporter::s_last_failure;

std::string ErrorReport::languagePair() const
{
    if (source_iso.empty() && target_iso.empty())
        return {};
    return source_iso + " -> " + target_iso;
}

void ErrorReporter::Push(ErrorReport report)
{
    std::string log_msg = std::string("[") + CategoryToString(report.category) + "] ";
    if (!report.languagePair().empty())
        log_msg += "[" + report.languagePair() + "] ";
    log_msg += report.user_message;
    if (!report.technical_details.empty())
        log_msg += " | Details: " + report.technical_details;

    if (report.severity == ErrorSeverity::Error)
        PLOG_ERROR << log_msg;
    else
        PLOG_WARNING << log_msg;

    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.push_back(std::move(report));
    if (s_error_queue.size() > MAX_QUEUE_SIZE)
        s_error_queue.erase(s_error_queue.begin());
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    Push({ .category = category,
           .severity = ErrorSeverity::Error,
           .user_message = user_message,
           .technical_details = technical_details });
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    Push({ .category = category,
           .severity = ErrorSeverity::Warning,
           .user_message = user_message,
           .technical_details = technical_details });
}

void ErrorReporter::ReportTranslationFailure(translate::TranslateError error, const std::string& source_iso,
                                             const std::string& target_iso, const std::string& details)
{
    using translate::TranslateError;

    ErrorReport report;
    report.translate_error = error;
    report.source_iso = source_iso;
    report.target_iso = target_iso;
    report.technical_details = details;

    switch (error)
    {
    case TranslateError::None:
        return;
    case TranslateError::UnsupportedLanguage:
    case TranslateError::InvalidTarget:
        report.user_message = "The language pair is not supported";
        break;
    case TranslateError::IpBanned:
        report.user_message = "The translation service is refusing requests from this address";
        break;
    case TranslateError::TransportError:
        report.category = ErrorCategory::Network;
        report.user_message = "Could not reach the translation service";
        break;
    case TranslateError::ParseError:
        report.user_message = "The translation service returned an unreadable response";
        break;
    case TranslateError::NotReady:
        report.severity = ErrorSeverity::Error;
        report.user_message = "The translator was used before it was started";
        break;
    }

    std::string key = std::string(translate::toString(error)) + "|" + report.languagePair() + "|" + details;
    {
        std::lock_guard<std::mutex> lock(s_mutex);
        if (key == s_last_failure)
        {
            PLOG_DEBUG << "Repeated translation failure not queued: " << details;
            return;
        }
        s_last_failure = std::move(key);
    }
    Push(std::move(report));
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_error_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> errors;
    errors.swap(s_error_queue);
    return errors;
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_error_queue.clear();
    s_last_failure.clear();
}

const char* ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Network:
        return "Network";
    case ErrorCategory::Translation:
        return "Translation";
    }
    return "Unknown";
}

const char* ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    return severity == ErrorSeverity::Error ? "Error" : "Warning";
}

} // namespace utils
