#include <spdlog/fmt/fmt.h>
#include <vector>
#include <payplan/extraction/error_messages.h>

namespace payplan::extraction {

namespace {

std::string joinFields(const std::vector<std::string>& fields) {
    if (fields.size() == 1) {
        return fields.front();
    }
    std::string out;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            out += (i + 1 == fields.size()) ? " and " : ", ";
        }
        out += fields[i];
    }
    return out;
}

} // namespace

std::string issueReason(const MissingFields& missing) {
    std::vector<std::string> fields;
    if (missing.amount) {
        fields.emplace_back("payment amount");
    }
    if (missing.dueDate) {
        fields.emplace_back("due date");
    }
    if (missing.installment) {
        fields.emplace_back("installment number");
    }

    std::string reason;
    if (missing.provider) {
        reason = "Could not identify payment provider (Klarna, Affirm, Afterpay, PayPal, Zip or "
                 "Sezzle).";
    }
    if (!fields.empty()) {
        if (!reason.empty()) {
            reason += ' ';
        }
        reason += fmt::format("No {} found.", joinFields(fields));
    }
    if (reason.empty()) {
        return "Unable to extract payment information from this email.";
    }
    return reason + " Paste the full payment reminder email, including text like "
                    "\"Payment 1 of 4: $25.00 due 10/6/2025\".";
}

std::string userFriendlyMessage(const Error& error) {
    switch (error.code) {
        case ErrorCode::ValidationError:
            if (error.message.find("imezone") != std::string::npos) {
                return "Invalid timezone setting. Please use a valid timezone like "
                       "\"America/New_York\" or \"Europe/London\".";
            }
            return fmt::format("{} Dates must be between 2020-01-01 and 2032-12-31 in "
                               "YYYY-MM-DD format.",
                               error.message);
        case ErrorCode::DateParseError:
            return "Date format not recognized. Supported formats: \"10/06/2025\", "
                   "\"October 6, 2025\", or \"2025-10-06\".";
        case ErrorCode::InvalidArgument:
            return "No email text provided. Please paste the full payment reminder email.";
        case ErrorCode::NotFound:
            return "The requested row no longer exists. Re-run the extraction and try again.";
        default:
            break;
    }
    return "Unable to process this email. Please ensure you've pasted a complete payment "
           "reminder email from Klarna, Affirm, Afterpay, PayPal, Zip, or Sezzle.";
}

} // namespace payplan::extraction
