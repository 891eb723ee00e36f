#pragma once

#include <string>
#include <payplan/core/types.h>

namespace payplan::extraction {

/**
 * @brief Fields missing from a segment that produced no Item
 */
struct MissingFields {
    bool provider = false;
    bool amount = false;
    bool dueDate = false;
    bool installment = false;
};

/// Issue reason naming the missing fields, with guidance on what to paste.
std::string issueReason(const MissingFields& missing);

/// Actionable message for an error returned by the extraction or quick-fix APIs.
std::string userFriendlyMessage(const Error& error);

} // namespace payplan::extraction
