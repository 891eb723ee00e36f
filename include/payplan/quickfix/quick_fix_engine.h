#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <payplan/core/types.h>
#include <payplan/extraction/item.h>

namespace payplan::quickfix {

/**
 * @brief Manual correction for one row
 */
struct RowPatch {
    std::string dueDate;                   ///< YYYY-MM-DD
    std::optional<std::string> rawDueDate; ///< Replaces the stored date text when set
};

/**
 * @brief Row state captured before the first fix
 */
struct UndoSnapshot {
    RowId rowId;
    std::string previousDueDate;
    std::string previousRawDueDate;
    double previousConfidence = 0.0;
    extraction::DateSignal previousDateSignal = extraction::DateSignal::Missing;
};

/**
 * @brief Working copy of extracted rows with one level of undo per row
 *
 * Each row keeps at most one snapshot. The first fix after load, undo or clear records it;
 * later fixes leave it alone, so undo always returns to the pre-fix state. Not thread-safe.
 */
class QuickFixEngine {
public:
    QuickFixEngine() = default;

    /// Replace the rows and drop every snapshot.
    void setItems(std::vector<extraction::Item> items);

    const std::vector<extraction::Item>& items() const { return items_; }

    const extraction::Item* find(const RowId& rowId) const;

    bool hasSnapshot(const RowId& rowId) const;

    /**
     * @brief Set a row's due date by hand
     *
     * The date is validated before anything changes. The date signal becomes
     * Unambiguous and confidence is recomputed. An unknown row is a no-op.
     * @return ValidationError for a malformed or out of range date
     */
    Result<void> applyRowFix(const RowId& rowId, const RowPatch& patch);

    /**
     * @brief Restore the row to its state before the first fix
     *
     * No-op when the row has no pending snapshot.
     */
    void undoRowFix(const RowId& rowId);

    /**
     * @brief Re-read a raw date under a different locale
     * @return DateParseError when the text does not resolve
     */
    static Result<std::string> reparseDate(std::string_view rawDueDate, std::string_view timezone,
                                           extraction::DateLocale locale);

    /**
     * @brief Re-read a row's stored date text and apply the result as a fix
     *
     * Snapshots and scores like applyRowFix, without the manual entry date range.
     * @return NotFound for an unknown row, DateParseError when the text does not resolve
     */
    Result<void> reparseRow(const RowId& rowId, std::string_view timezone,
                            extraction::DateLocale locale);

    /// Drop every row and snapshot.
    void clear();

private:
    extraction::Item* findMutable(const RowId& rowId);
    void applyDate(extraction::Item& item, std::string isoDate,
                   const std::optional<std::string>& rawDueDate);

    std::vector<extraction::Item> items_;
    std::unordered_map<RowId, UndoSnapshot> snapshots_;
};

} // namespace payplan::quickfix
