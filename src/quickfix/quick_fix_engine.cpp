#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>
#include <payplan/extraction/confidence_scorer.h>
#include <payplan/extraction/date_resolver.h>
#include <payplan/quickfix/quick_fix_engine.h>

namespace payplan::quickfix {

void QuickFixEngine::setItems(std::vector<extraction::Item> items) {
    items_ = std::move(items);
    snapshots_.clear();
}

const extraction::Item* QuickFixEngine::find(const RowId& rowId) const {
    auto it = std::find_if(items_.begin(), items_.end(),
                           [&rowId](const extraction::Item& item) { return item.id == rowId; });
    return it != items_.end() ? &*it : nullptr;
}

extraction::Item* QuickFixEngine::findMutable(const RowId& rowId) {
    return const_cast<extraction::Item*>(std::as_const(*this).find(rowId));
}

bool QuickFixEngine::hasSnapshot(const RowId& rowId) const {
    return snapshots_.find(rowId) != snapshots_.end();
}

Result<void> QuickFixEngine::applyRowFix(const RowId& rowId, const RowPatch& patch) {
    auto validated = extraction::validateManualDate(patch.dueDate);
    if (!validated) {
        spdlog::debug("Rejected manual date for row {}: {}", rowId, validated.error().message);
        return validated.error();
    }

    auto* item = findMutable(rowId);
    if (item == nullptr) {
        spdlog::debug("Fix ignored, row {} not found", rowId);
        return {};
    }
    applyDate(*item, std::move(validated).value(), patch.rawDueDate);
    return {};
}

void QuickFixEngine::applyDate(extraction::Item& item, std::string isoDate,
                               const std::optional<std::string>& rawDueDate) {
    // Keep the oldest snapshot so undo returns to the extracted state
    snapshots_.try_emplace(item.id, UndoSnapshot{item.id, item.dueDate, item.rawDueDate,
                                                 item.confidence, item.signals.date});

    item.dueDate = std::move(isoDate);
    if (rawDueDate) {
        item.rawDueDate = *rawDueDate;
    }
    item.signals.date = extraction::DateSignal::Unambiguous;
    item.confidence = extraction::scoreItem(item);
}

void QuickFixEngine::undoRowFix(const RowId& rowId) {
    auto snap = snapshots_.find(rowId);
    if (snap == snapshots_.end()) {
        return;
    }

    if (auto* item = findMutable(rowId)) {
        item->dueDate = snap->second.previousDueDate;
        item->rawDueDate = snap->second.previousRawDueDate;
        item->signals.date = snap->second.previousDateSignal;
        item->confidence = snap->second.previousConfidence;
    }
    snapshots_.erase(snap);
}

Result<std::string> QuickFixEngine::reparseDate(std::string_view rawDueDate,
                                                std::string_view timezone,
                                                extraction::DateLocale locale) {
    return extraction::reparseDate(rawDueDate, timezone, locale);
}

Result<void> QuickFixEngine::reparseRow(const RowId& rowId, std::string_view timezone,
                                        extraction::DateLocale locale) {
    auto* item = findMutable(rowId);
    if (item == nullptr) {
        return Error{ErrorCode::NotFound, "Row not found: " + rowId};
    }

    auto reparsed = reparseDate(item->rawDueDate, timezone, locale);
    if (!reparsed) {
        return reparsed.error();
    }
    // The date comes from the email itself, so the manual entry range does not apply
    applyDate(*item, std::move(reparsed).value(), std::nullopt);
    return {};
}

void QuickFixEngine::clear() {
    items_.clear();
    snapshots_.clear();
}

} // namespace payplan::quickfix
