#pragma once

#include <payplan/extraction/item.h>

namespace payplan::extraction {

/**
 * @brief Signal weights; the "present" states sum to 1.0
 */
struct ConfidenceWeights {
    static constexpr double kProvider = 0.35;
    static constexpr double kDateUnambiguous = 0.25;
    static constexpr double kDateAmbiguous = 0.15;
    static constexpr double kAmount = 0.20;
    static constexpr double kInstallmentStated = 0.15;
    static constexpr double kInstallmentInferred = 0.10;
    static constexpr double kInstallmentDefaulted = 0.05;
    static constexpr double kAutopay = 0.05;
};

/**
 * @brief Raw signal flags, independent of any Item
 */
struct ConfidenceSignals {
    bool provider = false;
    DateSignal date = DateSignal::Missing;
    bool amount = false;
    InstallmentSignal installment = InstallmentSignal::Missing;
    bool autopay = false;
};

enum class ConfidenceBand { Low, Medium, High };

/// Weighted sum of the signals, clamped to [0,1] and rounded to 2 decimals.
double scoreSignals(const ConfidenceSignals& signals);

/// Signals of an Item as currently stored; a date signal without a due date counts as missing.
ConfidenceSignals signalsOf(const Item& item);

/// Pure function of the item's fields and signals; the same fields always give the same score.
double scoreItem(const Item& item);

/// High >= 0.8, Medium >= 0.6, Low otherwise.
ConfidenceBand confidenceBand(double score);

constexpr const char* confidenceBandToString(ConfidenceBand band) {
    switch (band) {
        case ConfidenceBand::High: return "High";
        case ConfidenceBand::Medium: return "Med";
        case ConfidenceBand::Low: return "Low";
    }
    return "Low";
}

} // namespace payplan::extraction
