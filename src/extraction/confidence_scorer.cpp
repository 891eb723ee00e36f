#include <algorithm>
#include <cmath>
#include <payplan/extraction/confidence_scorer.h>

namespace payplan::extraction {

namespace {

double dateWeight(DateSignal signal) {
    switch (signal) {
        case DateSignal::Unambiguous: return ConfidenceWeights::kDateUnambiguous;
        case DateSignal::Ambiguous: return ConfidenceWeights::kDateAmbiguous;
        case DateSignal::Missing: return 0.0;
    }
    return 0.0;
}

double installmentWeight(InstallmentSignal signal) {
    switch (signal) {
        case InstallmentSignal::Stated: return ConfidenceWeights::kInstallmentStated;
        case InstallmentSignal::Inferred: return ConfidenceWeights::kInstallmentInferred;
        case InstallmentSignal::Defaulted: return ConfidenceWeights::kInstallmentDefaulted;
        case InstallmentSignal::Missing: return 0.0;
    }
    return 0.0;
}

} // namespace

double scoreSignals(const ConfidenceSignals& signals) {
    double score = 0.0;
    score += signals.provider ? ConfidenceWeights::kProvider : 0.0;
    score += dateWeight(signals.date);
    score += signals.amount ? ConfidenceWeights::kAmount : 0.0;
    score += installmentWeight(signals.installment);
    score += signals.autopay ? ConfidenceWeights::kAutopay : 0.0;

    // Round so that 0.35 + 0.25 compares equal to 0.6
    score = std::round(score * 100.0) / 100.0;
    return std::clamp(score, 0.0, 1.0);
}

ConfidenceSignals signalsOf(const Item& item) {
    ConfidenceSignals signals;
    signals.provider = item.provider != Provider::Unknown;
    signals.date = item.dueDate.empty() ? DateSignal::Missing : item.signals.date;
    signals.amount = item.signals.amountFound;
    signals.installment =
        item.installmentNo > 0 ? item.signals.installment : InstallmentSignal::Missing;
    signals.autopay = item.signals.autopayStated;
    return signals;
}

double scoreItem(const Item& item) {
    return scoreSignals(signalsOf(item));
}

ConfidenceBand confidenceBand(double score) {
    if (score >= 0.8) {
        return ConfidenceBand::High;
    }
    if (score >= 0.6) {
        return ConfidenceBand::Medium;
    }
    return ConfidenceBand::Low;
}

} // namespace payplan::extraction
