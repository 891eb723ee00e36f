#include <gtest/gtest.h>
#include <payplan/extraction/confidence_scorer.h>
#include <payplan/quickfix/quick_fix_engine.h>

using namespace payplan;
using namespace payplan::extraction;
using namespace payplan::quickfix;

class QuickFixEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Unknown provider, amount and autopay found, no date
        Item partial;
        partial.id = "row-1";
        partial.provider = Provider::Unknown;
        partial.installmentNo = 1;
        partial.amountCents = 2500;
        partial.autopay = true;
        partial.signals = {true, DateSignal::Missing, InstallmentSignal::Defaulted, true};
        partial.confidence = scoreItem(partial);

        // Known provider with a zero amount; only the date is missing
        Item zeroAmount;
        zeroAmount.id = "row-2";
        zeroAmount.provider = Provider::Klarna;
        zeroAmount.installmentNo = 1;
        zeroAmount.amountCents = 0;
        zeroAmount.autopay = false;
        zeroAmount.signals = {true, DateSignal::Missing, InstallmentSignal::Stated, true};
        zeroAmount.confidence = scoreItem(zeroAmount);

        // Ambiguous date read as US
        Item ambiguous;
        ambiguous.id = "row-3";
        ambiguous.provider = Provider::Afterpay;
        ambiguous.installmentNo = 2;
        ambiguous.dueDate = "2026-01-02";
        ambiguous.rawDueDate = "01/02/2026";
        ambiguous.amountCents = 3750;
        ambiguous.signals = {true, DateSignal::Ambiguous, InstallmentSignal::Stated, false};
        ambiguous.confidence = scoreItem(ambiguous);

        engine_.setItems({partial, zeroAmount, ambiguous});
    }

    const Item& row(const std::string& id) {
        const auto* item = engine_.find(id);
        EXPECT_NE(item, nullptr);
        return *item;
    }

    QuickFixEngine engine_;
};

TEST_F(QuickFixEngineTest, FixRaisesConfidence) {
    EXPECT_DOUBLE_EQ(row("row-1").confidence, 0.30);

    ASSERT_TRUE(engine_.applyRowFix("row-1", {"2026-03-15", std::nullopt}));

    EXPECT_EQ(row("row-1").dueDate, "2026-03-15");
    EXPECT_EQ(row("row-1").signals.date, DateSignal::Unambiguous);
    EXPECT_GT(row("row-1").confidence, 0.30);
    EXPECT_DOUBLE_EQ(row("row-1").confidence, scoreItem(row("row-1")));
    EXPECT_TRUE(engine_.hasSnapshot("row-1"));
}

TEST_F(QuickFixEngineTest, ZeroAmountRowReachesFullConfidence) {
    ASSERT_TRUE(engine_.applyRowFix("row-2", {"2026-05-01", std::nullopt}));
    EXPECT_DOUBLE_EQ(row("row-2").confidence, 1.0);
}

TEST_F(QuickFixEngineTest, UndoRestoresOriginal) {
    const auto before = row("row-1");

    ASSERT_TRUE(engine_.applyRowFix("row-1", {"2026-03-15", std::nullopt}));
    engine_.undoRowFix("row-1");

    EXPECT_TRUE(row("row-1").sameValueAs(before));
    EXPECT_EQ(row("row-1").id, before.id);
    EXPECT_FALSE(engine_.hasSnapshot("row-1"));

    // Nothing left to undo
    engine_.undoRowFix("row-1");
    EXPECT_TRUE(row("row-1").sameValueAs(before));
}

TEST_F(QuickFixEngineTest, SecondFixKeepsFirstSnapshot) {
    const auto before = row("row-3");

    ASSERT_TRUE(engine_.applyRowFix("row-3", {"2026-04-01", std::nullopt}));
    ASSERT_TRUE(engine_.applyRowFix("row-3", {"2026-04-15", std::nullopt}));
    EXPECT_EQ(row("row-3").dueDate, "2026-04-15");

    engine_.undoRowFix("row-3");
    EXPECT_EQ(row("row-3").dueDate, "2026-01-02");
    EXPECT_DOUBLE_EQ(row("row-3").confidence, before.confidence);
    EXPECT_EQ(row("row-3").signals.date, DateSignal::Ambiguous);
}

TEST_F(QuickFixEngineTest, InvalidDateLeavesRowUntouched) {
    const auto before = row("row-1");

    auto result = engine_.applyRowFix("row-1", {"2033-01-01", std::nullopt});
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ValidationError);
    EXPECT_TRUE(row("row-1").sameValueAs(before));
    EXPECT_FALSE(engine_.hasSnapshot("row-1"));

    EXPECT_FALSE(engine_.applyRowFix("row-1", {"not a date", std::nullopt}));
}

TEST_F(QuickFixEngineTest, BoundaryDatesAreAccepted) {
    EXPECT_TRUE(engine_.applyRowFix("row-1", {"2020-01-01", std::nullopt}));
    EXPECT_TRUE(engine_.applyRowFix("row-1", {"2032-12-31", std::nullopt}));
    EXPECT_EQ(row("row-1").dueDate, "2032-12-31");
}

TEST_F(QuickFixEngineTest, UnknownRowIsNoOp) {
    EXPECT_TRUE(engine_.applyRowFix("missing", {"2026-03-15", std::nullopt}));
    EXPECT_FALSE(engine_.hasSnapshot("missing"));
    engine_.undoRowFix("missing");
    EXPECT_EQ(engine_.items().size(), 3u);
}

TEST_F(QuickFixEngineTest, PatchCanReplaceRawText) {
    ASSERT_TRUE(engine_.applyRowFix("row-3", {"2026-02-01", std::string("1 February 2026")}));
    EXPECT_EQ(row("row-3").rawDueDate, "1 February 2026");
    engine_.undoRowFix("row-3");
    EXPECT_EQ(row("row-3").rawDueDate, "01/02/2026");
}

TEST_F(QuickFixEngineTest, SetItemsDropsSnapshots) {
    ASSERT_TRUE(engine_.applyRowFix("row-1", {"2026-03-15", std::nullopt}));
    auto rows = engine_.items();
    engine_.setItems(rows);
    EXPECT_FALSE(engine_.hasSnapshot("row-1"));

    engine_.undoRowFix("row-1");
    EXPECT_EQ(row("row-1").dueDate, "2026-03-15");
}

TEST_F(QuickFixEngineTest, ClearDropsEverything) {
    ASSERT_TRUE(engine_.applyRowFix("row-1", {"2026-03-15", std::nullopt}));
    engine_.clear();
    EXPECT_TRUE(engine_.items().empty());
    EXPECT_FALSE(engine_.hasSnapshot("row-1"));
}

TEST_F(QuickFixEngineTest, ReparseRowUnderOtherLocale) {
    ASSERT_TRUE(engine_.reparseRow("row-3", "Europe/Paris", DateLocale::EU));
    EXPECT_EQ(row("row-3").dueDate, "2026-02-01");
    EXPECT_EQ(row("row-3").rawDueDate, "01/02/2026");

    engine_.undoRowFix("row-3");
    EXPECT_EQ(row("row-3").dueDate, "2026-01-02");
}

TEST_F(QuickFixEngineTest, ReparseRowOutsideManualRange) {
    Item future;
    future.id = "row-4";
    future.provider = Provider::Klarna;
    future.installmentNo = 1;
    future.dueDate = "2035-01-02";
    future.rawDueDate = "01/02/2035";
    future.signals = {true, DateSignal::Ambiguous, InstallmentSignal::Stated, false};
    future.confidence = scoreItem(future);
    engine_.setItems({future});

    EXPECT_FALSE(engine_.applyRowFix("row-4", RowPatch{"2035-02-01", std::nullopt}));
    EXPECT_EQ(row("row-4").dueDate, "2035-01-02");

    ASSERT_TRUE(engine_.reparseRow("row-4", "UTC", DateLocale::EU));
    EXPECT_EQ(row("row-4").dueDate, "2035-02-01");
    EXPECT_EQ(row("row-4").signals.date, DateSignal::Unambiguous);
    EXPECT_TRUE(engine_.hasSnapshot("row-4"));

    engine_.undoRowFix("row-4");
    EXPECT_EQ(row("row-4").dueDate, "2035-01-02");
}

TEST_F(QuickFixEngineTest, ReparseErrors) {
    auto missing = engine_.reparseRow("missing", "UTC", DateLocale::EU);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    // row-1 has no date text to re-read
    auto noRaw = engine_.reparseRow("row-1", "UTC", DateLocale::EU);
    ASSERT_FALSE(noRaw);
    EXPECT_EQ(noRaw.error().code, ErrorCode::DateParseError);

    auto bad = QuickFixEngine::reparseDate("02/30/2026", "UTC", DateLocale::US);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::DateParseError);
}
