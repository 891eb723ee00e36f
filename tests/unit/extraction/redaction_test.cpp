#include <gtest/gtest.h>
#include <payplan/extraction/redaction.h>

using namespace payplan::extraction;

TEST(RedactionTest, EmailsAndAmounts) {
    EXPECT_EQ(redactPII("From: user@example.com, Payment: $25.00"),
              "From: [EMAIL], Payment: [AMOUNT]");
    EXPECT_EQ(redactPII("Total €1,200.50 today"), "Total [AMOUNT] today");
}

TEST(RedactionTest, AccountNumbers) {
    EXPECT_EQ(redactPII("charged to card 12345678 today"), "charged to card: [ACCOUNT] today");
    EXPECT_EQ(redactPII("Account #99887766"), "Account: [ACCOUNT]");
    // Years are not account numbers
    EXPECT_EQ(redactPII("due in 2026"), "due in 2026");
}

TEST(RedactionTest, NamesButNotCommonPhrases) {
    EXPECT_EQ(redactPII("Hi Jane Doe, your Due Date is near"),
              "Hi [NAME], your Due Date is near");
    EXPECT_EQ(redactPII("Late Fee applies"), "Late Fee applies");
}

TEST(RedactionTest, SnippetIsTruncatedThenRedacted) {
    const std::string longText(150, 'a');
    EXPECT_EQ(makeSnippet(longText).size(), kDefaultSnippetLength);
    EXPECT_EQ(makeSnippet(longText, 10), std::string(10, 'a'));
    EXPECT_EQ(makeSnippet("Contact bob@example.com"), "Contact [EMAIL]");
}

TEST(RedactionTest, SnippetKeepsMultibyteCharactersWhole) {
    const std::string text = std::string(99, 'a') + "€€";
    EXPECT_EQ(makeSnippet(text), std::string(99, 'a') + "€");
}

TEST(RedactionTest, SafePreviewMarksTruncation) {
    const std::string longText(300, 'b');
    const auto preview = safePreview(longText);
    EXPECT_EQ(preview, std::string(100, 'b') + "... [redacted]");
    EXPECT_EQ(safePreview("short"), "short");
}
