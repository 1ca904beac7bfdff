#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "domain/Errors.hpp"
#include "domain/matching/Matcher.hpp"
#include "test/TestSupport.hpp"

using namespace redliner::domain;
using namespace redliner::domain::matching;
using redliner::test::MakeDocument;

namespace {

void TestWholeWordAndCase() {
    std::cout << "[Test] Whole-word and case handling..." << std::endl;
    auto doc = MakeDocument({{"The category lists a Cat."}});
    Matcher matcher;

    auto span = matcher.find(*doc, matcher.compile("cat", MatchOptions{}));
    assert(span && "whole-word 'cat' should match the standalone word");
    assert(span->textStart == 21 && span->textEnd == 24);

    MatchOptions substring;
    substring.wholeWord = false;
    span = matcher.find(*doc, matcher.compile("cat", substring));
    assert(span && span->textStart == 4);

    MatchOptions exactCase;
    exactCase.caseSensitive = true;
    assert(!matcher.find(*doc, matcher.compile("cat", exactCase)));
}

void TestCrossRunMatch() {
    std::cout << "[Test] Match spanning runs..." << std::endl;
    auto doc = MakeDocument({{"Our pol", "icy owner", " is here."}});
    Matcher matcher;
    auto span = matcher.find(*doc, matcher.compile("policy owner", MatchOptions{}));
    assert(span);
    assert(span->startRun == 0 && span->startOffset == 4);
    assert(span->endRun == 1 && span->endOffset == 9);
    assert(span->textStart == 4 && span->textEnd == 16);
}

void TestDeletedTextIsInvisible() {
    std::cout << "[Test] Deleted runs are not matchable..." << std::endl;
    auto doc = std::make_unique<Document>();
    BlockId block = doc->addBlock(ContainerKind::BodyParagraph, "/word/document.xml");
    Run removed;
    removed.text = "secret";
    removed.revision = RevisionTag{RevisionKind::Deleted, "a", "t", 1};
    doc->appendRun(block, removed);
    Run live;
    live.text = " public";
    doc->appendRun(block, live);

    Matcher matcher;
    assert(!matcher.find(*doc, matcher.compile("secret", MatchOptions{})));
    auto span = matcher.find(*doc, matcher.compile("public", MatchOptions{}));
    assert(span && span->startRun == 1 && span->startOffset == 1);
}

void TestCursorAndBlocks() {
    std::cout << "[Test] Search cursor across blocks..." << std::endl;
    auto doc = MakeDocument({{"alpha and alpha"}, {"beta alpha"}});
    Matcher matcher;
    auto query = matcher.compile("alpha", MatchOptions{});

    auto first = matcher.find(*doc, query);
    assert(first && first->block == 0 && first->textStart == 0);
    auto second = matcher.find(*doc, query, SearchCursor{0, first->textEnd});
    assert(second && second->block == 0 && second->textStart == 10);
    auto third = matcher.find(*doc, query, SearchCursor{0, second->textEnd});
    assert(third && third->block == 1 && third->textStart == 5);
    assert(!matcher.find(*doc, query, SearchCursor{1, third->textEnd}));
}

void TestPatterns() {
    std::cout << "[Test] Bounded patterns..." << std::endl;
    auto doc = MakeDocument({{"The policies apply to all staff."}});
    Matcher matcher;
    MatchOptions pattern;
    pattern.isPattern = true;

    auto span = matcher.find(*doc, matcher.compile("polic(y|ies)", pattern));
    assert(span && span->textStart == 4 && span->textEnd == 12);

    // Literal targets never get regex meaning.
    auto literalDoc = MakeDocument({{"Cost is 5.00 (approx)."}});
    assert(matcher.find(*literalDoc, matcher.compile("(approx)", MatchOptions{})));

    bool threw = false;
    try {
        matcher.compile("(abc", pattern);
    } catch (const PatternRejectedError&) {
        threw = true;
    }
    assert(threw && "malformed pattern must be rejected");

    threw = false;
    try {
        matcher.compile(std::string(600, 'a'), pattern);
    } catch (const PatternRejectedError&) {
        threw = true;
    }
    assert(threw && "oversized pattern must be rejected");

    threw = false;
    try {
        matcher.compile("", MatchOptions{});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw && "empty target must be rejected");
}

void TestPathologicalPatternRejectedQuickly() {
    std::cout << "[Test] Nested quantifiers are rejected up front..." << std::endl;
    Matcher matcher;
    MatchOptions pattern;
    pattern.isPattern = true;

    auto start = std::chrono::steady_clock::now();
    for (const char* bad : {"(a+)+b", "(a*)*", "(ab+){2,}", "((a|b)+)*c"}) {
        bool threw = false;
        try {
            matcher.compile(bad, pattern);
        } catch (const PatternRejectedError&) {
            threw = true;
        }
        assert(threw && "nested unbounded repetition must be rejected");
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    assert(elapsed.count() < 1000);

    // Single-level repetition is fine and runs in linear time.
    auto doc = MakeDocument({{std::string(20000, 'a') + "!"}});
    MatchOptions anywhere = pattern;
    anywhere.wholeWord = false;
    auto query = matcher.compile("(a|b)*c", anywhere);
    start = std::chrono::steady_clock::now();
    assert(!matcher.find(*doc, query));
    elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    assert(elapsed.count() < 5000);
}

void TestSentenceBounds() {
    std::cout << "[Test] Sentence bounds..." << std::endl;
    std::string text = "Users are reviewed. Access will be terminated within <24 business hours>. Logs are kept.";
    size_t start = text.find('<');
    size_t end = text.find('>') + 1;
    auto bounds = Matcher::SentenceBounds(text, start, end);
    assert(text.substr(bounds.first, bounds.second - bounds.first) ==
           "Access will be terminated within <24 business hours>.");

    // A decimal point is not a sentence end.
    std::string price = "The fee is 5.00 per <unit> today";
    auto whole = Matcher::SentenceBounds(price, price.find('<'), price.find('>') + 1);
    assert(whole.first == 0 && whole.second == price.size());
}

void TestSpanForRange() {
    std::cout << "[Test] Range to run mapping..." << std::endl;
    auto doc = MakeDocument({{"One. ", "Two three. ", "Four."}});
    Matcher matcher;
    auto span = matcher.spanForRange(*doc, 0, 5, 15);
    assert(span && span->startRun == 1 && span->startOffset == 0);
    assert(span->endRun == 1 && span->endOffset == 10);
    assert(!matcher.spanForRange(*doc, 0, 5, 99));
}

void TestVisibleOpaqueContentSplitsText() {
    std::cout << "[Test] Hyperlinks and fields are not matched across..." << std::endl;
    auto doc = std::make_unique<Document>();
    BlockId block = doc->addBlock(ContainerKind::BodyParagraph, "/word/document.xml");
    Run before;
    before.text = "Pay ";
    doc->appendRun(block, before);
    Run link;
    link.content = RunContent::Opaque;
    link.formatting = "<w:hyperlink><w:r><w:t>$5 </w:t></w:r></w:hyperlink>";
    link.visible = true;
    doc->appendRun(block, link);
    Run after;
    after.text = "now";
    doc->appendRun(block, after);
    Run bookmark;
    bookmark.content = RunContent::Opaque;
    bookmark.formatting = "<w:bookmarkStart w:id=\"3\" w:name=\"x\"/>";
    doc->appendRun(block, bookmark);
    Run tail;
    tail.text = " please";
    doc->appendRun(block, tail);

    Matcher matcher;
    assert(!matcher.find(*doc, matcher.compile("Pay now", MatchOptions{})));
    assert(!matcher.find(*doc, matcher.compile("y n", MatchOptions{false, false, false})));

    // Each side stays matchable on its own.
    auto pay = matcher.find(*doc, matcher.compile("Pay", MatchOptions{}));
    assert(pay && pay->startRun == 0);
    auto now = matcher.find(*doc, matcher.compile("now", MatchOptions{}));
    assert(now && now->startRun == 2);

    // Content-free markers do not split text.
    auto joined = matcher.find(*doc, matcher.compile("now please", MatchOptions{}));
    assert(joined && joined->startRun == 2 && joined->endRun == 4);

    assert(!matcher.spanForRange(*doc, block, 0, 7));
    assert(matcher.spanForRange(*doc, block, 4, 14));
}

void TestUnderscoreIsAWordCharacter() {
    std::cout << "[Test] Underscore joins words..." << std::endl;
    auto doc = MakeDocument({{"Set max_retries and retries."}});
    Matcher matcher;
    auto span = matcher.find(*doc, matcher.compile("retries", MatchOptions{}));
    assert(span && span->textStart == 20);
}

} // namespace

int main() {
    std::cout << "[Test] Starting Matcher Test..." << std::endl;
    TestWholeWordAndCase();
    TestCrossRunMatch();
    TestDeletedTextIsInvisible();
    TestCursorAndBlocks();
    TestPatterns();
    TestPathologicalPatternRejectedQuickly();
    TestSentenceBounds();
    TestSpanForRange();
    TestVisibleOpaqueContentSplitsText();
    TestUnderscoreIsAWordCharacter();
    std::cout << "[PASS] Matcher Test." << std::endl;
    return 0;
}
