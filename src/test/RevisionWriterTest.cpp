#include <cassert>
#include <iostream>
#include <stdexcept>

#include "domain/matching/Matcher.hpp"
#include "domain/revision/CommentAttacher.hpp"
#include "domain/revision/RevisionWriter.hpp"
#include "test/TestSupport.hpp"

using namespace redliner::domain;
using namespace redliner::domain::matching;
using namespace redliner::domain::revision;
using redliner::test::FixedClock;
using redliner::test::MakeDocument;

namespace {

MatchSpan Find(const Document& doc, const std::string& target) {
    Matcher matcher;
    auto span = matcher.find(doc, matcher.compile(target, MatchOptions{}));
    assert(span && "target should be present");
    return *span;
}

void TestReplaceInsideRun() {
    std::cout << "[Test] Replace inside a single run..." << std::endl;
    auto doc = MakeDocument({{"Our policy owner is <owner>."}});
    doc->run(0).formatting = "<w:rPr><w:b/></w:rPr>";
    RevisionWriter writer(FixedClock);

    auto result = writer.applyReplace(*doc, Find(*doc, "<owner>"), "Jane Doe", "tester");
    assert(result.deletion && result.deletion->id == 1);
    assert(result.insertion && result.insertion->id == 2);
    assert(result.insertion->timestamp == "2026-01-01T00:00:00Z");

    const Block& block = doc->block(0);
    assert(block.runs.size() == 4);
    assert(doc->run(block.runs[0]).text == "Our policy owner is ");
    assert(doc->run(block.runs[1]).text == "<owner>" && doc->run(block.runs[1]).isDeleted());
    assert(doc->run(block.runs[2]).text == "Jane Doe" && doc->run(block.runs[2]).isInserted());
    assert(doc->run(block.runs[2]).formatting == "<w:rPr><w:b/></w:rPr>");
    assert(doc->run(block.runs[3]).text == "." && !doc->run(block.runs[3]).revision);

    assert(doc->text(TextView::Current) == "Our policy owner is Jane Doe.");
    assert(doc->text(TextView::Original) == "Our policy owner is <owner>.");
}

void TestDeleteAcrossRuns() {
    std::cout << "[Test] Delete across runs..." << std::endl;
    auto doc = MakeDocument({{"Keep ", "remove", " this", " end"}});
    RevisionWriter writer(FixedClock);

    auto result = writer.applyDelete(*doc, Find(*doc, "remove this"), "tester");
    assert(result.deletion && !result.insertion);
    assert(result.deletedRuns.size() == 2);
    for (RunId id : result.deletedRuns) {
        assert(doc->run(id).revision->id == result.deletion->id);
    }
    assert(doc->text(TextView::Current) == "Keep  end");
    assert(doc->text(TextView::Original) == "Keep remove this end");
}

void TestReplacingAnInsertionRetractsIt() {
    std::cout << "[Test] Editing an earlier insertion..." << std::endl;
    auto doc = MakeDocument({{"Our policy owner is <owner>."}});
    RevisionWriter writer(FixedClock);
    writer.applyReplace(*doc, Find(*doc, "<owner>"), "Jane Doe", "tester");

    auto second = writer.applyReplace(*doc, Find(*doc, "Jane Doe"), "John Roe", "tester");
    assert(!second.deletion && "inserted text is withdrawn, not marked deleted");
    assert(second.retractedRuns.size() == 1);
    assert(second.insertion);

    for (RunId id : doc->block(0).runs) {
        assert(doc->run(id).text != "Jane Doe");
    }
    assert(doc->text(TextView::Current) == "Our policy owner is John Roe.");
    assert(doc->text(TextView::Original) == "Our policy owner is <owner>.");
}

void TestInvalidSpans() {
    std::cout << "[Test] Invalid spans are refused..." << std::endl;
    auto doc = MakeDocument({{"Our policy owner is <owner>."}});
    RevisionWriter writer(FixedClock);
    writer.applyDelete(*doc, Find(*doc, "<owner>"), "tester");

    MatchSpan onDeleted;
    onDeleted.block = 0;
    onDeleted.startRun = 1;
    onDeleted.startOffset = 0;
    onDeleted.endRun = 1;
    onDeleted.endOffset = 7;
    bool threw = false;
    try {
        writer.applyDelete(*doc, onDeleted, "tester");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw && "a span on deleted text must be refused");

    threw = false;
    try {
        writer.applyReplace(*doc, Find(*doc, "policy"), "", "tester");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw && "empty replacement must be refused");

    threw = false;
    try {
        ImageRef ref;
        ref.resourceId = "image9";
        writer.applyImageReplace(*doc, Find(*doc, "policy"), ref, "tester");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw && "unknown image resource must be refused");
    assert(doc->text(TextView::Current) == "Our policy owner is .");
}

void TestCommentAnchors() {
    std::cout << "[Test] Comment threads..." << std::endl;
    auto doc = MakeDocument({{"Review access quarterly."}});
    RevisionWriter writer(FixedClock);
    CommentAttacher comments(FixedClock);

    auto result = writer.applyReplace(*doc, Find(*doc, "quarterly"), "monthly", "tester");
    auto anchor = CommentAttacher::AnchorFor(result);
    assert(anchor && anchor->id == result.deletion->id);

    auto thread = comments.attach(*doc, *anchor, "Tightened cadence", "reviewer");
    assert(thread && thread->commentId == 0);
    assert(thread->revision && *thread->revision == result.deletion->id);
    assert(doc->run(thread->anchorFirst).text == "quarterly");
    assert(doc->run(thread->anchorLast).isDeleted());
    assert(doc->threads().size() == 1);

    assert(!comments.attach(*doc, *anchor, "   ", "reviewer") && "blank bodies are ignored");

    auto header = MakeDocument({{"Company header"}}, ContainerKind::Header);
    assert(!comments.attachToRuns(*header, 0, 0, 0, "note", "reviewer"));
    assert(header->threads().empty());
}

void TestSplitKeepsCommentCoverage() {
    std::cout << "[Test] Splitting an anchored run..." << std::endl;
    auto doc = MakeDocument({{"alpha beta gamma"}});
    CommentAttacher comments(FixedClock);
    auto thread = comments.attachToRuns(*doc, 0, 0, 0, "whole run", "reviewer");
    assert(thread);

    RunId right = doc->splitRun(0, 0, 6);
    assert(doc->run(0).text == "alpha " && doc->run(right).text == "beta gamma");
    assert(doc->threads()[0].anchorFirst == 0);
    assert(doc->threads()[0].anchorLast == right);

    bool threw = false;
    try {
        doc->splitRun(0, 0, 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

} // namespace

int main() {
    std::cout << "[Test] Starting RevisionWriter Test..." << std::endl;
    TestReplaceInsideRun();
    TestDeleteAcrossRuns();
    TestReplacingAnInsertionRetractsIt();
    TestInvalidSpans();
    TestCommentAnchors();
    TestSplitKeepsCommentCoverage();
    std::cout << "[PASS] RevisionWriter Test." << std::endl;
    return 0;
}
