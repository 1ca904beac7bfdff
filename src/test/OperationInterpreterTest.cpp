#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/OperationInterpreter.hpp"
#include "domain/grammar/HeuristicGrammarAdvisor.hpp"
#include "test/TestSupport.hpp"

using namespace redliner::application;
using namespace redliner::domain;
using redliner::test::FakeGrammarAdvisor;
using redliner::test::FakeImageProbe;
using redliner::test::FixedClock;
using redliner::test::MakeDocument;
using redliner::test::ThrowingGrammarAdvisor;

namespace {

std::unique_ptr<OperationInterpreter> MakeInterpreter(std::unique_ptr<Document> doc,
                                                      std::shared_ptr<grammar::GrammarAdvisor> advisor = nullptr) {
    OperationInterpreter::Settings settings;
    settings.revisionAuthor = "policy assistant";
    return std::make_unique<OperationInterpreter>(std::move(doc), std::move(advisor),
                                                  std::make_shared<FakeImageProbe>(200, 100), settings, FixedClock);
}

Operation Replace(const std::string& target, const std::string& replacement) {
    Operation op;
    op.target = target;
    op.action = ReplaceAction{replacement};
    return op;
}

Operation Simple(const std::string& target, Action action) {
    Operation op;
    op.target = target;
    op.action = std::move(action);
    return op;
}

std::vector<OperationEntry> Entries(const std::vector<Operation>& ops) {
    std::vector<OperationEntry> entries;
    for (const auto& op : ops) {
        OperationEntry entry;
        entry.operation = op;
        entry.target = op.target;
        entry.action = ActionToString(op.action);
        entries.push_back(entry);
    }
    return entries;
}

void TestPlaceholderReplace() {
    std::cout << "[Test] Placeholder replace..." << std::endl;
    auto interpreter = MakeInterpreter(MakeDocument({{"Our policy owner is <owner>."}}),
                                       std::make_shared<grammar::HeuristicGrammarAdvisor>());
    auto outcome = interpreter->apply(0, Replace("<owner>", "Jane Doe"));

    assert(outcome.status == OperationStatus::Applied);
    assert(outcome.occurrences == 1 && !outcome.widened);
    assert(outcome.revisions.size() == 2);
    const Document& doc = interpreter->document();
    assert(doc.text(TextView::Current) == "Our policy owner is Jane Doe.");
    assert(doc.text(TextView::Original) == "Our policy owner is <owner>.");
    assert(doc.run(doc.block(0).runs[1]).revision->author == "policy assistant");
}

void TestSentenceRewrite() {
    std::cout << "[Test] Oracle-driven sentence rewrite..." << std::endl;
    const std::string original =
        "Users are reviewed quarterly. Access will be terminated within <24 business hours>. Logs are kept.";
    auto advisor = std::make_shared<FakeGrammarAdvisor>(
        grammar::NeedsSentenceRewrite{"Access will be terminated immediately."});
    auto interpreter = MakeInterpreter(MakeDocument({{original}}), advisor);

    auto outcome = interpreter->apply(0, Replace("<24 business hours>", "immediately"));
    assert(outcome.status == OperationStatus::Applied);
    assert(outcome.widened);
    assert(advisor->calls == 1);
    assert(advisor->lastRequest.target == "<24 business hours>");
    assert(advisor->lastRequest.sentence == "Access will be terminated within <24 business hours>.");
    assert(advisor->lastRequest.replacement == "immediately");

    const Document& doc = interpreter->document();
    assert(doc.text(TextView::Current) ==
           "Users are reviewed quarterly. Access will be terminated immediately. Logs are kept.");
    assert(doc.text(TextView::Original) == original);

    // The offline advisor reaches the same verdict.
    auto heuristic = MakeInterpreter(MakeDocument({{original}}), std::make_shared<grammar::HeuristicGrammarAdvisor>());
    auto second = heuristic->apply(0, Replace("<24 business hours>", "immediately"));
    assert(second.widened);
    assert(heuristic->document().text(TextView::Current) == doc.text(TextView::Current));
}

void TestNonPlaceholderSkipsAdvisor() {
    std::cout << "[Test] Plain targets stay narrow..." << std::endl;
    auto advisor = std::make_shared<FakeGrammarAdvisor>(grammar::NeedsSentenceRewrite{"Rewritten."});
    auto interpreter = MakeInterpreter(MakeDocument({{"Respond within 24 business hours."}}), advisor);
    auto outcome = interpreter->apply(0, Replace("24 business hours", "one day"));
    assert(outcome.status == OperationStatus::Applied && !outcome.widened);
    assert(advisor->calls == 0);
    assert(interpreter->document().text(TextView::Current) == "Respond within one day.");
}

void TestDeleteThenComment() {
    std::cout << "[Test] Delete then comment on the same text..." << std::endl;
    auto interpreter = MakeInterpreter(MakeDocument({{"Store secrets in the Password Management System only."}}));
    Operation comment = Simple("Password Management System", CommentAction{});
    comment.comment = "Which system?";

    auto report = interpreter->run(Entries({Simple("Password Management System", DeleteAction{}), comment}));
    assert(report.outcomes.size() == 2);
    assert(report.outcomes[0].status == OperationStatus::Applied);
    assert(report.outcomes[1].status == OperationStatus::Skipped);
    assert(report.outcomes[1].reason == FailureReason::TargetNotFound);
    assert(interpreter->document().threads().empty());
    assert(interpreter->document().text(TextView::Current) == "Store secrets in the  only.");
}

void TestReplaceWithCommentAnchorsToDeletion() {
    std::cout << "[Test] Replace with comment..." << std::endl;
    auto interpreter = MakeInterpreter(MakeDocument({{"Review access quarterly."}}));
    Operation op = Replace("quarterly", "monthly");
    op.comment = "Tightened cadence";
    op.commentAuthor = "auditor";

    auto outcome = interpreter->apply(0, op);
    assert(outcome.status == OperationStatus::Applied);
    assert(outcome.commentIds.size() == 1);

    const Document& doc = interpreter->document();
    assert(doc.threads().size() == 1);
    const RevisionThread& thread = doc.threads()[0];
    assert(thread.author == "auditor" && thread.body == "Tightened cadence");
    assert(thread.revision && *thread.revision == outcome.revisions[0]);
    assert(doc.run(thread.anchorFirst).isDeleted());
    assert(doc.run(thread.anchorFirst).text == "quarterly");
}

void TestCommentOnly() {
    std::cout << "[Test] Comment operation..." << std::endl;
    auto interpreter = MakeInterpreter(MakeDocument({{"Review access quarterly."}}));
    Operation op = Simple("access", CommentAction{});
    op.comment = "Includes contractors?";
    auto outcome = interpreter->apply(0, op);
    assert(outcome.status == OperationStatus::Applied);
    assert(outcome.revisions.empty());

    const Document& doc = interpreter->document();
    assert(doc.threads().size() == 1 && !doc.threads()[0].revision);
    assert(doc.run(doc.threads()[0].anchorFirst).text == "access");
    assert(doc.text(TextView::Current) == doc.text(TextView::Original));

    Operation blank = Simple("access", CommentAction{});
    auto invalid = interpreter->apply(1, blank);
    assert(invalid.status == OperationStatus::Failed && invalid.reason == FailureReason::InvalidOperation);
}

void TestHeaderCommentSkipped() {
    std::cout << "[Test] Comments are not placed in headers..." << std::endl;
    auto interpreter = MakeInterpreter(MakeDocument({{"Acme Corp Confidential"}}, ContainerKind::Header));
    Operation comment = Simple("Confidential", CommentAction{});
    comment.comment = "Classification?";
    auto outcome = interpreter->apply(0, comment);
    assert(outcome.status == OperationStatus::Skipped);
    assert(interpreter->document().threads().empty());

    auto replaced = interpreter->apply(1, Replace("Acme Corp", "Globex"));
    assert(replaced.status == OperationStatus::Applied);
    assert(interpreter->document().text(TextView::Current) == "Globex Confidential");
}

void TestNoDoubleEdit() {
    std::cout << "[Test] Overlapping targets are edited once..." << std::endl;
    auto interpreter = MakeInterpreter(MakeDocument({{"Respond within 24 business hours."}}));
    Operation overlapping = Replace("business hours", "working hours");
    auto report = interpreter->run(Entries({Replace("24 business hours", "one day"), overlapping}));
    assert(report.outcomes[0].status == OperationStatus::Applied);
    assert(report.outcomes[1].status == OperationStatus::Failed);
    assert(report.outcomes[1].reason == FailureReason::TargetNotFound);
    assert(interpreter->document().text(TextView::Current) == "Respond within one day.");

    overlapping.skipIfAbsent = true;
    auto skipped = interpreter->apply(2, overlapping);
    assert(skipped.status == OperationStatus::Skipped);
}

void TestWholeWordDefault() {
    std::cout << "[Test] Whole-word default..." << std::endl;
    auto interpreter = MakeInterpreter(MakeDocument({{"The category list names a cat."}}));
    auto outcome = interpreter->apply(0, Replace("cat", "dog"));
    assert(outcome.status == OperationStatus::Applied);
    assert(interpreter->document().text(TextView::Current) == "The category list names a dog.");
}

void TestRejectedInputsLeaveDocumentUntouched() {
    std::cout << "[Test] Failed operations do not modify the document..." << std::endl;
    const std::string text = "aaaa b policy";
    auto interpreter = MakeInterpreter(MakeDocument({{text}}));

    Operation pathological = Replace("(a+)+b", "x");
    pathological.match.isPattern = true;
    auto rejected = interpreter->apply(0, pathological);
    assert(rejected.status == OperationStatus::Failed);
    assert(rejected.reason == FailureReason::PatternRejected);

    auto empty = interpreter->apply(1, Replace("policy", ""));
    assert(empty.status == OperationStatus::Failed && empty.reason == FailureReason::InvalidOperation);

    auto missing = interpreter->apply(2, Replace("absent", "x"));
    assert(missing.status == OperationStatus::Failed && missing.reason == FailureReason::TargetNotFound);

    OperationEntry broken;
    broken.target = "policy";
    broken.action = "rename";
    broken.error = "Unknown action 'rename'.";
    auto report = interpreter->run({broken});
    assert(report.outcomes[0].status == OperationStatus::Failed);
    assert(report.outcomes[0].message == "Unknown action 'rename'.");

    const Document& doc = interpreter->document();
    assert(doc.text(TextView::Current) == text);
    for (RunId id : doc.block(0).runs) assert(!doc.run(id).revision);
}

void TestWholeDocument() {
    std::cout << "[Test] Whole-document replace..." << std::endl;
    auto interpreter = MakeInterpreter(MakeDocument({{"cat and cat"}, {"another cat"}}));
    Operation op = Replace("cat", "cat food");
    op.wholeDocument = true;
    auto outcome = interpreter->apply(0, op);
    assert(outcome.status == OperationStatus::Applied);
    assert(outcome.occurrences == 3);
    assert(outcome.revisions.size() == 6);
    assert(interpreter->document().text(TextView::Current) == "cat food and cat food\nanother cat food");
    assert(interpreter->document().text(TextView::Original) == "cat and cat\nanother cat");
}

void TestAcceptAndRejectAll() {
    std::cout << "[Test] Accept-all and reject-all projections..." << std::endl;
    const std::string original = "The CISO owns this policy. Reviews are annual. Exceptions need approval.";
    auto interpreter = MakeInterpreter(MakeDocument({{"The CISO owns this ", "policy. Reviews are annual.",
                                                      " Exceptions need approval."}}));
    auto report = interpreter->run(Entries({Replace("CISO", "Security Lead"), Replace("annual", "quarterly"),
                                            Simple("need approval", DeleteAction{})}));
    assert(report.count(OperationStatus::Applied) == 3);

    std::string expected = original;
    expected.replace(expected.find("CISO"), 4, "Security Lead");
    expected.replace(expected.find("annual"), 6, "quarterly");
    expected.erase(expected.find("need approval"), 13);
    assert(interpreter->document().text(TextView::Current) == expected);
    assert(interpreter->document().text(TextView::Original) == original);
}

void TestDeterminism() {
    std::cout << "[Test] Same input, same output..." << std::endl;
    auto runOnce = []() {
        auto interpreter = MakeInterpreter(MakeDocument({{"Owner: <owner>. Review quarterly."}}));
        Operation op = Replace("quarterly", "monthly");
        op.comment = "cadence";
        interpreter->run(Entries({Replace("<owner>", "Jane Doe"), op}));
        return interpreter->releaseDocument();
    };
    auto a = runOnce();
    auto b = runOnce();
    assert(a->text(TextView::Current) == b->text(TextView::Current));
    assert(a->block(0).runs == b->block(0).runs);
    for (RunId id : a->block(0).runs) {
        const Run& ra = a->run(id);
        const Run& rb = b->run(id);
        assert(ra.text == rb.text);
        assert(ra.revision.has_value() == rb.revision.has_value());
        if (ra.revision) assert(ra.revision->id == rb.revision->id && ra.revision->timestamp == rb.revision->timestamp);
    }
    assert(a->threads().size() == 1 && b->threads().size() == 1);
    assert(a->threads()[0].anchorFirst == b->threads()[0].anchorFirst);
}

void TestImageSubstitution() {
    std::cout << "[Test] Logo substitution..." << std::endl;
    auto interpreter = MakeInterpreter(MakeDocument({{"Prepared by [Company Logo] for review."}}));

    ReplaceWithImageAction logo;
    logo.imageBytes = {1, 2, 3};
    auto outcome = interpreter->apply(0, Simple("[Company Logo]", logo));
    assert(outcome.status == OperationStatus::Applied);

    const Document& doc = interpreter->document();
    assert(doc.images().size() == 1);
    bool sawImage = false;
    for (RunId id : doc.block(0).runs) {
        const Run& run = doc.run(id);
        if (run.content != RunContent::Image) continue;
        sawImage = true;
        assert(run.isInserted());
        assert(run.image->heightEmu == 216000 && run.image->widthEmu == 432000);
        assert(run.image->resourceId == doc.images()[0].id);
    }
    assert(sawImage);
    assert(doc.text(TextView::Current) == "Prepared by  for review.");

    auto noBytes = MakeInterpreter(MakeDocument({{"Prepared by [Company Logo]."}}));
    auto failed = noBytes->apply(0, Simple("[Company Logo]", ReplaceWithImageAction{}));
    assert(failed.status == OperationStatus::Failed && failed.reason == FailureReason::ImageDecodeFailed);
    assert(noBytes->document().text(TextView::Current) == "Prepared by [Company Logo].");
}

void TestThrowingAdvisorDoesNotStopBatch() {
    std::cout << "[Test] A throwing advisor fails only its own operation..." << std::endl;
    auto advisor = std::make_shared<ThrowingGrammarAdvisor>(2);
    auto interpreter = MakeInterpreter(
        MakeDocument({{"Owner <owner> signs off. Backup <owner> signs off."}, {"Keep logs."}}), advisor);

    Operation everywhere = Replace("<owner>", "Jane Doe");
    everywhere.wholeDocument = true;
    auto report = interpreter->run(Entries({everywhere, Simple("Keep logs.", DeleteAction{})}));

    assert(report.outcomes.size() == 2);
    assert(report.outcomes[0].status == OperationStatus::Failed);
    assert(report.outcomes[0].reason == FailureReason::InternalError);
    assert(report.outcomes[0].message == "oracle down");
    assert(report.outcomes[0].revisions.empty());
    assert(FailureReasonToString(report.outcomes[0].reason) == "internal_error");
    assert(advisor->calls == 2);

    // The first occurrence was already replaced; the failure rolls it back.
    const Document& doc = interpreter->document();
    assert(doc.blockText(0, TextView::Current) == "Owner <owner> signs off. Backup <owner> signs off.");
    assert(doc.blockText(0, TextView::Original) == "Owner <owner> signs off. Backup <owner> signs off.");

    assert(report.outcomes[1].status == OperationStatus::Applied);
    assert(doc.blockText(1, TextView::Current).empty());
}

void TestOutcomeActionLabels() {
    std::cout << "[Test] Outcomes carry the action label..." << std::endl;
    assert(ActionToString(ReplaceAction{"x"}) == "replace");
    assert(ActionToString(DeleteAction{}) == "delete");
    assert(ActionToString(CommentAction{}) == "comment");
    assert(ActionToString(ReplaceWithImageAction{}) == "replace_with_logo");

    auto interpreter = MakeInterpreter(MakeDocument({{"Review quarterly."}}));
    Operation note = Simple("quarterly", CommentAction{});
    note.comment = "Too often?";
    assert(interpreter->apply(0, note).action == "comment");
    assert(interpreter->apply(1, Simple("Review", DeleteAction{})).action == "delete");
}

} // namespace

int main() {
    std::cout << "[Test] Starting OperationInterpreter Test..." << std::endl;
    TestPlaceholderReplace();
    TestSentenceRewrite();
    TestNonPlaceholderSkipsAdvisor();
    TestDeleteThenComment();
    TestReplaceWithCommentAnchorsToDeletion();
    TestCommentOnly();
    TestHeaderCommentSkipped();
    TestNoDoubleEdit();
    TestWholeWordDefault();
    TestRejectedInputsLeaveDocumentUntouched();
    TestWholeDocument();
    TestAcceptAndRejectAll();
    TestDeterminism();
    TestImageSubstitution();
    TestThrowingAdvisorDoesNotStopBatch();
    TestOutcomeActionLabels();
    std::cout << "[PASS] OperationInterpreter Test." << std::endl;
    return 0;
}
