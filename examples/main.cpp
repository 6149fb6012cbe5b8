#include <iostream>
#include <vector>

#include "sftcurator/dedup_index.hpp"
#include "sftcurator/quality_filter.hpp"
#include "sftcurator/templates.hpp"

int main() {
  using namespace sftcurator;

  const std::string answer =
      "Access control limits information system access to authorized users, processes acting on behalf of "
      "authorized users, and devices. Organizations define the types of transactions and functions that "
      "authorized users are permitted to execute and review those permissions on a regular schedule.";

  TemplateContext ctx;
  ctx.source = "NIST SP 800-171";
  ctx.topic = "Limit system access to authorized users";
  ctx.framework = "sp800_171";

  std::vector<ChatRecord> batch = {
      MakeChatRecord(SelectTemplate(ctx), answer, "nist_sp800_171_3.1.1"),
      MakeChatRecord(SelectTemplate(ctx), answer, "nist_sp800_171_3.1.1_copy"),
      MakeChatRecord("What is 3.2.1?", "3.2.1", "nist_sp800_171_3.2.1"),
  };

  QualityFilter filter;
  auto filtered = filter.FilterBatch(batch);
  std::cout << "Quality: passed=" << filtered.stats.passed << " rejected=" << filtered.stats.TotalRejected() << '\n';

  DedupIndex dedup;
  auto deduped = dedup.DeduplicateBatch(filtered.passed);
  std::cout << "Dedup: unique=" << deduped.stats.unique << " exact=" << deduped.stats.exact_dupes
            << " near=" << deduped.stats.near_dupes << '\n';
  for (const auto& r : deduped.kept) {
    std::cout << r.source << ": " << r.messages[kUserTurn].content << '\n';
  }
  return 0;
}
